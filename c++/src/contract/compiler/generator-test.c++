// Copyright (c) 2026 capnp-contract contributors
// Licensed under the MIT License:
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include "generator.h"
#include "plugin.h"
#include "test-util.h"
#include <kj/test.h>
#include <kj/time.h>
#include <kj/vector.h>

namespace contract {
namespace compiler {
namespace {

const char CONTRACT[] = R"({
  "name": "generator",
  "services": {
    "MyService": { "myMethod": { "successCases": [
      { "request": {"requestField": "VALUE"}, "response": {"responseField": 42} } ] } },
    "Registry": { "getName": { "successCases": [
      { "request": {}, "response": {"name": "registry"} } ] } }
  }
})";

KJ_TEST("one unit per file with contracted interfaces") {
  TestRequest request;
  auto contract = parseContract(kj::StringPtr(CONTRACT));
  auto dir = kj::newInMemoryDirectory(kj::nullClock());

  generate(request.getRequest(), contract, *dir);

  KJ_EXPECT(dir->listNames().size() == 1);
  auto file = dir->openFile(kj::Path::parse("contract/test.capnp.contract.h"));
  auto text = file->readAllText();
  KJ_EXPECT(text.startsWith("// Generated by capnpc-contract from contract/test.capnp"));
  KJ_EXPECT(contains(text, "class MyServiceContractMock final"));
  KJ_EXPECT(contains(text, "class RegistryContractMock final"));
  KJ_EXPECT(!contains(text, "UnlistedContract"));
}

KJ_TEST("files without contracted interfaces produce nothing") {
  TestRequest request;
  auto contract = parseContract(kj::StringPtr(R"({
    "services": { "Elsewhere": { "anything": {} } }
  })"));
  auto dir = kj::newInMemoryDirectory(kj::nullClock());

  KJ_EXPECT_LOG(WARNING, "contract names a service no requested file declares");
  KJ_EXPECT(renderUnits(request.getRequest(), contract).size() == 0);
  generate(request.getRequest(), contract, *dir);
  KJ_EXPECT(dir->listNames().size() == 0);
}

KJ_TEST("an error leaves the output directory untouched") {
  TestRequest request;

  // MyService compiles; Registry fails afterwards, in the same unit.
  auto contract = parseContract(kj::StringPtr(R"({
    "services": {
      "MyService": { "myMethod": { "successCases": [
        { "request": {"requestField": "VALUE"}, "response": {"responseField": 42} } ] } },
      "Registry": { "register": { "failureCases": [
        { "request": {"name": "x"}, "error": {"code": "NotARealCode", "message": "x"} } ] } }
    }
  })"));

  auto dir = kj::newInMemoryDirectory(kj::nullClock());
  auto path = kj::Path::parse("contract/test.capnp.contract.h");
  dir->openFile(path, kj::WriteMode::CREATE | kj::WriteMode::CREATE_PARENT)
      ->writeAll("previous output");

  KJ_EXPECT_THROW_MESSAGE("invalid error code",
      generate(request.getRequest(), contract, *dir));

  KJ_EXPECT(dir->listNames().size() == 1);
  KJ_EXPECT(dir->openFile(path)->readAllText() == "previous output");
}

KJ_TEST("writeUnits replaces existing files") {
  auto dir = kj::newInMemoryDirectory(kj::nullClock());
  GeneratedUnit units[] = {
    { kj::str("a/b.capnp.contract.h"), kj::str("first") },
    { kj::str("/abs/c.capnp.contract.h"), kj::str("second") },
  };
  writeUnits(*dir, kj::arrayPtr(units, 2));
  units[0].text = kj::str("again");
  writeUnits(*dir, kj::arrayPtr(units, 1));

  KJ_EXPECT(dir->openFile(kj::Path::parse("a/b.capnp.contract.h"))->readAllText() == "again");
  KJ_EXPECT(dir->openFile(kj::Path::parse("abs/c.capnp.contract.h"))->readAllText() == "second");
}

// =======================================================================================

class TestProcessContext final: public kj::ProcessContext {
  // Turns exits into exceptions so that the main function returns control to the test.

public:
  kj::StringPtr getProgramName() override { return "capnpc-contract"; }

  [[noreturn]] void exit() override {
    kj::throwFatalException(KJ_EXCEPTION(FAILED, "exit", errors.size()));
  }

  void warning(kj::StringPtr message) override {}

  void error(kj::StringPtr message) override {
    errors.add(kj::heapString(message));
  }

  [[noreturn]] void exitError(kj::StringPtr message) override {
    error(message);
    exit();
  }

  [[noreturn]] void exitInfo(kj::StringPtr message) override {
    info = kj::heapString(message);
    exit();
  }

  void increaseLoggingVerbosity() override {}

  kj::Vector<kj::String> errors;
  kj::String info;
};

KJ_TEST("the contract file option is required") {
  TestProcessContext context;
  CapnpcContractMain main(context);

  KJ_EXPECT_THROW_MESSAGE("exit", main.getMain()("capnpc-contract", nullptr));
  KJ_ASSERT(context.errors.size() == 1);
  KJ_EXPECT(contains(context.errors[0],
      "missing option: '--contract-file' option not provided"), context.errors[0]);
}

KJ_TEST("a contract which cannot be read fails the run") {
  TestProcessContext context;
  CapnpcContractMain main(context);

  kj::StringPtr args[] = { "--contract-file=/nonexistent/contract.json" };
  KJ_EXPECT_THROW_MESSAGE("exit", main.getMain()("capnpc-contract", args));
  KJ_ASSERT(context.errors.size() == 1);
  KJ_EXPECT(context.errors[0].startsWith(
      "error: malformed contract: contract file not found"), context.errors[0]);
}

KJ_TEST("--version") {
  TestProcessContext context;
  CapnpcContractMain main(context);

  kj::StringPtr args[] = { "--version" };
  KJ_EXPECT_THROW_MESSAGE("exit", main.getMain()("capnpc-contract", args));
  KJ_EXPECT(context.errors.size() == 0);
  KJ_EXPECT(context.info.startsWith("Cap'n Proto contract plugin version "), context.info);
}

KJ_TEST("describeError names the context") {
  auto exception = KJ_ASSERT_NONNULL(kj::runCatchingExceptions([]() {
    KJ_CONTEXT("service", "MyService");
    KJ_CONTEXT("success case", "myMethod", "returns 42");
    KJ_FAIL_REQUIRE("field mismatch: field not found while inspecting message");
  }));

  auto text = describeError(exception);
  KJ_EXPECT(text.startsWith("field mismatch: field not found while inspecting message\n"), text);
  KJ_EXPECT(contains(text, "  while processing service; MyService\n"), text);
  KJ_EXPECT(contains(text, "returns 42"), text);
}

}  // namespace
}  // namespace compiler
}  // namespace contract
