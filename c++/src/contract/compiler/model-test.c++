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

#include "model.h"
#include <kj/test.h>

namespace contract {
namespace compiler {
namespace {

const char CONTRACT[] = R"({
  "name": "demo",
  "services": {
    "MyService": {
      "MyMethod": {
        "successCases": [
          { "description": "first", "request": {"requestField": "VALUE"},
            "response": {"responseField": 42} },
          { "request": {}, "response": {} }
        ],
        "failureCases": [
          { "description": "missing", "request": {"requestField": "ANOTHER_VALUE"},
            "error": {"code": "NotFound", "message": "ANOTHER_VALUE NotFound"} }
        ]
      },
      "otherMethod": {}
    }
  }
})";

KJ_TEST("parse contract") {
  auto contract = parseContract(kj::StringPtr(CONTRACT));
  KJ_EXPECT(contract.name == "demo");

  auto& service = KJ_ASSERT_NONNULL(contract.findService("MyService"));
  KJ_EXPECT(contract.findService("Unlisted") == kj::none);

  auto& method = KJ_ASSERT_NONNULL(service.findMethod("myMethod"));
  KJ_ASSERT(method.successCases.size() == 2);
  KJ_ASSERT(method.failureCases.size() == 1);

  KJ_EXPECT(method.successCases[0].description == "first");
  KJ_EXPECT(method.successCases[1].description == "");
  KJ_EXPECT(method.successCases[0].request.getObject()[0].getName() == "requestField");
  KJ_EXPECT(method.successCases[0].response.getObject()[0].getValue().getNumber() == 42);

  KJ_EXPECT(method.failureCases[0].error.code == "NotFound");
  KJ_EXPECT(method.failureCases[0].error.message == "ANOTHER_VALUE NotFound");

  auto& other = KJ_ASSERT_NONNULL(service.findMethod("otherMethod"));
  KJ_EXPECT(other.successCases.size() == 0);
  KJ_EXPECT(other.failureCases.size() == 0);
}

KJ_TEST("method lookup accepts both spellings") {
  auto contract = parseContract(kj::StringPtr(CONTRACT));
  auto& service = KJ_ASSERT_NONNULL(contract.findService("MyService"));

  KJ_EXPECT(service.findMethod("myMethod") != kj::none);
  KJ_EXPECT(service.findMethod("MyMethod") != kj::none);
  KJ_EXPECT(service.findMethod("otherMethod") != kj::none);
  KJ_EXPECT(service.findMethod("mymethod") == kj::none);
  KJ_EXPECT(service.findMethod("describe") == kj::none);
}

KJ_TEST("empty contract") {
  auto contract = parseContract(kj::StringPtr("{}"));
  KJ_EXPECT(contract.name == "");
  KJ_EXPECT(contract.services.size() == 0);
}

KJ_TEST("duplicate keys keep the last value") {
  auto contract = parseContract(kj::StringPtr(R"({
    "services": {
      "MyService": { "myMethod": { "successCases": [] } },
      "MyService": { "myMethod": { "failureCases": [
        { "request": {}, "error": {"code": "Internal", "message": "boom"} } ] } }
    }
  })"));

  auto& service = KJ_ASSERT_NONNULL(contract.findService("MyService"));
  auto& method = KJ_ASSERT_NONNULL(service.findMethod("myMethod"));
  KJ_EXPECT(method.successCases.size() == 0);
  KJ_EXPECT(method.failureCases.size() == 1);
}

KJ_TEST("malformed contracts") {
  KJ_EXPECT_THROW_MESSAGE("malformed contract: document is not valid JSON",
      parseContract(kj::StringPtr("{ \"services\": ")));
  KJ_EXPECT_THROW_MESSAGE("malformed contract: expected a JSON object",
      parseContract(kj::StringPtr("[]")));
  KJ_EXPECT_THROW_MESSAGE("malformed contract: expected a JSON object",
      parseContract(kj::StringPtr(R"({"services": {"MyService": []}})")));
  KJ_EXPECT_THROW_MESSAGE("malformed contract: expected a JSON array",
      parseContract(kj::StringPtr(
          R"({"services": {"MyService": {"myMethod": {"successCases": {}}}}})")));
  KJ_EXPECT_THROW_MESSAGE("malformed contract: missing member",
      parseContract(kj::StringPtr(
          R"({"services": {"MyService": {"myMethod": {"successCases": [
              {"request": {}}]}}}})")));
  KJ_EXPECT_THROW_MESSAGE("malformed contract: missing member",
      parseContract(kj::StringPtr(
          R"({"services": {"MyService": {"myMethod": {"failureCases": [
              {"request": {}, "error": {"code": "NotFound"}}]}}}})")));
  KJ_EXPECT_THROW_MESSAGE("malformed contract: expected a JSON string",
      parseContract(kj::StringPtr(
          R"({"services": {"MyService": {"myMethod": {"failureCases": [
              {"request": {}, "error": {"code": 5, "message": "x"}}]}}}})")));
  KJ_EXPECT_THROW_MESSAGE("malformed contract: expected a JSON string",
      parseContract(kj::StringPtr(R"({"name": 3})")));
}

KJ_TEST("the contract does not judge codes or bodies") {
  // Semantic checks belong to the case compiler.
  auto contract = parseContract(kj::StringPtr(R"({
    "services": { "MyService": { "myMethod": {
      "successCases": [ { "request": 17, "response": "anything" } ],
      "failureCases": [ { "request": [], "error": {"code": "Bogus", "message": ""} } ]
    } } }
  })"));
  auto& service = KJ_ASSERT_NONNULL(contract.findService("MyService"));
  auto& method = KJ_ASSERT_NONNULL(service.findMethod("myMethod"));
  KJ_EXPECT(method.failureCases[0].error.code == "Bogus");
}

KJ_TEST("missing contract file") {
  auto fs = kj::newDiskFilesystem();
  KJ_EXPECT_THROW_MESSAGE("malformed contract: contract file not found",
      loadContract(*fs, "/nonexistent/contract.json"));
}

}  // namespace
}  // namespace compiler
}  // namespace contract
