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

#include "case-compiler.h"
#include <contract/test.capnp.h>
#include <kj/test.h>

namespace contract {
namespace compiler {
namespace {

capnp::InterfaceSchema myService() {
  return capnp::Schema::from<test::MyService>();
}

capnp::InterfaceSchema::Method myMethod() {
  return myService().getMethodByName("myMethod");
}

class RequestFixture {
public:
  capnp::DynamicStruct::Reader myMethodRequest(kj::Maybe<kj::StringPtr> requestField) {
    auto root = message.initRoot<capnp::DynamicStruct>(myMethod().getParamType());
    KJ_IF_SOME(value, requestField) {
      root.set("requestField", value);
    }
    return root.asReader();
  }

private:
  capnp::MallocMessageBuilder message;
};

const char END_TO_END[] = R"({
  "name": "end-to-end",
  "services": { "MyService": { "MyMethod": {
    "failureCases": [
      { "description": "missing", "request": {"requestField": "ANOTHER_VALUE"},
        "error": {"code": "NotFound", "message": "ANOTHER_VALUE NotFound"} }
    ],
    "successCases": [
      { "description": "found", "request": {"requestField": "VALUE"},
        "response": {"responseField": 42} }
    ]
  } } }
})";

KJ_TEST("end-to-end: success, failure and the default outcome") {
  auto contract = parseContract(kj::StringPtr(END_TO_END));
  ValueResolver resolver;
  CaseCompiler compiler(resolver);

  auto& service = KJ_ASSERT_NONNULL(contract.findService("MyService"));
  auto dispatch = compiler.compile(myMethod(), service.findMethod("myMethod"));

  KJ_EXPECT(dispatch.hasContract);
  KJ_ASSERT(dispatch.entries.size() == 2);
  KJ_EXPECT(dispatch.successCount == 1);

  // Successes come first, whatever order the document lists them in.
  KJ_EXPECT(dispatch.entries[0].description == "found");
  KJ_EXPECT(dispatch.entries[1].description == "missing");

  RequestFixture requests;
  {
    auto& entry = KJ_ASSERT_NONNULL(dispatch.match(requests.myMethodRequest("VALUE"_kj)));
    auto& response = entry.outcome.get<ResolvedMessage>();
    KJ_EXPECT(response.value.get("responseField").as<int64_t>() == 42);
  }
  {
    auto& entry = KJ_ASSERT_NONNULL(dispatch.match(requests.myMethodRequest("ANOTHER_VALUE"_kj)));
    auto& error = entry.outcome.get<ErrorOutcome>();
    KJ_EXPECT(error.code == StatusCode::NOT_FOUND);
    KJ_EXPECT(error.message == "ANOTHER_VALUE NotFound");
  }

  // No match: the caller falls back to an empty response and no error.
  KJ_EXPECT(dispatch.match(requests.myMethodRequest("OTHER"_kj)) == kj::none);
  KJ_EXPECT(dispatch.match(requests.myMethodRequest(kj::none)) == kj::none);
}

KJ_TEST("first match wins") {
  auto contract = parseContract(kj::StringPtr(R"({
    "services": { "MyService": { "myMethod": {
      "successCases": [
        { "description": "first", "request": {"requestField": "VALUE"},
          "response": {"responseField": 1} },
        { "description": "second", "request": {"requestField": "VALUE"},
          "response": {"responseField": 2} }
      ],
      "failureCases": [
        { "description": "shadowed", "request": {"requestField": "VALUE"},
          "error": {"code": "Internal", "message": "never"} },
        { "description": "empty", "request": {},
          "error": {"code": "InvalidArgument", "message": "empty"} }
      ]
    } } }
  })"));
  ValueResolver resolver;
  CaseCompiler compiler(resolver);

  auto& service = KJ_ASSERT_NONNULL(contract.findService("MyService"));
  auto dispatch = compiler.compile(myMethod(), service.findMethod("myMethod"));
  KJ_ASSERT(dispatch.entries.size() == 4);

  RequestFixture requests;
  KJ_EXPECT(KJ_ASSERT_NONNULL(dispatch.match(requests.myMethodRequest("VALUE"_kj)))
      .description == "first");
  KJ_EXPECT(KJ_ASSERT_NONNULL(dispatch.match(requests.myMethodRequest(kj::none)))
      .description == "empty");
}

KJ_TEST("methods without a contract") {
  ValueResolver resolver;
  CaseCompiler compiler(resolver);

  auto dispatch = compiler.compile(myMethod(), kj::none);
  KJ_EXPECT(!dispatch.hasContract);
  KJ_EXPECT(dispatch.entries.size() == 0);

  RequestFixture requests;
  KJ_EXPECT(dispatch.match(requests.myMethodRequest("VALUE"_kj)) == kj::none);
}

KJ_TEST("error codes are validated") {
  KJ_EXPECT(validateErrorCode("Unavailable") == StatusCode::UNAVAILABLE);
  KJ_EXPECT_THROW_MESSAGE("invalid error code", validateErrorCode("NotARealCode"));
  KJ_EXPECT_THROW_MESSAGE("invalid error code", validateErrorCode("OK"));

  auto contract = parseContract(kj::StringPtr(R"({
    "services": { "MyService": { "myMethod": {
      "failureCases": [
        { "description": "bad", "request": {"requestField": "X"},
          "error": {"code": "NotARealCode", "message": "x"} }
      ]
    } } }
  })"));
  ValueResolver resolver;
  CaseCompiler compiler(resolver);
  auto& service = KJ_ASSERT_NONNULL(contract.findService("MyService"));
  KJ_EXPECT_THROW_MESSAGE("code = NotARealCode",
      compiler.compile(myMethod(), service.findMethod("myMethod")));
}

KJ_TEST("resolver errors propagate") {
  auto contract = parseContract(kj::StringPtr(R"({
    "services": { "MyService": { "myMethod": {
      "successCases": [
        { "description": "drifted", "request": {"requestFeld": "VALUE"},
          "response": {"responseField": 42} }
      ]
    } } }
  })"));
  ValueResolver resolver;
  CaseCompiler compiler(resolver);
  auto& service = KJ_ASSERT_NONNULL(contract.findService("MyService"));
  KJ_EXPECT_THROW_MESSAGE("field mismatch",
      compiler.compile(myMethod(), service.findMethod("myMethod")));
}

KJ_TEST("compile a service") {
  auto contract = parseContract(kj::StringPtr(R"({
    "services": { "MyService": {
      "myMethod": { "successCases": [
        { "request": {"requestField": "VALUE"}, "response": {"responseField": 42} } ] },
      "noSuchMethod": {}
    } }
  })"));
  ValueResolver resolver;
  CaseCompiler compiler(resolver);
  auto& service = KJ_ASSERT_NONNULL(contract.findService("MyService"));

  KJ_EXPECT_LOG(WARNING, "contract names a method the interface does not declare");
  auto result = compiler.compileService(myService(), service);

  // Every declared method is present, in ordinal order.
  KJ_ASSERT(result.methods.size() == 3);
  KJ_EXPECT(result.methods[0].method.getProto().getName() == "myMethod");
  KJ_EXPECT(result.methods[0].hasContract);
  KJ_EXPECT(result.methods[1].method.getProto().getName() == "describe");
  KJ_EXPECT(!result.methods[1].hasContract);
  KJ_EXPECT(!result.methods[2].hasContract);
}

KJ_TEST("inherited methods are compiled") {
  auto registry = capnp::Schema::from<test::Registry>();
  auto methods = allMethods(registry);
  KJ_ASSERT(methods.size() == 2);
  KJ_EXPECT(methods[0].getProto().getName() == "register");
  KJ_EXPECT(methods[1].getProto().getName() == "getName");
  KJ_EXPECT(methods[1].getContainingInterface() == capnp::Schema::from<test::Named>());

  auto contract = parseContract(kj::StringPtr(R"({
    "services": { "Registry": {
      "GetName": { "successCases": [ { "request": {}, "response": {"name": "registry"} } ] }
    } }
  })"));
  ValueResolver resolver;
  CaseCompiler compiler(resolver);
  auto& service = KJ_ASSERT_NONNULL(contract.findService("Registry"));

  auto result = compiler.compileService(registry, service);
  KJ_ASSERT(result.methods.size() == 2);
  KJ_EXPECT(!result.methods[0].hasContract);
  KJ_EXPECT(result.methods[1].hasContract);
  KJ_EXPECT(result.methods[1].entries.size() == 1);
}

}  // namespace
}  // namespace compiler
}  // namespace contract
