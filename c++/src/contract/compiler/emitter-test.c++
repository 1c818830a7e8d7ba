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

#include "emitter.h"
#include "test-util.h"
#include <kj/test.h>

namespace contract {
namespace compiler {
namespace {

KJ_TEST("identifier helpers") {
  KJ_EXPECT(safeIdentifier("delete") == "delete_");
  // capnpc-c++ leaves newer keywords alone, so names must too.
  KJ_EXPECT(safeIdentifier("co_await") == "co_await");
  KJ_EXPECT(safeIdentifier("requires") == "requires");
  KJ_EXPECT(safeIdentifier("myMethod") == "myMethod");

  KJ_EXPECT(toTitleCase("myMethod") == "MyMethod");
  KJ_EXPECT(toTitleCase("X") == "X");
  KJ_EXPECT(toTitleCase("") == "");

  KJ_EXPECT(toUpperCase("red") == "RED");
  KJ_EXPECT(toUpperCase("notFound") == "NOT_FOUND");
  KJ_EXPECT(toUpperCase("null") == "NULL_");
}

KJ_TEST("string literals") {
  KJ_EXPECT(cppStringLiteral(kj::StringPtr("plain")) == "\"plain\"");
  KJ_EXPECT(cppStringLiteral(kj::StringPtr("say \"hi\"\\\n\t")) ==
            "\"say \\\"hi\\\"\\\\\\n\\t\"");
  // Octal escapes cannot absorb the digit that follows.
  KJ_EXPECT(cppStringLiteral(kj::StringPtr("\0011")) == "\"\\0011\"");
  KJ_EXPECT(cppStringLiteral(kj::StringPtr("\xff")) == "\"\\377\"");

  KJ_EXPECT(commentText("two\nlines\r") == "two lines ");
  KJ_EXPECT(commentText("C:\\") == "C:\\.");
  KJ_EXPECT(commentText("a\\b") == "a\\b");
}

KJ_TEST("C++ names of schema entities") {
  TestRequest schemas;
  CppNames names(schemas.loader);

  auto service = schemas.nested("MyService").asInterface();
  auto widget = schemas.nested("Widget").asStruct();
  auto color = schemas.nested("Color").asEnum();

  KJ_EXPECT(KJ_ASSERT_NONNULL(names.fileNamespace(schemas.file())) == "contract::test");
  KJ_EXPECT(names.fullName(service) == " ::contract::test::MyService");
  KJ_EXPECT(names.fullName(widget.getFieldByName("shape").getType().asStruct()) ==
            " ::contract::test::Widget::Shape");

  auto myMethod = service.getMethodByName("myMethod");
  KJ_EXPECT(names.paramTypeName(myMethod) == " ::contract::test::MyService::MyMethodParams");
  KJ_EXPECT(names.resultTypeName(myMethod) == " ::contract::test::MyService::MyMethodResults");
  KJ_EXPECT(names.methodIdentifier(myMethod) == "myMethod");
  KJ_EXPECT(names.requestMethod(myMethod) == "myMethodRequest");

  // describe takes and returns Widget directly.
  auto describe = service.getMethodByName("describe");
  KJ_EXPECT(names.paramTypeName(describe) == " ::contract::test::Widget");
  KJ_EXPECT(names.resultTypeName(describe) == " ::contract::test::Widget");

  KJ_EXPECT(names.accessorSuffix(widget.getFieldByName("payload")) == "Payload");
  KJ_EXPECT(names.enumerantLiteral(color, 1) == " ::contract::test::Color::GREEN");
  KJ_EXPECT(names.enumerantLiteral(color, 9) ==
            "static_cast< ::contract::test::Color>(9)");
}

KJ_TEST("scalar literals") {
  TestRequest schemas;
  CppNames names(schemas.loader);
  MessageRenderer renderer(names);

  KJ_EXPECT(renderer.literal(capnp::schema::Type::BOOL, true) == "true");
  KJ_EXPECT(renderer.literal(capnp::schema::Type::INT8, int8_t(-128)) == "-128");
  KJ_EXPECT(renderer.literal(capnp::schema::Type::INT64, int64_t(42)) == "42ll");
  int64_t lowest = kj::minValue;
  KJ_EXPECT(renderer.literal(capnp::schema::Type::INT64, lowest) ==
            "(-9223372036854775807ll - 1)");
  KJ_EXPECT(renderer.literal(capnp::schema::Type::UINT16, uint16_t(7)) == "7u");
  KJ_EXPECT(renderer.literal(capnp::schema::Type::UINT64, uint64_t(7)) == "7llu");
  KJ_EXPECT(renderer.literal(capnp::schema::Type::FLOAT32, 1.0f) == "1.0f");
  KJ_EXPECT(renderer.literal(capnp::schema::Type::FLOAT32, 2.5f) == "2.5f");
  KJ_EXPECT(renderer.literal(capnp::schema::Type::FLOAT64, kj::inf()) == "::kj::inf()");
  KJ_EXPECT(renderer.literal(capnp::schema::Type::FLOAT64, -kj::inf()) == "-::kj::inf()");
  KJ_EXPECT(renderer.literal(capnp::schema::Type::FLOAT64, kj::nan()) == "::kj::nan()");
  KJ_EXPECT(renderer.literal(capnp::schema::Type::TEXT, capnp::Text::Reader("a\"b")) ==
            "\"a\\\"b\"");

  auto color = schemas.nested("Color").asEnum();
  KJ_EXPECT(renderer.literal(color, capnp::DynamicEnum(color, 2)) ==
            " ::contract::test::Color::BLUE");
}

const char CONTRACT[] = R"({
  "name": "emitter \"test\"",
  "services": { "MyService": {
    "myMethod": {
      "successCases": [
        { "description": "returns 42\nfor VALUE", "request": {"requestField": "VALUE"},
          "response": {"responseField": 42} },
        { "description": "C:\\", "request": {"requestField": "C:\\"},
          "response": {"responseField": 1} }
      ],
      "failureCases": [
        { "description": "not found", "request": {"requestField": "ANOTHER_VALUE"},
          "error": {"code": "NotFound", "message": "ANOTHER_VALUE NotFound"} }
      ]
    },
    "describe": {
      "successCases": [
        { "description": "nested values",
          "request": {"label": {"text": "main"}, "tags": ["a"], "payload": [1, 2],
                      "color": "blue", "shape": {"none": null}},
          "response": {} }
      ]
    }
  },
  "Registry": {
    "getName": { "successCases": [ { "request": {}, "response": {"name": "registry"} } ] }
  } }
})";

class UnitFixture {
public:
  UnitFixture(): contract(parseContract(kj::StringPtr(CONTRACT))),
                 compiler(resolver), names(schemas.loader) {
    for (auto name: {"MyService"_kj, "Registry"_kj}) {
      services.add(compiler.compileService(
          schemas.nested(name).asInterface(), KJ_ASSERT_NONNULL(contract.findService(name))));
    }
    UnitEmitter emitter(names, contract.name);
    text = emitter.emit(schemas.file(), services.asPtr()).flatten();
  }

  TestRequest schemas;
  Contract contract;
  ValueResolver resolver;
  CaseCompiler compiler;
  CppNames names;
  kj::Vector<ServiceDispatch> services;
  kj::String text;
};

KJ_TEST("unit layout") {
  UnitFixture unit;
  auto& text = unit.text;

  KJ_EXPECT(text.startsWith(
      "// Generated by capnpc-contract from contract/test.capnp and contract "
      "\"emitter \"test\"\".\n// DO NOT EDIT.\n"), text);
  KJ_EXPECT(contains(text, "#pragma once\n"));
  KJ_EXPECT(contains(text, "#include \"test.capnp.h\"\n"));
  KJ_EXPECT(contains(text, "#include <contract/dispatch.h>\n"));
  KJ_EXPECT(contains(text, "#include <contract/harness.h>\n"));
  KJ_EXPECT(contains(text, "namespace contract {\nnamespace test {\n"));
  KJ_EXPECT(contains(text, "}  // namespace\n}  // namespace\n"));
}

KJ_TEST("dispatch tables") {
  UnitFixture unit;
  auto& text = unit.text;

  KJ_EXPECT(contains(text, "struct MyServiceContract {\n"));
  KJ_EXPECT(contains(text,
      "  typedef ::contract::DispatchCase< ::contract::test::MyService::MyMethodParams, "
      " ::contract::test::MyService::MyMethodResults> MyMethodCase;\n"));
  KJ_EXPECT(contains(text, "    // returns 42 for VALUE\n"));
  KJ_EXPECT(contains(text, "    { \"returns 42\\nfor VALUE\",\n"));
  // The trailing backslash must not splice the row into the comment.
  KJ_EXPECT(contains(text, "    // C:\\.\n    { \"C:\\\\\",\n"));
  KJ_EXPECT(contains(text, "request.setRequestField(\"VALUE\");\n"));
  KJ_EXPECT(contains(text, "response.setResponseField(42ll);\n"));
  KJ_EXPECT(contains(text,
      "      nullptr,\n      ::contract::StatusCode::NOT_FOUND, \"ANOTHER_VALUE NotFound\" },\n"));

  // Nested values and the empty response.
  KJ_EXPECT(contains(text, "auto message1 = request.initLabel();\n"));
  KJ_EXPECT(contains(text, "message1.setText(\"main\");\n"));
  KJ_EXPECT(contains(text, "auto list1 = request.initTags(1);\n"));
  KJ_EXPECT(contains(text, "list1.set(0, \"a\");\n"));
  KJ_EXPECT(contains(text, "static const ::kj::byte bytes[] = { 1, 2 };\n"));
  KJ_EXPECT(contains(text, "request.setColor( ::contract::test::Color::BLUE);\n"));
  KJ_EXPECT(contains(text, "[]( ::contract::test::Widget::Builder) {}"));

  // ping is declared but not in the contract.
  KJ_EXPECT(contains(text, "  // Not covered by the contract.\n  return nullptr;\n"));
}

KJ_TEST("mock and harness") {
  UnitFixture unit;
  auto& text = unit.text;

  KJ_EXPECT(contains(text,
      "class MyServiceContractMock final: public  ::contract::test::MyService::Server {\n"));
  KJ_EXPECT(contains(text, "EMPTY RESULT AND NO ERROR"));
  KJ_EXPECT(contains(text,
      "  ::kj::Promise<void> ping(PingContext context) override {\n"
      "    return ::contract::dispatchCall(MyServiceContract::ping(), context);\n"));
  KJ_EXPECT(contains(text, "inline  ::contract::test::MyService::Client newMockMyServiceClient()"));

  KJ_EXPECT(contains(text, "inline void runMyServiceContractCases("));
  KJ_EXPECT(contains(text,
      "  ::contract::exerciseMethod(\"describe\", MyServiceContract::describe(),\n"
      "      [&]() { return client.describeRequest(); }, waitScope);\n"));
  // Methods the contract does not cover are not exercised.
  KJ_EXPECT(!contains(text, "exerciseMethod(\"ping\""));
  KJ_EXPECT(contains(text, "inline void runMyServiceContractTest(::kj::AsyncIoContext& io,\n"));
}

KJ_TEST("inherited methods") {
  UnitFixture unit;
  auto& text = unit.text;

  KJ_EXPECT(contains(text,
      "  typedef ::contract::DispatchCase< ::contract::test::Named::GetNameParams, "
      " ::contract::test::Named::GetNameResults> GetNameCase;\n"));
  KJ_EXPECT(contains(text, "response.setName(\"registry\");\n"));

  // Own methods use the short context name; inherited ones name the declaring Server.
  KJ_EXPECT(contains(text,
      "  ::kj::Promise<void> register_(RegisterContext context) override {\n"
      "    return ::contract::dispatchCall(RegistryContract::register_(), context);\n"));
  KJ_EXPECT(contains(text,
      "  ::kj::Promise<void> getName( ::contract::test::Named::Server::GetNameContext context) "
      "override {\n"
      "    return ::contract::dispatchCall(RegistryContract::getName(), context);\n"));

  KJ_EXPECT(contains(text,
      "  ::contract::exerciseMethod(\"getName\", RegistryContract::getName(),\n"
      "      [&]() { return client.getNameRequest(); }, waitScope);\n"));
  KJ_EXPECT(!contains(text, "exerciseMethod(\"register\""));
}

}  // namespace
}  // namespace compiler
}  // namespace contract
