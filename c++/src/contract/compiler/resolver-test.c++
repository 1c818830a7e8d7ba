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

#include "resolver.h"
#include <contract/test.capnp.h>
#include <kj/test.h>

namespace contract {
namespace compiler {
namespace {

class JsonFixture {
public:
  capnp::JsonValue::Reader parse(kj::StringPtr text) {
    auto root = message.initRoot<capnp::JsonValue>();
    codec.decodeRaw(text, root);
    return root.asReader();
  }

private:
  capnp::MallocMessageBuilder message;
  capnp::JsonCodec codec;
};

capnp::StructSchema widgetType() {
  return capnp::Schema::from<test::Widget>();
}

capnp::StructSchema myMethodParams() {
  return capnp::Schema::from<test::MyService>().getMethodByName("myMethod").getParamType();
}

KJ_TEST("value kinds") {
  auto widget = widgetType();
  KJ_EXPECT(kindOf(widget.getFieldByName("id").getType()) == ValueKind::SCALAR);
  KJ_EXPECT(kindOf(widget.getFieldByName("name").getType()) == ValueKind::SCALAR);
  KJ_EXPECT(kindOf(widget.getFieldByName("payload").getType()) == ValueKind::SCALAR);
  KJ_EXPECT(kindOf(widget.getFieldByName("color").getType()) == ValueKind::ENUM);
  KJ_EXPECT(kindOf(widget.getFieldByName("label").getType()) == ValueKind::MESSAGE);
  KJ_EXPECT(kindOf(widget.getFieldByName("shape").getType()) == ValueKind::MESSAGE);
  KJ_EXPECT(kindOf(widget.getFieldByName("tags").getType()) == ValueKind::REPEATED);
  KJ_EXPECT(kindOf(widget.getFieldByName("history").getType()) == ValueKind::REPEATED);
  KJ_EXPECT(kindOf(widget.getFieldByName("attributes").getType()) == ValueKind::MAP);
}

KJ_TEST("message layout numbers fields by ordinal") {
  MessageLayout layout(capnp::Schema::from<test::Reordered>());

  auto first = KJ_ASSERT_NONNULL(layout.findByName("first"));
  auto second = KJ_ASSERT_NONNULL(layout.findByName("second"));
  auto dimensions = KJ_ASSERT_NONNULL(layout.findByName("dimensions"));

  KJ_EXPECT(layout.numberOf(first) == 0);
  KJ_EXPECT(layout.numberOf(second) == 1);
  // A group takes the lowest ordinal of its members.
  KJ_EXPECT(layout.numberOf(dimensions) == 2);

  KJ_EXPECT(KJ_ASSERT_NONNULL(layout.findByNumber(1)) == second);
  KJ_EXPECT(layout.findByNumber(3) == kj::none);
  KJ_EXPECT(layout.findByName("height") == kj::none);
}

KJ_TEST("layouts are cached per type") {
  ValueResolver resolver;
  auto& a = resolver.layoutFor(widgetType());
  auto& b = resolver.layoutFor(widgetType());
  KJ_EXPECT(&a == &b);
  KJ_EXPECT(&resolver.layoutFor(capnp::Schema::from<test::Label>()) != &a);
}

KJ_TEST("resolve the end-to-end request") {
  JsonFixture json;
  ValueResolver resolver;

  auto message = resolver.resolve(json.parse(R"({"requestField": "VALUE"})"), myMethodParams());
  KJ_ASSERT(message.fields.size() == 1);
  KJ_EXPECT(message.fields[0].field.getProto().getName() == "requestField");
  KJ_EXPECT(message.fields[0].number == 0);
  KJ_EXPECT(message.fields[0].value.kind == ValueKind::SCALAR);
  KJ_EXPECT(message.fields[0].value.value.as<capnp::Text>() == "VALUE");
  KJ_EXPECT(message.value.get("requestField").as<capnp::Text>() == "VALUE");
}

KJ_TEST("populated fields are ordered by number, not by JSON order") {
  JsonFixture json;
  ValueResolver resolver;

  auto message = resolver.resolve(
      json.parse(R"({"dimensions": {"width": 3}, "second": "b", "first": "a"})"),
      capnp::Schema::from<test::Reordered>());

  KJ_ASSERT(message.fields.size() == 3);
  KJ_EXPECT(message.fields[0].field.getProto().getName() == "first");
  KJ_EXPECT(message.fields[1].field.getProto().getName() == "second");
  KJ_EXPECT(message.fields[2].field.getProto().getName() == "dimensions");

  auto& dimensions = *message.fields[2].value.message;
  KJ_ASSERT(dimensions.fields.size() == 1);
  KJ_EXPECT(dimensions.fields[0].field.getProto().getName() == "width");
  KJ_EXPECT(dimensions.fields[0].value.value.as<uint16_t>() == 3);
}

KJ_TEST("resolve every value kind") {
  JsonFixture json;
  ValueResolver resolver;

  auto message = resolver.resolve(json.parse(R"({
    "palette": ["blue"],
    "id": 7,
    "color": "green",
    "tags": ["a", "b"],
    "label": {"text": "main", "weight": 1.5},
    "history": [{"text": "old"}, {}],
    "attributes": [{"key": "size", "value": 3}],
    "payload": [0, 127, 255],
    "shape": {"circle": 2.5},
    "scores": [1, -2, "3"],
    "matrix": [[1, 2], []]
  })"), widgetType());

  auto names = KJ_MAP(field, message.fields) { return field.field.getProto().getName(); };
  KJ_ASSERT(names.size() == 11);
  KJ_EXPECT(names[0] == "id");
  KJ_EXPECT(names[1] == "color");
  KJ_EXPECT(names[10] == "palette");

  auto widget = message.value.as<test::Widget>();
  KJ_EXPECT(widget.getId() == 7);
  KJ_EXPECT(widget.getColor() == test::Color::GREEN);
  KJ_EXPECT(widget.getLabel().getWeight() == 1.5);
  KJ_EXPECT(widget.getShape().isCircle());
  KJ_EXPECT(widget.getShape().getCircle() == 2.5);
  KJ_EXPECT(widget.getScores()[2] == 3);
  KJ_EXPECT(widget.getPayload().size() == 3);
  KJ_EXPECT(widget.getPayload()[2] == 255);
  KJ_EXPECT(widget.getMatrix()[1].size() == 0);

  auto& history = message.fields[4].value;
  KJ_EXPECT(history.kind == ValueKind::REPEATED);
  KJ_ASSERT(history.elements.size() == 2);
  KJ_EXPECT(history.elements[0].message->fields.size() == 1);
  KJ_EXPECT(history.elements[1].message->fields.size() == 0);

  auto& attributes = message.fields[5].value;
  KJ_EXPECT(attributes.kind == ValueKind::MAP);
  KJ_EXPECT(attributes.elements[0].message->fields.size() == 2);
}

KJ_TEST("null means absent") {
  JsonFixture json;
  ValueResolver resolver;

  auto message = resolver.resolve(
      json.parse(R"({"id": 1, "name": null, "label": null, "shape": {"none": null}})"),
      widgetType());
  KJ_ASSERT(message.fields.size() == 2);
  KJ_EXPECT(message.fields[0].field.getProto().getName() == "id");
  KJ_EXPECT(message.fields[1].field.getProto().getName() == "shape");

  // Void members are the exception: null is their value.
  auto& shape = *message.fields[1].value.message;
  KJ_ASSERT(shape.fields.size() == 1);
  KJ_EXPECT(shape.fields[0].field.getProto().getName() == "none");

  KJ_EXPECT(!message.value.as<test::Widget>().hasName());
}

KJ_TEST("duplicate keys keep the last value") {
  JsonFixture json;
  ValueResolver resolver;

  auto message = resolver.resolve(
      json.parse(R"({"requestField": "first", "requestField": "second"})"), myMethodParams());
  KJ_ASSERT(message.fields.size() == 1);
  KJ_EXPECT(message.fields[0].value.value.as<capnp::Text>() == "second");
}

KJ_TEST("unknown fields are a field mismatch") {
  JsonFixture json;
  ValueResolver resolver;

  KJ_EXPECT_THROW_MESSAGE("field mismatch: field not found while inspecting message",
      resolver.resolve(json.parse(R"({"requestFeld": "VALUE"})"), myMethodParams()));

  // Drift is caught below the top level too.
  KJ_EXPECT_THROW_MESSAGE("fieldName = colour",
      resolver.resolve(json.parse(R"({"label": {"colour": "red"}})"), widgetType()));
  KJ_EXPECT_THROW_MESSAGE("messageName = Label",
      resolver.resolve(json.parse(R"({"history": [{}, {"bogus": 1}]})"), widgetType()));
  KJ_EXPECT_THROW_MESSAGE("field mismatch",
      resolver.resolve(json.parse(R"({"shape": {"triangle": 1}})"), widgetType()));

  // Even when null.
  KJ_EXPECT_THROW_MESSAGE("field mismatch",
      resolver.resolve(json.parse(R"({"nickname": null})"), widgetType()));
}

KJ_TEST("values must fit their fields") {
  JsonFixture json;
  ValueResolver resolver;

  KJ_EXPECT_THROW_MESSAGE("schema conformance",
      resolver.resolve(json.parse(R"({"requestField": 5})"), myMethodParams()));
  KJ_EXPECT_THROW_MESSAGE("schema conformance",
      resolver.resolve(json.parse(R"({"id": "abc"})"), widgetType()));
  KJ_EXPECT_THROW_MESSAGE("schema conformance",
      resolver.resolve(json.parse(R"({"id": -1})"), widgetType()));
  KJ_EXPECT_THROW_MESSAGE("schema conformance",
      resolver.resolve(json.parse(R"({"delta": 300})"), widgetType()));
  KJ_EXPECT_THROW_MESSAGE("schema conformance",
      resolver.resolve(json.parse(R"({"scores": [1.5]})"), widgetType()));
  KJ_EXPECT_THROW_MESSAGE("schema conformance",
      resolver.resolve(json.parse(R"({"color": "purple"})"), widgetType()));
  KJ_EXPECT_THROW_MESSAGE("schema conformance",
      resolver.resolve(json.parse(R"({"label": "main"})"), widgetType()));
  KJ_EXPECT_THROW_MESSAGE("schema conformance",
      resolver.resolve(json.parse(R"({"tags": "a"})"), widgetType()));
  KJ_EXPECT_THROW_MESSAGE("schema conformance",
      resolver.resolve(json.parse(R"({"payload": [256]})"), widgetType()));
  KJ_EXPECT_THROW_MESSAGE("schema conformance",
      resolver.resolve(json.parse(R"(["VALUE"])"), myMethodParams()));
}

KJ_TEST("conformance errors name the message and the field") {
  JsonFixture json;
  ValueResolver resolver;

  KJ_EXPECT_THROW_MESSAGE("fieldName = weight",
      resolver.resolve(json.parse(R"({"label": {"weight": "heavy"}})"), widgetType()));
}

KJ_TEST("only one union member may be set") {
  JsonFixture json;
  ValueResolver resolver;

  KJ_EXPECT_THROW_MESSAGE("more than one member of a union is set",
      resolver.resolve(json.parse(R"({"shape": {"circle": 1, "square": 2}})"), widgetType()));

  // A null member does not count.
  auto message = resolver.resolve(
      json.parse(R"({"shape": {"circle": 1, "square": null}})"), widgetType());
  KJ_EXPECT(message.value.as<test::Widget>().getShape().isCircle());
}

}  // namespace
}  // namespace compiler
}  // namespace contract
