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
#include <kj/debug.h>
#include <algorithm>

namespace contract {
namespace compiler {

namespace {

bool isMapEntry(capnp::StructSchema type) {
  return type.getFields().size() == 2 &&
         type.getUnionFields().size() == 0 &&
         type.findFieldByName("key") != kj::none &&
         type.findFieldByName("value") != kj::none;
}

uint lowestOrdinal(capnp::StructSchema::Field field) {
  auto proto = field.getProto();
  switch (proto.which()) {
    case capnp::schema::Field::SLOT:
      return proto.getOrdinal().getExplicit();
    case capnp::schema::Field::GROUP: {
      uint result = kj::maxValue;
      for (auto member: field.getType().asStruct().getFields()) {
        result = kj::min(result, lowestOrdinal(member));
      }
      return result;
    }
  }
  KJ_UNREACHABLE;
}

bool isAbsent(capnp::JsonValue::Reader json, capnp::StructSchema::Field field) {
  // null stands for "not set", except on Void fields where it is the only sensible spelling
  // of the value.
  return json.isNull() && field.getType().which() != capnp::schema::Type::VOID;
}

bool isInUnion(capnp::StructSchema::Field field) {
  return field.getProto().getDiscriminantValue() != capnp::schema::Field::NO_DISCRIMINANT;
}

}  // namespace

ValueKind kindOf(capnp::Type type) {
  switch (type.which()) {
    case capnp::schema::Type::ENUM:
      return ValueKind::ENUM;
    case capnp::schema::Type::STRUCT:
      return ValueKind::MESSAGE;
    case capnp::schema::Type::LIST: {
      auto element = type.asList().getElementType();
      if (element.which() == capnp::schema::Type::STRUCT && isMapEntry(element.asStruct())) {
        return ValueKind::MAP;
      }
      return ValueKind::REPEATED;
    }
    default:
      return ValueKind::SCALAR;
  }
}

// =======================================================================================

MessageLayout::MessageLayout(capnp::StructSchema schema)
    : schema(schema),
      numbers(KJ_MAP(field, schema.getFields()) { return lowestOrdinal(field); }) {
  for (auto field: schema.getFields()) {
    byName.insert(field.getProto().getName(), field);
    byNumber.insert(numbers[field.getIndex()], field);
  }
}

kj::Maybe<capnp::StructSchema::Field> MessageLayout::findByName(kj::StringPtr name) const {
  return byName.find(name).map([](const capnp::StructSchema::Field& field) { return field; });
}

kj::Maybe<capnp::StructSchema::Field> MessageLayout::findByNumber(uint number) const {
  return byNumber.find(number).map([](const capnp::StructSchema::Field& field) { return field; });
}

uint MessageLayout::numberOf(capnp::StructSchema::Field field) const {
  KJ_REQUIRE(field.getContainingStruct() == schema, "field belongs to another struct");
  return numbers[field.getIndex()];
}

// =======================================================================================

ValueResolver::ValueResolver() {}

const MessageLayout& ValueResolver::layoutFor(capnp::StructSchema type) {
  uint64_t id = type.getProto().getId();
  KJ_IF_SOME(layout, layouts.find(id)) {
    return *layout;
  }
  return *layouts.insert(id, kj::heap<MessageLayout>(type)).value;
}

ResolvedMessage ValueResolver::resolve(capnp::JsonValue::Reader json,
                                       capnp::StructSchema type) {
  auto storage = kj::heap<capnp::MallocMessageBuilder>();
  auto root = storage->initRoot<capnp::DynamicStruct>(type);
  decodeMessage(json, root);

  auto result = resolveMessage(json, root.asReader());
  result.storage = kj::mv(storage);
  return result;
}

template <typename Func>
void ValueResolver::decodeLeaf(kj::StringPtr messageName, kj::StringPtr fieldName,
                               Func&& func) {
  // The codec and the dynamic API report bad leaf values in their own words. Restate them as
  // conformance errors that say where the value was.
  KJ_IF_SOME(exception, kj::runCatchingExceptions(kj::fwd<Func>(func))) {
    KJ_FAIL_REQUIRE("schema conformance: value does not fit the field's type",
                    messageName, fieldName, exception.getDescription());
  }
}

void ValueResolver::decodeMessage(capnp::JsonValue::Reader json,
                                  capnp::DynamicStruct::Builder output) {
  auto type = output.getSchema();
  auto& layout = layoutFor(type);
  kj::StringPtr messageName = type.getShortDisplayName();

  KJ_REQUIRE(json.isObject(), "schema conformance: expected a JSON object for a message",
             messageName);

  auto orphanage = capnp::Orphanage::getForMessageContaining(output);
  kj::Maybe<capnp::StructSchema::Field> unionMember;

  for (auto member: json.getObject()) {
    kj::StringPtr fieldName = member.getName();
    auto value = member.getValue();

    KJ_IF_SOME(field, layout.findByName(fieldName)) {
      if (isAbsent(value, field)) continue;

      if (isInUnion(field)) {
        KJ_IF_SOME(previous, unionMember) {
          KJ_REQUIRE(previous == field,
                     "schema conformance: more than one member of a union is set",
                     messageName, fieldName, previous.getProto().getName());
        }
        unionMember = field;
      }

      auto fieldType = field.getType();
      if (field.getProto().isGroup()) {
        decodeMessage(value, output.init(field).as<capnp::DynamicStruct>());
        continue;
      }

      switch (fieldType.which()) {
        case capnp::schema::Type::STRUCT:
        case capnp::schema::Type::LIST:
          output.adopt(field, decodePointer(value, fieldType, orphanage, messageName, fieldName));
          break;
        case capnp::schema::Type::INTERFACE:
        case capnp::schema::Type::ANY_POINTER:
          KJ_FAIL_REQUIRE(
              "schema conformance: capabilities and AnyPointer values cannot appear in a contract",
              messageName, fieldName);
        default:
          decodeLeaf(messageName, fieldName, [&]() {
            output.adopt(field, codec.decode(value, fieldType, orphanage));
          });
          break;
      }
    } else {
      KJ_FAIL_REQUIRE("field mismatch: field not found while inspecting message",
                      fieldName, messageName);
    }
  }
}

capnp::Orphan<capnp::DynamicValue> ValueResolver::decodePointer(
    capnp::JsonValue::Reader json, capnp::Type type, capnp::Orphanage orphanage,
    kj::StringPtr messageName, kj::StringPtr fieldName) {
  if (type.which() == capnp::schema::Type::STRUCT) {
    auto orphan = orphanage.newOrphan(type.asStruct());
    decodeMessage(json, orphan.get());
    return kj::mv(orphan);
  }

  auto listType = type.asList();
  KJ_REQUIRE(json.isArray(), "schema conformance: expected a JSON array for a list",
             messageName, fieldName);
  auto items = json.getArray();
  auto orphan = orphanage.newOrphan(listType, items.size());
  auto list = orphan.get();
  auto elementType = listType.getElementType();

  for (auto i: kj::indices(items)) {
    switch (elementType.which()) {
      case capnp::schema::Type::STRUCT:
        decodeMessage(items[i], list[i].as<capnp::DynamicStruct>());
        break;
      case capnp::schema::Type::LIST:
        list.adopt(i, decodePointer(items[i], elementType, orphanage, messageName, fieldName));
        break;
      case capnp::schema::Type::INTERFACE:
      case capnp::schema::Type::ANY_POINTER:
        KJ_FAIL_REQUIRE(
            "schema conformance: capabilities and AnyPointer values cannot appear in a contract",
            messageName, fieldName);
      default:
        decodeLeaf(messageName, fieldName, [&]() {
          list.adopt(i, codec.decode(items[i], elementType, orphanage));
        });
        break;
    }
  }

  return kj::mv(orphan);
}

ResolvedMessage ValueResolver::resolveMessage(capnp::JsonValue::Reader json,
                                              capnp::DynamicStruct::Reader value) {
  // Runs after decodeMessage() accepted `json`, so every member has a field.
  auto& layout = layoutFor(value.getSchema());

  kj::Vector<ResolvedField> fields;
  for (auto member: json.getObject()) {
    auto field = KJ_ASSERT_NONNULL(layout.findByName(member.getName()));
    if (isAbsent(member.getValue(), field)) continue;

    ResolvedField resolved {
      field, layout.numberOf(field),
      resolveValue(member.getValue(), field.getType(), value.get(field))
    };

    bool replaced = false;
    for (auto& existing: fields) {
      if (existing.field == field) {
        // Duplicate key: the last one wins.
        existing = kj::mv(resolved);
        replaced = true;
        break;
      }
    }
    if (!replaced) {
      fields.add(kj::mv(resolved));
    }
  }

  std::sort(fields.begin(), fields.end(),
      [](const ResolvedField& a, const ResolvedField& b) { return a.number < b.number; });

  return ResolvedMessage { value.getSchema(), value, fields.releaseAsArray(), nullptr };
}

ResolvedValue ValueResolver::resolveValue(capnp::JsonValue::Reader json, capnp::Type type,
                                          capnp::DynamicValue::Reader value) {
  ResolvedValue result;
  result.type = type;
  result.kind = kindOf(type);
  result.value = value;

  switch (result.kind) {
    case ValueKind::SCALAR:
    case ValueKind::ENUM:
      break;
    case ValueKind::MESSAGE:
      result.message = kj::heap(resolveMessage(json, value.as<capnp::DynamicStruct>()));
      break;
    case ValueKind::REPEATED:
    case ValueKind::MAP: {
      auto items = json.getArray();
      auto list = value.as<capnp::DynamicList>();
      auto elementType = type.asList().getElementType();
      result.elements = KJ_MAP(i, kj::indices(items)) {
        return resolveValue(items[i], elementType, list[i]);
      };
      break;
    }
  }

  return result;
}

}  // namespace compiler
}  // namespace contract
