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

#pragma once

#include <capnp/compat/json.h>
#include <capnp/dynamic.h>
#include <capnp/message.h>
#include <capnp/schema.h>
#include <kj/map.h>

namespace contract {
namespace compiler {

enum class ValueKind: uint8_t {
  SCALAR,     // Void, Bool, numbers, Text and Data.
  ENUM,
  MESSAGE,    // Structs and groups.
  REPEATED,   // Lists, except key/value entry lists.
  MAP         // Lists of structs with exactly the fields `key` and `value`.
};

ValueKind kindOf(capnp::Type type);

struct ResolvedMessage;

struct ResolvedValue {
  capnp::Type type;
  ValueKind kind;

  capnp::DynamicValue::Reader value;
  // The decoded value, whatever the kind.

  kj::Own<ResolvedMessage> message;
  // Set for MESSAGE.

  kj::Array<ResolvedValue> elements;
  // Set for REPEATED and MAP.
};

struct ResolvedField {
  capnp::StructSchema::Field field;
  uint number;
  ResolvedValue value;
};

struct ResolvedMessage {
  // A struct value built from contract JSON. `fields` lists exactly the fields the JSON
  // populated, in ascending field number.

  capnp::StructSchema type;
  capnp::DynamicStruct::Reader value;
  kj::Array<ResolvedField> fields;

  kj::Own<capnp::MallocMessageBuilder> storage;
  // Backs `value` and every reader below it. Only set on the outermost message.
};

class MessageLayout {
  // Field lookups for one struct type.

public:
  explicit MessageLayout(capnp::StructSchema schema);
  KJ_DISALLOW_COPY_AND_MOVE(MessageLayout);

  capnp::StructSchema getSchema() const { return schema; }

  kj::Maybe<capnp::StructSchema::Field> findByName(kj::StringPtr name) const;
  kj::Maybe<capnp::StructSchema::Field> findByNumber(uint number) const;

  uint numberOf(capnp::StructSchema::Field field) const;
  // A field's number is its ordinal. A group has no ordinal of its own and takes the lowest
  // ordinal among its members.

private:
  capnp::StructSchema schema;
  kj::Array<uint> numbers;  // indexed by field index
  kj::HashMap<kj::StringPtr, capnp::StructSchema::Field> byName;
  kj::HashMap<uint, capnp::StructSchema::Field> byNumber;
};

class ValueResolver {
  // Checks contract JSON against struct types and decodes it.
  //
  // Two kinds of errors are raised. "field mismatch" means the JSON names a field the type does
  // not have, which usually means the contract and the schema have drifted apart. "schema
  // conformance" means a value does not fit the type of the field it was given for.

public:
  ValueResolver();
  KJ_DISALLOW_COPY_AND_MOVE(ValueResolver);

  ResolvedMessage resolve(capnp::JsonValue::Reader json, capnp::StructSchema type);

  const MessageLayout& layoutFor(capnp::StructSchema type);
  // Layouts are built on first use and cached for the life of the resolver.

private:
  capnp::JsonCodec codec;
  kj::HashMap<uint64_t, kj::Own<MessageLayout>> layouts;

  void decodeMessage(capnp::JsonValue::Reader json, capnp::DynamicStruct::Builder output);
  capnp::Orphan<capnp::DynamicValue> decodePointer(
      capnp::JsonValue::Reader json, capnp::Type type, capnp::Orphanage orphanage,
      kj::StringPtr messageName, kj::StringPtr fieldName);
  template <typename Func>
  void decodeLeaf(kj::StringPtr messageName, kj::StringPtr fieldName, Func&& func);

  ResolvedMessage resolveMessage(capnp::JsonValue::Reader json,
                                 capnp::DynamicStruct::Reader value);
  ResolvedValue resolveValue(capnp::JsonValue::Reader json, capnp::Type type,
                             capnp::DynamicValue::Reader value);
};

}  // namespace compiler
}  // namespace contract
