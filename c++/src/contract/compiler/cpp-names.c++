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

#include "cpp-names.h"
#include <kj/debug.h>
#include <kj/vector.h>
#include <set>
#include <string.h>

namespace contract {
namespace compiler {

namespace {

static constexpr uint64_t NAMESPACE_ANNOTATION_ID = 0xb9c6f99ebf805f2cull;
static constexpr uint64_t NAME_ANNOTATION_ID = 0xf264a779fef191ceull;

template <typename P>
kj::Maybe<capnp::schema::Value::Reader> annotationValue(P proto, uint64_t annotationId) {
  for (auto annotation: proto.getAnnotations()) {
    if (annotation.getId() == annotationId) {
      return annotation.getValue();
    }
  }
  return kj::none;
}

template <typename P>
kj::StringPtr annotatedName(P proto) {
  KJ_IF_SOME(name, annotationValue(proto, NAME_ANNOTATION_ID)) {
    return name.getText();
  } else {
    return proto.getName();
  }
}

}  // namespace

kj::String safeIdentifier(kj::StringPtr identifier) {
  static const std::set<kj::StringPtr> keywords({
    "alignas", "alignof", "and", "and_eq", "asm", "auto", "bitand", "bitor", "bool", "break",
    "case", "catch", "char", "char16_t", "char32_t", "class", "compl", "const", "constexpr",
    "const_cast", "continue", "decltype", "default", "delete", "do", "double", "dynamic_cast",
    "else", "enum", "explicit", "export", "extern", "false", "float", "for", "friend", "goto",
    "if", "inline", "int", "long", "mutable", "namespace", "new", "noexcept", "not", "not_eq",
    "nullptr", "operator", "or", "or_eq", "private", "protected", "public", "register",
    "reinterpret_cast", "return", "short", "signed", "sizeof", "static", "static_assert",
    "static_cast", "struct", "switch", "template", "this", "thread_local", "throw", "true",
    "try", "typedef", "typeid", "typename", "union", "unsigned", "using", "virtual", "void",
    "volatile", "wchar_t", "while", "xor", "xor_eq"
  });

  if (keywords.count(identifier) > 0) {
    return kj::str(identifier, '_');
  } else {
    return kj::heapString(identifier);
  }
}

kj::String toTitleCase(kj::StringPtr name) {
  kj::String result = kj::heapString(name);
  if (result.size() > 0 && 'a' <= result[0] && result[0] <= 'z') {
    result[0] = result[0] - 'a' + 'A';
  }
  return result;
}

kj::String toUpperCase(kj::StringPtr name) {
  kj::Vector<char> result(name.size() + 4);

  for (char c: name) {
    if ('a' <= c && c <= 'z') {
      result.add(c - 'a' + 'A');
    } else if (result.size() > 0 && 'A' <= c && c <= 'Z') {
      result.add('_');
      result.add(c);
    } else {
      result.add(c);
    }
  }

  if (result.size() == 4 && memcmp(result.begin(), "NULL", 4) == 0) {
    // NULL probably collides with a macro.
    result.add('_');
  }

  result.add('\0');

  return kj::String(result.releaseAsArray());
}

// =======================================================================================

CppNames::CppNames(const capnp::SchemaLoader& schemaLoader): schemaLoader(schemaLoader) {}

kj::String CppNames::scopeName(capnp::schema::Node::Reader node) {
  if (node.getScopeId() == 0) {
    KJ_REQUIRE(node.isFile(),
        "non-file had scopeId zero; perhaps it's a method param / result struct?",
        node.getDisplayName());
    KJ_IF_SOME(ns, annotationValue(node, NAMESPACE_ANNOTATION_ID)) {
      return kj::str("::", ns.getText());
    } else {
      return kj::str();
    }
  }

  KJ_REQUIRE(node.getParameters().size() == 0,
      "schema conformance: generic types cannot be used in a contract", node.getDisplayName());

  auto parent = schemaLoader.get(node.getScopeId()).getProto();
  kj::StringPtr unqualifiedName;
  kj::String ownUnqualifiedName;
  KJ_IF_SOME(name, annotationValue(node, NAME_ANNOTATION_ID)) {
    unqualifiedName = name.getText();
  } else {
    for (auto nested: parent.getNestedNodes()) {
      if (nested.getId() == node.getId()) {
        unqualifiedName = nested.getName();
        break;
      }
    }
    if (unqualifiedName == nullptr && parent.isStruct()) {
      // Groups are not nested nodes; they are named after their field.
      for (auto field: parent.getStruct().getFields()) {
        if (field.isGroup() && field.getGroup().getTypeId() == node.getId()) {
          ownUnqualifiedName = toTitleCase(protoName(field));
          unqualifiedName = ownUnqualifiedName;
          break;
        }
      }
    }
    KJ_REQUIRE(unqualifiedName != nullptr,
        "a schema node's supposed scope did not contain the node", node.getDisplayName());
  }

  return kj::str(scopeName(parent), "::", unqualifiedName);
}

kj::String CppNames::fullName(capnp::Schema schema) {
  return kj::str(" ", scopeName(schema.getProto()));
}

kj::String CppNames::paramTypeName(capnp::InterfaceSchema::Method method) {
  auto paramType = method.getParamType();
  if (paramType.getProto().getScopeId() == 0) {
    // Implicit parameter struct, declared inside the interface.
    return kj::str(fullName(method.getContainingInterface()), "::",
                   toTitleCase(protoName(method.getProto())), "Params");
  }
  return fullName(paramType);
}

kj::String CppNames::resultTypeName(capnp::InterfaceSchema::Method method) {
  auto resultType = method.getResultType();
  if (resultType.getProto().getScopeId() == 0) {
    return kj::str(fullName(method.getContainingInterface()), "::",
                   toTitleCase(protoName(method.getProto())), "Results");
  }
  return fullName(resultType);
}

kj::Maybe<kj::StringPtr> CppNames::fileNamespace(capnp::Schema file) {
  KJ_IF_SOME(ns, annotationValue(file.getProto(), NAMESPACE_ANNOTATION_ID)) {
    kj::StringPtr result = ns.getText();
    if (result.startsWith("::")) {
      result = result.slice(2);
    }
    return result;
  }
  return kj::none;
}

kj::StringPtr CppNames::protoName(capnp::schema::Field::Reader proto) {
  return annotatedName(proto);
}

kj::StringPtr CppNames::protoName(capnp::schema::Method::Reader proto) {
  return annotatedName(proto);
}

kj::StringPtr CppNames::protoName(capnp::schema::Enumerant::Reader proto) {
  return annotatedName(proto);
}

kj::String CppNames::accessorSuffix(capnp::StructSchema::Field field) {
  return toTitleCase(protoName(field.getProto()));
}

kj::String CppNames::methodIdentifier(capnp::InterfaceSchema::Method method) {
  return safeIdentifier(protoName(method.getProto()));
}

kj::String CppNames::requestMethod(capnp::InterfaceSchema::Method method) {
  return kj::str(protoName(method.getProto()), "Request");
}

kj::String CppNames::enumerantLiteral(capnp::EnumSchema schema, uint16_t value) {
  auto enumerants = schema.getEnumerants();
  if (value < enumerants.size()) {
    return kj::str(fullName(schema), "::", toUpperCase(protoName(enumerants[value].getProto())));
  } else {
    return kj::str("static_cast<", fullName(schema), ">(", value, ")");
  }
}

}  // namespace compiler
}  // namespace contract
