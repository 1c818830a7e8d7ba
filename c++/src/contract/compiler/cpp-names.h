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

#include <capnp/schema-loader.h>
#include <capnp/schema.h>
#include <kj/string.h>

namespace contract {
namespace compiler {

// Names of the C++ entities capnpc-c++ generates for a schema. These must agree with
// capnpc-c++ exactly, since the code we emit is compiled against its output.

kj::String safeIdentifier(kj::StringPtr identifier);
// Appends an underscore to C++ keywords. The keyword list is capnpc-c++'s, so that the
// result names the same method capnpc-c++ declared.

kj::String toTitleCase(kj::StringPtr name);
kj::String toUpperCase(kj::StringPtr name);
// "fooBar" -> "FooBar" and "FOO_BAR" respectively.

class CppNames {
public:
  explicit CppNames(const capnp::SchemaLoader& schemaLoader);
  KJ_DISALLOW_COPY_AND_MOVE(CppNames);

  kj::String fullName(capnp::Schema schema);
  // Fully-qualified name of a struct, enum or interface, with a leading space so that it can
  // follow '<' safely, e.g. " ::foo::Bar". Generic types are rejected.

  kj::String paramTypeName(capnp::InterfaceSchema::Method method);
  kj::String resultTypeName(capnp::InterfaceSchema::Method method);

  kj::Maybe<kj::StringPtr> fileNamespace(capnp::Schema file);
  // The file's $Cxx.namespace, if any, e.g. "foo::bar".

  kj::StringPtr protoName(capnp::schema::Field::Reader proto);
  kj::StringPtr protoName(capnp::schema::Method::Reader proto);
  kj::StringPtr protoName(capnp::schema::Enumerant::Reader proto);
  // The name as C++ sees it, which the $Cxx.name annotation may override.

  kj::String accessorSuffix(capnp::StructSchema::Field field);
  // "Foo" for field `foo`, as in getFoo(), setFoo() and initFoo().

  kj::String methodIdentifier(capnp::InterfaceSchema::Method method);
  // The Server's virtual method, e.g. "myMethod".

  kj::String requestMethod(capnp::InterfaceSchema::Method method);
  // The Client's request method, e.g. "myMethodRequest".

  kj::String enumerantLiteral(capnp::EnumSchema schema, uint16_t value);
  // " ::foo::Color::RED", or a static_cast for values the enum does not declare.

private:
  const capnp::SchemaLoader& schemaLoader;

  kj::String scopeName(capnp::schema::Node::Reader node);
};

}  // namespace compiler
}  // namespace contract
