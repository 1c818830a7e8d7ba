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

#include "case-compiler.h"
#include "cpp-names.h"
#include <kj/string-tree.h>

namespace contract {
namespace compiler {

struct Indent {
  // Iterable run of spaces, so that it can be stringified into a StringTree.

  uint amount;
  Indent() = default;
  inline Indent(int amount): amount(amount) {}

  Indent next() const {
    return Indent(amount + 2);
  }

  struct Iterator {
    uint i;
    Iterator() = default;
    inline Iterator(uint i): i(i) {}
    inline char operator*() const { return ' '; }
    inline Iterator& operator++() { ++i; return *this; }
    inline Iterator operator++(int) { Iterator result = *this; ++i; return result; }
    inline bool operator==(const Iterator& other) const { return i == other.i; }
    inline bool operator!=(const Iterator& other) const { return i != other.i; }
  };

  inline size_t size() const { return amount; }

  inline Iterator begin() const { return Iterator(0); }
  inline Iterator end() const { return Iterator(amount); }
};

inline Indent KJ_STRINGIFY(const Indent& indent) {
  return indent;
}

class MessageRenderer {
  // Renders a resolved message as C++ statements that fill in a builder of its type.

public:
  explicit MessageRenderer(CppNames& names);

  kj::StringTree render(const ResolvedMessage& message, kj::StringPtr builder, Indent indent);

  kj::String literal(capnp::Type type, capnp::DynamicValue::Reader value);
  // A C++ expression for a scalar or enum value.

private:
  CppNames& names;

  kj::StringTree renderFields(const ResolvedMessage& message, kj::StringPtr builder,
                              Indent indent, uint depth);
  kj::StringTree renderField(const ResolvedField& field, kj::StringPtr builder,
                             Indent indent, uint depth);
  kj::StringTree renderElements(const ResolvedValue& list, kj::StringPtr builder,
                                Indent indent, uint depth);
};

kj::String cppStringLiteral(kj::ArrayPtr<const char> text);
// Quotes `text` as a C++ string literal.

kj::String commentText(kj::StringPtr text);
// `text` on a single line, suitable for a // comment. A trailing backslash is followed by a
// '.' so that it cannot continue the comment onto the next line.

class TableEmitter {
  // Emits `struct <Interface>Contract`, holding one dispatch table per method.

public:
  TableEmitter(CppNames& names, kj::StringPtr contractName);

  kj::StringTree emit(const ServiceDispatch& service);

private:
  CppNames& names;
  kj::StringPtr contractName;
  MessageRenderer renderer;

  kj::StringTree emitRow(const MethodDispatch& method, const DispatchEntry& entry);
};

class MockEmitter {
  // Emits `class <Interface>ContractMock`, a Server answering from the dispatch tables, and
  // `newMock<Interface>Client()`.

public:
  MockEmitter(CppNames& names, kj::StringPtr contractName);

  kj::StringTree emit(const ServiceDispatch& service);

private:
  CppNames& names;
  kj::StringPtr contractName;
};

class HarnessEmitter {
  // Emits `run<Interface>ContractCases()` and `run<Interface>ContractTest()`, which check a
  // real server against the dispatch tables of every method the contract covers.

public:
  HarnessEmitter(CppNames& names, kj::StringPtr contractName);

  kj::StringTree emit(const ServiceDispatch& service);

private:
  CppNames& names;
  kj::StringPtr contractName;
};

class UnitEmitter {
  // Emits the whole `<file>.contract.h` for one schema file.

public:
  UnitEmitter(CppNames& names, kj::StringPtr contractName);

  kj::StringTree emit(capnp::Schema file, kj::ArrayPtr<const ServiceDispatch> services);

private:
  CppNames& names;
  kj::StringPtr contractName;
  TableEmitter tables;
  MockEmitter mocks;
  HarnessEmitter harnesses;
};

}  // namespace compiler
}  // namespace contract
