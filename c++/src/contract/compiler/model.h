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
#include <capnp/message.h>
#include <kj/filesystem.h>
#include <kj/map.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace contract {
namespace compiler {

// The contract document, as authored. Nothing here knows about schemas: request and response
// bodies stay raw JSON until the resolver checks them against a struct type.

struct ErrorSpec {
  kj::String code;
  kj::String message;
};

struct SuccessCase {
  kj::String description;
  capnp::JsonValue::Reader request;
  capnp::JsonValue::Reader response;
};

struct FailureCase {
  kj::String description;
  capnp::JsonValue::Reader request;
  ErrorSpec error;
};

struct MethodContract {
  kj::Vector<SuccessCase> successCases;
  kj::Vector<FailureCase> failureCases;
};

struct ServiceContract {
  kj::HashMap<kj::String, MethodContract> methods;
  // Keyed by the method name as the contract spells it.

  kj::Maybe<const MethodContract&> findMethod(kj::StringPtr name) const;
  // Finds a method by its schema name ("myMethod") or by its exported spelling ("MyMethod").
};

struct Contract {
  kj::String name;
  kj::HashMap<kj::String, ServiceContract> services;

  kj::Own<capnp::MallocMessageBuilder> document;
  // Backs every JsonValue::Reader above.

  kj::Maybe<const ServiceContract&> findService(kj::StringPtr name) const;
};

Contract parseContract(kj::ArrayPtr<const char> text);
// Parses a contract document. Throws "malformed contract" if `text` is not JSON or is not
// shaped like a contract.

Contract loadContract(const kj::Filesystem& filesystem, kj::StringPtr path);
// Reads and parses the contract at `path`, which is interpreted relative to the current
// directory.

}  // namespace compiler
}  // namespace contract
