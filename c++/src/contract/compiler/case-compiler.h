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

#include "model.h"
#include "resolver.h"
#include <contract/status.h>
#include <kj/one-of.h>

namespace contract {
namespace compiler {

struct ErrorOutcome {
  StatusCode code;
  kj::String message;
};

struct DispatchEntry {
  kj::String description;
  ResolvedMessage request;
  kj::OneOf<ResolvedMessage, ErrorOutcome> outcome;
};

struct MethodDispatch {
  // The ordered match table for one method: every success case in contract order, then every
  // failure case in contract order. The first entry whose request equals the incoming request
  // decides the outcome. When none does, the outcome is an empty response and no error.

  capnp::InterfaceSchema::Method method;

  bool hasContract;
  // False when the contract does not mention the method. `entries` is then empty.

  kj::Array<DispatchEntry> entries;
  size_t successCount;

  kj::Maybe<const DispatchEntry&> match(capnp::DynamicStruct::Reader request) const;
  // Evaluates the table the way the emitted mock does.
};

struct ServiceDispatch {
  capnp::InterfaceSchema interface;
  kj::Array<MethodDispatch> methods;
  // One per method of allMethods(interface), in the same order.
};

kj::Array<capnp::InterfaceSchema::Method> allMethods(capnp::InterfaceSchema interface);
// The interface's own methods in ordinal order, followed by those it inherits through
// `extends`, depth-first. An interface reached by more than one path contributes once.

StatusCode validateErrorCode(kj::StringPtr code);
// Throws "invalid error code" unless `code` is one of the standard status codes.

class CaseCompiler {
public:
  explicit CaseCompiler(ValueResolver& resolver);
  KJ_DISALLOW_COPY_AND_MOVE(CaseCompiler);

  MethodDispatch compile(capnp::InterfaceSchema::Method method,
                         kj::Maybe<const MethodContract&> contract);

  ServiceDispatch compileService(capnp::InterfaceSchema interface,
                                 const ServiceContract& contract);
  // Covers inherited methods too. Contract methods the interface neither declares nor
  // inherits are logged and skipped.

private:
  ValueResolver& resolver;
};

}  // namespace compiler
}  // namespace contract
