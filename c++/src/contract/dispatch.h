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

#include "status.h"
#include <capnp/any.h>
#include <capnp/capability.h>
#include <capnp/message.h>

namespace contract {

template <typename Params, typename Results>
struct DispatchCase {
  // One row of a method's dispatch table, as emitted by capnpc-contract. Rows are kept in
  // contract order: success cases first, then failure cases.

  kj::StringPtr description;

  void (*initRequest)(typename Params::Builder request);
  // Fills in the request this row matches.

  void (*initResponse)(typename Results::Builder response);
  // Fills in the response of a success row. Null for failure rows.

  StatusCode code;
  kj::StringPtr message;
  // The error of a failure row. `code` is OK for success rows.

  bool isFailure() const { return initResponse == nullptr; }
};

template <typename Params>
bool requestMatches(typename Params::Reader request,
                    void (*initRequest)(typename Params::Builder)) {
  // Structural equality between `request` and the message `initRequest` builds.

  capnp::MallocMessageBuilder expected;
  auto root = expected.initRoot<Params>();
  initRequest(root);
  return capnp::AnyStruct::Reader(request) == capnp::AnyStruct::Reader(root.asReader());
}

template <typename Params, typename Results>
kj::Maybe<const DispatchCase<Params, Results>&> findCase(
    kj::ArrayPtr<const DispatchCase<Params, Results>> table,
    typename Params::Reader request) {
  // First match wins.

  for (auto& row: table) {
    if (requestMatches<Params>(request, row.initRequest)) {
      return row;
    }
  }
  return kj::none;
}

template <typename Params, typename Results>
kj::Promise<void> dispatchCall(kj::ArrayPtr<const DispatchCase<Params, Results>> table,
                               capnp::CallContext<Params, Results> context) {
  // Answers a call from `table`. A request that matches no row gets an empty response and no
  // error.

  KJ_IF_SOME(row, findCase(table, context.getParams())) {
    if (row.isFailure()) {
      return statusException(row.code, row.message);
    }
    row.initResponse(context.getResults());
  }
  return kj::READY_NOW;
}

}  // namespace contract
