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

#include "dispatch.h"
#include <capnp/rpc-twoparty.h>
#include <kj/async-io.h>
#include <kj/function.h>
#include <kj/test.h>

namespace contract {

constexpr size_t LOOPBACK_BUFFER_SIZE = 1 << 20;
// Largest message, in bytes, the loopback transport accepts in either direction.

capnp::ReaderOptions loopbackReaderOptions();

class LoopbackServer {
  // Runs a server on its own thread, connected to this thread through a socket pair carrying
  // two-party RPC. Destroying the LoopbackServer disconnects the client and joins the thread,
  // whichever way the caller leaves its scope.

public:
  LoopbackServer(kj::AsyncIoProvider& provider,
                 kj::Function<capnp::Capability::Client()> serverFactory);
  // `serverFactory` is called once, on the server thread, to produce the bootstrap capability.

  KJ_DISALLOW_COPY_AND_MOVE(LoopbackServer);
  ~LoopbackServer() noexcept(false);

  capnp::Capability::Client bootstrap();

  template <typename T>
  typename T::Client getClient() { return bootstrap().castAs<T>(); }

private:
  kj::Function<capnp::Capability::Client()> serverFactory;
  kj::AsyncIoProvider::PipeThread serverThread;
  capnp::TwoPartyVatNetwork network;
  capnp::RpcSystem<capnp::rpc::twoparty::VatId> rpcSystem;
};

template <typename Params, typename Results, typename NewRequest>
void exerciseMethod(kj::StringPtr methodName,
                    kj::ArrayPtr<const DispatchCase<Params, Results>> table,
                    NewRequest&& newRequest, kj::WaitScope& waitScope) {
  // Sends every row of `table` through requests made by `newRequest()` and checks the replies.
  // Each mismatch is reported with KJ_FAIL_EXPECT and the remaining rows still run.

  for (auto& row: table) {
    KJ_CONTEXT(methodName, row.description);

    auto request = newRequest();
    row.initRequest(request);

    if (!row.isFailure()) {
      capnp::MallocMessageBuilder expectedMessage;
      auto expected = expectedMessage.initRoot<Results>();
      row.initResponse(expected);

      kj::Maybe<capnp::Response<Results>> response;
      KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
        response = request.send().wait(waitScope);
      })) {
        KJ_FAIL_EXPECT("unexpected error", methodName, row.description, exception);
      } else {
        typename Results::Reader actual = KJ_ASSERT_NONNULL(response);
        KJ_EXPECT(capnp::AnyStruct::Reader(actual) ==
                  capnp::AnyStruct::Reader(expected.asReader()),
            "response does not match contract", methodName, row.description,
            expected.asReader(), actual);
      }
    } else {
      KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
        request.send().wait(waitScope);
      })) {
        KJ_EXPECT(messageMatches(exception, row.message), "error text does not match contract",
            methodName, row.description, row.message, errorText(exception));

        // Servers that do not use statusException() are held to the exception type only.
        KJ_IF_SOME(code, statusCodeOf(exception)) {
          KJ_EXPECT(code == row.code, "error code does not match contract",
              methodName, row.description, row.code, code);
        } else {
          KJ_EXPECT(exception.getType() == exceptionType(row.code),
              "error type does not match contract",
              methodName, row.description, row.code, exception.getType());
        }
      } else {
        KJ_FAIL_EXPECT("an error was expected but none was returned",
            methodName, row.description, row.code, row.message);
      }
    }
  }
}

}  // namespace contract
