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

#include "harness.h"
#include <string.h>

namespace contract {

capnp::ReaderOptions loopbackReaderOptions() {
  capnp::ReaderOptions options;
  options.traversalLimitInWords = LOOPBACK_BUFFER_SIZE / sizeof(capnp::word);
  return options;
}

LoopbackServer::LoopbackServer(kj::AsyncIoProvider& provider,
                               kj::Function<capnp::Capability::Client()> serverFactory)
    : serverFactory(kj::mv(serverFactory)),
      serverThread(provider.newPipeThread(
          [this](kj::AsyncIoProvider&, kj::AsyncIoStream& stream,
                 kj::WaitScope& waitScope) {
        capnp::TwoPartyVatNetwork serverNetwork(
            stream, capnp::rpc::twoparty::Side::SERVER, loopbackReaderOptions());
        auto server = capnp::makeRpcServer(serverNetwork, this->serverFactory());
        serverNetwork.onDisconnect().wait(waitScope);
      })),
      network(*serverThread.pipe, capnp::rpc::twoparty::Side::CLIENT, loopbackReaderOptions()),
      rpcSystem(capnp::makeRpcClient(network)) {}

LoopbackServer::~LoopbackServer() noexcept(false) {}

capnp::Capability::Client LoopbackServer::bootstrap() {
  capnp::word scratch[4];
  memset(&scratch, 0, sizeof(scratch));
  capnp::MallocMessageBuilder message(scratch);
  auto vatId = message.getRoot<capnp::rpc::twoparty::VatId>();
  vatId.setSide(capnp::rpc::twoparty::Side::SERVER);
  return rpcSystem.bootstrap(vatId);
}

}  // namespace contract
