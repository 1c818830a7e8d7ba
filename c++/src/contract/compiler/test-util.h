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

#include <capnp/schema.capnp.h>
#include <capnp/schema-loader.h>
#include <capnp/serialize.h>
#include <kj/io.h>

namespace contract {
namespace compiler {

class TestRequest {
  // Loads the CodeGeneratorRequest that `capnp compile -o-` wrote for contract/test.capnp at
  // build time. Compiled-in schemas leave out file nodes, which carry the $Cxx.namespace.

public:
  TestRequest();

  capnp::schema::CodeGeneratorRequest::Reader getRequest();

  capnp::Schema file();
  // The one requested file, contract/test.capnp.

  capnp::Schema nested(kj::StringPtr name);
  // A top-level declaration of test.capnp.

  capnp::SchemaLoader loader;

private:
  kj::AutoCloseFd fd;
  capnp::StreamFdMessageReader reader;
  uint64_t fileId;
};

bool contains(kj::StringPtr haystack, kj::StringPtr needle);

}  // namespace compiler
}  // namespace contract
