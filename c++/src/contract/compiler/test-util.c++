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

#include "test-util.h"
#include <kj/debug.h>
#include <fcntl.h>

#ifndef CONTRACT_TEST_REQUEST
#error "CONTRACT_TEST_REQUEST must name the CodeGeneratorRequest for contract/test.capnp"
#endif

namespace contract {
namespace compiler {

namespace {

kj::AutoCloseFd openRequest() {
  int result;
  KJ_SYSCALL(result = open(CONTRACT_TEST_REQUEST, O_RDONLY), CONTRACT_TEST_REQUEST);
  return kj::AutoCloseFd(result);
}

capnp::ReaderOptions requestOptions() {
  capnp::ReaderOptions result;
  result.traversalLimitInWords = 1 << 30;
  return result;
}

}  // namespace

TestRequest::TestRequest(): fd(openRequest()), reader(fd.get(), requestOptions()) {
  auto request = getRequest();
  for (auto node: request.getNodes()) {
    loader.load(node);
  }
  auto requestedFiles = request.getRequestedFiles();
  KJ_ASSERT(requestedFiles.size() == 1);
  fileId = requestedFiles[0].getId();
}

capnp::schema::CodeGeneratorRequest::Reader TestRequest::getRequest() {
  return reader.getRoot<capnp::schema::CodeGeneratorRequest>();
}

capnp::Schema TestRequest::file() {
  return loader.get(fileId);
}

capnp::Schema TestRequest::nested(kj::StringPtr name) {
  for (auto node: file().getProto().getNestedNodes()) {
    if (node.getName() == name) {
      return loader.get(node.getId());
    }
  }
  KJ_FAIL_ASSERT("no such node", name);
}

bool contains(kj::StringPtr haystack, kj::StringPtr needle) {
  if (needle.size() > haystack.size()) return false;
  for (size_t i = 0; i + needle.size() <= haystack.size(); i++) {
    if (haystack.slice(i).startsWith(needle)) return true;
  }
  return false;
}

}  // namespace compiler
}  // namespace contract
