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

#include <kj/main.h>

namespace contract {
namespace compiler {

kj::String describeError(const kj::Exception& exception);
// The description plus the context chain naming the service, method and case. File and line
// are left out; they point into this program, not into the contract.

class CapnpcContractMain {
  // The capnpc-contract command line. Reads a CodeGeneratorRequest from standard input and
  // writes one `<file>.contract.h` per requested file with contracted interfaces.

public:
  explicit CapnpcContractMain(kj::ProcessContext& context);

  kj::MainFunc getMain();

private:
  kj::ProcessContext& context;
  kj::Maybe<kj::StringPtr> contractFile;
  kj::StringPtr outputDir = ".";

  kj::MainBuilder::Validity setContractFile(kj::StringPtr path);
  kj::MainBuilder::Validity setOutputDir(kj::StringPtr path);
  kj::MainBuilder::Validity run();

  void generateFromStdin(kj::StringPtr contractPath);
};

}  // namespace compiler
}  // namespace contract
