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

#include "plugin.h"
#include "generator.h"
#include <capnp/serialize.h>
#include <kj/debug.h>
#include <kj/filesystem.h>
#include <kj/vector.h>
#include <unistd.h>

#ifndef CONTRACT_VERSION
#define CONTRACT_VERSION "(unknown)"
#endif

namespace contract {
namespace compiler {

kj::String describeError(const kj::Exception& exception) {
  kj::Vector<kj::String> lines;
  KJ_IF_SOME(head, exception.getContext()) {
    const kj::Exception::Context* context = &head;
    for (;;) {
      lines.add(kj::str("  while processing ", context->description, "\n"));
      KJ_IF_SOME(next, context->next) {
        context = next.get();
      } else {
        break;
      }
    }
  }
  return kj::str(exception.getDescription(), "\n", kj::strArray(lines, ""));
}

CapnpcContractMain::CapnpcContractMain(kj::ProcessContext& context): context(context) {}

kj::MainFunc CapnpcContractMain::getMain() {
  return kj::MainBuilder(context, "Cap'n Proto contract plugin version " CONTRACT_VERSION,
        "This is a Cap'n Proto compiler plugin which generates, from a JSON contract, a "
        "mock client and a conformance test harness for the schema's interfaces. "
        "Feed it the compiler's request on standard input, e.g.:\n"
        "    capnp compile -o- foo.capnp | capnpc-contract --contract-file=foo.json")
      .addOptionWithArg({"contract-file"}, KJ_BIND_METHOD(*this, setContractFile),
          "<path>", "Read the contract from <path>. Required.")
      .addOptionWithArg({'o', "output-dir"}, KJ_BIND_METHOD(*this, setOutputDir),
          "<dir>", "Write generated files under <dir> instead of the current directory.")
      .callAfterParsing(KJ_BIND_METHOD(*this, run))
      .build();
}

kj::MainBuilder::Validity CapnpcContractMain::setContractFile(kj::StringPtr path) {
  contractFile = path;
  return true;
}

kj::MainBuilder::Validity CapnpcContractMain::setOutputDir(kj::StringPtr path) {
  outputDir = path;
  return true;
}

kj::MainBuilder::Validity CapnpcContractMain::run() {
  kj::StringPtr contractPath;
  KJ_IF_SOME(path, contractFile) {
    contractPath = path;
  } else {
    return "missing option: '--contract-file' option not provided";
  }

  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
    generateFromStdin(contractPath);
  })) {
    context.exitError(kj::str("error: ", describeError(exception)));
  }

  return true;
}

void CapnpcContractMain::generateFromStdin(kj::StringPtr contractPath) {
  // The contract is loaded first, so that a bad path is reported without waiting on stdin.
  auto filesystem = kj::newDiskFilesystem();
  auto contract = loadContract(*filesystem, contractPath);

  capnp::ReaderOptions options;
  options.traversalLimitInWords = 1 << 30;  // Don't limit.
  capnp::StreamFdMessageReader reader(STDIN_FILENO, options);
  auto request = reader.getRoot<capnp::schema::CodeGeneratorRequest>();

  auto outputPath = filesystem->getCurrentPath().evalNative(outputDir);
  auto output = filesystem->getRoot().openSubdir(outputPath,
      kj::WriteMode::CREATE | kj::WriteMode::MODIFY | kj::WriteMode::CREATE_PARENT);
  generate(request, contract, *output);
}

}  // namespace compiler
}  // namespace contract
