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
#include <capnp/schema.capnp.h>
#include <kj/filesystem.h>

namespace contract {
namespace compiler {

struct GeneratedUnit {
  kj::String path;
  // Relative to the output directory, e.g. "foo/bar.capnp.contract.h".

  kj::String text;
};

void checkCompilerVersion(capnp::schema::CodeGeneratorRequest::Reader request);
// Logs a warning if the request came from a capnp compiler other than the version this
// plugin was built against.

kj::Array<GeneratedUnit> renderUnits(capnp::schema::CodeGeneratorRequest::Reader request,
                                     const Contract& contract);
// One unit per requested file that declares at least one interface named by the contract.
// Throws on the first error. Contract services that no requested file declares are logged.

void writeUnits(const kj::Directory& outputDir, kj::ArrayPtr<const GeneratedUnit> units);

void generate(capnp::schema::CodeGeneratorRequest::Reader request, const Contract& contract,
              const kj::Directory& outputDir);
// Renders every unit before writing any, so an error leaves `outputDir` untouched.

}  // namespace compiler
}  // namespace contract
