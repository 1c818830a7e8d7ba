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

#include "generator.h"
#include "case-compiler.h"
#include "cpp-names.h"
#include "emitter.h"
#include "resolver.h"
#include <capnp/schema-loader.h>
#include <kj/debug.h>
#include <kj/map.h>
#include <kj/vector.h>
#include <utility>

namespace contract {
namespace compiler {

namespace {

void collectInterfaces(capnp::SchemaLoader& schemaLoader, capnp::Schema scope,
                       kj::Vector<std::pair<kj::StringPtr, capnp::InterfaceSchema>>& out) {
  for (auto nested: scope.getProto().getNestedNodes()) {
    auto schema = schemaLoader.get(nested.getId());
    auto proto = schema.getProto();
    if (proto.isInterface()) {
      out.add(nested.getName(), schema.asInterface());
    }
    if (proto.isStruct() || proto.isInterface()) {
      collectInterfaces(schemaLoader, schema, out);
    }
  }
}

kj::Path unitPath(kj::StringPtr path) {
  // Display names are normally relative already; an absolute one is placed under the output
  // directory all the same.
  while (path.startsWith("/")) {
    path = path.slice(1);
  }
  return kj::Path::parse(path);
}

}  // namespace

void checkCompilerVersion(capnp::schema::CodeGeneratorRequest::Reader request) {
  auto capnpVersion = request.getCapnpVersion();

  if (capnpVersion.getMajor() != CAPNP_VERSION_MAJOR ||
      capnpVersion.getMinor() != CAPNP_VERSION_MINOR ||
      capnpVersion.getMicro() != CAPNP_VERSION_MICRO) {
    auto compilerVersion = request.hasCapnpVersion()
        ? kj::str(capnpVersion.getMajor(), '.', capnpVersion.getMinor(), '.',
                  capnpVersion.getMicro())
        : kj::str("pre-0.6");  // pre-0.6 didn't send the version.
    auto generatorVersion = kj::str(
        CAPNP_VERSION_MAJOR, '.', CAPNP_VERSION_MINOR, '.', CAPNP_VERSION_MICRO);

    KJ_LOG(WARNING,
        "You appear to be using different versions of 'capnp' (the compiler) and the "
        "library 'capnpc-contract' was built against. The generated code may not compile "
        "against the headers 'capnpc-c++' produces.",
        compilerVersion, generatorVersion);
  }
}

kj::Array<GeneratedUnit> renderUnits(capnp::schema::CodeGeneratorRequest::Reader request,
                                     const Contract& contract) {
  capnp::SchemaLoader schemaLoader;
  for (auto node: request.getNodes()) {
    schemaLoader.load(node);
  }

  ValueResolver resolver;
  CaseCompiler compiler(resolver);
  CppNames names(schemaLoader);
  UnitEmitter emitter(names, contract.name);

  kj::Vector<GeneratedUnit> units;
  kj::HashSet<kj::StringPtr> matchedServices;

  for (auto requestedFile: request.getRequestedFiles()) {
    auto file = schemaLoader.get(requestedFile.getId());
    KJ_CONTEXT("schema file", file.getProto().getDisplayName());

    kj::Vector<std::pair<kj::StringPtr, capnp::InterfaceSchema>> interfaces;
    collectInterfaces(schemaLoader, file, interfaces);

    kj::Vector<ServiceDispatch> services;
    for (auto& interface: interfaces) {
      KJ_IF_SOME(serviceContract, contract.findService(interface.first)) {
        if (!matchedServices.contains(interface.first)) {
          matchedServices.insert(interface.first);
        }
        services.add(compiler.compileService(interface.second, serviceContract));
      }
    }

    if (services.size() == 0) continue;

    units.add(GeneratedUnit {
      kj::str(file.getProto().getDisplayName(), ".contract.h"),
      emitter.emit(file, services.asPtr()).flatten()
    });
  }

  for (auto& entry: contract.services) {
    if (!matchedServices.contains(entry.key)) {
      KJ_LOG(WARNING, "contract names a service no requested file declares; ignoring it",
             entry.key);
    }
  }

  return units.releaseAsArray();
}

void writeUnits(const kj::Directory& outputDir, kj::ArrayPtr<const GeneratedUnit> units) {
  for (auto& unit: units) {
    auto path = unitPath(unit.path);
    auto replacer = outputDir.replaceFile(path,
        kj::WriteMode::CREATE | kj::WriteMode::MODIFY | kj::WriteMode::CREATE_PARENT);
    replacer->get().writeAll(unit.text);
    replacer->commit();
    KJ_LOG(INFO, "wrote contract unit", path.toString());
  }
}

void generate(capnp::schema::CodeGeneratorRequest::Reader request, const Contract& contract,
              const kj::Directory& outputDir) {
  checkCompilerVersion(request);
  auto units = renderUnits(request, contract);
  writeUnits(outputDir, units);
}

}  // namespace compiler
}  // namespace contract
