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

#include "case-compiler.h"
#include <capnp/any.h>
#include <kj/debug.h>
#include <kj/map.h>
#include <kj/vector.h>

namespace contract {
namespace compiler {

kj::Maybe<const DispatchEntry&> MethodDispatch::match(
    capnp::DynamicStruct::Reader request) const {
  auto actual = request.as<capnp::AnyStruct>();
  for (auto& entry: entries) {
    if (entry.request.value.as<capnp::AnyStruct>() == actual) {
      return entry;
    }
  }
  return kj::none;
}

StatusCode validateErrorCode(kj::StringPtr code) {
  KJ_IF_SOME(result, tryParseStatusCode(code)) {
    return result;
  } else {
    KJ_FAIL_REQUIRE("invalid error code", code);
  }
}

CaseCompiler::CaseCompiler(ValueResolver& resolver): resolver(resolver) {}

MethodDispatch CaseCompiler::compile(capnp::InterfaceSchema::Method method,
                                     kj::Maybe<const MethodContract&> contract) {
  auto name = method.getProto().getName();
  auto paramType = method.getParamType();
  auto resultType = method.getResultType();

  KJ_IF_SOME(methodContract, contract) {
    // Codes are checked before any request is resolved, so that a bad code is reported even
    // when the request is bad too.
    for (auto& failureCase: methodContract.failureCases) {
      KJ_CONTEXT("failure case", name, failureCase.description);
      validateErrorCode(failureCase.error.code);
    }

    kj::Vector<DispatchEntry> entries(
        methodContract.successCases.size() + methodContract.failureCases.size());

    for (auto& successCase: methodContract.successCases) {
      KJ_CONTEXT("success case", name, successCase.description);
      auto request = resolver.resolve(successCase.request, paramType);
      auto response = resolver.resolve(successCase.response, resultType);
      entries.add(DispatchEntry {
        kj::heapString(successCase.description), kj::mv(request), kj::mv(response)
      });
    }

    for (auto& failureCase: methodContract.failureCases) {
      KJ_CONTEXT("failure case", name, failureCase.description);
      auto code = validateErrorCode(failureCase.error.code);
      auto request = resolver.resolve(failureCase.request, paramType);
      entries.add(DispatchEntry {
        kj::heapString(failureCase.description), kj::mv(request),
        ErrorOutcome { code, kj::heapString(failureCase.error.message) }
      });
    }

    return MethodDispatch {
      method, true, entries.releaseAsArray(), methodContract.successCases.size()
    };
  } else {
    return MethodDispatch { method, false, nullptr, 0 };
  }
}

ServiceDispatch CaseCompiler::compileService(capnp::InterfaceSchema interface,
                                             const ServiceContract& contract) {
  auto serviceName = interface.getShortDisplayName();
  KJ_CONTEXT("service", serviceName);

  auto methods = allMethods(interface);

  for (auto& entry: contract.methods) {
    bool found = false;
    for (auto method: methods) {
      KJ_IF_SOME(declared, contract.findMethod(method.getProto().getName())) {
        if (&declared == &entry.value) {
          found = true;
          break;
        }
      }
    }
    if (!found) {
      KJ_LOG(WARNING, "contract names a method the interface does not declare; ignoring it",
             serviceName, entry.key);
    }
  }

  auto dispatch = KJ_MAP(method, methods) {
    return compile(method, contract.findMethod(method.getProto().getName()));
  };
  return ServiceDispatch { interface, kj::mv(dispatch) };
}

kj::Array<capnp::InterfaceSchema::Method> allMethods(capnp::InterfaceSchema interface) {
  kj::Vector<capnp::InterfaceSchema::Method> result;
  kj::HashSet<uint64_t> seen;

  // Depth-first through `extends`, visiting each interface once even when it is reachable by
  // more than one path.
  kj::Vector<capnp::InterfaceSchema> stack;
  stack.add(interface);
  while (stack.size() > 0) {
    auto current = stack.back();
    stack.removeLast();
    if (seen.contains(current.getProto().getId())) continue;
    seen.insert(current.getProto().getId());

    for (auto method: current.getMethods()) {
      result.add(method);
    }

    auto superclasses = current.getSuperclasses();
    for (uint i = superclasses.size(); i > 0; i--) {
      stack.add(superclasses[i - 1]);
    }
  }

  return result.releaseAsArray();
}

}  // namespace compiler
}  // namespace contract
