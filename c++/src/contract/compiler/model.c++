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

#include "model.h"
#include <kj/debug.h>

namespace contract {
namespace compiler {

namespace {

kj::String exportedName(kj::StringPtr name) {
  // "myMethod" -> "MyMethod"
  auto result = kj::heapString(name);
  if (result.size() > 0 && 'a' <= result[0] && result[0] <= 'z') {
    result[0] = result[0] - 'a' + 'A';
  }
  return result;
}

capnp::List<capnp::JsonValue::Field>::Reader expectObject(
    capnp::JsonValue::Reader value, kj::StringPtr path) {
  KJ_REQUIRE(value.isObject(), "malformed contract: expected a JSON object", path);
  return value.getObject();
}

capnp::List<capnp::JsonValue>::Reader expectArray(
    capnp::JsonValue::Reader value, kj::StringPtr path) {
  KJ_REQUIRE(value.isArray(), "malformed contract: expected a JSON array", path);
  return value.getArray();
}

kj::String expectString(capnp::JsonValue::Reader value, kj::StringPtr path) {
  KJ_REQUIRE(value.isString(), "malformed contract: expected a JSON string", path);
  return kj::heapString(value.getString());
}

kj::Maybe<capnp::JsonValue::Reader> findMember(
    capnp::List<capnp::JsonValue::Field>::Reader object, kj::StringPtr name) {
  // The last occurrence wins, as with every other duplicate key.
  kj::Maybe<capnp::JsonValue::Reader> result;
  for (auto member: object) {
    if (member.getName() == name) {
      result = member.getValue();
    }
  }
  return result;
}

capnp::JsonValue::Reader requireMember(
    capnp::List<capnp::JsonValue::Field>::Reader object, kj::StringPtr name,
    kj::StringPtr path) {
  KJ_IF_SOME(value, findMember(object, name)) {
    return value;
  } else {
    KJ_FAIL_REQUIRE("malformed contract: missing member", name, path);
  }
}

kj::String optionalString(
    capnp::List<capnp::JsonValue::Field>::Reader object, kj::StringPtr name,
    kj::StringPtr path) {
  KJ_IF_SOME(value, findMember(object, name)) {
    return expectString(value, kj::str(path, '.', name));
  } else {
    return kj::str();
  }
}

kj::Maybe<capnp::List<capnp::JsonValue>::Reader> optionalArray(
    capnp::List<capnp::JsonValue::Field>::Reader object, kj::StringPtr name,
    kj::StringPtr path) {
  KJ_IF_SOME(value, findMember(object, name)) {
    return expectArray(value, kj::str(path, '.', name));
  } else {
    return kj::none;
  }
}

MethodContract parseMethod(capnp::JsonValue::Reader value, kj::StringPtr path) {
  auto object = expectObject(value, path);
  MethodContract result;

  KJ_IF_SOME(cases, optionalArray(object, "successCases", path)) {
    for (auto i: kj::indices(cases)) {
      auto casePath = kj::str(path, ".successCases[", i, ']');
      auto item = expectObject(cases[i], casePath);
      result.successCases.add(SuccessCase {
        optionalString(item, "description", casePath),
        requireMember(item, "request", casePath),
        requireMember(item, "response", casePath)
      });
    }
  }

  KJ_IF_SOME(cases, optionalArray(object, "failureCases", path)) {
    for (auto i: kj::indices(cases)) {
      auto casePath = kj::str(path, ".failureCases[", i, ']');
      auto item = expectObject(cases[i], casePath);
      auto errorPath = kj::str(casePath, ".error");
      auto error = expectObject(requireMember(item, "error", casePath), errorPath);
      result.failureCases.add(FailureCase {
        optionalString(item, "description", casePath),
        requireMember(item, "request", casePath),
        ErrorSpec {
          expectString(requireMember(error, "code", errorPath), kj::str(errorPath, ".code")),
          expectString(requireMember(error, "message", errorPath),
                       kj::str(errorPath, ".message"))
        }
      });
    }
  }

  return result;
}

ServiceContract parseService(capnp::JsonValue::Reader value, kj::StringPtr path) {
  ServiceContract result;
  for (auto member: expectObject(value, path)) {
    auto name = member.getName();
    auto methodPath = kj::str(path, '.', name);
    auto method = parseMethod(member.getValue(), methodPath);
    result.methods.upsert(kj::heapString(name), kj::mv(method),
        [](MethodContract& existing, MethodContract&& replacement) {
      existing = kj::mv(replacement);
    });
  }
  return result;
}

}  // namespace

kj::Maybe<const MethodContract&> ServiceContract::findMethod(kj::StringPtr name) const {
  KJ_IF_SOME(method, methods.find(name)) {
    return method;
  }
  return methods.find(exportedName(name));
}

kj::Maybe<const ServiceContract&> Contract::findService(kj::StringPtr name) const {
  return services.find(name);
}

Contract parseContract(kj::ArrayPtr<const char> text) {
  auto document = kj::heap<capnp::MallocMessageBuilder>();
  auto root = document->initRoot<capnp::JsonValue>();

  capnp::JsonCodec codec;
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
    codec.decodeRaw(text, root);
  })) {
    KJ_FAIL_REQUIRE("malformed contract: document is not valid JSON",
                    exception.getDescription());
  }

  Contract result;
  auto object = expectObject(root.asReader(), "(document)");
  result.name = optionalString(object, "name", "(document)");

  KJ_IF_SOME(services, findMember(object, "services")) {
    for (auto member: expectObject(services, "services")) {
      auto name = member.getName();
      auto service = parseService(member.getValue(), kj::str("services.", name));
      result.services.upsert(kj::heapString(name), kj::mv(service),
          [](ServiceContract& existing, ServiceContract&& replacement) {
        existing = kj::mv(replacement);
      });
    }
  }

  result.document = kj::mv(document);
  return result;
}

Contract loadContract(const kj::Filesystem& filesystem, kj::StringPtr path) {
  auto absolute = filesystem.getCurrentPath().evalNative(path);
  KJ_IF_SOME(file, filesystem.getRoot().tryOpenFile(absolute)) {
    KJ_CONTEXT("reading contract", path);
    return parseContract(file->readAllText());
  } else {
    KJ_FAIL_REQUIRE("malformed contract: contract file not found", path);
  }
}

}  // namespace compiler
}  // namespace contract
