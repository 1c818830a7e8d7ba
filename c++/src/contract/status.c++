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

#include "status.h"
#include <kj/debug.h>

namespace contract {

namespace {

struct StatusInfo {
  StatusCode code;
  const char* name;
  const char* identifier;
};

static constexpr StatusInfo STATUS_CODES[] = {
  { StatusCode::OK, "OK", "OK" },
  { StatusCode::CANCELED, "Canceled", "CANCELED" },
  { StatusCode::UNKNOWN, "Unknown", "UNKNOWN" },
  { StatusCode::INVALID_ARGUMENT, "InvalidArgument", "INVALID_ARGUMENT" },
  { StatusCode::DEADLINE_EXCEEDED, "DeadlineExceeded", "DEADLINE_EXCEEDED" },
  { StatusCode::NOT_FOUND, "NotFound", "NOT_FOUND" },
  { StatusCode::ALREADY_EXISTS, "AlreadyExists", "ALREADY_EXISTS" },
  { StatusCode::PERMISSION_DENIED, "PermissionDenied", "PERMISSION_DENIED" },
  { StatusCode::RESOURCE_EXHAUSTED, "ResourceExhausted", "RESOURCE_EXHAUSTED" },
  { StatusCode::FAILED_PRECONDITION, "FailedPrecondition", "FAILED_PRECONDITION" },
  { StatusCode::ABORTED, "Aborted", "ABORTED" },
  { StatusCode::OUT_OF_RANGE, "OutOfRange", "OUT_OF_RANGE" },
  { StatusCode::UNIMPLEMENTED, "Unimplemented", "UNIMPLEMENTED" },
  { StatusCode::INTERNAL, "Internal", "INTERNAL" },
  { StatusCode::UNAVAILABLE, "Unavailable", "UNAVAILABLE" },
  { StatusCode::DATA_LOSS, "DataLoss", "DATA_LOSS" },
  { StatusCode::UNAUTHENTICATED, "Unauthenticated", "UNAUTHENTICATED" },
};

const StatusInfo& infoFor(StatusCode code) {
  uint index = static_cast<uint>(code);
  KJ_REQUIRE(index < kj::size(STATUS_CODES), "unknown status code", index);
  return STATUS_CODES[index];
}

constexpr kj::StringPtr REMOTE_PREFIX = "remote exception: "_kj;

}  // namespace

kj::Maybe<StatusCode> tryParseStatusCode(kj::StringPtr name) {
  for (auto& info: STATUS_CODES) {
    if (info.code != StatusCode::OK && name == info.name) {
      return info.code;
    }
  }
  return kj::none;
}

kj::StringPtr KJ_STRINGIFY(StatusCode code) {
  return infoFor(code).name;
}

kj::StringPtr statusIdentifier(StatusCode code) {
  return infoFor(code).identifier;
}

kj::Exception::Type exceptionType(StatusCode code) {
  switch (code) {
    case StatusCode::UNIMPLEMENTED:
      return kj::Exception::Type::UNIMPLEMENTED;
    case StatusCode::UNAVAILABLE:
      return kj::Exception::Type::DISCONNECTED;
    case StatusCode::RESOURCE_EXHAUSTED:
    case StatusCode::DEADLINE_EXCEEDED:
      return kj::Exception::Type::OVERLOADED;
    default:
      return kj::Exception::Type::FAILED;
  }
}

kj::Maybe<kj::Array<kj::byte>> StatusDetail::trySerializeForKjException() const {
  return kj::heapArray<kj::byte>({ static_cast<kj::byte>(code) });
}

kj::Maybe<StatusDetail> StatusDetail::tryDeserializeForKjException(
    kj::ArrayPtr<const kj::byte> data) {
  if (data.size() != 1 || data[0] == 0 || data[0] >= kj::size(STATUS_CODES)) {
    return kj::none;
  }
  return StatusDetail { static_cast<StatusCode>(data[0]) };
}

kj::Exception statusException(StatusCode code, kj::StringPtr message) {
  KJ_REQUIRE(code != StatusCode::OK, "a failure needs a status code other than OK");
  kj::Exception exception(exceptionType(code), "(contract)", 0, kj::heapString(message));
  exception.setDetail(StatusDetail { code });
  return exception;
}

kj::Maybe<StatusCode> statusCodeOf(const kj::Exception& exception) {
  KJ_IF_SOME(detail, exception.getDetail<StatusDetail>()) {
    return detail.code;
  }
  return kj::none;
}

kj::StringPtr errorText(const kj::Exception& exception) {
  kj::StringPtr description = exception.getDescription();
  if (description.startsWith(REMOTE_PREFIX)) {
    return description.slice(REMOTE_PREFIX.size());
  }
  return description;
}

bool messageMatches(const kj::Exception& exception, kj::StringPtr message) {
  return exception.getDescription() == message || errorText(exception) == message;
}

}  // namespace contract
