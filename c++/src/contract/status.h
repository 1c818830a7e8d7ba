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

#include <kj/array.h>
#include <kj/common.h>
#include <kj/exception.h>
#include <kj/string.h>

namespace contract {

enum class StatusCode: uint8_t {
  // The standard RPC status codes a contract's failure case may declare. Contracts spell them
  // in UpperCamelCase ("NotFound"); `OK` only marks success entries and is never accepted from
  // a contract.

  OK = 0,
  CANCELED = 1,
  UNKNOWN = 2,
  INVALID_ARGUMENT = 3,
  DEADLINE_EXCEEDED = 4,
  NOT_FOUND = 5,
  ALREADY_EXISTS = 6,
  PERMISSION_DENIED = 7,
  RESOURCE_EXHAUSTED = 8,
  FAILED_PRECONDITION = 9,
  ABORTED = 10,
  OUT_OF_RANGE = 11,
  UNIMPLEMENTED = 12,
  INTERNAL = 13,
  UNAVAILABLE = 14,
  DATA_LOSS = 15,
  UNAUTHENTICATED = 16
};

kj::Maybe<StatusCode> tryParseStatusCode(kj::StringPtr name);
// Looks up a failure code by its contract spelling. The comparison is exact (case-sensitive).
// Returns none for unknown names and for "OK".

kj::StringPtr KJ_STRINGIFY(StatusCode code);
// The contract spelling, e.g. "NotFound".

kj::StringPtr statusIdentifier(StatusCode code);
// The enumerator name, e.g. "NOT_FOUND", for use in generated code.

kj::Exception::Type exceptionType(StatusCode code);
// kj has fewer exception types than there are status codes. Unimplemented maps to
// UNIMPLEMENTED, Unavailable to DISCONNECTED, ResourceExhausted and DeadlineExceeded to
// OVERLOADED, and everything else to FAILED.

struct StatusDetail {
  // Exception detail carrying the status code of a failure. It is serialized as a single byte,
  // so it crosses RPC connections along with the description.

  static constexpr uint64_t EXCEPTION_DETAIL_TYPE_ID = 0xd41b7f2a93c6e058ull;

  StatusCode code;

  kj::Maybe<kj::Array<kj::byte>> trySerializeForKjException() const;
  static kj::Maybe<StatusDetail> tryDeserializeForKjException(kj::ArrayPtr<const kj::byte> data);
};

kj::Exception statusException(StatusCode code, kj::StringPtr message);
// Builds the exception a mock returns for a failure case. The description is exactly
// `message`, so that it survives the RPC layer unchanged, and `code` is attached as a
// StatusDetail.

kj::Maybe<StatusCode> statusCodeOf(const kj::Exception& exception);
// The code attached by statusException(), if any.

kj::StringPtr errorText(const kj::Exception& exception);
// The description of an exception as the contract would spell it: exceptions which crossed
// an RPC connection have the "remote exception: " prefix removed.

bool messageMatches(const kj::Exception& exception, kj::StringPtr message);
// True if the exception's description is `message`, with or without the RPC prefix. The RPC
// layer does not add the prefix to descriptions which already start with it, so a message
// which itself begins with "remote exception: " arrives unchanged.

}  // namespace contract
