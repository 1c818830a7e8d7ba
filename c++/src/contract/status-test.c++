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
#include <kj/test.h>

namespace contract {
namespace {

KJ_TEST("status codes parse by their contract spelling") {
  KJ_EXPECT(KJ_ASSERT_NONNULL(tryParseStatusCode("NotFound")) == StatusCode::NOT_FOUND);
  KJ_EXPECT(KJ_ASSERT_NONNULL(tryParseStatusCode("Canceled")) == StatusCode::CANCELED);
  KJ_EXPECT(KJ_ASSERT_NONNULL(tryParseStatusCode("Unauthenticated")) ==
            StatusCode::UNAUTHENTICATED);

  KJ_EXPECT(tryParseStatusCode("NotARealCode") == kj::none);
  KJ_EXPECT(tryParseStatusCode("notFound") == kj::none);
  KJ_EXPECT(tryParseStatusCode("NOT_FOUND") == kj::none);
  KJ_EXPECT(tryParseStatusCode("") == kj::none);

  // OK is not a failure.
  KJ_EXPECT(tryParseStatusCode("OK") == kj::none);
}

KJ_TEST("every status code round-trips through its name") {
  for (uint i = 1; i <= static_cast<uint>(StatusCode::UNAUTHENTICATED); i++) {
    auto code = static_cast<StatusCode>(i);
    KJ_EXPECT(KJ_ASSERT_NONNULL(tryParseStatusCode(kj::str(code))) == code, i);
  }
}

KJ_TEST("status identifiers") {
  KJ_EXPECT(statusIdentifier(StatusCode::NOT_FOUND) == "NOT_FOUND");
  KJ_EXPECT(statusIdentifier(StatusCode::OK) == "OK");
  KJ_EXPECT(kj::str(StatusCode::FAILED_PRECONDITION) == "FailedPrecondition");
}

KJ_TEST("status codes map onto exception types") {
  KJ_EXPECT(exceptionType(StatusCode::UNIMPLEMENTED) == kj::Exception::Type::UNIMPLEMENTED);
  KJ_EXPECT(exceptionType(StatusCode::UNAVAILABLE) == kj::Exception::Type::DISCONNECTED);
  KJ_EXPECT(exceptionType(StatusCode::RESOURCE_EXHAUSTED) == kj::Exception::Type::OVERLOADED);
  KJ_EXPECT(exceptionType(StatusCode::DEADLINE_EXCEEDED) == kj::Exception::Type::OVERLOADED);
  KJ_EXPECT(exceptionType(StatusCode::NOT_FOUND) == kj::Exception::Type::FAILED);
  KJ_EXPECT(exceptionType(StatusCode::INTERNAL) == kj::Exception::Type::FAILED);
}

KJ_TEST("status exceptions carry the message verbatim") {
  auto exception = statusException(StatusCode::NOT_FOUND, "ANOTHER_VALUE NotFound");
  KJ_EXPECT(exception.getDescription() == "ANOTHER_VALUE NotFound");
  KJ_EXPECT(exception.getType() == kj::Exception::Type::FAILED);

  KJ_EXPECT_THROW_MESSAGE("a failure needs a status code other than OK",
      statusException(StatusCode::OK, "nope"));
}

KJ_TEST("status exceptions carry their code") {
  auto notFound = statusException(StatusCode::NOT_FOUND, "missing");
  auto invalid = statusException(StatusCode::INVALID_ARGUMENT, "missing");
  KJ_EXPECT(notFound.getType() == invalid.getType());
  KJ_EXPECT(KJ_ASSERT_NONNULL(statusCodeOf(notFound)) == StatusCode::NOT_FOUND);
  KJ_EXPECT(KJ_ASSERT_NONNULL(statusCodeOf(invalid)) == StatusCode::INVALID_ARGUMENT);

  // Copies share the detail.
  kj::Exception copy = notFound;
  KJ_EXPECT(KJ_ASSERT_NONNULL(statusCodeOf(copy)) == StatusCode::NOT_FOUND);

  kj::Exception plain(kj::Exception::Type::FAILED, __FILE__, __LINE__, kj::str("missing"));
  KJ_EXPECT(statusCodeOf(plain) == kj::none);
}

KJ_TEST("status details decode from their serialized form") {
  StatusDetail detail { StatusCode::DATA_LOSS };
  auto maybeSerialized = detail.trySerializeForKjException();
  auto& serialized = KJ_ASSERT_NONNULL(maybeSerialized);
  KJ_ASSERT(serialized.size() == 1);

  // This is how the RPC layer hands details to the receiving side.
  kj::Exception remote(kj::Exception::Type::FAILED, "(remote)", 0,
                       kj::str("remote exception: lost"));
  remote.setDetail(StatusDetail::EXCEPTION_DETAIL_TYPE_ID, kj::mv(serialized));
  KJ_EXPECT(KJ_ASSERT_NONNULL(statusCodeOf(remote)) == StatusCode::DATA_LOSS);

  const kj::byte ok[] = { 0 };
  const kj::byte outOfRange[] = { 17 };
  const kj::byte tooLong[] = { 5, 5 };
  KJ_EXPECT(StatusDetail::tryDeserializeForKjException(ok) == kj::none);
  KJ_EXPECT(StatusDetail::tryDeserializeForKjException(outOfRange) == kj::none);
  KJ_EXPECT(StatusDetail::tryDeserializeForKjException(tooLong) == kj::none);
  KJ_EXPECT(StatusDetail::tryDeserializeForKjException(nullptr) == kj::none);
}

KJ_TEST("errorText strips the RPC prefix") {
  kj::Exception remote(kj::Exception::Type::FAILED, "(remote)", 0,
                       kj::str("remote exception: ANOTHER_VALUE NotFound"));
  KJ_EXPECT(errorText(remote) == "ANOTHER_VALUE NotFound");

  kj::Exception local(kj::Exception::Type::FAILED, __FILE__, __LINE__,
                      kj::str("ANOTHER_VALUE NotFound"));
  KJ_EXPECT(errorText(local) == "ANOTHER_VALUE NotFound");

  // Only a leading prefix is removed.
  kj::Exception nested(kj::Exception::Type::FAILED, __FILE__, __LINE__,
                       kj::str("oops: remote exception: x"));
  KJ_EXPECT(errorText(nested) == "oops: remote exception: x");
}

KJ_TEST("messageMatches accepts a message which itself looks remote") {
  kj::Exception remote(kj::Exception::Type::FAILED, "(remote)", 0,
                       kj::str("remote exception: ANOTHER_VALUE NotFound"));
  KJ_EXPECT(messageMatches(remote, "ANOTHER_VALUE NotFound"));
  KJ_EXPECT(!messageMatches(remote, "ANOTHER_VALUE"));

  // The RPC layer passes this description through without adding a second prefix.
  kj::Exception verbatim(kj::Exception::Type::FAILED, "(remote)", 0,
                         kj::str("remote exception: upstream down"));
  KJ_EXPECT(messageMatches(verbatim, "remote exception: upstream down"));
}

}  // namespace
}  // namespace contract
