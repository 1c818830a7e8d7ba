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

#include "dispatch.h"
#include <contract/test.capnp.h>
#include <kj/async.h>
#include <kj/test.h>

namespace contract {
namespace {

typedef DispatchCase<test::MyService::MyMethodParams, test::MyService::MyMethodResults>
    MyMethodCase;

kj::ArrayPtr<const MyMethodCase> myMethodTable() {
  static const MyMethodCase TABLE[] = {
    { "VALUE answers 42",
      [](test::MyService::MyMethodParams::Builder request) {
        request.setRequestField("VALUE");
      },
      [](test::MyService::MyMethodResults::Builder response) {
        response.setResponseField(42);
      },
      StatusCode::OK, "" },
    { "VALUE again, shadowed by the row above",
      [](test::MyService::MyMethodParams::Builder request) {
        request.setRequestField("VALUE");
      },
      [](test::MyService::MyMethodResults::Builder response) {
        response.setResponseField(7);
      },
      StatusCode::OK, "" },
    { "ANOTHER_VALUE is not found",
      [](test::MyService::MyMethodParams::Builder request) {
        request.setRequestField("ANOTHER_VALUE");
      },
      nullptr,
      StatusCode::NOT_FOUND, "ANOTHER_VALUE NotFound" },
  };
  return TABLE;
}

class TableServer final: public test::MyService::Server {
public:
  kj::Promise<void> myMethod(MyMethodContext context) override {
    return dispatchCall(myMethodTable(), context);
  }
};

KJ_TEST("requestMatches compares whole messages") {
  capnp::MallocMessageBuilder message;
  auto params = message.initRoot<test::MyService::MyMethodParams>();

  auto initValue = [](test::MyService::MyMethodParams::Builder request) {
    request.setRequestField("VALUE");
  };

  KJ_EXPECT(!requestMatches<test::MyService::MyMethodParams>(params, initValue));
  params.setRequestField("VALUE");
  KJ_EXPECT(requestMatches<test::MyService::MyMethodParams>(params, initValue));
  params.setRequestField("VALUE2");
  KJ_EXPECT(!requestMatches<test::MyService::MyMethodParams>(params, initValue));
}

KJ_TEST("findCase returns the first matching row") {
  capnp::MallocMessageBuilder message;
  auto params = message.initRoot<test::MyService::MyMethodParams>();

  params.setRequestField("VALUE");
  auto& row = KJ_ASSERT_NONNULL(findCase(myMethodTable(), params.asReader()));
  KJ_EXPECT(row.description == "VALUE answers 42");
  KJ_EXPECT(!row.isFailure());

  params.setRequestField("ANOTHER_VALUE");
  KJ_EXPECT(KJ_ASSERT_NONNULL(findCase(myMethodTable(), params.asReader())).isFailure());

  params.setRequestField("SOMETHING_ELSE");
  KJ_EXPECT(findCase(myMethodTable(), params.asReader()) == kj::none);
}

KJ_TEST("dispatchCall answers from the table") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);

  test::MyService::Client client = kj::heap<TableServer>();

  {
    auto request = client.myMethodRequest();
    request.setRequestField("VALUE");
    KJ_EXPECT(request.send().wait(waitScope).getResponseField() == 42);
  }

  {
    auto request = client.myMethodRequest();
    request.setRequestField("ANOTHER_VALUE");
    auto promise = request.send();
    KJ_EXPECT_THROW_MESSAGE("ANOTHER_VALUE NotFound", promise.wait(waitScope));
  }

  {
    // Unmatched requests get an empty response, not an error.
    auto request = client.myMethodRequest();
    request.setRequestField("SOMETHING_ELSE");
    auto response = request.send().wait(waitScope);
    KJ_EXPECT(response.getResponseField() == 0);
  }
}

KJ_TEST("dispatchCall failures carry the mapped exception type") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);

  test::MyService::Client client = kj::heap<TableServer>();
  auto request = client.myMethodRequest();
  request.setRequestField("ANOTHER_VALUE");

  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
    request.send().wait(waitScope);
  })) {
    KJ_EXPECT(exception.getType() == kj::Exception::Type::FAILED);
    KJ_EXPECT(errorText(exception) == "ANOTHER_VALUE NotFound");
  } else {
    KJ_FAIL_EXPECT("expected an error");
  }
}

}  // namespace
}  // namespace contract
