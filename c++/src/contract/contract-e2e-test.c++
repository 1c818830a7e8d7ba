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

// Runs the code capnpc-contract generated for test.capnp and test-contract.json.

#include <contract/test.capnp.contract.h>
#include <kj/async-io.h>
#include <kj/test.h>

namespace contract {
namespace test {
namespace {

KJ_TEST("mock answers success cases") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  auto client = newMockMyServiceClient();

  {
    auto request = client.myMethodRequest();
    request.setRequestField("VALUE");
    KJ_EXPECT(request.send().wait(waitScope).getResponseField() == 42);
  }

  {
    auto request = client.myMethodRequest();
    request.setRequestField("tab\there \"quoted\" \\ back\001slash");
    int64_t lowest = kj::minValue;
    KJ_EXPECT(request.send().wait(waitScope).getResponseField() == lowest);
  }

  {
    auto request = client.describeRequest();
    request.setId(1);
    auto response = request.send().wait(waitScope);
    KJ_EXPECT(response.getId() == 1);
    KJ_EXPECT(response.getShape().isNone());
    KJ_EXPECT(!response.hasName());
  }
}

KJ_TEST("mock answers failure cases with the contract's message") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  auto client = newMockMyServiceClient();

  {
    auto request = client.myMethodRequest();
    request.setRequestField("ANOTHER_VALUE");
    KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
      request.send().wait(waitScope);
    })) {
      KJ_EXPECT(exception.getType() == kj::Exception::Type::FAILED);
      KJ_EXPECT(exception.getDescription() == "ANOTHER_VALUE NotFound",
                exception.getDescription());
      KJ_EXPECT(KJ_ASSERT_NONNULL(statusCodeOf(exception)) == StatusCode::NOT_FOUND);
    } else {
      KJ_FAIL_EXPECT("expected NotFound");
    }
  }

  {
    auto request = client.myMethodRequest();
    KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
      request.send().wait(waitScope);
    })) {
      KJ_EXPECT(exception.getDescription() == "requestField is required");
      KJ_EXPECT(KJ_ASSERT_NONNULL(statusCodeOf(exception)) == StatusCode::INVALID_ARGUMENT);
    } else {
      KJ_FAIL_EXPECT("expected InvalidArgument");
    }
  }
}

KJ_TEST("status codes survive the RPC connection") {
  auto io = kj::setupAsyncIo();
  LoopbackServer server(*io.provider, []() -> capnp::Capability::Client {
    return newMockMyServiceClient();
  });
  auto client = server.getClient<MyService>();

  auto codeFor = [&](kj::Maybe<kj::StringPtr> requestField) -> StatusCode {
    auto request = client.myMethodRequest();
    KJ_IF_SOME(field, requestField) {
      request.setRequestField(field);
    }
    KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
      request.send().wait(io.waitScope);
    })) {
      return KJ_ASSERT_NONNULL(statusCodeOf(exception));
    } else {
      KJ_FAIL_ASSERT("expected an error");
    }
  };

  KJ_EXPECT(codeFor("ANOTHER_VALUE"_kj) == StatusCode::NOT_FOUND);
  KJ_EXPECT(codeFor(kj::none) == StatusCode::INVALID_ARGUMENT);
}

KJ_TEST("mock answers inherited methods") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  auto client = newMockRegistryClient();

  KJ_EXPECT(client.getNameRequest().send().wait(waitScope).getName() == "registry");

  auto request = client.registerRequest();
  request.setName("gear");
  KJ_EXPECT(request.send().wait(waitScope).getId() == 7);
}

KJ_TEST("mock returns an empty result for requests no case lists") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  auto client = newMockMyServiceClient();

  {
    auto request = client.myMethodRequest();
    request.setRequestField("OTHER");
    KJ_EXPECT(request.send().wait(waitScope).getResponseField() == 0);
  }

  {
    // An empty name is present, unlike the absent name the contract lists.
    auto request = client.describeRequest();
    request.setId(1);
    request.setName("");
    auto response = request.send().wait(waitScope);
    KJ_EXPECT(response.getId() == 0);
  }

  // ping is not in the contract at all.
  client.pingRequest().send().wait(waitScope);
}

KJ_TEST("the mock satisfies its own contract") {
  auto io = kj::setupAsyncIo();
  runMyServiceContractTest(io, []() -> MyService::Client {
    return newMockMyServiceClient();
  });
}

enum class Fault {
  NONE,
  WRONG_MESSAGE,
  WRONG_CODE,
  WRONG_RESPONSE,
  NO_ERROR
};

class HandWrittenServer final: public MyService::Server {
  // Implements MyService by hand, optionally with one deliberate defect.

public:
  explicit HandWrittenServer(Fault fault): fault(fault) {}

  kj::Promise<void> myMethod(MyMethodContext context) override {
    auto params = context.getParams();
    auto results = context.getResults();

    if (!params.hasRequestField()) {
      KJ_FAIL_REQUIRE("requestField is required");
    }

    auto field = params.getRequestField();
    if (field == "VALUE") {
      results.setResponseField(fault == Fault::WRONG_RESPONSE ? 41 : 42);
    } else if (field == "ANOTHER_VALUE") {
      switch (fault) {
        case Fault::WRONG_MESSAGE:
          return statusException(StatusCode::NOT_FOUND, "not found");
        case Fault::WRONG_CODE:
          return statusException(StatusCode::INTERNAL, "ANOTHER_VALUE NotFound");
        case Fault::NO_ERROR:
          break;
        default:
          return statusException(StatusCode::NOT_FOUND, "ANOTHER_VALUE NotFound");
      }
    } else if (field.startsWith("tab\t")) {
      int64_t lowest = kj::minValue;
      results.setResponseField(lowest);
    }
    return kj::READY_NOW;
  }

  kj::Promise<void> describe(DescribeContext context) override {
    auto params = context.getParams();
    auto results = context.getResults();

    if (params.getId() == 7) {
      results.setId(8);
      results.setName(params.getName());
      results.setColor(Color::BLUE);
      results.initLabel().setText(params.getLabel().getText());
      results.initPayload(0);
      results.getShape().setSquare(1.0f);
      results.initScores(0);
    } else {
      results.setId(params.getId());
    }
    return kj::READY_NOW;
  }

private:
  Fault fault;
};

KJ_TEST("a correct server passes") {
  auto io = kj::setupAsyncIo();
  runMyServiceContractTest(io, []() -> MyService::Client {
    return kj::heap<HandWrittenServer>(Fault::NONE);
  });
}

KJ_TEST("a wrong error message is reported") {
  auto io = kj::setupAsyncIo();
  KJ_EXPECT_LOG(ERROR, "error text does not match contract");
  runMyServiceContractTest(io, []() -> MyService::Client {
    return kj::heap<HandWrittenServer>(Fault::WRONG_MESSAGE);
  });
}

KJ_TEST("a wrong error code is reported") {
  auto io = kj::setupAsyncIo();
  KJ_EXPECT_LOG(ERROR, "error code does not match contract");
  runMyServiceContractTest(io, []() -> MyService::Client {
    return kj::heap<HandWrittenServer>(Fault::WRONG_CODE);
  });
}

KJ_TEST("a wrong response is reported") {
  auto io = kj::setupAsyncIo();
  KJ_EXPECT_LOG(ERROR, "response does not match contract");
  runMyServiceContractTest(io, []() -> MyService::Client {
    return kj::heap<HandWrittenServer>(Fault::WRONG_RESPONSE);
  });
}

KJ_TEST("a missing error is reported") {
  auto io = kj::setupAsyncIo();
  KJ_EXPECT_LOG(ERROR, "an error was expected but none was returned");
  runMyServiceContractTest(io, []() -> MyService::Client {
    return kj::heap<HandWrittenServer>(Fault::NO_ERROR);
  });
}

class RegistryServer final: public Registry::Server {
public:
  explicit RegistryServer(bool implementsGetName): implementsGetName(implementsGetName) {}

  kj::Promise<void> getName(GetNameContext context) override {
    if (!implementsGetName) {
      return Registry::Server::getName(context);
    }
    context.getResults().setName("registry");
    return kj::READY_NOW;
  }

  kj::Promise<void> register_(RegisterContext context) override {
    auto name = context.getParams().getName();
    if (name == "taken") {
      return statusException(StatusCode::ALREADY_EXISTS, "taken is already registered");
    }
    context.getResults().setId(name == "gear" ? 7 : 1);
    return kj::READY_NOW;
  }

private:
  bool implementsGetName;
};

KJ_TEST("inherited methods are exercised") {
  auto io = kj::setupAsyncIo();
  runRegistryContractTest(io, []() -> Registry::Client {
    return kj::heap<RegistryServer>(true);
  });
}

KJ_TEST("an unimplemented inherited method is reported") {
  auto io = kj::setupAsyncIo();
  KJ_EXPECT_LOG(ERROR, "unexpected error");
  runRegistryContractTest(io, []() -> Registry::Client {
    return kj::heap<RegistryServer>(false);
  });
}

}  // namespace
}  // namespace test
}  // namespace contract
