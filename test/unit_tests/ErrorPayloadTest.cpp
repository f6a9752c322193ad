#include "ErrorPayload.hpp"
#include "TestHeaders.hpp"
#include "VortexMatchers.hpp"

using namespace vortex;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("ErrorPayload parses code and message", "[ErrorPayload]") {
  ErrorPayload error = ErrorPayload::fromBytes("1:Error message");

  REQUIRE(error.getCode() == ErrorCode::INVALID_ARGUMENT);
  REQUIRE(error.getMessage() == "Error message");
  REQUIRE(error.toBytes() == "1:Error message");
}

TEST_CASE("ErrorPayload message may be empty or contain separators",
          "[ErrorPayload]") {
  REQUIRE(ErrorPayload::fromBytes("2:").getMessage() == "");
  REQUIRE(ErrorPayload::fromBytes("3:a:b:c").getMessage() == "a:b:c");
  REQUIRE(ErrorPayload::fromBytes("3:a:b:c").getCode() == ErrorCode::INTERNAL);
}

TEST_CASE("ErrorPayload keeps codes without a name", "[ErrorPayload]") {
  ErrorPayload error = ErrorPayload::fromBytes("200:custom");

  REQUIRE(int(error.getCode()) == 200);
  REQUIRE(errorCodeName(error.getCode()) == "Reserved(200)");
  REQUIRE(error.toBytes() == "200:custom");
}

TEST_CASE("ErrorPayload code names", "[ErrorPayload]") {
  REQUIRE(errorCodeName(ErrorCode::UNKNOWN) == "Unknown");
  REQUIRE(errorCodeName(ErrorCode::INVALID_ARGUMENT) == "InvalidArgument");
  REQUIRE(errorCodeName(ErrorCode::NOT_FOUND) == "NotFound");
  REQUIRE(errorCodeName(ErrorCode::INTERNAL) == "Internal");
}

TEST_CASE("ErrorPayload rejects malformed values", "[ErrorPayload]") {
  REQUIRE_THROWS_WITH(ErrorPayload::fromBytes("no separator"),
                      ContainsSubstring("no ':' separator"));

  for (const string& value : {":message", "256:x", "-1:x", "01:x", "a:x"}) {
    INFO("Parsing '" << value << "'");
    REQUIRE_THROWS_MATCHES(ErrorPayload::fromBytes(value), VortexException,
                           IsVortexError(VortexErrorType::INVALID_VALUE));
  }
}
