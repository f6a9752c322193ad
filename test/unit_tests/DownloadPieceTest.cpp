#include "DownloadPiece.hpp"
#include "TestHeaders.hpp"
#include "VortexMatchers.hpp"

using namespace vortex;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("DownloadPiece parses task id and piece number",
          "[DownloadPiece]") {
  string value = string(32, 'a') + "-42";
  DownloadPiece downloadPiece = DownloadPiece::fromBytes(value);

  REQUIRE(downloadPiece.getTaskId() == string(32, 'a'));
  REQUIRE(downloadPiece.getPieceNumber() == 42);
  REQUIRE(downloadPiece.toBytes() == value);
}

TEST_CASE("DownloadPiece accepts the full piece number range",
          "[DownloadPiece]") {
  REQUIRE(DownloadPiece::fromBytes("task-0").getPieceNumber() == 0);
  REQUIRE(DownloadPiece::fromBytes("task-4294967295").getPieceNumber() ==
          4294967295u);
}

TEST_CASE("DownloadPiece encodes as task-number", "[DownloadPiece]") {
  DownloadPiece downloadPiece("abc123", 7);
  REQUIRE(downloadPiece.toBytes() == "abc123-7");
  REQUIRE(DownloadPiece::fromBytes(downloadPiece.toBytes()) == downloadPiece);
}

TEST_CASE("DownloadPiece rejects malformed values", "[DownloadPiece]") {
  SECTION("Missing separator") {
    REQUIRE_THROWS_WITH(DownloadPiece::fromBytes("abcdef"),
                        ContainsSubstring("no '-' separator"));
  }

  SECTION("Empty task id") {
    REQUIRE_THROWS_WITH(DownloadPiece::fromBytes("-42"),
                        ContainsSubstring("empty task id"));
  }

  SECTION("Bad piece numbers") {
    for (const string& value :
         {"task-", "task-x1", "task-+1", "task-007", "task-4294967296",
          "task-1-2", "task- 1"}) {
      INFO("Parsing '" << value << "'");
      REQUIRE_THROWS_MATCHES(DownloadPiece::fromBytes(value), VortexException,
                             IsVortexError(VortexErrorType::INVALID_VALUE));
    }
  }

  SECTION("Empty value") {
    REQUIRE_THROWS_MATCHES(DownloadPiece::fromBytes(""), VortexException,
                           IsVortexError(VortexErrorType::INVALID_VALUE));
  }
}

TEST_CASE("DownloadPiece constructor validates the task id",
          "[DownloadPiece]") {
  REQUIRE_THROWS_MATCHES(DownloadPiece("", 1), VortexException,
                         IsVortexError(VortexErrorType::INVALID_VALUE));
  REQUIRE_THROWS_MATCHES(DownloadPiece("a-b", 1), VortexException,
                         IsVortexError(VortexErrorType::INVALID_VALUE));
}
