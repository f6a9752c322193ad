#include "FakePacketIdGenerator.hpp"
#include "PacketPrinter.hpp"
#include "TestHeaders.hpp"

using namespace vortex;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("PacketPrinter renders download pieces", "[PacketPrinter]") {
  shared_ptr<FakePacketIdGenerator> idGenerator(new FakePacketIdGenerator(3));
  Packet packet = Packet::create(Tag::downloadPiece(), "abc-9", idGenerator);

  json j = PacketPrinter::toJson(packet);
  REQUIRE(j["packet_id"] == 3);
  REQUIRE(j["tag"] == "DownloadPiece");
  REQUIRE(j["tag_code"] == 0);
  REQUIRE(j["length"] == 5);
  REQUIRE(j["payload"]["task_id_base64"] == "YWJj");
  REQUIRE(j["payload"]["piece_number"] == 9);

  string text = PacketPrinter::toText(packet);
  REQUIRE_THAT(text, ContainsSubstring("packet id: 3"));
  REQUIRE_THAT(text, ContainsSubstring("tag: DownloadPiece (0)"));
  REQUIRE_THAT(text, ContainsSubstring("task id: abc"));
  REQUIRE_THAT(text, ContainsSubstring("piece number: 9"));
}

TEST_CASE("PacketPrinter base64 encodes opaque bytes", "[PacketPrinter]") {
  shared_ptr<FakePacketIdGenerator> idGenerator(new FakePacketIdGenerator());

  Packet content = Packet::create(Tag::pieceContent(), "Man", idGenerator);
  REQUIRE(PacketPrinter::toJson(content)["payload"]["content_base64"] ==
          "TWFu");

  Packet error = Packet::create(Tag::error(), "2:Man", idGenerator);
  json j = PacketPrinter::toJson(error);
  REQUIRE(j["payload"]["code"] == 2);
  REQUIRE(j["payload"]["code_name"] == "NotFound");
  REQUIRE(j["payload"]["message_base64"] == "TWFu");

  Packet reserved = Packet::create(Tag::fromByte(9), "", idGenerator);
  j = PacketPrinter::toJson(reserved);
  REQUIRE(j["tag"] == "Reserved(9)");
  REQUIRE(j["payload"]["value_base64"] == "");
}

TEST_CASE("PacketPrinter JSON survives task ids that are not UTF-8",
          "[PacketPrinter]") {
  // The task id is arbitrary bytes from the wire
  string bytes = PacketHeader(7, Tag::downloadPiece(), 4).toBytes();
  bytes.append("\xff\xfe-1");
  Packet packet = Packet::fromBytes(bytes);
  REQUIRE(packet.getDownloadPiece().getTaskId() == "\xff\xfe");

  json j = PacketPrinter::toJson(packet);
  REQUIRE(j["payload"]["task_id_base64"] == "//4=");
  REQUIRE(j["payload"]["piece_number"] == 1);
  string dumped;
  REQUIRE_NOTHROW(dumped = j.dump(2));
  REQUIRE_THAT(dumped, ContainsSubstring("\"task_id_base64\": \"//4=\""));
}

TEST_CASE("PacketPrinter truncates long content", "[PacketPrinter]") {
  shared_ptr<FakePacketIdGenerator> idGenerator(new FakePacketIdGenerator());
  Packet packet =
      Packet::create(Tag::pieceContent(), string(100, '\x01'), idGenerator);

  string text = PacketPrinter::toText(packet);
  REQUIRE_THAT(text, ContainsSubstring("length: 100"));
  REQUIRE_THAT(text, ContainsSubstring("... (100 bytes)"));
}
