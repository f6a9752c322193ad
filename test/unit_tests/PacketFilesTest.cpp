#include "FakePacketIdGenerator.hpp"
#include "PacketFiles.hpp"
#include "TestHeaders.hpp"
#include "VortexMatchers.hpp"

using namespace vortex;

namespace {
string makeTempDirectory() {
  string pattern = GetTempDirectory() + string("vortex_files_XXXXXXXX");
  REQUIRE(mkdtemp(&pattern[0]) != nullptr);
  return pattern;
}
}  // namespace

TEST_CASE("PacketFiles writes and reads a packet", "[PacketFiles]") {
  string directory = makeTempDirectory();
  string path = directory + "/packet.bin";
  shared_ptr<FakePacketIdGenerator> idGenerator(new FakePacketIdGenerator(77));

  Packet written =
      PacketFiles::write(path, Tag::pieceContent(), "payload", idGenerator);
  REQUIRE(PacketFiles::readFile(path) == written.toBytes());

  Packet read = PacketFiles::read(path);
  REQUIRE(read == written);
  REQUIRE(read.getPacketId() == 77);

  fs::remove_all(directory);
}

TEST_CASE("PacketFiles reports unreadable and invalid files",
          "[PacketFiles]") {
  string directory = makeTempDirectory();

  REQUIRE_THROWS_AS(PacketFiles::read(directory + "/missing.bin"),
                    std::runtime_error);

  string truncated = directory + "/truncated.bin";
  PacketFiles::writeFile(truncated, string("\x01\x01\x00", 3));
  REQUIRE_THROWS_MATCHES(PacketFiles::read(truncated), VortexException,
                         IsVortexError(VortexErrorType::INVALID_PACKET));

  fs::remove_all(directory);
}
