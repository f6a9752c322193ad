#include "PacketFiles.hpp"

namespace vortex {
Packet PacketFiles::write(const string& path, const Tag& tag,
                          const string& value,
                          const shared_ptr<PacketIdGenerator>& idGenerator) {
  Packet packet = Packet::create(tag, value, idGenerator);
  writeFile(path, packet.toBytes());
  LOG(INFO) << "Wrote " << packet << " to " << path;
  return packet;
}

Packet PacketFiles::read(const string& path) {
  string bytes = readFile(path);
  VLOG(1) << "Read " << bytes.length() << " bytes from " << path;
  return Packet::fromBytes(bytes);
}

string PacketFiles::readFile(const string& path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in.is_open()) {
    throw runtime_error("Cannot open " + path + " for reading");
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  if (in.bad()) {
    throw runtime_error("Error while reading " + path);
  }
  return contents.str();
}

void PacketFiles::writeFile(const string& path, const string& contents) {
  std::ofstream out(path,
                    std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw runtime_error("Cannot open " + path + " for writing");
  }
  out.write(contents.data(), contents.length());
  out.close();
  if (out.fail()) {
    throw runtime_error("Error while writing " + path);
  }
}
}  // namespace vortex
