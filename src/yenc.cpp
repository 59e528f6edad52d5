#include "yenc.hpp"

#include <zlib.h>

#include <cstdint>
#include <iomanip>
#include <sstream>

#include "transfer_errors.hpp"

namespace {

bool is_critical(unsigned char c) {
  return c == 0x00 || c == 0x0a || c == 0x0d || c == '=';
}

bool is_edge_sensitive(unsigned char c) {
  return c == '\t' || c == ' ';
}

// Returns the value of `key=` in a =y control line, or empty.
std::string control_value(const std::string& line, const std::string& key) {
  auto pos = line.find(" " + key + "=");
  if(pos == std::string::npos) return {};
  pos += key.size() + 2;
  if(key == "name") return line.substr(pos); // name runs to end of line
  auto end = line.find(' ', pos);
  return line.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
}

} // namespace

uint32_t crc32_of(const Bytes& data) {
  uLong crc = crc32(0L, Z_NULL, 0);
  crc = crc32(crc, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size()));
  return static_cast<uint32_t>(crc);
}

std::string yenc_encode(const Bytes& data, const std::string& name, std::size_t line_length) {
  if(line_length < 2) line_length = kYencLineLength;
  std::string out;
  out.reserve(data.size() + data.size() / 32 + 128);
  out += "=ybegin line=" + std::to_string(line_length) + " size=" + std::to_string(data.size()) +
         " name=" + name + "\r\n";

  std::size_t column = 0;
  for(std::size_t i = 0; i < data.size(); ++i) {
    unsigned char encoded = static_cast<unsigned char>(static_cast<unsigned char>(data[i]) + 42);
    bool line_start = column == 0;
    bool line_end = column + 1 >= line_length || i + 1 == data.size();
    bool escape = is_critical(encoded) ||
                  (line_start && (encoded == '.' || is_edge_sensitive(encoded))) ||
                  (line_end && is_edge_sensitive(encoded));
    if(escape) {
      out.push_back('=');
      out.push_back(static_cast<char>(static_cast<unsigned char>(encoded + 64)));
      column += 2;
    } else {
      out.push_back(static_cast<char>(encoded));
      column += 1;
    }
    if(column >= line_length) {
      out += "\r\n";
      column = 0;
    }
  }
  if(column != 0) out += "\r\n";

  std::ostringstream trailer;
  trailer << "=yend size=" << data.size() << " crc32="
          << std::hex << std::setw(8) << std::setfill('0') << crc32_of(data) << "\r\n";
  out += trailer.str();
  return out;
}

Bytes yenc_decode(const std::string& body) {
  std::istringstream in(body);
  std::string line;
  bool in_block = false;
  bool saw_end = false;
  std::string expected_size;
  std::string expected_crc;
  Bytes out;

  while(std::getline(in, line)) {
    if(!line.empty() && line.back() == '\r') line.pop_back();
    if(!in_block) {
      if(line.rfind("=ybegin ", 0) == 0) {
        in_block = true;
        expected_size = control_value(line, "size");
      }
      continue;
    }
    if(line.rfind("=ypart ", 0) == 0) continue;
    if(line.rfind("=yend", 0) == 0) {
      auto end_size = control_value(line, "size");
      if(!end_size.empty()) expected_size = end_size;
      expected_crc = control_value(line, "crc32");
      if(expected_crc.empty()) expected_crc = control_value(line, "pcrc32");
      saw_end = true;
      break;
    }
    for(std::size_t i = 0; i < line.size(); ++i) {
      auto c = static_cast<unsigned char>(line[i]);
      if(c == '=') {
        if(++i >= line.size()) {
          throw IntegrityError("yEnc escape at end of line");
        }
        c = static_cast<unsigned char>(static_cast<unsigned char>(line[i]) - 64);
      }
      out.push_back(static_cast<char>(static_cast<unsigned char>(c - 42)));
    }
  }

  if(!in_block || !saw_end) {
    throw IntegrityError("yEnc block markers missing");
  }
  try {
    if(!expected_size.empty() && std::stoull(expected_size) != out.size()) {
      throw IntegrityError("yEnc size mismatch: expected " + expected_size +
                           " got " + std::to_string(out.size()));
    }
    if(!expected_crc.empty() && std::stoul(expected_crc, nullptr, 16) != crc32_of(out)) {
      throw IntegrityError("yEnc crc32 mismatch");
    }
  } catch(const std::logic_error& e) {
    throw IntegrityError(std::string("malformed yEnc trailer: ") + e.what());
  }
  return out;
}
