#include "objmap_io_common.h"

#include <cerrno>
#include <cstdio>
#include <cstring>

namespace objmap::detail {

int version_from_code(uint32_t code) noexcept {
  switch (code) {
    case kVersion1Code: return 1;
    case kVersion2Code: return 2;
    case kVersion3Code: return 3;
    case kVersion4Code: return 4;
    case kVersion5Code: return 5;
    case kVersion6Code: return 6;
    case kVersion7Code: return 7;
    default: return 0;
  }
}

bool load_file_bytes(const std::string &path, std::vector<uint8_t> &out, std::error_code &ec) {
  ec.clear();
  out.clear();
  FILE *fp = std::fopen(path.c_str(), "rb");
  if (!fp) {
    ec = std::error_code(errno, std::generic_category());
    return false;
  }

  uint8_t chunk[64 * 1024];
  for (;;) {
    const size_t got = std::fread(chunk, 1, sizeof(chunk), fp);
    out.insert(out.end(), chunk, chunk + got);
    if (got < sizeof(chunk)) break;
  }
  if (std::ferror(fp)) {
    ec = std::error_code(errno != 0 ? errno : EIO, std::generic_category());
    std::fclose(fp);
    out.clear();
    return false;
  }
  std::fclose(fp);
  return true;
}

uint16_t load_u16be(const uint8_t *p) noexcept {
  return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

uint32_t load_u32be(const uint8_t *p) noexcept {
  return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

bool ByteReader::read_u8(uint8_t &v) {
  if (remaining() < 1) return false;
  v = *p_++;
  return true;
}

bool ByteReader::read_u16(uint16_t &v) {
  if (remaining() < 2) return false;
  v = load_u16be(p_);
  p_ += 2;
  return true;
}

bool ByteReader::read_u32(uint32_t &v) {
  if (remaining() < 4) return false;
  v = load_u32be(p_);
  p_ += 4;
  return true;
}

bool ByteReader::read_i16(int16_t &v) {
  uint16_t u;
  if (!read_u16(u)) return false;
  v = static_cast<int16_t>(u);
  return true;
}

bool ByteReader::read_i32(int32_t &v) {
  uint32_t u;
  if (!read_u32(u)) return false;
  v = static_cast<int32_t>(u);
  return true;
}

bool ByteReader::read_f32(float &v) {
  uint32_t u;
  if (!read_u32(u)) return false;
  static_assert(sizeof(float) == 4, "float must be IEEE-754 binary32");
  std::memcpy(&v, &u, sizeof(v));
  return true;
}

bool ByteReader::read_bytes(void *dst, size_t n) {
  if (remaining() < n) return false;
  std::memcpy(dst, p_, n);
  p_ += n;
  return true;
}

bool ByteReader::skip(size_t n) {
  if (remaining() < n) return false;
  p_ += n;
  return true;
}

} // namespace objmap::detail
