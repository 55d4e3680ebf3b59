#include "objmap_v7_io.h"

namespace objmap::v7 {

bool decode_header(detail::ByteReader &reader, MapHeader &out, std::string &err) {
  // The 4-byte version code has already been consumed.
  if (!reader.read_u32(out.width) || !reader.read_u32(out.height) ||
      !reader.read_u32(out.depth) || !reader.read_u32(out.object_count) ||
      !reader.read_u32(out.volume_count)) {
    err = "objmap v7: truncated header";
    return false;
  }
  if (out.width == 0 || out.height == 0 || out.depth == 0) {
    err = "objmap v7: invalid dimensions";
    return false;
  }
  if (out.volume_count == 0) {
    err = "objmap v7: volume count is zero";
    return false;
  }
  return true;
}

} // namespace objmap::v7
