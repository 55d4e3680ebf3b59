#include "objmap_v6_io.h"

namespace objmap::v6 {

bool decode_header(detail::ByteReader &reader, MapHeader &out, std::string &err) {
  // The 4-byte version code has already been consumed.
  if (!reader.read_u32(out.width) || !reader.read_u32(out.height) ||
      !reader.read_u32(out.depth) || !reader.read_u32(out.object_count)) {
    err = "objmap v6: truncated header";
    return false;
  }
  if (out.width == 0 || out.height == 0 || out.depth == 0) {
    err = "objmap v6: invalid dimensions";
    return false;
  }
  out.volume_count = 1;
  return true;
}

} // namespace objmap::v6
