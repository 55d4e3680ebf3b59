#include "objmap_io.h"
#include "objmap_io_common.h"
#include "objmap_v6_io.h"
#include "objmap_v7_io.h"

#include <cstring>
#include <string>

namespace
{
  using objmap::detail::ByteReader;
  using objmap::detail::kObjectNameSize;
  using objmap::detail::kObjectRecordSize;

  bool read_triple(ByteReader &reader, objmap::Triple &t)
  {
    return reader.read_i32(t[0]) && reader.read_i32(t[1]) && reader.read_i32(t[2]);
  }

  bool read_short_triple(ByteReader &reader, objmap::ShortTriple &t)
  {
    return reader.read_i16(t[0]) && reader.read_i16(t[1]) && reader.read_i16(t[2]);
  }

  bool decode_object(ByteReader &reader, uint32_t index, objmap::ObjectRecord &obj, std::string &err)
  {
    const std::string where = "objmap: object " + std::to_string(index);

    char name[kObjectNameSize];
    if (!reader.read_bytes(name, sizeof(name)))
    {
      err = where + ": truncated record";
      return false;
    }
    const void *nul = std::memchr(name, '\0', sizeof(name));
    if (!nul)
    {
      err = where + ": name is not NUL-terminated within " + std::to_string(kObjectNameSize) + " bytes";
      return false;
    }
    obj.name.assign(name, static_cast<std::size_t>(static_cast<const char *>(nul) - name));

    bool ok = reader.read_i32(obj.display_flag) &&
              reader.read_u8(obj.copy_flag) &&
              reader.read_u8(obj.mirror) &&
              reader.read_u8(obj.status) &&
              reader.read_u8(obj.n_used) &&
              reader.read_i32(obj.shades) &&
              read_triple(reader, obj.start_color) &&
              read_triple(reader, obj.end_color) &&
              read_triple(reader, obj.rotation) &&
              read_triple(reader, obj.translation) &&
              read_triple(reader, obj.center) &&
              read_triple(reader, obj.rotation_increment) &&
              read_triple(reader, obj.translation_increment) &&
              read_short_triple(reader, obj.min_bound) &&
              read_short_triple(reader, obj.max_bound) &&
              reader.read_f32(obj.opacity) &&
              reader.read_i32(obj.opacity_thickness) &&
              reader.read_f32(obj.blend_factor);
    if (!ok)
    {
      err = where + ": truncated record";
      return false;
    }

    // label 0 is background; records start at 1
    obj.label = index + 1;
    return true;
  }

  bool decode_versioned(ByteReader &reader, objmap::MapHeader &header, std::string &err)
  {
    header.version = objmap::detail::version_from_code(header.version_code);
    if (header.version == 7)
    {
      return objmap::v7::decode_header(reader, header, err);
    }
    if (header.version >= 1)
    {
      return objmap::v6::decode_header(reader, header, err);
    }
    err = "objmap: unrecognised version code " + std::to_string(header.version_code);
    return false;
  }

} // namespace

namespace objmap
{

const char *to_string(PixelEncoding encoding)
{
  switch (encoding)
  {
  case PixelEncoding::Auto:
    return "auto";
  case PixelEncoding::Raw:
    return "raw";
  case PixelEncoding::RunLength:
    return "rle";
  }
  return "unknown";
}

bool decode_header(const uint8_t *data,
                   std::size_t size,
                   MapHeader &header,
                   std::vector<ObjectRecord> &objects,
                   std::string &err)
{
  err.clear();
  header = MapHeader{};
  objects.clear();

  ByteReader reader(data, size);
  if (!reader.read_u32(header.version_code))
  {
    err = "objmap: file too short for a version code";
    return false;
  }
  if (!decode_versioned(reader, header, err))
    return false;

  // Reject an impossible count before allocating anything for it.
  const uint64_t table_bytes = static_cast<uint64_t>(header.object_count) * kObjectRecordSize;
  if (table_bytes > reader.remaining())
  {
    err = "objmap: object table truncated (" + std::to_string(header.object_count) +
          " objects declared, " + std::to_string(reader.remaining()) + " bytes left)";
    return false;
  }

  objects.resize(header.object_count);
  for (uint32_t i = 0; i < header.object_count; ++i)
  {
    if (!decode_object(reader, i, objects[i], err))
    {
      objects.clear();
      return false;
    }
  }

  header.pixel_offset = reader.position();
  return true;
}

} // namespace objmap
