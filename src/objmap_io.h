#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "objmap_types.h"
#include "objmap_volume.h"

namespace objmap
{

const char *to_string(PixelEncoding encoding);

// Parses the header and the object table. On success header.pixel_offset is
// the offset of the first pixel byte and objects.size() == header.object_count.
bool decode_header(const uint8_t *data,
                   std::size_t size,
                   MapHeader &header,
                   std::vector<ObjectRecord> &objects,
                   std::string &err);

// Rebuilds header.volume_count volumes from the bytes following the object
// table. All volumes share one decoded buffer.
bool reconstruct_volumes(const uint8_t *pixels,
                         std::size_t size,
                         const MapHeader &header,
                         const DecodeOptions &opt,
                         std::vector<VolumeData> &out,
                         std::string &err);

} // namespace objmap
