// Export helpers for objmapinfo
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "object_map.h"

namespace objmap
{

// JSON description: header fields, object table and per-volume label counts
nlohmann::json to_json(const ObjectRecord &obj);
nlohmann::json to_json(const ObjectMap &map);
bool write_json(const std::string &path, const nlohmann::json &doc, std::string &err);

// Writes slice z of a volume as RGBA (system libpng). Each label is drawn in
// its object's start colour; hidden objects and background are transparent.
bool save_label_slice_png(const std::string &path,
                          const VolumeData &labels,
                          std::size_t z,
                          const std::vector<ObjectRecord> &objects,
                          std::string &err);

} // namespace objmap
