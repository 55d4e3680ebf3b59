#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "objmap_types.h"
#include "objmap_volume.h"

namespace objmap
{

// Malformed or unrecognised object map content.
class FormatError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

// Decoded Analyze object map (.obj).
//
// Usage:
//   objmap::ObjectMap map("path/to/file.obj");
//   // or
//   objmap::ObjectMap map;
//   map.from_file("path/to/file.obj");
//
//   const objmap::VolumeData &labels = map.get_data(0);
//
// A parse either fully succeeds or throws and leaves the previous contents
// untouched. Errors: FormatError for bad content, std::system_error when the
// file cannot be read, std::out_of_range for a bad volume index.
class ObjectMap
{
public:
  ObjectMap() = default;
  explicit ObjectMap(const std::string &path, const DecodeOptions &opt = DecodeOptions{});

  void from_file(const std::string &path, const DecodeOptions &opt = DecodeOptions{});
  void from_bytes(const std::vector<uint8_t> &bytes, const DecodeOptions &opt = DecodeOptions{});
  void from_bytes(const uint8_t *data, std::size_t size, const DecodeOptions &opt = DecodeOptions{});

  // Volume idx in [0, volume_count()). The default is always the first volume.
  const VolumeData &get_data(int idx = 0) const;

  const std::vector<ObjectRecord> &objects() const noexcept { return objects_; }
  const std::vector<VolumeData> &volumes() const noexcept { return volumes_; }
  const MapHeader &header() const noexcept { return header_; }

  uint32_t version_code() const noexcept { return header_.version_code; }
  int version() const noexcept { return header_.version; }
  uint32_t width() const noexcept { return header_.width; }
  uint32_t height() const noexcept { return header_.height; }
  uint32_t depth() const noexcept { return header_.depth; }
  uint32_t object_count() const noexcept { return header_.object_count; }
  uint32_t volume_count() const noexcept { return static_cast<uint32_t>(volumes_.size()); }

  bool empty() const noexcept { return volumes_.empty(); }

  // Object owning a label, or nullptr for background and unknown labels.
  const ObjectRecord *find_object(uint32_t label) const noexcept;

private:
  MapHeader header_;
  std::vector<ObjectRecord> objects_;
  std::vector<VolumeData> volumes_;
};

} // namespace objmap
