#include "object_map.h"
#include "objmap_io.h"
#include "objmap_io_common.h"

#include <system_error>
#include <utility>

namespace objmap
{

ObjectMap::ObjectMap(const std::string &path, const DecodeOptions &opt)
{
  from_file(path, opt);
}

void ObjectMap::from_file(const std::string &path, const DecodeOptions &opt)
{
  std::vector<uint8_t> bytes;
  std::error_code ec;
  if (!detail::load_file_bytes(path, bytes, ec))
    throw std::system_error(ec, path);
  from_bytes(bytes, opt);
}

void ObjectMap::from_bytes(const std::vector<uint8_t> &bytes, const DecodeOptions &opt)
{
  from_bytes(bytes.data(), bytes.size(), opt);
}

void ObjectMap::from_bytes(const uint8_t *data, std::size_t size, const DecodeOptions &opt)
{
  MapHeader header;
  std::vector<ObjectRecord> objects;
  std::vector<VolumeData> volumes;
  std::string err;

  if (!decode_header(data, size, header, objects, err))
    throw FormatError(err);
  if (!reconstruct_volumes(data + header.pixel_offset, size - header.pixel_offset, header, opt, volumes, err))
    throw FormatError(err);

  header_ = header;
  objects_ = std::move(objects);
  volumes_ = std::move(volumes);
}

const VolumeData &ObjectMap::get_data(int idx) const
{
  if (idx < 0 || static_cast<std::size_t>(idx) >= volumes_.size())
  {
    throw std::out_of_range("ObjectMap: volume index " + std::to_string(idx) +
                            " out of range [0, " + std::to_string(volumes_.size()) + ")");
  }
  return volumes_[static_cast<std::size_t>(idx)];
}

const ObjectRecord *ObjectMap::find_object(uint32_t label) const noexcept
{
  if (label == 0 || label > objects_.size())
    return nullptr;
  return &objects_[label - 1];
}

} // namespace objmap
