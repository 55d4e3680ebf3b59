#include "objmap_io.h"
#include "objmap_io_common.h"

#include <algorithm>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace {

bool checked_mul(std::size_t a, std::size_t b, std::size_t &out) {
  if (a != 0 && b > std::numeric_limits<std::size_t>::max() / a) return false;
  out = a * b;
  return true;
}

// Packed voxels. 16-bit labels are big-endian in the file.
void decode_raw(const uint8_t *in, std::size_t total, std::vector<uint8_t> &out) {
  out.assign(in, in + total);
}

void decode_raw(const uint8_t *in, std::size_t total, std::vector<uint16_t> &out) {
  out.resize(total);
  for (std::size_t i = 0; i < total; ++i) out[i] = objmap::detail::load_u16be(in + i * 2);
}

// (count, value) byte pairs. Runs continue across rows, slices and volumes.
bool decode_run_length(const uint8_t *in, std::size_t size, std::size_t total,
                       std::vector<uint8_t> &out, std::string &err) {
  if (size % 2 != 0) {
    err = "objmap: run-length data has odd length " + std::to_string(size);
    return false;
  }
  out.assign(total, 0);
  std::size_t pos = 0;
  for (std::size_t i = 0; i < size; i += 2) {
    const std::size_t count = in[i];
    const uint8_t value = in[i + 1];
    if (count == 0) continue;
    if (pos == total) {
      err = "objmap: " + std::to_string(size - i) + " bytes of run-length data past the last voxel";
      return false;
    }
    if (count > total - pos) {
      err = "objmap: run at byte " + std::to_string(i) + " overflows the volume (" +
            std::to_string(total - pos) + " voxels left, run of " + std::to_string(count) + ")";
      return false;
    }
    std::fill_n(out.begin() + static_cast<std::ptrdiff_t>(pos), count, value);
    pos += count;
  }
  if (pos != total) {
    err = "objmap: run-length data ends after " + std::to_string(pos) + " of " +
          std::to_string(total) + " voxels";
    return false;
  }
  return true;
}

template <class LabelT>
bool check_labels(const std::vector<LabelT> &labels, uint32_t object_count, std::string &err) {
  auto it = std::find_if(labels.begin(), labels.end(),
                         [object_count](LabelT v) { return static_cast<uint32_t>(v) > object_count; });
  if (it == labels.end()) return true;
  err = "objmap: voxel " + std::to_string(it - labels.begin()) + " has label " +
        std::to_string(static_cast<uint32_t>(*it)) + " but only " + std::to_string(object_count) +
        " objects are declared";
  return false;
}

template <class LabelT>
void split_volumes(std::vector<LabelT> &&labels, const objmap::MapHeader &header,
                   std::vector<objmap::VolumeData> &out) {
  const std::size_t voxels = header.voxels_per_volume();
  auto storage = std::make_shared<const std::vector<LabelT>>(std::move(labels));
  out.clear();
  out.reserve(header.volume_count);
  for (uint32_t v = 0; v < header.volume_count; ++v) {
    objmap::volume<LabelT> view(storage, v * voxels, header.depth, header.height, header.width);
    out.emplace_back(std::move(view));
  }
}

} // namespace

namespace objmap {

bool reconstruct_volumes(const uint8_t *pixels,
                         std::size_t size,
                         const MapHeader &header,
                         const DecodeOptions &opt,
                         std::vector<VolumeData> &out,
                         std::string &err) {
  err.clear();
  out.clear();

  const std::size_t element_width = header.element_width();
  std::size_t voxels = 0, total = 0, raw_bytes = 0;
  if (!checked_mul(header.width, header.height, voxels) ||
      !checked_mul(voxels, header.depth, voxels) ||
      !checked_mul(voxels, header.volume_count, total) ||
      !checked_mul(total, element_width, raw_bytes)) {
    err = "objmap: dimensions too large";
    return false;
  }

  PixelEncoding encoding = opt.encoding;
  if (encoding == PixelEncoding::Auto) {
    encoding = (size == raw_bytes || element_width != 1) ? PixelEncoding::Raw : PixelEncoding::RunLength;
  }

  const std::string expected = std::to_string(header.volume_count) + " x " +
                               std::to_string(header.depth) + " x " + std::to_string(header.height) +
                               " x " + std::to_string(header.width) + " x " +
                               std::to_string(element_width) + " bytes";

  if (encoding == PixelEncoding::Raw) {
    if (size != raw_bytes) {
      err = "objmap: pixel data is " + std::to_string(size) + " bytes, expected " +
            std::to_string(raw_bytes) + " (" + expected + ")";
      return false;
    }
    if (element_width == 2) {
      std::vector<uint16_t> labels;
      decode_raw(pixels, total, labels);
      if (opt.check_labels && !check_labels(labels, header.object_count, err)) return false;
      split_volumes(std::move(labels), header, out);
    } else {
      std::vector<uint8_t> labels;
      decode_raw(pixels, total, labels);
      if (opt.check_labels && !check_labels(labels, header.object_count, err)) return false;
      split_volumes(std::move(labels), header, out);
    }
    return true;
  }

  // run-length
  if (element_width != 1) {
    err = "objmap: run-length pixel data needs 8-bit labels (" +
          std::to_string(header.object_count) + " objects declared)";
    return false;
  }
  std::vector<uint8_t> labels;
  if (!decode_run_length(pixels, size, total, labels, err)) {
    if (opt.encoding == PixelEncoding::Auto) {
      err = "objmap: pixel data is " + std::to_string(size) + " bytes, which is neither raw (" +
            std::to_string(raw_bytes) + " = " + expected + ") nor valid run-length data: " + err;
    }
    return false;
  }
  if (opt.check_labels && !check_labels(labels, header.object_count, err)) return false;
  split_volumes(std::move(labels), header, out);
  return true;
}

} // namespace objmap
