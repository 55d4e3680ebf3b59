// Plain data types shared by the object map decoder
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace objmap
{

enum class PixelEncoding
{
  Auto,     // raw when the length matches exactly, run-length otherwise; opt-in only
  Raw,      // packed voxels, depth outermost
  RunLength // (count, value) byte pairs as written by Analyze
};

struct DecodeOptions
{
  PixelEncoding encoding = PixelEncoding::Raw;
  bool check_labels = true; // reject voxels whose label has no object record
};

struct MapHeader
{
  uint32_t version_code = 0;
  int version = 0; // 1..7
  uint32_t width = 0;
  uint32_t height = 0;
  uint32_t depth = 0;
  uint32_t object_count = 0;
  uint32_t volume_count = 1;
  // bytes consumed by the header and the object table
  std::size_t pixel_offset = 0;

  std::size_t voxels_per_volume() const
  {
    return static_cast<std::size_t>(width) * height * depth;
  }

  // 1 when every label 0..object_count fits in a byte, 2 otherwise
  std::size_t element_width() const
  {
    return object_count <= 0xFFu ? 1u : 2u;
  }

  bool multi_volume() const { return version >= 7; }
};

using Triple = std::array<int32_t, 3>;
using ShortTriple = std::array<int16_t, 3>;

struct ObjectRecord
{
  std::string name;
  int32_t display_flag = 0;
  uint8_t copy_flag = 0;
  uint8_t mirror = 0;
  uint8_t status = 0;
  uint8_t n_used = 0;
  int32_t shades = 0;

  Triple start_color{};  // r, g, b
  Triple end_color{};    // r, g, b
  Triple rotation{};
  Triple translation{};
  Triple center{};
  Triple rotation_increment{};
  Triple translation_increment{};

  ShortTriple min_bound{};
  ShortTriple max_bound{};

  float opacity = 0.0f;
  int32_t opacity_thickness = 0;
  float blend_factor = 0.0f;

  // never stored in the file: position in the object table + 1
  uint32_t label = 0;

  bool visible() const { return display_flag != 0; }
};

} // namespace objmap
