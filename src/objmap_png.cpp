// Label slice export using system libpng
#include "objmap_export.h"
#include <png.h>
#include <algorithm>
#include <array>
#include <cstdio>
#include <vector>

static void png_write_fn(png_structp png_ptr, png_bytep data, png_size_t length)
{
  FILE *fp = static_cast<FILE *>(png_get_io_ptr(png_ptr));
  if (fwrite(data, 1, length, fp) != length)
    png_error(png_ptr, "write error");
}

static void png_flush_fn(png_structp png_ptr)
{
  FILE *fp = static_cast<FILE *>(png_get_io_ptr(png_ptr));
  fflush(fp);
}

static uint8_t clamp_component(int32_t v)
{
  return static_cast<uint8_t>(std::clamp<int32_t>(v, 0, 255));
}

namespace objmap
{

bool save_label_slice_png(const std::string &path,
                          const VolumeData &labels,
                          std::size_t z,
                          const std::vector<ObjectRecord> &objects,
                          std::string &err)
{
  err.clear();
  if (labels.empty())
  {
    err = "empty volume";
    return false;
  }
  if (z >= labels.get_depth())
  {
    err = "slice " + std::to_string(z) + " out of range (depth " + std::to_string(labels.get_depth()) + ")";
    return false;
  }

  const uint32_t width = static_cast<uint32_t>(labels.get_width());
  const uint32_t height = static_cast<uint32_t>(labels.get_height());

  // RGBA per label; index 0 stays transparent black
  std::vector<std::array<uint8_t, 4>> palette(objects.size() + 1, std::array<uint8_t, 4>{0, 0, 0, 0});
  for (std::size_t i = 0; i < objects.size(); ++i)
  {
    const ObjectRecord &obj = objects[i];
    palette[i + 1] = {clamp_component(obj.start_color[0]),
                      clamp_component(obj.start_color[1]),
                      clamp_component(obj.start_color[2]),
                      static_cast<uint8_t>(obj.visible() ? 255 : 0)};
  }

  // Build the RGBA rows before touching the file so nothing is left half-written
  std::vector<uint8_t> buffer(static_cast<size_t>(width) * height * 4);
  for (uint32_t y = 0; y < height; ++y)
  {
    for (uint32_t x = 0; x < width; ++x)
    {
      const uint32_t label = labels(z, y, x);
      const std::array<uint8_t, 4> &rgba = label < palette.size() ? palette[label] : palette[0];
      std::copy(rgba.begin(), rgba.end(), buffer.begin() + (static_cast<size_t>(y) * width + x) * 4);
    }
  }

  FILE *fp = fopen(path.c_str(), "wb");
  if (!fp)
  {
    err = "cannot open file";
    return false;
  }

  png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
  if (!png_ptr)
  {
    fclose(fp);
    err = "png_create_write_struct failed";
    return false;
  }
  png_infop info_ptr = png_create_info_struct(png_ptr);
  if (!info_ptr)
  {
    png_destroy_write_struct(&png_ptr, nullptr);
    fclose(fp);
    err = "png_create_info_struct failed";
    return false;
  }
  std::vector<png_bytep> rows(height);
  if (setjmp(png_jmpbuf(png_ptr)))
  {
    png_destroy_write_struct(&png_ptr, &info_ptr);
    fclose(fp);
    if (err.empty())
      err = "libpng error";
    return false;
  }

  png_set_write_fn(png_ptr, fp, png_write_fn, png_flush_fn);
  png_set_IHDR(png_ptr, info_ptr, width, height, 8, PNG_COLOR_TYPE_RGB_ALPHA, PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);
  png_write_info(png_ptr, info_ptr);

  for (uint32_t y = 0; y < height; ++y)
    rows[y] = buffer.data() + static_cast<size_t>(y) * width * 4;

  png_write_image(png_ptr, rows.data());
  png_write_end(png_ptr, nullptr);
  png_destroy_write_struct(&png_ptr, &info_ptr);
  if (fclose(fp) != 0)
  {
    err = "write error";
    return false;
  }
  return true;
}

} // namespace objmap
