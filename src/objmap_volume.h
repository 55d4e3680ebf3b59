#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace objmap
{

// -----------------------------------------------------------------------------
// volume<T>: read-only 3D label raster over shared contiguous storage.
// Indexed (z, y, x); depth is the slowest varying axis, x the fastest.
// Several volumes may view disjoint blocks of the same storage.
// -----------------------------------------------------------------------------
template <class LabelT>
class volume
{
public:
  using value_type = LabelT;
  using storage_type = std::vector<value_type>;
  using storage_ptr = std::shared_ptr<const storage_type>;
  using shape_type = std::array<std::size_t, 3>;

  volume() = default;

  volume(storage_ptr storage,
         std::size_t offset,
         std::size_t depth,
         std::size_t height,
         std::size_t width)
      : depth_(depth), height_(height), width_(width),
        storage_(std::move(storage)), offset_(offset)
  {
    const std::size_t need = depth_ * height_ * width_;
    if (!storage_ || offset_ > storage_->size() || storage_->size() - offset_ < need)
      throw std::invalid_argument("volume: storage smaller than shape");
  }

  bool empty() const noexcept { return size() == 0; }

  std::size_t get_depth() const noexcept { return depth_; }
  std::size_t get_height() const noexcept { return height_; }
  std::size_t get_width() const noexcept { return width_; }
  std::size_t size() const noexcept { return depth_ * height_ * width_; }

  shape_type shape() const noexcept { return {depth_, height_, width_}; }

  // element strides for (z, y, x)
  shape_type strides() const noexcept { return {height_ * width_, width_, 1}; }

  const value_type *data() const noexcept
  {
    return storage_ ? storage_->data() + offset_ : nullptr;
  }

  const value_type *slice_ptr(std::size_t z) const noexcept
  {
    return (data() && z < depth_) ? data() + z * height_ * width_ : nullptr;
  }

  const value_type *row_ptr(std::size_t z, std::size_t y) const noexcept
  {
    return (data() && z < depth_ && y < height_) ? data() + (z * height_ + y) * width_ : nullptr;
  }

  const value_type &operator()(std::size_t z, std::size_t y, std::size_t x) const noexcept
  {
    return data()[(z * height_ + y) * width_ + x];
  }

  const value_type &at(std::size_t z, std::size_t y, std::size_t x) const
  {
    if (z >= depth_ || y >= height_ || x >= width_)
      throw std::out_of_range("volume: index (" + std::to_string(z) + ", " + std::to_string(y) +
                              ", " + std::to_string(x) + ") outside shape");
    return (*this)(z, y, x);
  }

  const value_type *begin() const noexcept { return data(); }
  const value_type *end() const noexcept { return data() ? data() + size() : nullptr; }

  storage_ptr storage() const noexcept { return storage_; }
  std::size_t storage_offset() const noexcept { return offset_; }

private:
  std::size_t depth_ = 0;
  std::size_t height_ = 0;
  std::size_t width_ = 0;
  storage_ptr storage_;
  std::size_t offset_ = 0;
};

// Labelled volume whose element width (1 or 2 bytes) is chosen at decode time.
class VolumeData
{
public:
  using shape_type = volume<uint8_t>::shape_type;

  VolumeData() = default;
  explicit VolumeData(volume<uint8_t> labels);
  explicit VolumeData(volume<uint16_t> labels);

  std::size_t element_width() const noexcept { return element_width_; }

  std::size_t get_depth() const noexcept;
  std::size_t get_height() const noexcept;
  std::size_t get_width() const noexcept;
  std::size_t size() const noexcept;
  std::size_t size_bytes() const noexcept { return size() * element_width_; }
  shape_type shape() const noexcept;
  bool empty() const noexcept { return size() == 0; }

  uint32_t operator()(std::size_t z, std::size_t y, std::size_t x) const noexcept;
  uint32_t at(std::size_t z, std::size_t y, std::size_t x) const;

  // Typed access; throws std::logic_error when the element width differs.
  const volume<uint8_t> &u8() const;
  const volume<uint16_t> &u16() const;

  uint32_t max_label() const noexcept;
  std::map<uint32_t, std::size_t> label_histogram() const;

private:
  std::size_t element_width_ = 0;
  volume<uint8_t> bytes_;
  volume<uint16_t> words_;
};

} // namespace objmap
