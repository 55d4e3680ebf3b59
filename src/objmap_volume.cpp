#include "objmap_volume.h"

#include <algorithm>

namespace objmap
{

VolumeData::VolumeData(volume<uint8_t> labels)
    : element_width_(1), bytes_(std::move(labels))
{
}

VolumeData::VolumeData(volume<uint16_t> labels)
    : element_width_(2), words_(std::move(labels))
{
}

std::size_t VolumeData::get_depth() const noexcept
{
  return element_width_ == 2 ? words_.get_depth() : bytes_.get_depth();
}

std::size_t VolumeData::get_height() const noexcept
{
  return element_width_ == 2 ? words_.get_height() : bytes_.get_height();
}

std::size_t VolumeData::get_width() const noexcept
{
  return element_width_ == 2 ? words_.get_width() : bytes_.get_width();
}

std::size_t VolumeData::size() const noexcept
{
  return element_width_ == 2 ? words_.size() : bytes_.size();
}

VolumeData::shape_type VolumeData::shape() const noexcept
{
  return element_width_ == 2 ? words_.shape() : bytes_.shape();
}

uint32_t VolumeData::operator()(std::size_t z, std::size_t y, std::size_t x) const noexcept
{
  return element_width_ == 2 ? words_(z, y, x) : bytes_(z, y, x);
}

uint32_t VolumeData::at(std::size_t z, std::size_t y, std::size_t x) const
{
  return element_width_ == 2 ? words_.at(z, y, x) : bytes_.at(z, y, x);
}

const volume<uint8_t> &VolumeData::u8() const
{
  if (element_width_ != 1)
    throw std::logic_error("VolumeData: labels are not 8-bit");
  return bytes_;
}

const volume<uint16_t> &VolumeData::u16() const
{
  if (element_width_ != 2)
    throw std::logic_error("VolumeData: labels are not 16-bit");
  return words_;
}

uint32_t VolumeData::max_label() const noexcept
{
  if (empty())
    return 0;
  if (element_width_ == 2)
    return *std::max_element(words_.begin(), words_.end());
  return *std::max_element(bytes_.begin(), bytes_.end());
}

std::map<uint32_t, std::size_t> VolumeData::label_histogram() const
{
  std::map<uint32_t, std::size_t> counts;
  if (element_width_ == 2)
  {
    for (uint16_t v : words_)
      ++counts[v];
  }
  else if (element_width_ == 1)
  {
    std::array<std::size_t, 256> table{};
    for (uint8_t v : bytes_)
      ++table[v];
    for (std::size_t i = 0; i < table.size(); ++i)
    {
      if (table[i] != 0)
        counts[static_cast<uint32_t>(i)] = table[i];
    }
  }
  return counts;
}

} // namespace objmap
