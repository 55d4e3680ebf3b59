#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

namespace objmap::detail
{

    // Analyze writes every multi-byte field big-endian.
    constexpr uint32_t kVersion1Code = 880102u;
    constexpr uint32_t kVersion2Code = 880801u;
    constexpr uint32_t kVersion3Code = 890209u;
    constexpr uint32_t kVersion4Code = 900302u;
    constexpr uint32_t kVersion5Code = 910402u;
    constexpr uint32_t kVersion6Code = 910926u;
    constexpr uint32_t kVersion7Code = 20050829u;

    constexpr std::size_t kBaseHeaderSize = 5 * 4;
    constexpr std::size_t kVersion7HeaderSize = kBaseHeaderSize + 4;
    constexpr std::size_t kObjectNameSize = 32;
    constexpr std::size_t kObjectRecordSize = 152;

    // Returns 1..7 for a known version code, 0 otherwise.
    int version_from_code(uint32_t code) noexcept;

    bool load_file_bytes(const std::string &path, std::vector<uint8_t> &out, std::error_code &ec);

    uint16_t load_u16be(const uint8_t *p) noexcept;
    uint32_t load_u32be(const uint8_t *p) noexcept;

    // Bounds-checked big-endian cursor. Every read returns false on underflow
    // and leaves the position unchanged.
    class ByteReader
    {
    public:
        ByteReader(const uint8_t *data, size_t size)
            : p_(data), begin_(data), end_(data + size) {}

        bool read_u8(uint8_t &v);
        bool read_u16(uint16_t &v);
        bool read_u32(uint32_t &v);
        bool read_i16(int16_t &v);
        bool read_i32(int32_t &v);
        bool read_f32(float &v);
        bool read_bytes(void *dst, size_t n);
        bool skip(size_t n);

        size_t position() const noexcept { return static_cast<size_t>(p_ - begin_); }
        size_t remaining() const noexcept { return static_cast<size_t>(end_ - p_); }
        const uint8_t *current() const noexcept { return p_; }

    private:
        const uint8_t *p_;
        const uint8_t *begin_;
        const uint8_t *end_;
    };

} // namespace objmap::detail
