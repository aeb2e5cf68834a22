#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>

#include "vcdiff_error.h"

namespace vcdelta {

// ---------------------------------------------------------------------------
//  Bounded read cursor over a borrowed byte range
// ---------------------------------------------------------------------------
class ByteCursor {
public:
    ByteCursor() : begin_(nullptr), p_(nullptr), end_(nullptr) {}
    ByteCursor(const uint8_t* data, size_t size)
        : begin_(data), p_(data), end_(data + size) {}

    size_t size() const { return static_cast<size_t>(end_ - begin_); }
    size_t position() const { return static_cast<size_t>(p_ - begin_); }
    size_t remaining() const { return static_cast<size_t>(end_ - p_); }
    bool atEnd() const { return p_ == end_; }
    const uint8_t* data() const { return p_; }

    uint8_t readByte(const char* what) {
        if (p_ == end_) {
            throw VcdiffError(ErrorKind::TruncatedInput,
                              std::string("truncated ") + what);
        }
        return *p_++;
    }

    // Returns a pointer to the next n bytes and advances past them.
    const uint8_t* readBytes(size_t n, const char* what) {
        if (remaining() < n) {
            throw VcdiffError(ErrorKind::TruncatedInput,
                              std::string("truncated ") + what + " (need " +
                                  std::to_string(n) + ", have " +
                                  std::to_string(remaining()) + ")");
        }
        const uint8_t* start = p_;
        p_ += n;
        return start;
    }

    // Splits off the next n bytes as an independent cursor.
    ByteCursor sub(size_t n, const char* what) {
        const uint8_t* start = readBytes(n, what);
        return ByteCursor(start, n);
    }

private:
    const uint8_t* begin_;
    const uint8_t* p_;
    const uint8_t* end_;
};

// --- read a big-endian base-128 varint ------------------------------------
//
// Most significant 7-bit group first; a clear high bit ends the integer.
// Encodings longer than T can need are rejected even when the value fits.
template <typename T>
T readVarint(ByteCursor& cursor, const char* what) {
    static_assert(std::is_unsigned<T>::value, "varints decode to unsigned types");
    constexpr int kMaxBytes = (std::numeric_limits<T>::digits + 6) / 7;
    constexpr T kShiftLimit = std::numeric_limits<T>::max() >> 7;

    T val = 0;
    for (int i = 0; i < kMaxBytes; ++i) {
        const uint8_t byte = cursor.readByte(what);
        if (val > kShiftLimit) {
            throw VcdiffError(ErrorKind::IntegerOverflow,
                              std::string("varint overflow in ") + what);
        }
        val = static_cast<T>((val << 7) | (byte & 0x7F));
        if (!(byte & 0x80)) return val;
    }
    throw VcdiffError(ErrorKind::IntegerOverflow,
                      std::string("varint too long in ") + what);
}

inline uint32_t readBigEndian32(ByteCursor& cursor, const char* what) {
    const uint8_t* p = cursor.readBytes(4, what);
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) |
           (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

}  // namespace vcdelta
