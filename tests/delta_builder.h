#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "vcdiff.h"
#include "window.h"

namespace vcdelta {
namespace test {

// ---------- minimal vcdiff writers -----------------------------------------

// big-endian base-128: most significant group first
inline void writeVarint(std::string& out, uint64_t v) {
    char buf[10];
    int n = 0;
    buf[n++] = static_cast<char>(v & 0x7F);
    v >>= 7;
    while (v != 0) {
        buf[n++] = static_cast<char>((v & 0x7F) | 0x80);
        v >>= 7;
    }
    while (n > 0) out += buf[--n];
}

inline std::string varint(uint64_t v) {
    std::string out;
    writeVarint(out, v);
    return out;
}

inline std::string fileHeader(uint8_t indicator = 0) {
    return std::string{'\xD6', '\xC3', '\xC4', '\x00', static_cast<char>(indicator)};
}

// Default-table opcodes used by the builders.
constexpr uint8_t kOpRun = 0x00;            // RUN, size follows
constexpr uint8_t kOpAdd = 0x01;            // ADD, size follows
inline uint8_t copyOpcode(uint8_t mode) {   // COPY, size follows
    return static_cast<uint8_t>(19 + mode * 16);
}

/**
 * Builds one window: instructions, data and addresses are accumulated
 * separately and laid out as data, instructions, addresses by build().
 */
class WindowBuilder {
public:
    WindowBuilder& emitADD(const std::string& bytes) {
        inst_ += static_cast<char>(kOpAdd);
        writeVarint(inst_, bytes.size());
        data_ += bytes;
        return *this;
    }

    WindowBuilder& emitRUN(char byte, uint32_t size) {
        inst_ += static_cast<char>(kOpRun);
        writeVarint(inst_, size);
        data_ += byte;
        return *this;
    }

    // addressValue is what goes into the address section: the absolute
    // address for SELF, the distance back for HERE, the offset for NEAR and
    // the slot byte for SAME modes.
    WindowBuilder& emitCOPY(uint32_t size, uint8_t mode, uint32_t addressValue) {
        inst_ += static_cast<char>(copyOpcode(mode));
        writeVarint(inst_, size);
        if (mode >= 2 + CodeTable::kDefaultNearSize) {
            addr_ += static_cast<char>(addressValue);
        } else {
            writeVarint(addr_, addressValue);
        }
        return *this;
    }

    WindowBuilder& rawInstructions(const std::string& bytes) { inst_ += bytes; return *this; }
    WindowBuilder& rawData(const std::string& bytes) { data_ += bytes; return *this; }
    WindowBuilder& rawAddresses(const std::string& bytes) { addr_ += bytes; return *this; }

    WindowBuilder& source(uint8_t kind, uint64_t length, uint64_t position) {
        sourceKind_ = kind;
        sourceLength_ = length;
        sourcePosition_ = position;
        return *this;
    }

    WindowBuilder& checksum(uint32_t adler) {
        hasChecksum_ = true;
        checksum_ = adler;
        return *this;
    }

    std::string build(uint32_t targetLength) const {
        std::string encoding;
        writeVarint(encoding, targetLength);
        encoding += '\0';  // delta indicator
        writeVarint(encoding, data_.size());
        writeVarint(encoding, inst_.size());
        writeVarint(encoding, addr_.size());
        if (hasChecksum_) {
            encoding += static_cast<char>(checksum_ >> 24);
            encoding += static_cast<char>(checksum_ >> 16);
            encoding += static_cast<char>(checksum_ >> 8);
            encoding += static_cast<char>(checksum_);
        }
        encoding += data_;
        encoding += inst_;
        encoding += addr_;

        std::string out;
        uint8_t indicator = sourceKind_;
        if (hasChecksum_) indicator |= 0x04;
        out += static_cast<char>(indicator);
        if (sourceKind_ != 0) {
            writeVarint(out, sourceLength_);
            writeVarint(out, sourcePosition_);
        }
        writeVarint(out, encoding.size());
        out += encoding;
        return out;
    }

    // Offsets of the section boundaries inside build()'s result.
    std::vector<size_t> boundaries(uint32_t targetLength) const {
        const std::string whole = build(targetLength);
        const size_t bodyStart = whole.size() - data_.size() - inst_.size() - addr_.size();
        return {bodyStart, bodyStart + data_.size(),
                bodyStart + data_.size() + inst_.size(), whole.size()};
    }

private:
    std::string inst_;
    std::string data_;
    std::string addr_;
    uint8_t sourceKind_ = 0;
    uint64_t sourceLength_ = 0;
    uint64_t sourcePosition_ = 0;
    bool hasChecksum_ = false;
    uint32_t checksum_ = 0;
};

inline const uint8_t* bytesOf(const std::string& s) {
    return reinterpret_cast<const uint8_t*>(s.data());
}

inline std::string decodeToString(const std::string& dictionary,
                                  const std::string& delta,
                                  const DecoderOptions& options = DecoderOptions()) {
    std::vector<uint8_t> out = decode(bytesOf(dictionary), dictionary.size(),
                                      bytesOf(delta), delta.size(), options);
    return std::string(out.begin(), out.end());
}

}  // namespace test
}  // namespace vcdelta

// Runs statement and expects it to throw VcdiffError of the given kind.
#define EXPECT_VCDIFF_ERROR(statement, expectedKind)                           \
    do {                                                                       \
        try {                                                                  \
            statement;                                                         \
            ADD_FAILURE() << "expected " << ::vcdelta::errorKindName(expectedKind); \
        } catch (const ::vcdelta::VcdiffError& e) {                            \
            EXPECT_STREQ(::vcdelta::errorKindName(expectedKind),               \
                         ::vcdelta::errorKindName(e.kind()))                   \
                << e.what();                                                   \
        }                                                                      \
    } while (0)
