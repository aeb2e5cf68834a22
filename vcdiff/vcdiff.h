#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "address_cache.h"
#include "code_table.h"
#include "vcdiff_error.h"
#include "varint.h"

namespace vcdelta {

// File header: 'V' 'C' 'D' with the high bit set, then the version byte.
constexpr uint8_t kVcdiffMagic[3] = {0xD6, 0xC3, 0xC4};
constexpr uint8_t kVcdiffVersion = 0x00;
constexpr uint8_t kSdchVersion = 'S';

// Hdr_Indicator bits.
enum : uint8_t {
    VCD_DECOMPRESS = 0x01,
    VCD_CODETABLE = 0x02,
    VCD_APPHEADER = 0x04
};

struct DecoderOptions {
    uint64_t maxTargetWindowSize = 64ull * 1024 * 1024;
    uint64_t maxTargetFileSize = 1ull << 30;
    bool verifyChecksums = true;
    bool allowTargetSource = true;
};

struct DecodeStats {
    size_t windows = 0;
    size_t checksummedWindows = 0;
    size_t targetSourcedWindows = 0;
    uint64_t targetBytes = 0;
};

/**
 * Decodes a complete in-memory VCDIFF delta against a dictionary.
 *
 * The decoder owns the address cache for the session and keeps the
 * application header and statistics of the last successful decode; a failed
 * decode leaves both empty. Not thread-safe;
 * use one instance per thread.
 */
class VcdiffDecoder {
public:
    explicit VcdiffDecoder(const DecoderOptions& options = DecoderOptions());

    /**
     * @param dictionary      source bytes the delta refers to
     * @param dictionarySize  number of dictionary bytes
     * @param delta           the VCDIFF file
     * @param deltaSize       number of delta bytes
     * @return the reconstructed target; throws VcdiffError on any failure
     *         and never returns partial output
     */
    std::vector<uint8_t> decode(const uint8_t* dictionary, size_t dictionarySize,
                                const uint8_t* delta, size_t deltaSize);

    std::vector<uint8_t> decode(const std::vector<uint8_t>& dictionary,
                                const std::vector<uint8_t>& delta);

    const std::vector<uint8_t>& applicationHeader() const { return appHeader_; }
    const DecodeStats& stats() const { return stats_; }
    const DecoderOptions& options() const { return options_; }

private:
    void readFileHeader(ByteCursor& delta, std::vector<uint8_t>& appHeader);

    DecoderOptions options_;
    const CodeTable& table_;
    AddressCache cache_;
    std::vector<uint8_t> appHeader_;
    DecodeStats stats_;
};

// One-shot helpers around VcdiffDecoder.
std::vector<uint8_t> decode(const uint8_t* dictionary, size_t dictionarySize,
                            const uint8_t* delta, size_t deltaSize,
                            const DecoderOptions& options = DecoderOptions());

std::vector<uint8_t> decode(const std::vector<uint8_t>& dictionary,
                            const std::vector<uint8_t>& delta,
                            const DecoderOptions& options = DecoderOptions());

}  // namespace vcdelta
