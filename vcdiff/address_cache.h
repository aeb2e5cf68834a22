#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "varint.h"

namespace vcdelta {

/**
 * Near/same caches used to decode COPY addresses (RFC 3284 section 5.3).
 *
 * Mode 0 (SELF) and 1 (HERE) read a varint; modes 2 .. 1+nearSize add a
 * varint to a near slot; the remaining sameSize modes pick a same slot with
 * one raw byte. Every resolved address updates both caches.
 */
class AddressCache {
public:
    static constexpr uint8_t kSelfMode = 0;
    static constexpr uint8_t kHereMode = 1;

    AddressCache(uint8_t nearSize, uint8_t sameSize);

    // Clears both caches; called at the start of every window.
    void reset();

    /**
     * Resolve the address of one COPY.
     *
     * @param here       source segment length plus bytes already produced
     * @param mode       addressing mode from the code table
     * @param addresses  the window's address section
     * @return absolute address in the source+target space, always < here
     */
    uint64_t decodeAddress(uint64_t here, uint8_t mode, ByteCursor& addresses);

    uint8_t nearSize() const { return nearSize_; }
    uint8_t sameSize() const { return sameSize_; }

private:
    void update(uint64_t address);

    uint8_t nearSize_;
    uint8_t sameSize_;
    std::vector<uint64_t> near_;
    std::vector<uint64_t> same_;
    size_t nextNearSlot_ = 0;
};

}  // namespace vcdelta
