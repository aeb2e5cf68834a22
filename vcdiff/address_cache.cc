#include "address_cache.h"

#include <algorithm>
#include <string>

#include "debug.h"

namespace vcdelta {

AddressCache::AddressCache(uint8_t nearSize, uint8_t sameSize)
    : nearSize_(nearSize),
      sameSize_(sameSize),
      near_(nearSize, 0),
      same_(static_cast<size_t>(sameSize) * 256, 0) {}

void AddressCache::reset() {
    std::fill(near_.begin(), near_.end(), 0);
    std::fill(same_.begin(), same_.end(), 0);
    nextNearSlot_ = 0;
}

uint64_t AddressCache::decodeAddress(uint64_t here, uint8_t mode,
                                     ByteCursor& addresses) {
    uint64_t address;
    if (mode == kSelfMode) {
        address = readVarint<uint32_t>(addresses, "COPY address");
    } else if (mode == kHereMode) {
        const uint64_t back = readVarint<uint32_t>(addresses, "COPY address");
        if (back > here) {
            throw VcdiffError(ErrorKind::InvalidAddress,
                              "HERE offset " + std::to_string(back) +
                                  " reaches before position 0 (here = " +
                                  std::to_string(here) + ")");
        }
        address = here - back;
    } else if (mode - 2u < nearSize_) {
        // near slots hold earlier addresses (< here), the sum cannot wrap
        address = near_[mode - 2u] +
                  readVarint<uint32_t>(addresses, "COPY address");
    } else if (mode - 2u - nearSize_ < sameSize_) {
        const unsigned m = mode - 2u - nearSize_;
        const uint8_t slot = addresses.readByte("COPY address");
        address = same_[m * 256u + slot];
    } else {
        throw VcdiffError(ErrorKind::InvalidAddress,
                          "COPY mode " + std::to_string(mode) +
                              " out of range for near=" +
                              std::to_string(nearSize_) +
                              " same=" + std::to_string(sameSize_));
    }

    update(address);

    if (address >= here) {
        throw VcdiffError(ErrorKind::InvalidAddress,
                          "COPY address " + std::to_string(address) +
                              " is not before here = " + std::to_string(here));
    }
    VCD_TRACE("address mode=" << unsigned(mode) << " here=" << here
                               << " -> " << address);
    return address;
}

void AddressCache::update(uint64_t address) {
    if (nearSize_ > 0) {
        near_[nextNearSlot_] = address;
        nextNearSlot_ = (nextNearSlot_ + 1) % nearSize_;
    }
    if (sameSize_ > 0) {
        same_[address % (static_cast<uint64_t>(sameSize_) * 256)] = address;
    }
}

}  // namespace vcdelta
