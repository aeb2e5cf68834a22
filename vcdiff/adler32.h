#pragma once

#include <cstddef>
#include <cstdint>

namespace vcdelta {

// Adler-32 of a whole buffer, as carried by VCD_ADLER32 windows.
uint32_t computeAdler32(const uint8_t* data, size_t size);

}  // namespace vcdelta
