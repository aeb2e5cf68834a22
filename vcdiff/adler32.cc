#include "adler32.h"

#include <zlib.h>

namespace vcdelta {

uint32_t computeAdler32(const uint8_t* data, size_t size) {
    uLong adler = adler32_z(0L, Z_NULL, 0);
    if (size != 0) {
        adler = adler32_z(adler, data, static_cast<z_size_t>(size));
    }
    return static_cast<uint32_t>(adler);
}

}  // namespace vcdelta
