#pragma once

#include "decoder.h"

#include "xdelta3.h"


// Reference engine: xdelta3's in-memory decoder over the same buffers.
class XDeltaDecoder final : public DeltaDecoder {
public:
    explicit XDeltaDecoder(uint64_t maxOutputSize = 64ull * 1024 * 1024)
        : maxOutputSize_(maxOutputSize) {}

    const char* name() const override { return "xdelta3"; }
    uint64_t decode() override;

private:
    uint64_t maxOutputSize_;
    std::vector<uint8_t> scratch_;
};
