#pragma once

#include "decoder.h"

#include "vcdiff.h"


class VcdiffDeltaDecoder final : public DeltaDecoder {
public:
    explicit VcdiffDeltaDecoder(
        const vcdelta::DecoderOptions& options = vcdelta::DecoderOptions())
        : decoder_(options) {}

    const char* name() const override { return "vcdiff"; }
    uint64_t decode() override;

    const vcdelta::VcdiffDecoder& engine() const { return decoder_; }

private:
    vcdelta::VcdiffDecoder decoder_;
};
