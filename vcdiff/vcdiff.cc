#include "vcdiff.h"

#include <string>
#include <utility>

#include "applier.h"
#include "debug.h"
#include "window.h"

namespace vcdelta {

namespace {

constexpr uint8_t kKnownHeaderBits = VCD_DECOMPRESS | VCD_CODETABLE | VCD_APPHEADER;

}  // namespace

VcdiffDecoder::VcdiffDecoder(const DecoderOptions& options)
    : options_(options),
      table_(CodeTable::defaultTable()),
      cache_(table_.nearSize(), table_.sameSize()) {}

void VcdiffDecoder::readFileHeader(ByteCursor& delta,
                                   std::vector<uint8_t>& appHeader) {
    for (uint8_t expected : kVcdiffMagic) {
        const uint8_t b = delta.readByte("file header");
        if (b != expected) {
            throw VcdiffError(ErrorKind::BadMagic,
                              "delta does not start with the VCDIFF magic");
        }
    }

    const uint8_t version = delta.readByte("file header version");
    if (version == kSdchVersion) {
        throw VcdiffError(ErrorKind::UnsupportedVersion,
                          "interleaved (SDCH) format is not supported");
    }
    if (version != kVcdiffVersion) {
        throw VcdiffError(ErrorKind::UnsupportedVersion,
                          "unknown VCDIFF version " + std::to_string(version));
    }

    const uint8_t indicator = delta.readByte("header indicator");
    if (indicator & ~kKnownHeaderBits) {
        throw VcdiffError(ErrorKind::InvalidIndicator,
                          "reserved header indicator bits set: " +
                              std::to_string(indicator));
    }
    if (indicator & VCD_DECOMPRESS) {
        throw VcdiffError(ErrorKind::UnsupportedFeature,
                          "secondary compression (VCD_DECOMPRESS)");
    }
    if (indicator & VCD_CODETABLE) {
        // A parsed table would be handed to CodeTable's entry constructor
        // and the address cache resized to its near/same sizes.
        throw VcdiffError(ErrorKind::UnsupportedFeature,
                          "custom code table (VCD_CODETABLE)");
    }
    if (indicator & VCD_APPHEADER) {
        const uint32_t length =
            readVarint<uint32_t>(delta, "application header length");
        const uint8_t* p = delta.readBytes(length, "application header");
        appHeader.assign(p, p + length);
    }
}

std::vector<uint8_t> VcdiffDecoder::decode(const uint8_t* dictionary,
                                           size_t dictionarySize,
                                           const uint8_t* delta,
                                           size_t deltaSize) {
    appHeader_.clear();
    stats_ = DecodeStats();

    std::vector<uint8_t> appHeader;
    DecodeStats stats;

    ByteCursor cursor(delta, deltaSize);
    readFileHeader(cursor, appHeader);

    std::vector<uint8_t> output;
    while (!cursor.atEnd()) {
        WindowLimits limits;
        limits.dictionarySize = dictionarySize;
        limits.decodedSize = output.size();
        limits.maxTargetWindowSize = options_.maxTargetWindowSize;
        limits.allowTargetSource = options_.allowTargetSource;

        Window window = parseWindow(cursor, limits);
        const WindowHeader& h = window.header;
        if (output.size() + uint64_t(h.targetLength) > options_.maxTargetFileSize) {
            throw VcdiffError(ErrorKind::LimitExceeded,
                              "decoded output would exceed " +
                                  std::to_string(options_.maxTargetFileSize) +
                                  " bytes");
        }

        const uint8_t* source = nullptr;
        if (h.sourceKind == SourceKind::Dictionary) {
            source = dictionary + h.sourcePosition;
        } else if (h.sourceKind == SourceKind::Target) {
            source = output.data() + h.sourcePosition;
            ++stats.targetSourcedWindows;
        }

        cache_.reset();
        DeltaApplier applier(window, source, table_, cache_,
                             options_.verifyChecksums);
        const std::vector<uint8_t> target = applier.run();
        output.insert(output.end(), target.begin(), target.end());

        ++stats.windows;
        if (h.hasChecksum) ++stats.checksummedWindows;
        stats.targetBytes += target.size();
        VCD_TRACE("window " << stats.windows << " done, output="
                            << output.size());
    }

    appHeader_ = std::move(appHeader);
    stats_ = stats;
    return output;
}

std::vector<uint8_t> VcdiffDecoder::decode(const std::vector<uint8_t>& dictionary,
                                           const std::vector<uint8_t>& delta) {
    return decode(dictionary.data(), dictionary.size(), delta.data(),
                  delta.size());
}

std::vector<uint8_t> decode(const uint8_t* dictionary, size_t dictionarySize,
                            const uint8_t* delta, size_t deltaSize,
                            const DecoderOptions& options) {
    VcdiffDecoder decoder(options);
    return decoder.decode(dictionary, dictionarySize, delta, deltaSize);
}

std::vector<uint8_t> decode(const std::vector<uint8_t>& dictionary,
                            const std::vector<uint8_t>& delta,
                            const DecoderOptions& options) {
    return decode(dictionary.data(), dictionary.size(), delta.data(),
                  delta.size(), options);
}

}  // namespace vcdelta
