#include "vcdiff_decoder.h"

uint64_t VcdiffDeltaDecoder::decode() {
    outputBuf.clear();
    outputBuf = decoder_.decode(baseBuf, deltaBuf);
#ifdef VERBOSE
    const vcdelta::DecodeStats& stats = decoder_.stats();
    std::cout << "vcdiff: " << stats.windows << " windows ("
              << stats.checksummedWindows << " checksummed, "
              << stats.targetSourcedWindows << " target-sourced), "
              << outputBuf.size() << " bytes\n";
#endif
    return outputBuf.size();
}
