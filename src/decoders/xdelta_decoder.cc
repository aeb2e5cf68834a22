#include "xdelta_decoder.h"

#include <stdexcept>
#include <string>

uint64_t XDeltaDecoder::decode() {
    outputBuf.clear();
    if (scratch_.size() < maxOutputSize_) {
        scratch_.resize(static_cast<size_t>(maxOutputSize_));
    }

    usize_t decodedSize = 0;
    int ret = xd3_decode_memory(deltaBuf.data(), static_cast<usize_t>(deltaBuf.size()),
                                baseBuf.data(), static_cast<usize_t>(baseBuf.size()),
                                scratch_.data(), &decodedSize,
                                static_cast<usize_t>(scratch_.size()), 0);
    if (ret != 0) {
        throw std::runtime_error(std::string("xd3_decode_memory failed: ") +
                                 xd3_strerror(ret));
    }
    outputBuf.assign(scratch_.begin(), scratch_.begin() + decodedSize);
    return outputBuf.size();
}
