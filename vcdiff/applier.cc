#include "applier.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

#include "adler32.h"
#include "debug.h"
#include "vcdiff_error.h"

namespace vcdelta {

DeltaApplier::DeltaApplier(Window& window, const uint8_t* source,
                           const CodeTable& table, AddressCache& cache,
                           bool verifyChecksum)
    : window_(window),
      source_(source),
      sourceLength_(window.header.sourceLength),
      table_(table),
      cache_(cache),
      verifyChecksum_(verifyChecksum) {
    target_.reserve(window.header.targetLength);
}

std::vector<uint8_t> DeltaApplier::run() {
    requireRunning();
    while (!window_.instructions.atEnd()) {
        step();
    }
    try {
        finish();
    } catch (const VcdiffError&) {
        state_ = State::Faulted;
        throw;
    }
    return std::move(target_);
}

void DeltaApplier::step() {
    requireRunning();
    try {
        executeOpcode();
    } catch (const VcdiffError&) {
        state_ = State::Faulted;
        throw;
    }
}

void DeltaApplier::requireRunning() const {
    if (state_ != State::Running) {
        throw std::logic_error(state_ == State::Done
                                   ? "window already decoded"
                                   : "window decoding already failed");
    }
}

void DeltaApplier::executeOpcode() {
    const uint8_t opcode = window_.instructions.readByte("opcode");
    const OpcodeEntry& entry = table_.decode(opcode);

    for (const Instruction& in : entry) {
        switch (in.type) {
            case InstructionType::NoOp:
                break;
            case InstructionType::Add:
                applyADD(instructionSize(in));
                break;
            case InstructionType::Run:
                applyRUN(instructionSize(in));
                break;
            case InstructionType::Copy:
                applyCOPY(instructionSize(in), in.mode);
                break;
        }
    }
}

uint32_t DeltaApplier::instructionSize(const Instruction& in) {
    if (in.size != 0) return in.size;
    return readVarint<uint32_t>(window_.instructions, "instruction size");
}

void DeltaApplier::ensureRoom(uint32_t size, const char* what) const {
    const uint64_t room = uint64_t(window_.header.targetLength) - target_.size();
    if (size > room) {
        throw VcdiffError(ErrorKind::LengthMismatch,
                          std::string(what) + " of " + std::to_string(size) +
                              " bytes overruns target window (" +
                              std::to_string(room) + " bytes left)");
    }
}

void DeltaApplier::applyADD(uint32_t size) {
    ensureRoom(size, "ADD");
    const uint8_t* p = window_.data.readBytes(size, "ADD data");
    target_.insert(target_.end(), p, p + size);
    VCD_TRACE("ADD len=" << size);
}

void DeltaApplier::applyRUN(uint32_t size) {
    ensureRoom(size, "RUN");
    const uint8_t byte = window_.data.readByte("RUN data");
    target_.insert(target_.end(), size, byte);
    VCD_TRACE("RUN len=" << size << " byte=" << unsigned(byte));
}

void DeltaApplier::applyCOPY(uint32_t size, uint8_t mode) {
    const uint64_t here = sourceLength_ + target_.size();
    uint64_t addr = cache_.decodeAddress(here, mode, window_.addresses);
    ensureRoom(size, "COPY");
    VCD_TRACE("COPY addr=" << addr << " len=" << size
                           << " mode=" << unsigned(mode));
    if (size == 0) return;

    size_t start = target_.size();
    target_.resize(start + size);
    uint8_t* out = target_.data();
    size_t left = size;

    // part of the range inside the source segment
    if (addr < sourceLength_) {
        const size_t n = static_cast<size_t>(
            std::min<uint64_t>(left, sourceLength_ - addr));
        std::memcpy(out + start, source_ + addr, n);
        start += n;
        left -= n;
        addr += n;
    }
    if (left == 0) return;

    // the rest comes from this window's target; addr < here keeps from < start
    const size_t from = static_cast<size_t>(addr - sourceLength_);
    if (from + left <= start) {
        std::memcpy(out + start, out + from, left);
    } else {
        // overlapping self-copy: bytes written here are read again later on
        for (size_t i = 0; i < left; ++i) {
            out[start + i] = out[from + i];
        }
    }
}

void DeltaApplier::finish() {
    const WindowHeader& h = window_.header;
    if (target_.size() != h.targetLength) {
        throw VcdiffError(ErrorKind::LengthMismatch,
                          "window produced " + std::to_string(target_.size()) +
                              " bytes, target length is " +
                              std::to_string(h.targetLength));
    }
    if (h.hasChecksum && verifyChecksum_) {
        const uint32_t actual = computeAdler32(target_.data(), target_.size());
        if (actual != h.checksum) {
            throw VcdiffError(ErrorKind::ChecksumMismatch,
                              "window Adler-32 " + std::to_string(actual) +
                                  " != expected " + std::to_string(h.checksum));
        }
    }
    if (!window_.data.atEnd() || !window_.addresses.atEnd()) {
        VCD_TRACE("unused section bytes: data=" << window_.data.remaining()
                  << " addresses=" << window_.addresses.remaining());
    }
    state_ = State::Done;
}

}  // namespace vcdelta
