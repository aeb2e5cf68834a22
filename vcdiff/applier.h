#pragma once

#include <cstdint>
#include <vector>

#include "address_cache.h"
#include "code_table.h"
#include "window.h"

namespace vcdelta {

/**
 * Forward-pass interpreter for one window.
 *
 * Reads opcodes from the instruction section, pulls literal bytes from the
 * data section and COPY addresses through the address cache, and appends the
 * produced bytes to a window-local target buffer. The applier starts in
 * Running, ends in Done once the instruction section is consumed and the
 * target validated, and moves to Faulted on the first error (which is
 * rethrown to the caller). Once Done or Faulted, run() and step() throw
 * std::logic_error.
 */
class DeltaApplier {
public:
    enum class State { Running, Done, Faulted };

    /**
     * @param window      parsed window; its cursors are consumed
     * @param source      first byte of the window's source segment, may be
     *                    null when the segment is empty
     * @param table       code table the instructions are encoded with
     * @param cache       address cache, reset by the caller for this window
     * @param verifyChecksum  compare a present Adler-32 after decoding
     */
    DeltaApplier(Window& window, const uint8_t* source, const CodeTable& table,
                 AddressCache& cache, bool verifyChecksum = true);

    // Decodes the rest of the window and returns the produced bytes.
    std::vector<uint8_t> run();

    // Executes the instructions of a single opcode.
    void step();

    State state() const { return state_; }
    const std::vector<uint8_t>& target() const { return target_; }

private:
    void requireRunning() const;
    void executeOpcode();
    uint32_t instructionSize(const Instruction& in);
    void ensureRoom(uint32_t size, const char* what) const;
    void applyADD(uint32_t size);
    void applyRUN(uint32_t size);
    void applyCOPY(uint32_t size, uint8_t mode);
    void finish();

    Window& window_;
    const uint8_t* source_;
    uint64_t sourceLength_;
    const CodeTable& table_;
    AddressCache& cache_;
    bool verifyChecksum_;
    std::vector<uint8_t> target_;
    State state_ = State::Running;
};

}  // namespace vcdelta
