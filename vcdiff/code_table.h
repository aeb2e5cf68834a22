#pragma once

#include <array>
#include <cstdint>

namespace vcdelta {

enum class InstructionType : uint8_t {
    NoOp = 0,
    Add = 1,
    Run = 2,
    Copy = 3
};

// One logical instruction of an opcode. A size of 0 means the real size
// follows in the instruction stream.
struct Instruction {
    InstructionType type = InstructionType::NoOp;
    uint8_t size = 0;
    uint8_t mode = 0;
};

using OpcodeEntry = std::array<Instruction, 2>;

class CodeTable {
public:
    static constexpr uint8_t kDefaultNearSize = 4;
    static constexpr uint8_t kDefaultSameSize = 3;

    // The RFC 3284 default table, built once.
    static const CodeTable& defaultTable();

    // Entry point for tables that do not come from the format defaults.
    CodeTable(const std::array<OpcodeEntry, 256>& entries, uint8_t nearSize,
              uint8_t sameSize);

    const OpcodeEntry& decode(uint8_t opcode) const { return entries_[opcode]; }

    uint8_t nearSize() const { return nearSize_; }
    uint8_t sameSize() const { return sameSize_; }

    // Highest COPY mode addressable with this table's cache sizes.
    unsigned maxMode() const { return 1u + nearSize_ + sameSize_; }

private:
    std::array<OpcodeEntry, 256> entries_;
    uint8_t nearSize_;
    uint8_t sameSize_;
};

}  // namespace vcdelta
