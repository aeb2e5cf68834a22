#include "code_table.h"

namespace vcdelta {

namespace {

inline Instruction inst(InstructionType type, unsigned size, unsigned mode) {
    Instruction in;
    in.type = type;
    in.size = static_cast<uint8_t>(size);
    in.mode = static_cast<uint8_t>(mode);
    return in;
}

// RFC 3284 section 5.6. Opcode order matters: encoders emit these indices.
std::array<OpcodeEntry, 256> buildDefaultEntries() {
    constexpr unsigned kModes =
        2 + CodeTable::kDefaultNearSize + CodeTable::kDefaultSameSize;

    std::array<OpcodeEntry, 256> t{};
    unsigned i = 0;

    // 0: RUN, size in the instruction stream
    t[i++][0] = inst(InstructionType::Run, 0, 0);

    // 1..18: ADD sizes 0, 1..17
    for (unsigned size = 0; size <= 17; ++size) {
        t[i++][0] = inst(InstructionType::Add, size, 0);
    }

    // 19..162: COPY per mode, sizes 0, 4..18
    for (unsigned mode = 0; mode < kModes; ++mode) {
        t[i++][0] = inst(InstructionType::Copy, 0, mode);
        for (unsigned size = 4; size <= 18; ++size) {
            t[i++][0] = inst(InstructionType::Copy, size, mode);
        }
    }

    // 163..234: ADD 1..4 + COPY 4..6, modes 0..5
    for (unsigned mode = 0; mode < 6; ++mode) {
        for (unsigned addSize = 1; addSize <= 4; ++addSize) {
            for (unsigned copySize = 4; copySize <= 6; ++copySize) {
                t[i][0] = inst(InstructionType::Add, addSize, 0);
                t[i][1] = inst(InstructionType::Copy, copySize, mode);
                ++i;
            }
        }
    }

    // 235..246: ADD 1..4 + COPY 4, modes 6..8
    for (unsigned mode = 6; mode < kModes; ++mode) {
        for (unsigned addSize = 1; addSize <= 4; ++addSize) {
            t[i][0] = inst(InstructionType::Add, addSize, 0);
            t[i][1] = inst(InstructionType::Copy, 4, mode);
            ++i;
        }
    }

    // 247..255: COPY 4 + ADD 1, all modes
    for (unsigned mode = 0; mode < kModes; ++mode) {
        t[i][0] = inst(InstructionType::Copy, 4, mode);
        t[i][1] = inst(InstructionType::Add, 1, 0);
        ++i;
    }

    return t;
}

}  // namespace

CodeTable::CodeTable(const std::array<OpcodeEntry, 256>& entries,
                     uint8_t nearSize, uint8_t sameSize)
    : entries_(entries), nearSize_(nearSize), sameSize_(sameSize) {}

const CodeTable& CodeTable::defaultTable() {
    static const CodeTable table(buildDefaultEntries(), kDefaultNearSize,
                                 kDefaultSameSize);
    return table;
}

}  // namespace vcdelta
