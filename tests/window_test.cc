#include <string>

#include <gtest/gtest.h>

#include "delta_builder.h"
#include "window.h"

namespace vcdelta {
namespace {

using test::bytesOf;
using test::varint;
using test::WindowBuilder;

class ParseWindowTest : public ::testing::Test {
protected:
    ParseWindowTest() {
        limits_.dictionarySize = 100;
        limits_.decodedSize = 0;
        limits_.maxTargetWindowSize = 1 << 20;
        limits_.allowTargetSource = true;
    }

    Window parse(const std::string& bytes) {
        buf_ = bytes;
        cursor_ = ByteCursor(bytesOf(buf_), buf_.size());
        return parseWindow(cursor_, limits_);
    }

    WindowLimits limits_;
    std::string buf_;
    ByteCursor cursor_;
};

TEST_F(ParseWindowTest, WithoutSource) {
    const std::string bytes = WindowBuilder().emitADD("hello").build(5);
    Window w = parse(bytes);

    EXPECT_EQ(0, w.header.indicator);
    EXPECT_EQ(SourceKind::None, w.header.sourceKind);
    EXPECT_EQ(0u, w.header.sourceLength);
    EXPECT_EQ(5u, w.header.targetLength);
    EXPECT_EQ(5u, w.header.dataLength);
    EXPECT_EQ(2u, w.header.instructionsLength);
    EXPECT_EQ(0u, w.header.addressesLength);
    EXPECT_FALSE(w.header.hasChecksum);
    EXPECT_TRUE(cursor_.atEnd());

    EXPECT_EQ(5u, w.data.size());
    EXPECT_EQ('h', w.data.data()[0]);
    EXPECT_EQ(test::kOpAdd, w.instructions.data()[0]);
    EXPECT_TRUE(w.addresses.atEnd());
}

TEST_F(ParseWindowTest, DictionarySource) {
    const std::string bytes = WindowBuilder()
                                  .source(VCD_SOURCE, 40, 60)
                                  .emitCOPY(40, AddressCache::kSelfMode, 0)
                                  .build(40);
    Window w = parse(bytes);

    EXPECT_EQ(SourceKind::Dictionary, w.header.sourceKind);
    EXPECT_EQ(40u, w.header.sourceLength);
    EXPECT_EQ(60u, w.header.sourcePosition);
    EXPECT_EQ(1u, w.header.addressesLength);
    EXPECT_TRUE(cursor_.atEnd());
}

TEST_F(ParseWindowTest, DictionarySourceOutOfRange) {
    const std::string past = WindowBuilder().source(VCD_SOURCE, 41, 60).build(0);
    EXPECT_VCDIFF_ERROR(parse(past), ErrorKind::LengthMismatch);

    const std::string start = WindowBuilder().source(VCD_SOURCE, 0, 101).build(0);
    EXPECT_VCDIFF_ERROR(parse(start), ErrorKind::LengthMismatch);
}

TEST_F(ParseWindowTest, HugeSourceDoesNotWrap) {
    const std::string bytes =
        WindowBuilder().source(VCD_SOURCE, ~uint64_t(0) - 5, 10).build(0);
    EXPECT_VCDIFF_ERROR(parse(bytes), ErrorKind::LengthMismatch);
}

TEST_F(ParseWindowTest, TargetSourceUsesDecodedOutput) {
    const std::string bytes = WindowBuilder().source(VCD_TARGET, 8, 2).build(0);

    EXPECT_VCDIFF_ERROR(parse(bytes), ErrorKind::LengthMismatch);

    limits_.decodedSize = 10;
    Window w = parse(bytes);
    EXPECT_EQ(SourceKind::Target, w.header.sourceKind);
    EXPECT_EQ(8u, w.header.sourceLength);
    EXPECT_EQ(2u, w.header.sourcePosition);
}

TEST_F(ParseWindowTest, TargetSourceDisabled) {
    limits_.decodedSize = 10;
    limits_.allowTargetSource = false;
    const std::string bytes = WindowBuilder().source(VCD_TARGET, 8, 2).build(0);
    EXPECT_VCDIFF_ERROR(parse(bytes), ErrorKind::UnsupportedFeature);
}

TEST_F(ParseWindowTest, Checksum) {
    const std::string bytes =
        WindowBuilder().emitADD("abc").checksum(0x024d0127).build(3);
    Window w = parse(bytes);

    EXPECT_EQ(unsigned(VCD_ADLER32), unsigned(w.header.indicator));
    EXPECT_TRUE(w.header.hasChecksum);
    EXPECT_EQ(0x024d0127u, w.header.checksum);
    EXPECT_EQ(3u, w.data.size());
    EXPECT_TRUE(cursor_.atEnd());
}

TEST_F(ParseWindowTest, BothSourceBits) {
    std::string bytes = WindowBuilder().source(VCD_SOURCE, 1, 0).build(0);
    bytes[0] = VCD_SOURCE | VCD_TARGET;
    EXPECT_VCDIFF_ERROR(parse(bytes), ErrorKind::InvalidIndicator);
}

TEST_F(ParseWindowTest, ReservedWindowBits) {
    for (uint8_t bit : {0x08, 0x10, 0x80}) {
        std::string bytes = WindowBuilder().build(0);
        bytes[0] = static_cast<char>(bit);
        EXPECT_VCDIFF_ERROR(parse(bytes), ErrorKind::InvalidIndicator);
    }
}

// Layout without a source segment: indicator, delta length, target length,
// delta indicator.
TEST_F(ParseWindowTest, SecondaryCompression) {
    for (uint8_t bit : {VCD_DATACOMP, VCD_INSTCOMP, VCD_ADDRCOMP}) {
        std::string bytes = WindowBuilder().emitADD("x").build(1);
        bytes[3] = static_cast<char>(bit);
        EXPECT_VCDIFF_ERROR(parse(bytes), ErrorKind::UnsupportedFeature);
    }
}

TEST_F(ParseWindowTest, ReservedDeltaIndicatorBits) {
    std::string bytes = WindowBuilder().emitADD("x").build(1);
    bytes[3] = '\x08';
    EXPECT_VCDIFF_ERROR(parse(bytes), ErrorKind::InvalidIndicator);
}

TEST_F(ParseWindowTest, TargetWindowLimit) {
    limits_.maxTargetWindowSize = 4;
    const std::string bytes = WindowBuilder().emitADD("hello").build(5);
    EXPECT_VCDIFF_ERROR(parse(bytes), ErrorKind::LimitExceeded);
}

TEST_F(ParseWindowTest, DeltaLengthPastInput) {
    const std::string bytes = WindowBuilder().emitADD("hello").build(5);
    EXPECT_VCDIFF_ERROR(parse(bytes.substr(0, bytes.size() - 1)),
                        ErrorKind::TruncatedInput);
}

TEST_F(ParseWindowTest, SectionsDoNotAddUp) {
    // declared 6 bytes, but the five header bytes plus two section bytes make 7
    std::string bytes;
    bytes += '\0';
    bytes += varint(6);
    bytes += varint(1);          // target length
    bytes += '\0';               // delta indicator
    bytes += varint(1);          // data
    bytes += varint(1);          // instructions
    bytes += varint(0);          // addresses
    bytes += "x";
    EXPECT_VCDIFF_ERROR(parse(bytes + "y"), ErrorKind::LengthMismatch);

    // delta length shorter than its own header
    std::string shortHeader;
    shortHeader += '\0';
    shortHeader += varint(3);
    shortHeader += varint(1);
    shortHeader += '\0';
    shortHeader += varint(0);
    shortHeader += varint(0);
    shortHeader += varint(0);
    EXPECT_VCDIFF_ERROR(parse(shortHeader), ErrorKind::LengthMismatch);
}

TEST_F(ParseWindowTest, TruncatedHeaderFields) {
    EXPECT_VCDIFF_ERROR(parse(std::string()), ErrorKind::TruncatedInput);
    EXPECT_VCDIFF_ERROR(parse(std::string(1, char(VCD_SOURCE))),
                        ErrorKind::TruncatedInput);
    EXPECT_VCDIFF_ERROR(parse(std::string("\x01\x05", 2)),
                        ErrorKind::TruncatedInput);
}

TEST_F(ParseWindowTest, ConsecutiveWindows) {
    const std::string first = WindowBuilder().emitADD("ab").build(2);
    const std::string second = WindowBuilder().emitRUN('z', 4).build(4);
    buf_ = first + second;
    cursor_ = ByteCursor(bytesOf(buf_), buf_.size());

    Window a = parseWindow(cursor_, limits_);
    EXPECT_EQ(first.size(), cursor_.position());
    Window b = parseWindow(cursor_, limits_);
    EXPECT_TRUE(cursor_.atEnd());
    EXPECT_EQ(2u, a.header.targetLength);
    EXPECT_EQ(4u, b.header.targetLength);
    EXPECT_EQ('z', b.data.data()[0]);
}

}  // namespace
}  // namespace vcdelta
