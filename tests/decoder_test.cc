#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "decoders/vcdiff_decoder.h"

namespace {

namespace fs = std::filesystem;

class DeltaDecoderFilesTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::path(::testing::TempDir()) / "vcdelta_decoder_test";
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
};

TEST_F(DeltaDecoderFilesTest, LoadsRegularFile) {
    const fs::path file = dir_ / "base.bin";
    const std::string contents("base\0bytes", 10);
    {
        std::ofstream out(file, std::ios::binary);
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    }

    VcdiffDeltaDecoder decoder;
    ASSERT_TRUE(decoder.loadBase(file));
    EXPECT_EQ(contents, std::string(decoder.baseBuf.begin(), decoder.baseBuf.end()));
}

TEST_F(DeltaDecoderFilesTest, LoadsEmptyFile) {
    const fs::path file = dir_ / "empty.vcdiff";
    std::ofstream(file, std::ios::binary).close();

    VcdiffDeltaDecoder decoder;
    decoder.deltaBuf = {1, 2, 3};
    ASSERT_TRUE(decoder.loadDelta(file));
    EXPECT_TRUE(decoder.deltaBuf.empty());
}

TEST_F(DeltaDecoderFilesTest, RejectsDirectory) {
    VcdiffDeltaDecoder decoder;
    EXPECT_FALSE(decoder.loadDelta(dir_));
    EXPECT_TRUE(decoder.deltaBuf.empty());
}

TEST_F(DeltaDecoderFilesTest, RejectsMissingFile) {
    VcdiffDeltaDecoder decoder;
    EXPECT_FALSE(decoder.loadExpected(dir_ / "missing.out"));
    EXPECT_TRUE(decoder.expectedBuf.empty());
}

}  // namespace
