#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#define XXH_INLINE_ALL
#include "xxhash.h"

// Common buffers and file plumbing shared by the decode engines.
class DeltaDecoder {
public:
    virtual ~DeltaDecoder() = default;

    std::vector<uint8_t> deltaBuf;
    std::vector<uint8_t> baseBuf;
    std::vector<uint8_t> expectedBuf;
    std::vector<uint8_t> outputBuf;

    virtual const char* name() const = 0;

    // Decodes deltaBuf against baseBuf into outputBuf and returns its size.
    // Throws on malformed input; outputBuf is left empty in that case.
    virtual uint64_t decode() = 0;

    bool loadDelta(const std::filesystem::path& filePath) {
        return readFile(filePath, deltaBuf, "delta");
    }

    bool loadBase(const std::filesystem::path& filePath) {
        return readFile(filePath, baseBuf, "base");
    }

    bool loadExpected(const std::filesystem::path& filePath) {
        return readFile(filePath, expectedBuf, "expected");
    }

    bool verifyDecode() const { return outputBuf == expectedBuf; }

    uint64_t fingerprint() const {
        return XXH3_64bits(outputBuf.data(), outputBuf.size());
    }

protected:
    static bool readFile(const std::filesystem::path& filePath,
                         std::vector<uint8_t>& buf, const char* what) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(filePath, ec)) {
            std::cerr << "Not a regular " << what << " file: " << filePath << "\n";
            return false;
        }
        std::ifstream inFile(filePath, std::ios::binary | std::ios::ate);
        if (!inFile) {
            std::cerr << "Failed to open " << what << " file: " << filePath << "\n";
            return false;
        }
        const std::streamoff size = inFile.tellg();
        if (size < 0) {
            std::cerr << "Failed to size " << what << " file: " << filePath << "\n";
            return false;
        }
        buf.resize(static_cast<size_t>(size));
        inFile.seekg(0, std::ios::beg);
        inFile.read(reinterpret_cast<char*>(buf.data()),
                    static_cast<std::streamsize>(buf.size()));
        if (!inFile) {
            std::cerr << "Failed to read " << what << " file: " << filePath << "\n";
            return false;
        }
        return true;
    }
};
