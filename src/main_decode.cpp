#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "decoders/vcdiff_decoder.h"

namespace fs = std::filesystem;

/**
 * Decode a VCDIFF delta against its base (dictionary) file and store the
 * reconstructed target beside the delta file.
 *
 * @param deltaPath     path to the VCDIFF delta
 * @param basePath      path to the reference / dictionary file
 * @param expectedPath  optional file the output must match (empty: skip)
 *
 * Result is written as  <deltaPath>.decoded   in the same directory.
 * Prints the reconstructed size and its XXH3 fingerprint.
 * @return 0 on success, 1 when the output differs from the expected file
 */
static int decodeFile(const fs::path& deltaPath, const fs::path& basePath,
                      const fs::path& expectedPath)
{
    VcdiffDeltaDecoder decoder;

    /* ---- load delta and dictionary -------------------------------------- */
    if (!decoder.loadDelta(deltaPath)) return 2;
    if (!decoder.loadBase(basePath)) return 2;

    /* ---- decode --------------------------------------------------------- */
    decoder.decode();

    /* ---- write reconstructed target ------------------------------------- */
    fs::path outPath = deltaPath;
    outPath += ".decoded";

    std::ofstream outFile(outPath, std::ios::binary);
    if (!outFile) throw std::runtime_error("Cannot create " + outPath.string());
    outFile.write(reinterpret_cast<const char*>(decoder.outputBuf.data()),
                  static_cast<std::streamsize>(decoder.outputBuf.size()));
    if (!outFile) throw std::runtime_error("Cannot write " + outPath.string());

    std::cout << "Decoded file written to " << outPath
              << " (size: " << decoder.outputBuf.size() << " bytes)\n";
    std::cout << "XXH3: " << std::hex << std::setw(16) << std::setfill('0')
              << decoder.fingerprint() << std::dec << '\n';

    const std::vector<uint8_t>& appHeader = decoder.engine().applicationHeader();
    if (!appHeader.empty()) {
        std::cout << "Application header: "
                  << std::string(appHeader.begin(), appHeader.end()) << '\n';
    }

    /* ---- optional verification ------------------------------------------ */
    if (expectedPath.empty()) return 0;
    if (!decoder.loadExpected(expectedPath)) return 2;
    if (decoder.verifyDecode()) {
        std::cout << "Decoded output matches " << expectedPath << ".\n";
        return 0;
    }
    std::cerr << "Decoded output does NOT match " << expectedPath << "!\n";
    return 1;
}


int main(int argc, char* argv[])
{
    std::string deltaPath = argc >= 2 ? argv[1] : "./deltas/delta.vcdiff";
    std::string basePath = argc >= 3 ? argv[2] : "./base";
    std::string expectedPath = argc >= 4 ? argv[3] : "";
    try {
        return decodeFile(deltaPath, basePath, expectedPath);
    } catch (const std::exception& e) {
        std::cerr << "decode error: " << e.what() << '\n';
        return 2;
    }
}
