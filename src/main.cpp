#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "csv.h"
#include "decoders/vcdiff_decoder.h"
#include "decoders/xdelta_decoder.h"

namespace fs = std::filesystem;

static fs::path DATA_DIR = "./test_data";      // default data directory
static fs::path delta_map = "./delta_map.csv";  // default delta map file

struct EngineTotals {
    std::unique_ptr<DeltaDecoder> decoder;
    uint64_t decodedBytes = 0;
    uint64_t durationNs = 0;
    uint64_t mismatches = 0;
    uint64_t failures = 0;
};

static void decodeEntry(EngineTotals& engine, const std::string& deltaId)
{
    DeltaDecoder& decoder = *engine.decoder;
    auto start = std::chrono::high_resolution_clock::now();
    try {
        decoder.decode();
    } catch (const std::exception& e) {
        auto end = std::chrono::high_resolution_clock::now();
        engine.durationNs +=
            std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
        ++engine.failures;
        std::cerr << decoder.name() << " failed on " << deltaId << ": "
                  << e.what() << '\n';
        return;
    }
    auto end = std::chrono::high_resolution_clock::now();
    engine.durationNs +=
        std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    engine.decodedBytes += decoder.outputBuf.size();

    if (!decoder.verifyDecode()) {
        ++engine.mismatches;
        std::cerr << decoder.name() << ": decoded output for " << deltaId
                  << " does NOT match the expected chunk!\n";
    }
#ifdef VERBOSE
    std::cout << decoder.name() << " decoded " << deltaId << ": "
              << decoder.outputBuf.size() << " bytes, XXH3 "
              << std::hex << decoder.fingerprint() << std::dec << '\n';
#endif
}

static void report(const EngineTotals& engine)
{
    const std::string name = engine.decoder->name();
    double throughput = 0.0;
    if (engine.durationNs > 0) {
        throughput = (static_cast<double>(engine.decodedBytes) / (1024 * 1024)) /
                     (engine.durationNs / 1000000000.0);  // MB/s
    }
    std::cout << name << " decoded: " << engine.decodedBytes << " bytes\n";
    std::cout << name << " Throughput: " << throughput << " MB/s" << std::endl;
    std::cout << name << " mismatches: " << engine.mismatches
              << ", failures: " << engine.failures << '\n';
}


int main(int argc, char* argv[]) try {

    const fs::path inCsv = argc > 1 ? fs::path{ argv[1] } : delta_map;
    const std::string engineName = argc > 2 ? argv[2] : "vcdiff";
    if (argc > 3) DATA_DIR = fs::path{ argv[3] };  // optional override

    std::vector<EngineTotals> engines;
    if (engineName == "vcdiff" || engineName == "both") {
        engines.emplace_back();
        engines.back().decoder = std::make_unique<VcdiffDeltaDecoder>();
    }
    if (engineName == "xdelta3" || engineName == "both") {
        engines.emplace_back();
        engines.back().decoder = std::make_unique<XDeltaDecoder>();
    }
    if (engines.empty()) {
        std::cerr << "Unknown engine " << engineName
                  << " (expected vcdiff, xdelta3 or both)\n";
        return 1;
    }

    std::ifstream in(inCsv);
    if (!in) {
        std::cerr << "Cannot open " << inCsv << '\n';
        return 1;
    }

    std::string header, line;
    std::getline(in, header);  // skip header line
    uint64_t entries = 0;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        auto fields = splitCSV(line);
        if (fields.size() < 4) {
            std::cerr << "Bad CSV line: " << line << '\n';
            continue;
        }

        const std::string& deltaId = fields[0];
        const fs::path deltaPath = DATA_DIR / fields[1];
        const fs::path basePath = DATA_DIR / fields[2];
        const fs::path expectedPath = DATA_DIR / fields[3];
#ifdef VERBOSE
        std::cout << "Processing delta ID: " << deltaId
            << ", Delta: " << deltaPath << ", Base: " << basePath
            << '\n';
#endif

        // load once, share the buffers with every engine
        DeltaDecoder& first = *engines.front().decoder;
        if (!first.loadDelta(deltaPath) || !first.loadBase(basePath) ||
            !first.loadExpected(expectedPath)) {
            continue;
        }
        for (size_t i = 1; i < engines.size(); ++i) {
            engines[i].decoder->deltaBuf = first.deltaBuf;
            engines[i].decoder->baseBuf = first.baseBuf;
            engines[i].decoder->expectedBuf = first.expectedBuf;
        }

        for (EngineTotals& engine : engines) {
            decodeEntry(engine, deltaId);
        }
        ++entries;
    }

    std::cout << "Entries: " << entries << '\n';
    int status = 0;
    for (const EngineTotals& engine : engines) {
        report(engine);
        if (engine.mismatches != 0 || engine.failures != 0) status = 1;
    }
    return status;
}
catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 2;
}
