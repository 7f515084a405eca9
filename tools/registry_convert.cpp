// registry_convert.cpp – Decode a fixed-width registry extract, build the name
// index and re-emit the batch as numbered segment files.
//
// Usage:
//   registry_convert [--config <layout.xml>] <input.txt> <out_dir>
//
// Outputs (in <out_dir>):
//   <prefix>0.txt …   re-encoded records, <chunk> per file
//   name_map.json     canonical name → document number
//   status.json       { last_update, status, message }

#include "RegistryCodec/Artifacts.hpp"
#include "RegistryCodec/Batcher.hpp"
#include "RegistryCodec/ConfigLoader.hpp"
#include "RegistryCodec/MatchIndex.hpp"
#include "RegistryCodec/RecordCodec.hpp"

#include <chrono>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace registry;

static void usage() {
    std::cerr << "Usage: registry_convert [--config <layout.xml>] <input.txt> <out_dir>\n";
}

// Write a failure status.json; errors doing so are reported, not rethrown.
static void reportFailure(const fs::path& out_dir, const std::string& message) {
    try {
        fs::create_directories(out_dir);
        writeStatus(RunStatus{std::chrono::system_clock::now(), RunOutcome::Failure, message},
                    out_dir / "status.json");
    } catch (const std::exception& ex) {
        std::cerr << "[registry_convert] cannot write failure status: " << ex.what() << '\n';
    }
}

int main(int argc, char* argv[]) {
    std::optional<fs::path> config_path;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) { usage(); return 2; }
            config_path = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            usage();
            return 0;
        } else {
            positional.push_back(std::move(arg));
        }
    }
    if (positional.size() != 2) { usage(); return 2; }

    const fs::path input   = positional[0];
    const fs::path out_dir = positional[1];

    std::cout << "[registry_convert] input=" << input.string()
              << " out=" << out_dir.string() << '\n';

    try {
        RegistryConfig cfg = config_path ? loadConfig(*config_path) : defaultConfig();
        std::cout << "[registry_convert] layout '" << cfg.name << "' width="
                  << cfg.layout.totalWidth() << " officers<=" << cfg.layout.maxOfficers()
                  << " chunk=" << cfg.batch.chunk_size << '\n';

        RecordCodec codec{cfg.layout};

        std::vector<std::string> lines = readLines(input);
        DecodedBatch batch = codec.decodeBatch(lines);
        for (const auto& l : batch.lines) {
            if (!l.valid)
                std::cerr << "[registry_convert] line " << (l.index + 1)
                          << " rejected: " << l.error << '\n';
        }

        std::vector<Entity> entities = batch.entities();

        NameNormalizer normalizer{cfg.normalizer};
        MatchIndex index = MatchIndex::build(entities, normalizer);

        Batcher batcher{codec, entities, cfg.batch.chunk_size};
        auto segments = writeSegments(batcher, out_dir, cfg.batch.prefix);
        for (size_t i = 0; i < segments.size(); ++i)
            std::cout << "[registry_convert] wrote " << segments[i].filename().string()
                      << " (" << batcher.chunk(i).size() << " records)\n";

        writeNameMap(index, out_dir / "name_map.json");

        std::string message = std::to_string(entities.size()) + " records in " +
                              std::to_string(segments.size()) + " segments, " +
                              std::to_string(batch.rejected) + " rejected, " +
                              std::to_string(index.size()) + " names indexed";
        writeStatus(RunStatus{std::chrono::system_clock::now(), RunOutcome::Success, message},
                    out_dir / "status.json");

        std::cout << "[registry_convert] " << message << '\n';
    } catch (const std::exception& ex) {
        std::cerr << "[registry_convert] failed: " << ex.what() << '\n';
        reportFailure(out_dir, ex.what());
        return 1;
    }
    return 0;
}
