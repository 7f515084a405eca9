#pragma once
// Artifacts.hpp – File-level inputs and outputs around the codec core.
//
//   <dir>/<prefix>0.txt, <prefix>1.txt, …   encoded segments, one per chunk
//   name_map.json                           { canonicalName: documentNumber }
//   status.json                             { last_update, status, message }
//
// JSON documents are written to "<path>.tmp" and renamed into place.

#include "Batcher.hpp"
#include "MatchIndex.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace registry {

// Thrown when an artifact cannot be read or written.
class ArtifactError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class RunOutcome { Success, Failure };

struct RunStatus {
    std::chrono::system_clock::time_point timestamp;
    RunOutcome                            outcome{RunOutcome::Success};
    std::string                           message;
};

// Read a batch file into lines without their terminators ('\n' or "\r\n").
// A final empty line (file ending in a newline) is not returned.
[[nodiscard]] std::vector<std::string> readLines(const std::filesystem::path& path);

// Write one "<prefix><i>.txt" file per chunk into `dir`; returns their paths.
// "<prefix>N.txt" files with N >= chunkCount() from an earlier, larger run
// are removed.
std::vector<std::filesystem::path> writeSegments(const Batcher& batcher,
                                                 const std::filesystem::path& dir,
                                                 const std::string& prefix);

void writeNameMap(const MatchIndex& index, const std::filesystem::path& path);
void writeStatus(const RunStatus& status, const std::filesystem::path& path);

// "2026-10-19T08:30:00Z"
[[nodiscard]] std::string isoTimestamp(std::chrono::system_clock::time_point tp);

} // namespace registry
