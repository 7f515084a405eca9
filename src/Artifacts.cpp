// Artifacts.cpp – Batch file input, segment output and JSON side documents.

#include "RegistryCodec/Artifacts.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <ctime>
#include <fstream>
#include <optional>
#include <system_error>
#include <utility>

namespace registry {

namespace fs = std::filesystem;
using json   = nlohmann::json;

// ─── Helpers ──────────────────────────────────────────────────────────────────

// Write `text` to "<path>.tmp", then rename over `path`.
static void replaceFile(const fs::path& path, const std::string& text) {
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out)
            throw ArtifactError("cannot open " + tmp.string() + " for write");
        out << text;
        out.close();
        if (!out)
            throw ArtifactError("write failed for " + tmp.string());
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec)
        throw ArtifactError("cannot rename " + tmp.string() + " to " + path.string() +
                            ": " + ec.message());
}

std::string isoTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

// ─── Input ────────────────────────────────────────────────────────────────────

std::vector<std::string> readLines(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw ArtifactError("cannot open " + path.string() + " for read");

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        line.clear();
    }
    if (in.bad())
        throw ArtifactError("read failed for " + path.string());
    return lines;
}

// ─── Output ───────────────────────────────────────────────────────────────────

// Index N of a "<prefix>N.txt" file name, or nullopt for any other name.
static std::optional<size_t> segmentIndex(const std::string& file, const std::string& prefix) {
    static const std::string kExt = ".txt";
    if (file.size() <= prefix.size() + kExt.size()) return std::nullopt;
    if (file.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    if (file.compare(file.size() - kExt.size(), kExt.size(), kExt) != 0) return std::nullopt;

    const char* first = file.data() + prefix.size();
    const char* last  = file.data() + file.size() - kExt.size();
    size_t index = 0;
    auto [ptr, errc] = std::from_chars(first, last, index);
    if (errc != std::errc{} || ptr != last) return std::nullopt;
    return index;
}

// Remove "<prefix>N.txt" files with N >= count left over from a larger run.
static void removeStaleSegments(const fs::path& dir, const std::string& prefix, size_t count) {
    std::error_code ec;
    std::vector<fs::path> stale;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        auto index = segmentIndex(it->path().filename().string(), prefix);
        if (index && *index >= count) stale.push_back(it->path());
    }
    if (ec)
        throw ArtifactError("cannot list " + dir.string() + ": " + ec.message());

    for (const auto& p : stale) {
        fs::remove(p, ec);
        if (ec)
            throw ArtifactError("cannot remove " + p.string() + ": " + ec.message());
    }
}

std::vector<fs::path> writeSegments(const Batcher& batcher,
                                    const fs::path& dir,
                                    const std::string& prefix) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
        throw ArtifactError("cannot create " + dir.string() + ": " + ec.message());

    std::vector<fs::path> written;
    written.reserve(batcher.chunkCount());
    for (size_t i = 0; i < batcher.chunkCount(); ++i) {
        fs::path p = dir / (prefix + std::to_string(i) + ".txt");
        replaceFile(p, batcher.segment(i));
        written.push_back(std::move(p));
    }
    removeStaleSegments(dir, prefix, batcher.chunkCount());
    return written;
}

void writeNameMap(const MatchIndex& index, const fs::path& path) {
    json j = json::object();
    for (const auto& [key, doc] : index.entries())
        j[key] = doc;
    replaceFile(path, j.dump(2, ' ', false, json::error_handler_t::replace) + "\n");
}

void writeStatus(const RunStatus& status, const fs::path& path) {
    json j;
    j["last_update"] = isoTimestamp(status.timestamp);
    j["status"]      = status.outcome == RunOutcome::Success ? "success" : "failure";
    j["message"]     = status.message;
    replaceFile(path, j.dump(2, ' ', false, json::error_handler_t::replace) + "\n");
}

} // namespace registry
