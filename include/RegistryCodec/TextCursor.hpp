#pragma once
// TextCursor.hpp – Column-level I/O over one fixed-width text record.
//
// Record text rules:
//   • Every column is left-justified and right-padded with spaces.
//   • Reading trims trailing spaces only; leading and embedded spaces are data.
//   • Writing hard-truncates values longer than the column (no ellipsis).
//   • Columns never move: the writer owns a pre-sized, space-filled line.

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace registry {

// ─────────────────────────────────────────────────────────────────────────────
//  ColumnReader
// ─────────────────────────────────────────────────────────────────────────────
// Reads columns from a read-only line.  Offsets are absolute unless a base
// has been set with rebase(), which is how officer strides are walked.
class ColumnReader {
public:
    explicit ColumnReader(std::string_view line) noexcept
        : line_(line), base_(0) {}

    [[nodiscard]] size_t size() const noexcept { return line_.size(); }
    [[nodiscard]] size_t base() const noexcept { return base_; }

    void rebase(size_t base) noexcept { base_ = base; }

    // Raw column text, padding included.
    [[nodiscard]] std::string_view raw(size_t offset, size_t width) const {
        boundsCheck(offset, width);
        return line_.substr(base_ + offset, width);
    }

    // Column text with trailing spaces removed.
    [[nodiscard]] std::string read(size_t offset, size_t width) const {
        return std::string(trimRight(raw(offset, width)));
    }

    // True when every character of the column is a space.
    [[nodiscard]] bool blank(size_t offset, size_t width) const {
        std::string_view v = raw(offset, width);
        return std::all_of(v.begin(), v.end(), [](char c) { return c == ' '; });
    }

    [[nodiscard]] static std::string_view trimRight(std::string_view v) noexcept {
        size_t end = v.find_last_not_of(' ');
        return end == std::string_view::npos ? std::string_view{} : v.substr(0, end + 1);
    }

private:
    void boundsCheck(size_t offset, size_t width) const {
        if (base_ + offset + width > line_.size())
            throw std::out_of_range("ColumnReader: column past end of line");
    }

    std::string_view line_;
    size_t           base_;
};

// ─────────────────────────────────────────────────────────────────────────────
//  ColumnWriter
// ─────────────────────────────────────────────────────────────────────────────
// Writes columns into a space-filled line of fixed width.  The line length
// never changes after construction.
class ColumnWriter {
public:
    explicit ColumnWriter(size_t width) : line_(width, ' '), base_(0) {}

    void rebase(size_t base) noexcept { base_ = base; }

    // Copy at most `width` characters of `value`; the rest stays as padding.
    void write(size_t offset, size_t width, std::string_view value) {
        if (base_ + offset + width > line_.size())
            throw std::out_of_range("ColumnWriter: column past end of line");
        size_t n = std::min(value.size(), width);
        std::copy_n(value.begin(), n, line_.begin() + static_cast<std::ptrdiff_t>(base_ + offset));
    }

    [[nodiscard]] const std::string& line() const noexcept { return line_; }
    [[nodiscard]] std::string        take()       noexcept { return std::move(line_); }

private:
    std::string line_;
    size_t      base_;
};

} // namespace registry
