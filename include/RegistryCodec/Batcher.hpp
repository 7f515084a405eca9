#pragma once
// Batcher.hpp – Positional chunking of an entity batch into encoded segments.
//
// Chunk i is entities[i × chunkSize, min((i + 1) × chunkSize, n)).  Chunks are
// computed on demand, so iterating twice yields the same partition.
//
//   Batcher b{codec, entities, 100};
//   for (auto chunk : b) { … }          // std::span<const Entity>
//   std::string seg = b.segment(0);     // one line per entity, '\n'-terminated

#include "RecordCodec.hpp"
#include "Types.hpp"

#include <cstddef>
#include <iterator>
#include <span>
#include <string>

namespace registry {

struct BatchConfig {
    size_t      chunk_size{100};
    std::string prefix{"cordata"}; // segment file name prefix: <prefix><i>.txt
};

class Batcher {
public:
    // Throws std::invalid_argument if chunkSize is zero.  `codec` and
    // `entities` must outlive the Batcher.
    Batcher(const RecordCodec& codec, std::span<const Entity> entities, size_t chunkSize);

    [[nodiscard]] size_t chunkSize()  const noexcept { return chunk_size_; }
    [[nodiscard]] size_t chunkCount() const noexcept;

    // Positional slice for chunk `i`.  Throws std::out_of_range.
    [[nodiscard]] std::span<const Entity> chunk(size_t i) const;

    // Encoded text of chunk `i`: every member in order, each line followed
    // by a single '\n'.
    [[nodiscard]] std::string segment(size_t i) const;

    // ── Forward iteration over chunks ────────────────────────────────────────
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = std::span<const Entity>;
        using difference_type   = std::ptrdiff_t;
        using pointer           = void;
        using reference         = std::span<const Entity>;

        iterator() = default;
        iterator(const Batcher* owner, size_t index) noexcept
            : owner_(owner), index_(index) {}

        reference operator*() const { return owner_->chunk(index_); }
        iterator& operator++() noexcept { ++index_; return *this; }
        iterator  operator++(int) noexcept { iterator tmp = *this; ++index_; return tmp; }

        [[nodiscard]] size_t index() const noexcept { return index_; }

        bool operator==(const iterator& o) const noexcept {
            return owner_ == o.owner_ && index_ == o.index_;
        }

    private:
        const Batcher* owner_{nullptr};
        size_t         index_{0};
    };

    [[nodiscard]] iterator begin() const noexcept { return iterator{this, 0}; }
    [[nodiscard]] iterator end()   const noexcept { return iterator{this, chunkCount()}; }

private:
    const RecordCodec*      codec_;
    std::span<const Entity> entities_;
    size_t                  chunk_size_;
};

} // namespace registry
