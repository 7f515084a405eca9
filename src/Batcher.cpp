// Batcher.cpp – Chunk slicing and segment encoding.

#include "RegistryCodec/Batcher.hpp"

#include <algorithm>
#include <stdexcept>

namespace registry {

Batcher::Batcher(const RecordCodec& codec, std::span<const Entity> entities, size_t chunkSize)
    : codec_(&codec), entities_(entities), chunk_size_(chunkSize) {
    if (chunk_size_ == 0)
        throw std::invalid_argument("Batcher: chunk size must be positive");
}

size_t Batcher::chunkCount() const noexcept {
    const size_t n = entities_.size();
    return n / chunk_size_ + (n % chunk_size_ != 0 ? 1 : 0);
}

std::span<const Entity> Batcher::chunk(size_t i) const {
    if (i >= chunkCount())
        throw std::out_of_range("Batcher: chunk " + std::to_string(i) + " out of range (" +
                                std::to_string(chunkCount()) + " chunks)");
    size_t first = i * chunk_size_;
    size_t count = std::min(chunk_size_, entities_.size() - first);
    return entities_.subspan(first, count);
}

std::string Batcher::segment(size_t i) const {
    auto members = chunk(i);

    std::string out;
    out.reserve(members.size() * (codec_->layout().totalWidth() + 1));
    for (const auto& e : members) {
        out += codec_->encode(e);
        out += '\n';
    }
    return out;
}

} // namespace registry
