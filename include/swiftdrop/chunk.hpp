#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <vector>

namespace swiftdrop::chunk {

using Bytes = std::vector<std::uint8_t>;

// Non-owning view; the underlying buffer must outlive it.
struct ByteView {
    const std::uint8_t* data = nullptr;
    std::size_t size = 0;

    ByteView() = default;
    ByteView(const std::uint8_t* ptr, std::size_t len) : data(ptr), size(len) {}
    ByteView(const Bytes& bytes) : data(bytes.data()), size(bytes.size()) {}  // NOLINT

    Bytes ToBytes() const { return Bytes(data, data + size); }
};

struct ChunkView {
    std::size_t index = 0;
    std::uint64_t offset = 0;
    ByteView bytes;
    bool last = false;
};

std::size_t OptimalChunkSize(std::uint64_t file_size);
bool ShouldUseHighPerformanceMode(std::uint64_t file_size);
std::size_t ChunkCount(std::uint64_t total_size, std::size_t chunk_size);

// Lazy, restartable sequence of zero-copy views over a buffer.
class ChunkSequence {
public:
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = ChunkView;
        using difference_type = std::ptrdiff_t;
        using pointer = const ChunkView*;
        using reference = ChunkView;

        Iterator(const ChunkSequence* owner, std::size_t index) : owner_(owner), index_(index) {}

        ChunkView operator*() const { return (*owner_)[index_]; }
        Iterator& operator++() {
            ++index_;
            return *this;
        }
        Iterator operator++(int) {
            Iterator prev = *this;
            ++index_;
            return prev;
        }
        bool operator==(const Iterator& other) const { return owner_ == other.owner_ && index_ == other.index_; }
        bool operator!=(const Iterator& other) const { return !(*this == other); }

    private:
        const ChunkSequence* owner_;
        std::size_t index_;
    };

    ChunkSequence(ByteView data, std::size_t chunk_size);

    Iterator begin() const { return Iterator(this, 0); }
    Iterator end() const { return Iterator(this, count_); }
    std::size_t size() const noexcept { return count_; }
    bool empty() const noexcept { return count_ == 0; }
    std::size_t chunk_size() const noexcept { return chunk_size_; }

    ChunkView operator[](std::size_t index) const;

private:
    ByteView data_;
    std::size_t chunk_size_;
    std::size_t count_;
};

ChunkSequence Split(ByteView data, std::size_t chunk_size);

struct Unpacked {
    ByteView head;
    ByteView body;
};

// [u16 little-endian len(head)][head][body]
Bytes Pack(ByteView head, ByteView body);
// Views point into combined. Throws FormatError when the prefix overruns it.
Unpacked Unpack(ByteView combined);

}  // namespace swiftdrop::chunk
