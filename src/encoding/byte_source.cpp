#include "dcmpix/encoding/byte_source.hpp"

#include <algorithm>
#include <cstring>

namespace dcmpix::encoding {

// ============================================================================
// memory_byte_source
// ============================================================================

memory_byte_source::memory_byte_source(std::span<const uint8_t> data) noexcept
    : data_(data) {}

std::size_t memory_byte_source::read(std::span<uint8_t> destination) {
    const std::size_t count = std::min(destination.size(), remaining());
    if (count > 0) {
        std::memcpy(destination.data(), data_.data() + position_, count);
        position_ += count;
    }
    return count;
}

std::uint64_t memory_byte_source::tell() const {
    return position_;
}

bool memory_byte_source::seek(std::uint64_t position) {
    if (position > data_.size()) {
        return false;
    }
    position_ = static_cast<std::size_t>(position);
    return true;
}

std::size_t memory_byte_source::remaining() const noexcept {
    return data_.size() - position_;
}

// ============================================================================
// stream_byte_source
// ============================================================================

stream_byte_source::stream_byte_source(std::istream& stream) noexcept
    : stream_(&stream) {}

std::size_t stream_byte_source::read(std::span<uint8_t> destination) {
    if (destination.empty() || !stream_->good()) {
        return 0;
    }
    stream_->read(reinterpret_cast<char*>(destination.data()),
                  static_cast<std::streamsize>(destination.size()));
    return static_cast<std::size_t>(stream_->gcount());
}

std::uint64_t stream_byte_source::tell() const {
    // tellg() fails once eofbit is set
    if (stream_->eof()) {
        stream_->clear(stream_->rdstate() & ~std::ios::eofbit & ~std::ios::failbit);
    }
    const auto position = stream_->tellg();
    return position < 0 ? 0 : static_cast<std::uint64_t>(position);
}

bool stream_byte_source::seek(std::uint64_t position) {
    stream_->clear();
    stream_->seekg(static_cast<std::streamoff>(position), std::ios::beg);
    return !stream_->fail();
}

// ============================================================================
// read_bounded
// ============================================================================

std::uint64_t read_bounded(byte_source& source, std::uint64_t length,
                           std::vector<uint8_t>& out) {
    constexpr std::size_t kChunkSize = 64 * 1024;

    std::uint64_t total = 0;
    while (total < length) {
        const auto chunk = static_cast<std::size_t>(
            std::min<std::uint64_t>(kChunkSize, length - total));
        const auto start = out.size();
        out.resize(start + chunk);

        const auto received = source.read(std::span<uint8_t>(out.data() + start, chunk));
        out.resize(start + received);
        total += received;
        if (received < chunk) {
            break;
        }
    }
    return total;
}

}  // namespace dcmpix::encoding
