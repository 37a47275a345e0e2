/**
 * @file byte_source.hpp
 * @brief Minimal read/tell/seek capability used by the container readers
 *
 * The encapsulated pixel data readers only ever need to read forward, ask
 * where they are and jump to a known position. byte_source captures exactly
 * that, so the same parsing code runs over an in-memory buffer or over a
 * std::istream positioned inside a larger file.
 */

#ifndef DCMPIX_ENCODING_BYTE_SOURCE_HPP
#define DCMPIX_ENCODING_BYTE_SOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <istream>
#include <span>
#include <vector>

namespace dcmpix::encoding {

/**
 * @brief Abstract forward reader with random positioning.
 *
 * A short read (fewer bytes than requested) means the end of the data has
 * been reached; it is not an error on its own.
 */
class byte_source {
public:
    virtual ~byte_source() = default;

    /**
     * @brief Reads up to destination.size() bytes.
     * @return Number of bytes actually copied into destination
     */
    [[nodiscard]] virtual std::size_t read(std::span<uint8_t> destination) = 0;

    /**
     * @brief Returns the current absolute position.
     */
    [[nodiscard]] virtual std::uint64_t tell() const = 0;

    /**
     * @brief Moves to an absolute position.
     * @return false if the position cannot be reached
     */
    [[nodiscard]] virtual bool seek(std::uint64_t position) = 0;

protected:
    byte_source() = default;
    byte_source(const byte_source&) = default;
    byte_source& operator=(const byte_source&) = default;
};

/**
 * @brief byte_source over a caller-owned, read-only buffer.
 *
 * The buffer must outlive the source. Several memory_byte_source objects
 * may share one buffer; each keeps its own position.
 */
class memory_byte_source final : public byte_source {
public:
    explicit memory_byte_source(std::span<const uint8_t> data) noexcept;

    [[nodiscard]] std::size_t read(std::span<uint8_t> destination) override;
    [[nodiscard]] std::uint64_t tell() const override;
    [[nodiscard]] bool seek(std::uint64_t position) override;

    /// Bytes between the current position and the end of the buffer
    [[nodiscard]] std::size_t remaining() const noexcept;

private:
    std::span<const uint8_t> data_;
    std::size_t position_{0};
};

/**
 * @brief byte_source over a std::istream.
 *
 * Positions are the stream's own (tellg/seekg) positions. The stream must
 * outlive the source.
 */
class stream_byte_source final : public byte_source {
public:
    explicit stream_byte_source(std::istream& stream) noexcept;

    [[nodiscard]] std::size_t read(std::span<uint8_t> destination) override;
    [[nodiscard]] std::uint64_t tell() const override;
    [[nodiscard]] bool seek(std::uint64_t position) override;

private:
    std::istream* stream_;
};

/**
 * @brief Saves a source position and restores it on scope exit.
 */
class position_guard {
public:
    explicit position_guard(byte_source& source)
        : source_(source), position_(source.tell()) {}

    ~position_guard() { (void)source_.seek(position_); }

    position_guard(const position_guard&) = delete;
    position_guard& operator=(const position_guard&) = delete;

private:
    byte_source& source_;
    std::uint64_t position_;
};

/**
 * @brief Appends up to length bytes from source to out.
 *
 * Reads in fixed-size chunks, so memory grows with the bytes actually
 * present rather than with a length taken from the data.
 *
 * @return Number of bytes appended; less than length at the end of the data
 */
[[nodiscard]] std::uint64_t read_bounded(byte_source& source, std::uint64_t length,
                                         std::vector<uint8_t>& out);

}  // namespace dcmpix::encoding

#endif  // DCMPIX_ENCODING_BYTE_SOURCE_HPP
