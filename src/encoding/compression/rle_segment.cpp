#include "dcmpix/encoding/compression/rle_segment.hpp"

#include <algorithm>

namespace dcmpix::encoding::compression {

namespace {

constexpr std::size_t kMaxRunLength = 128;

/// Length of the run of identical bytes starting at pos, capped at limit
std::size_t run_length_at(std::span<const uint8_t> input, std::size_t pos,
                          std::size_t limit) {
    std::size_t length = 1;
    while (pos + length < input.size() &&
           input[pos + length] == input[pos] &&
           length < limit) {
        ++length;
    }
    return length;
}

}  // namespace

std::vector<uint8_t> decode_rle_segment(std::span<const uint8_t> input,
                                        std::size_t size_hint) {
    std::vector<uint8_t> output;
    output.reserve(size_hint);

    std::size_t pos = 0;
    const std::size_t size = input.size();

    while (pos < size) {
        const uint8_t header = input[pos];
        ++pos;

        if (header < 128) {
            // Literal: copy the next header + 1 bytes
            const std::size_t count = std::min<std::size_t>(header + 1u, size - pos);
            output.insert(output.end(), input.begin() + pos, input.begin() + pos + count);
            pos += count;
        } else if (header > 128) {
            // Replicate: the next byte 257 - header times
            if (pos >= size) {
                break;
            }
            const std::size_t count = 257u - header;
            output.insert(output.end(), count, input[pos]);
            ++pos;
        }
        // header == 128 is a no-op
    }

    return output;
}

std::vector<uint8_t> encode_rle_segment(std::span<const uint8_t> input) {
    std::vector<uint8_t> output;
    output.reserve(input.size() + input.size() / kMaxRunLength + 1);

    std::size_t pos = 0;
    const std::size_t size = input.size();

    while (pos < size) {
        const std::size_t run = run_length_at(input, pos, kMaxRunLength);

        if (run >= 3) {
            // Header 257 - run, i.e. 1 - run as a signed byte
            output.push_back(static_cast<uint8_t>(257 - run));
            output.push_back(input[pos]);
            pos += run;
            continue;
        }

        // Literal run up to the next 3-byte repeat
        const std::size_t start = pos;
        while (pos < size && pos - start < kMaxRunLength) {
            if (run_length_at(input, pos, 3) >= 3) {
                break;
            }
            ++pos;
        }

        output.push_back(static_cast<uint8_t>(pos - start - 1));
        output.insert(output.end(), input.begin() + start, input.begin() + pos);
    }

    return output;
}

}  // namespace dcmpix::encoding::compression
