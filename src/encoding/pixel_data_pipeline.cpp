#include "dcmpix/encoding/pixel_data_pipeline.hpp"
#include "dcmpix/encoding/byte_source.hpp"
#include "dcmpix/encoding/compression/codec_factory.hpp"
#include "dcmpix/encoding/encapsulation/encapsulator.hpp"
#include "dcmpix/integration/logger_adapter.hpp"
#include "dcmpix/integration/thread_adapter.hpp"

#include <string>
#include <utility>

namespace dcmpix::encoding {

namespace {

using dcmpix::integration::frame_operation;
using dcmpix::integration::logger_adapter;
using dcmpix::integration::thread_adapter;
using frame_bytes = pixel_data_pipeline::frame_bytes;

/// Runs task(i) for every frame index, on the pool when parallel is set
template <typename Task>
std::vector<Result<frame_bytes>> run_per_frame(std::size_t count, bool parallel,
                                                const Task& task) {
    if (parallel) {
        return thread_adapter::run_indexed(count, task);
    }

    std::vector<Result<frame_bytes>> results;
    results.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        results.push_back(task(i));
    }
    return results;
}

std::size_t total_size(const std::vector<frame_bytes>& frames) {
    std::size_t total = 0;
    for (const auto& frame : frames) {
        total += frame.size();
    }
    return total;
}

}  // namespace

pixel_data_pipeline::pixel_data_pipeline(pipeline_config config)
    : config_(std::move(config)) {}

std::unique_ptr<compression::compression_codec> pixel_data_pipeline::make_codec() const {
    if (config_.transfer_syntax_uid == compression::rle_codec::kTransferSyntaxUID) {
        return std::make_unique<compression::rle_codec>(config_.segment_order);
    }
    return compression::codec_factory::create(config_.transfer_syntax_uid);
}

encapsulation::frame_read_options pixel_data_pipeline::read_options_for(
    const compression::frame_geometry& geometry) const {
    auto options = config_.read_options;
    options.number_of_frames = geometry.number_of_frames;
    return options;
}

Result<frame_bytes> pixel_data_pipeline::decode_one(
    std::span<const uint8_t> frame,
    const compression::frame_geometry& geometry) const {

    // Codecs are not shared between threads
    auto codec = make_codec();
    if (!codec) {
        return dcmpix_error<frame_bytes>(
            error_codes::codec_not_supported,
            "No codec registered for transfer syntax " + config_.transfer_syntax_uid);
    }

    auto decoded = codec->decode(frame, geometry);
    if (decoded.is_err()) {
        return forward_error<frame_bytes>(decoded);
    }
    return ok<frame_bytes>(std::move(decoded.value().data));
}

Result<std::vector<frame_bytes>> pixel_data_pipeline::decode_frames(
    std::span<const uint8_t> encapsulated,
    const compression::frame_geometry& geometry) const {

    auto frames = encapsulation::read_frames(encapsulated, read_options_for(geometry));
    if (frames.is_err()) {
        return forward_error<std::vector<frame_bytes>>(frames);
    }

    const auto& compressed = frames.value();
    auto results = run_per_frame(compressed.size(), config_.parallel,
                                 [&](std::size_t i) {
                                     return decode_one(compressed[i], geometry);
                                 });

    std::vector<frame_bytes> decoded;
    decoded.reserve(results.size());
    for (std::size_t i = 0; i < results.size(); ++i) {
        if (results[i].is_err()) {
            const auto& err = results[i].error();
            return dcmpix_error<std::vector<frame_bytes>>(
                err.code, dcmpix::compat::format("Frame {}: {}", i, err.message));
        }
        decoded.push_back(std::move(results[i].value()));
    }

    logger_adapter::debug("Frame layout {} x {}, {} samples, {} bits", geometry.rows,
                          geometry.columns, geometry.samples_per_pixel,
                          geometry.bits_allocated);
    logger_adapter::log_frames_completed(frame_operation::decode, decoded.size(),
                                         decoded.size(), total_size(decoded));
    return ok<std::vector<frame_bytes>>(std::move(decoded));
}

std::vector<Result<frame_bytes>> pixel_data_pipeline::decode_frames_independently(
    std::span<const uint8_t> encapsulated,
    const compression::frame_geometry& geometry) const {

    const auto options = read_options_for(geometry);

    memory_byte_source probe(encapsulated);
    auto opened = encapsulation::frame_iterator::open(probe, options);
    if (opened.is_err()) {
        std::vector<Result<frame_bytes>> failed;
        failed.push_back(forward_error<frame_bytes>(opened));
        return failed;
    }

    // Assemble every frame first; each gets its own cursor when the count is
    // known up front
    std::vector<Result<frame_bytes>> compressed;
    auto& it = opened.value();
    if (auto count = it.frame_count()) {
        compressed.reserve(*count);
        for (std::size_t i = 0; i < *count; ++i) {
            memory_byte_source source(encapsulated);
            compressed.push_back(encapsulation::get_frame(source, i, options));
        }
    } else {
        while (true) {
            auto frame = it.next();
            if (frame.is_err()) {
                compressed.push_back(forward_error<frame_bytes>(frame));
                break;
            }
            if (!frame.value()) {
                break;
            }
            compressed.push_back(ok<frame_bytes>(std::move(*frame.value())));
        }
    }

    auto results = run_per_frame(compressed.size(), config_.parallel,
                                 [&](std::size_t i) -> Result<frame_bytes> {
                                     if (compressed[i].is_err()) {
                                         return compressed[i];
                                     }
                                     return decode_one(compressed[i].value(), geometry);
                                 });

    std::size_t succeeded = 0;
    std::size_t output_bytes = 0;
    for (std::size_t i = 0; i < results.size(); ++i) {
        if (results[i].is_err()) {
            logger_adapter::log_frame_failure(frame_operation::decode, i,
                                              results[i].error().message);
            continue;
        }
        ++succeeded;
        output_bytes += results[i].value().size();
    }
    logger_adapter::log_frames_completed(frame_operation::decode, succeeded,
                                         results.size(), output_bytes);

    return results;
}

Result<frame_bytes> pixel_data_pipeline::encode_frames(
    const std::vector<frame_bytes>& frames,
    const compression::frame_geometry& geometry) const {

    if (!make_codec()) {
        return dcmpix_error<frame_bytes>(
            error_codes::codec_not_supported,
            "No codec registered for transfer syntax " + config_.transfer_syntax_uid);
    }

    auto results = run_per_frame(frames.size(), config_.parallel,
                                 [&](std::size_t i) -> Result<frame_bytes> {
                                     auto codec = make_codec();
                                     auto encoded = codec->encode(frames[i], geometry);
                                     if (encoded.is_err()) {
                                         return forward_error<frame_bytes>(encoded);
                                     }
                                     return ok<frame_bytes>(
                                         std::move(encoded.value().data));
                                 });

    std::vector<frame_bytes> compressed;
    compressed.reserve(results.size());
    for (std::size_t i = 0; i < results.size(); ++i) {
        if (results[i].is_err()) {
            const auto& err = results[i].error();
            return dcmpix_error<frame_bytes>(
                err.code, dcmpix::compat::format("Frame {}: {}", i, err.message));
        }
        compressed.push_back(std::move(results[i].value()));
    }

    auto encapsulated = encapsulation::encapsulate(
        compressed, config_.fragments_per_frame, config_.include_offset_table);
    if (encapsulated.is_err()) {
        return encapsulated;
    }

    logger_adapter::log_frames_completed(frame_operation::encode, frames.size(),
                                         frames.size(), encapsulated.value().size());
    return encapsulated;
}

}  // namespace dcmpix::encoding
