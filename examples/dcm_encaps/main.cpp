/**
 * @file main.cpp
 * @brief DICOM Encaps - Encapsulated Pixel Data Utility
 *
 * A command-line utility for inspecting, splitting and building the value of
 * an encapsulated (7FE0,0010) Pixel Data element, with optional RLE Lossless
 * decoding and encoding of the frames.
 *
 * Input and output files hold the element value only: the Basic Offset Table
 * item followed by the fragment items, as produced by the element reader.
 *
 * Usage:
 *   dcm_encaps <command> [arguments] [options]
 *
 * Example:
 *   dcm_encaps info pixel_data.bin --frames 3
 *   dcm_encaps extract pixel_data.bin ./frames --rle 512 512 1 16
 *   dcm_encaps encapsulate out.bin f0.raw f1.raw --rle 64 64 3 8
 */

#include "dcmpix/encoding/byte_source.hpp"
#include "dcmpix/encoding/encapsulation/basic_offset_table.hpp"
#include "dcmpix/encoding/encapsulation/encapsulator.hpp"
#include "dcmpix/encoding/encapsulation/fragment_reader.hpp"
#include "dcmpix/encoding/encapsulation/frame_reader.hpp"
#include "dcmpix/encoding/pixel_data_pipeline.hpp"
#include "dcmpix/integration/logger_adapter.hpp"
#include "dcmpix/integration/thread_adapter.hpp"

#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace dcmpix;
using namespace dcmpix::encoding;

/**
 * @brief Sub-command
 */
enum class command_type { none, info, extract, encapsulate };

/**
 * @brief Command line options
 */
struct options {
    command_type command{command_type::none};
    std::vector<std::filesystem::path> paths;
    uint32_t number_of_frames{1};
    encapsulation::frame_boundary_heuristic heuristic{
        encapsulation::frame_boundary_heuristic::none};
    std::optional<compression::frame_geometry> rle_geometry;
    compression::rle_segment_order segment_order{compression::rle_segment_order::big_endian};
    std::size_t fragments_per_frame{1};
    bool include_bot{true};
    bool parallel{false};
    bool show_help{false};
    integration::log_level level{integration::log_level::warn};
};

/**
 * @brief Print usage information
 * @param program_name The name of the executable
 */
void print_usage(const char* program_name) {
    std::cout << R"(
DICOM Encaps - Encapsulated Pixel Data Utility

Usage:
  )" << program_name << R"( info <pixel-data-file> [--frames N]
  )" << program_name << R"( extract <pixel-data-file> <output-dir> [options]
  )" << program_name << R"( encapsulate <output-file> <frame-file>... [options]

Frame Options:
  --frames <n>              Number of frames (default: 1)
  --heuristic <name>        Boundary heuristic without a BOT: none, equal, eoi
                            (default: none)

RLE Options:
  --rle <rows> <cols> <spp> <bits>
                            Decode (extract) or encode (encapsulate) frames as
                            RLE Lossless with the given geometry; raw frames
                            are little-endian with planar configuration 1
  --little-endian-segments  Decode RLE segments written LSB first
  --parallel                Process frames on the thread pool

Encapsulation Options:
  --fragments <n>           Fragments per frame (default: 1)
  --no-bot                  Write an empty Basic Offset Table

General Options:
  --log-level <level>       trace, debug, info, warn, error, off (default: warn)
  -h, --help                Show this help message

Exit Codes:
  0  Success
  1  Invalid arguments
  2  Processing error
)";
}

bool parse_number(const char* text, uint64_t& value, const char* what) {
    try {
        std::size_t consumed = 0;
        value = std::stoull(text, &consumed);
        if (consumed != std::string(text).size()) {
            throw std::invalid_argument(text);
        }
        return true;
    } catch (const std::exception&) {
        std::cerr << "Error: Invalid " << what << " '" << text << "'\n";
        return false;
    }
}

/**
 * @brief Parse command line arguments
 * @return true if arguments are valid
 */
bool parse_arguments(int argc, char* argv[], options& opts) {
    if (argc < 2) {
        return false;
    }

    const std::string command = argv[1];
    if (command == "info") {
        opts.command = command_type::info;
    } else if (command == "extract") {
        opts.command = command_type::extract;
    } else if (command == "encapsulate") {
        opts.command = command_type::encapsulate;
    } else {
        if (command == "--help" || command == "-h") {
            opts.show_help = true;
        } else {
            std::cerr << "Error: Unknown command '" << command << "'\n";
        }
        return false;
    }

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        uint64_t value = 0;

        if (arg == "--help" || arg == "-h") {
            opts.show_help = true;
            return false;
        } else if (arg == "--frames" && i + 1 < argc) {
            if (!parse_number(argv[++i], value, "frame count") || value == 0) {
                return false;
            }
            opts.number_of_frames = static_cast<uint32_t>(value);
        } else if (arg == "--heuristic" && i + 1 < argc) {
            std::string name = argv[++i];
            if (name == "none") {
                opts.heuristic = encapsulation::frame_boundary_heuristic::none;
            } else if (name == "equal") {
                opts.heuristic = encapsulation::frame_boundary_heuristic::equal_fragment_count;
            } else if (name == "eoi") {
                opts.heuristic = encapsulation::frame_boundary_heuristic::end_of_image_marker;
            } else {
                std::cerr << "Error: Unknown heuristic '" << name << "'\n";
                return false;
            }
        } else if (arg == "--rle" && i + 4 < argc) {
            compression::frame_geometry geometry;
            uint64_t rows = 0, cols = 0, spp = 0, bits = 0;
            if (!parse_number(argv[++i], rows, "rows") ||
                !parse_number(argv[++i], cols, "columns") ||
                !parse_number(argv[++i], spp, "samples per pixel") ||
                !parse_number(argv[++i], bits, "bits allocated")) {
                return false;
            }
            geometry.rows = static_cast<uint32_t>(rows);
            geometry.columns = static_cast<uint32_t>(cols);
            geometry.samples_per_pixel = static_cast<uint16_t>(spp);
            geometry.bits_allocated = static_cast<uint16_t>(bits);
            opts.rle_geometry = geometry;
        } else if (arg == "--little-endian-segments") {
            opts.segment_order = compression::rle_segment_order::little_endian;
        } else if (arg == "--parallel") {
            opts.parallel = true;
        } else if (arg == "--fragments" && i + 1 < argc) {
            if (!parse_number(argv[++i], value, "fragment count") || value == 0) {
                return false;
            }
            opts.fragments_per_frame = static_cast<std::size_t>(value);
        } else if (arg == "--no-bot") {
            opts.include_bot = false;
        } else if (arg == "--log-level" && i + 1 < argc) {
            opts.level = integration::logger_adapter::parse_level(argv[++i], opts.level);
        } else if (arg[0] == '-') {
            std::cerr << "Error: Unknown option '" << arg << "'\n";
            return false;
        } else {
            opts.paths.emplace_back(arg);
        }
    }

    switch (opts.command) {
        case command_type::info:
            if (opts.paths.size() != 1) {
                std::cerr << "Error: info expects exactly one input file\n";
                return false;
            }
            break;
        case command_type::extract:
            if (opts.paths.size() != 2) {
                std::cerr << "Error: extract expects an input file and an output directory\n";
                return false;
            }
            break;
        case command_type::encapsulate:
            if (opts.paths.size() < 2) {
                std::cerr << "Error: encapsulate expects an output file and at least one frame\n";
                return false;
            }
            break;
        case command_type::none:
            return false;
    }

    return true;
}

std::optional<std::vector<uint8_t>> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open " << path.string() << "\n";
        return std::nullopt;
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file),
                                std::istreambuf_iterator<char>());
}

bool write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot create " << path.string() << "\n";
        return false;
    }
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    return static_cast<bool>(file);
}

std::string frame_file_name(std::size_t index, const char* extension) {
    std::ostringstream name;
    name << "frame_" << std::setw(4) << std::setfill('0') << index << extension;
    return name.str();
}

encapsulation::frame_read_options make_read_options(const options& opts) {
    encapsulation::frame_read_options read_options;
    read_options.number_of_frames = opts.number_of_frames;
    read_options.heuristic = opts.heuristic;
    return read_options;
}

pipeline_config make_pipeline_config(const options& opts) {
    pipeline_config config;
    config.read_options = make_read_options(opts);
    config.fragments_per_frame = opts.fragments_per_frame;
    config.include_offset_table = opts.include_bot;
    config.segment_order = opts.segment_order;
    config.parallel = opts.parallel;
    return config;
}

/**
 * @brief Print the structure of an encapsulated Pixel Data value
 */
int run_info(const options& opts) {
    std::ifstream file(opts.paths[0], std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open " << opts.paths[0].string() << "\n";
        return 2;
    }
    stream_byte_source source(file);

    auto offsets = encapsulation::parse_basic_offsets(source);
    if (offsets.is_err()) {
        std::cerr << "Error: " << offsets.error().message << "\n";
        return 2;
    }

    auto fragments = encapsulation::parse_fragments(source);
    if (fragments.is_err()) {
        std::cerr << "Error: " << fragments.error().message << "\n";
        return 2;
    }

    std::cout << "File:                 " << opts.paths[0].string() << "\n";
    std::cout << "Basic Offset Table:   ";
    if (offsets.value().empty()) {
        std::cout << "empty\n";
    } else {
        std::cout << offsets.value().size() << " entries\n";
        for (std::size_t i = 0; i < offsets.value().size(); ++i) {
            std::cout << "  [" << i << "] " << offsets.value()[i] << "\n";
        }
    }

    const auto& table = fragments.value();
    std::cout << "Fragments:            " << table.count << "\n";
    for (std::size_t i = 0; i < table.offsets.size(); ++i) {
        std::cout << "  [" << i << "] item at offset " << table.offsets[i] << "\n";
    }

    if (!source.seek(0)) {
        std::cerr << "Error: Cannot rewind " << opts.paths[0].string() << "\n";
        return 2;
    }
    auto frames = encapsulation::read_frames(source, make_read_options(opts));
    if (frames.is_err()) {
        std::cout << "Frames:               unknown (" << frames.error().message << ")\n";
        return 0;
    }

    std::cout << "Frames:               " << frames.value().size() << "\n";
    for (std::size_t i = 0; i < frames.value().size(); ++i) {
        std::cout << "  [" << i << "] " << frames.value()[i].size() << " bytes\n";
    }
    return 0;
}

/**
 * @brief Write each frame (compressed, or decoded with --rle) to a file
 */
int run_extract(const options& opts) {
    auto data = read_file(opts.paths[0]);
    if (!data) {
        return 2;
    }

    const auto& output_dir = opts.paths[1];
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "Error: Cannot create " << output_dir.string() << ": "
                  << ec.message() << "\n";
        return 2;
    }

    if (!opts.rle_geometry) {
        auto frames = encapsulation::read_frames(*data, make_read_options(opts));
        if (frames.is_err()) {
            std::cerr << "Error: " << frames.error().message << "\n";
            return 2;
        }
        for (std::size_t i = 0; i < frames.value().size(); ++i) {
            if (!write_file(output_dir / frame_file_name(i, ".bin"), frames.value()[i])) {
                return 2;
            }
        }
        std::cout << "Extracted " << frames.value().size() << " frames\n";
        return 0;
    }

    auto geometry = *opts.rle_geometry;
    geometry.number_of_frames = opts.number_of_frames;

    pixel_data_pipeline pipeline(make_pipeline_config(opts));
    auto results = pipeline.decode_frames_independently(*data, geometry);

    std::size_t written = 0;
    for (std::size_t i = 0; i < results.size(); ++i) {
        if (results[i].is_err()) {
            std::cerr << "Frame " << i << ": " << results[i].error().message << "\n";
            continue;
        }
        if (!write_file(output_dir / frame_file_name(i, ".raw"), results[i].value())) {
            return 2;
        }
        ++written;
    }

    std::cout << "Decoded " << written << " of " << results.size() << " frames\n";
    return written == results.size() ? 0 : 2;
}

/**
 * @brief Build an encapsulated Pixel Data value from frame files
 */
int run_encapsulate(const options& opts) {
    std::vector<std::vector<uint8_t>> frames;
    for (std::size_t i = 1; i < opts.paths.size(); ++i) {
        auto frame = read_file(opts.paths[i]);
        if (!frame) {
            return 2;
        }
        frames.push_back(std::move(*frame));
    }

    Result<std::vector<uint8_t>> output = [&]() {
        if (!opts.rle_geometry) {
            return encapsulation::encapsulate(frames, opts.fragments_per_frame,
                                              opts.include_bot);
        }
        auto geometry = *opts.rle_geometry;
        geometry.number_of_frames = static_cast<uint32_t>(frames.size());
        pixel_data_pipeline pipeline(make_pipeline_config(opts));
        return pipeline.encode_frames(frames, geometry);
    }();

    if (output.is_err()) {
        std::cerr << "Error: " << output.error().message << "\n";
        return 2;
    }

    if (!write_file(opts.paths[0], output.value())) {
        return 2;
    }

    std::cout << "Wrote " << frames.size() << " frames (" << output.value().size()
              << " bytes) to " << opts.paths[0].string() << "\n";
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    options opts;

    if (!parse_arguments(argc, argv, opts)) {
        print_usage(argv[0]);
        return opts.show_help ? 0 : 1;
    }

    integration::logger_config log_config;
    log_config.min_level = opts.level;
    integration::logger_adapter::initialize(log_config);

    int exit_code = 0;
    switch (opts.command) {
        case command_type::info:
            exit_code = run_info(opts);
            break;
        case command_type::extract:
            exit_code = run_extract(opts);
            break;
        case command_type::encapsulate:
            exit_code = run_encapsulate(opts);
            break;
        case command_type::none:
            exit_code = 1;
            break;
    }

    if (opts.parallel) {
        integration::thread_adapter::shutdown();
    }
    integration::logger_adapter::shutdown();
    return exit_code;
}
