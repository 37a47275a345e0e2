#ifndef DCMPIX_ENCODING_COMPRESSION_CODEC_FACTORY_HPP
#define DCMPIX_ENCODING_COMPRESSION_CODEC_FACTORY_HPP

#include "dcmpix/encoding/compression/compression_codec.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace dcmpix::encoding::compression {

/**
 * @brief Factory class for creating compression codec instances.
 *
 * Provides a registry for codec creation keyed by Transfer Syntax UID.
 * RLE Lossless is registered by default. Codecs backed by external
 * libraries (JPEG family, JPEG 2000, ...) are attached at run time with
 * register_codec().
 *
 * Thread-safe: All factory methods can be called from multiple threads.
 *
 * Usage:
 * @code
 * auto codec = codec_factory::create("1.2.840.10008.1.2.5");
 * if (codec) {
 *     auto result = codec->decode(frame, geometry);
 * }
 * @endcode
 */
class codec_factory {
public:
    using codec_creator = std::function<std::unique_ptr<compression_codec>()>;

    /**
     * @brief Creates a codec instance for the given Transfer Syntax UID.
     *
     * @param transfer_syntax_uid The DICOM Transfer Syntax UID
     * @return A new codec instance if registered, nullptr otherwise
     */
    [[nodiscard]] static std::unique_ptr<compression_codec> create(
        std::string_view transfer_syntax_uid);

    /**
     * @brief Registers (or replaces) the creator for a Transfer Syntax.
     *
     * @param transfer_syntax_uid The DICOM Transfer Syntax UID
     * @param creator Returns a new codec on each call
     * @return false if creator is empty
     */
    static bool register_codec(std::string_view transfer_syntax_uid, codec_creator creator);

    /**
     * @brief Removes a registered creator.
     * @return true if a creator was removed
     */
    static bool unregister_codec(std::string_view transfer_syntax_uid);

    /**
     * @brief Returns the UIDs of all registered codecs, sorted.
     */
    [[nodiscard]] static std::vector<std::string> supported_transfer_syntaxes();

    [[nodiscard]] static bool is_supported(std::string_view transfer_syntax_uid);

private:
    codec_factory() = delete;  // Static-only class
};

}  // namespace dcmpix::encoding::compression

#endif  // DCMPIX_ENCODING_COMPRESSION_CODEC_FACTORY_HPP
