#include "dcmpix/encoding/compression/codec_factory.hpp"
#include "dcmpix/encoding/compression/rle_codec.hpp"
#include "dcmpix/integration/logger_adapter.hpp"

#include <map>
#include <mutex>

namespace dcmpix::encoding::compression {

namespace {

using registry_map = std::map<std::string, codec_factory::codec_creator, std::less<>>;

struct codec_registry {
    std::mutex mutex;
    registry_map creators;

    codec_registry() {
        creators.emplace(std::string(rle_codec::kTransferSyntaxUID), []() {
            return std::make_unique<rle_codec>();
        });
    }
};

codec_registry& registry() {
    static codec_registry instance;
    return instance;
}

}  // namespace

std::unique_ptr<compression_codec> codec_factory::create(
    std::string_view transfer_syntax_uid) {

    codec_creator creator;
    {
        auto& reg = registry();
        std::lock_guard<std::mutex> lock(reg.mutex);
        auto it = reg.creators.find(transfer_syntax_uid);
        if (it == reg.creators.end()) {
            return nullptr;
        }
        creator = it->second;
    }

    // Creator runs unlocked; it may call back into the factory
    return creator();
}

bool codec_factory::register_codec(std::string_view transfer_syntax_uid,
                                   codec_creator creator) {
    if (!creator) {
        return false;
    }

    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    reg.creators.insert_or_assign(std::string(transfer_syntax_uid), std::move(creator));

    integration::logger_adapter::debug("Registered codec for transfer syntax {}",
                                       transfer_syntax_uid);
    return true;
}

bool codec_factory::unregister_codec(std::string_view transfer_syntax_uid) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    auto it = reg.creators.find(transfer_syntax_uid);
    if (it == reg.creators.end()) {
        return false;
    }
    reg.creators.erase(it);
    return true;
}

std::vector<std::string> codec_factory::supported_transfer_syntaxes() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    std::vector<std::string> uids;
    uids.reserve(reg.creators.size());
    for (const auto& [uid, creator] : reg.creators) {
        uids.push_back(uid);
    }
    return uids;
}

bool codec_factory::is_supported(std::string_view transfer_syntax_uid) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.creators.find(transfer_syntax_uid) != reg.creators.end();
}

}  // namespace dcmpix::encoding::compression
