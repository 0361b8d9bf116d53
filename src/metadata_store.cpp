#include "metadata_store.hpp"
#include "debug.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <optional>

namespace FxCacheManager {

namespace {

std::optional<nlohmann::json> loadSidecar(const std::filesystem::path& versionDir) {
    std::ifstream in(MetadataStore::sidecarPath(versionDir));
    if (!in) {
        return std::nullopt;
    }

    // No exceptions: a corrupt sidecar parses to a discarded value
    nlohmann::json data = nlohmann::json::parse(in, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        DEBUG_LOG("Ignoring malformed sidecar in " << versionDir);
        return std::nullopt;
    }
    return data;
}

std::string commentFrom(const nlohmann::json& data) {
    auto it = data.find("comment");
    if (it == data.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

bool protectionFrom(const nlohmann::json& data) {
    auto it = data.find("cache_protect");
    if (it == data.end()) {
        return false;
    }
    if (it->is_boolean()) {
        return it->get<bool>();
    }
    if (it->is_number()) {
        return it->get<double>() != 0.0;
    }
    return false;
}

} // namespace

CacheMetadata MetadataStore::read(const std::filesystem::path& versionDir) {
    CacheMetadata metadata;
    auto data = loadSidecar(versionDir);
    if (data) {
        metadata.comment = commentFrom(*data);
        metadata.isProtected = protectionFrom(*data);
    }
    return metadata;
}

std::string MetadataStore::readComment(const std::filesystem::path& versionDir) {
    auto data = loadSidecar(versionDir);
    return data ? commentFrom(*data) : "";
}

bool MetadataStore::readProtection(const std::filesystem::path& versionDir) {
    auto data = loadSidecar(versionDir);
    return data ? protectionFrom(*data) : false;
}

bool MetadataStore::write(const std::filesystem::path& versionDir, const CacheMetadata& metadata) {
    nlohmann::json data = loadSidecar(versionDir).value_or(nlohmann::json::object());
    data["comment"] = metadata.comment;
    data["cache_protect"] = metadata.isProtected ? 1 : 0;

    // Invalid UTF-8 in the comment is replaced with U+FFFD instead of throwing
    std::string text = data.dump(4, ' ', false, nlohmann::json::error_handler_t::replace);

    // Write beside the sidecar and rename over it so the old file survives any failure
    std::filesystem::path target = sidecarPath(versionDir);
    std::filesystem::path temp = target;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            WARN_LOG("Failed to open sidecar for writing: " << temp);
            return false;
        }
        out << text << "\n";
        out.flush();
        if (!out) {
            WARN_LOG("Failed to write sidecar: " << temp);
            std::error_code ec;
            std::filesystem::remove(temp, ec);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        WARN_LOG("Failed to replace sidecar " << target << ": " << ec.message());
        std::error_code removeEc;
        std::filesystem::remove(temp, removeEc);
        return false;
    }

    DEBUG_LOG("Wrote sidecar " << target);
    return true;
}

} // namespace FxCacheManager
