#include "reference_source.hpp"
#include "debug.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

namespace FxCacheManager {

namespace {

std::optional<std::string> stringField(const nlohmann::json& entry, const char* key) {
    auto it = entry.find(key);
    if (it == entry.end()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number_integer()) {
        return std::to_string(it->get<long long>());
    }
    return std::nullopt;
}

} // namespace

JsonReferenceFile::JsonReferenceFile(std::filesystem::path path)
    : m_path(std::move(path)) {}

std::vector<VersionReference> JsonReferenceFile::activeReferences() {
    std::vector<VersionReference> references;

    std::ifstream in(m_path);
    if (!in) {
        DEBUG_LOG("No reference export at " << m_path.string());
        return references;
    }

    nlohmann::json data = nlohmann::json::parse(in, nullptr, false);
    if (data.is_discarded() || !data.is_array()) {
        WARN_LOG("Reference export is not a JSON array: " << m_path.string());
        return references;
    }

    for (const auto& entry : data) {
        if (!entry.is_object()) {
            continue;
        }
        auto identifier = stringField(entry, "identifier");
        if (!identifier) {
            identifier = stringField(entry, "basename");
        }
        auto version = stringField(entry, "version");
        if (!identifier || !version) {
            DEBUG_LOG("Skipping incomplete reference entry: " << entry.dump());
            continue;
        }
        references.push_back({std::move(*identifier), std::move(*version)});
    }

    DEBUG_LOG("Loaded " << references.size() << " active references from " << m_path.string());
    return references;
}

} // namespace FxCacheManager
