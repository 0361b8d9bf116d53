#include "cache_root.hpp"
#include "debug.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>

namespace FxCacheManager {

std::string ProcessEnvironment::get(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    return value ? value : "";
}

void ProcessEnvironment::set(const std::string& name, const std::string& value) {
    if (setenv(name.c_str(), value.c_str(), 1) != 0) {
        WARN_LOG("setenv(" << name << ") failed: " << std::strerror(errno));
    }
}

CacheRootResolver::CacheRootResolver(EnvironmentStore& environment, CachePathPrompt& prompt, std::string sceneFileName)
    : m_environment(environment)
    , m_prompt(prompt)
    , m_sceneFileName(std::move(sceneFileName)) {}

std::string CacheRootResolver::sceneBaseName(const std::string& sceneFileName) {
    std::string name = std::filesystem::path(sceneFileName).filename().string();
    return name.substr(0, name.find('.'));
}

std::string CacheRootResolver::resolve() {
    std::string root = m_environment.get(kVariableName);
    if (!root.empty()) {
        return root;
    }

    DEBUG_LOG("$" << kVariableName << " is not set, asking for a cache path");
    auto entered = m_prompt.askCachePath();
    if (!entered) {
        throw CacheRootUnresolvedError();
    }

    root = *entered + sceneBaseName(m_sceneFileName);
    if (root.empty()) {
        throw CacheRootUnresolvedError();
    }
    m_environment.set(kVariableName, root);
    DEBUG_LOG("$" << kVariableName << " has been set to: " << root);
    return root;
}

} // namespace FxCacheManager
