/**
 * @file cache_root.hpp
 * @brief Resolution of the cache root from the host environment.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace FxCacheManager {

/**
 * @brief Thrown when no cache root is set and the user declined to enter one.
 */
class CacheRootUnresolvedError : public std::runtime_error {
public:
    CacheRootUnresolvedError()
        : std::runtime_error("Operation canceled. $CACHEPATH was not set.") {}
};

/**
 * @brief Key/value store holding host variables such as CACHEPATH.
 */
class EnvironmentStore {
public:
    virtual ~EnvironmentStore() = default;

    /// @return Value of the variable, or "" if unset
    virtual std::string get(const std::string& name) const = 0;
    virtual void set(const std::string& name, const std::string& value) = 0;
};

/**
 * @brief EnvironmentStore backed by the process environment.
 */
class ProcessEnvironment : public EnvironmentStore {
public:
    std::string get(const std::string& name) const override;
    void set(const std::string& name, const std::string& value) override;
};

/**
 * @brief Interactive input used when no cache root is configured.
 */
class CachePathPrompt {
public:
    virtual ~CachePathPrompt() = default;

    /**
     * @brief Ask the user for the directory that holds the caches.
     * @return Entered path, or std::nullopt if the user cancelled
     */
    virtual std::optional<std::string> askCachePath() = 0;
};

/**
 * @brief Finds the cache root for this session.
 *
 * Reads CACHEPATH from the environment store. When it is empty the user is
 * prompted for a base directory; the scene's base name is appended to it
 * and the result is written back to CACHEPATH so later lookups (and other
 * tools sharing the environment) see the same root.
 *
 * @code
 * ProcessEnvironment env;
 * CachePathDialog dialog(window);
 * CacheRootResolver resolver(env, dialog, "sh010_fx.hip");
 * std::string root = resolver.resolve();   // e.g. "/cache/sh010_fx"
 * @endcode
 */
class CacheRootResolver {
public:
    static constexpr const char* kVariableName = "CACHEPATH";

    /**
     * @param environment Store read and updated with CACHEPATH
     * @param prompt Asked for a path when CACHEPATH is empty
     * @param sceneFileName Name of the open scene file, used as the suffix
     */
    CacheRootResolver(EnvironmentStore& environment, CachePathPrompt& prompt, std::string sceneFileName);

    /**
     * @brief Return the cache root, prompting once if needed.
     * @throws CacheRootUnresolvedError if the prompt was cancelled
     */
    std::string resolve();

    /**
     * @brief Scene file name up to its first '.', e.g. "sh010_fx" for "sh010_fx.v2.hip".
     */
    static std::string sceneBaseName(const std::string& sceneFileName);

private:
    EnvironmentStore& m_environment;
    CachePathPrompt& m_prompt;
    std::string m_sceneFileName;
};

} // namespace FxCacheManager
