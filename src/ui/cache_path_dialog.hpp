/**
 * @file cache_path_dialog.hpp
 * @brief Modal prompt asking for the cache directory.
 */

#pragma once

#include "../cache_root.hpp"
#include <optional>
#include <string>

struct GLFWwindow;

namespace FxCacheManager {

/**
 * @brief ImGui implementation of CachePathPrompt.
 *
 * askCachePath() blocks the caller and drives its own frame loop on the
 * given window until the user confirms, cancels or closes the window.
 * It must be called from the thread owning the window and ImGui context.
 */
class CachePathDialog : public CachePathPrompt {
public:
    explicit CachePathDialog(GLFWwindow* window) : m_window(window) {}

    std::optional<std::string> askCachePath() override;

private:
    enum class State { Open, Confirmed, Cancelled };

    State renderFrame();

    GLFWwindow* m_window = nullptr;
    char m_pathBuffer[512] = {0};       ///< Path input buffer
};

} // namespace FxCacheManager
