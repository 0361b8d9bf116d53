/**
 * @file app.hpp
 * @brief Main application class for FX Cache Manager.
 */

#pragma once

#include "deletion_policy.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

struct GLFWwindow;

namespace FxCacheManager {

class CacheService;
class CacheRootResolver;
class CachePathDialog;
class CacheTreeView;
class JsonReferenceFile;
class ProcessEnvironment;
struct CacheRow;

/**
 * @brief Main application controller for FX Cache Manager.
 *
 * Manages the window, the UI and the CacheService that owns the scanned
 * cache tree.
 *
 * The application provides:
 * - Tree view of the cache root (context / element / version)
 * - Size, date, comment and protection per version
 * - Highlighting of versions used by the current scene
 * - Guarded deletion of version folders
 *
 * @par Architecture:
 * - Uses GLFW for window management
 * - Uses ImGui for the user interface
 * - Uses OpenGL 3.3 Core for rendering
 * - Scans run on a background thread; the UI polls for completion
 */
class App {
public:
    App();
    ~App();

    /**
     * @brief Initialize the application.
     *
     * Creates the window, initializes OpenGL and ImGui, resolves the cache
     * root (prompting if $CACHEPATH is unset) and sets up the service.
     *
     * @return true if initialization succeeded
     */
    bool init();

    /**
     * @brief Run the main application loop until the window is closed.
     */
    void run();

    /**
     * @brief Wait for background work and release all resources.
     */
    void shutdown();

private:
    /// @name UI Rendering
    /// @{
    void applyTheme();
    void renderUI();
    void renderHeader();
    void renderButtons();
    void renderStatusBar();
    void renderConfirmDeleteDialog();
    void renderOutcomeDialog();
    /// @}

    /// @name Actions
    /// @{
    bool resolveCacheRoot();
    void startBackgroundRefresh();
    void checkBackgroundRefreshComplete();
    void reloadRows();
    void handleSelect(const std::string& id, bool additive);
    void deleteSelected();
    void openCacheFolder();
    /// @}

    GLFWwindow* m_window = nullptr;             ///< GLFW window handle

    /// @name Subsystems
    /// @{
    std::unique_ptr<ProcessEnvironment> m_environment;
    std::unique_ptr<CachePathDialog> m_pathDialog;
    std::unique_ptr<CacheRootResolver> m_resolver;
    std::unique_ptr<JsonReferenceFile> m_references;
    std::unique_ptr<CacheService> m_service;
    std::unique_ptr<CacheTreeView> m_treeView;
    /// @}

    /// @name Display Data
    /// @{
    std::vector<CacheRow> m_rows;               ///< Rows shown in the tree view
    std::set<std::string> m_selection;          ///< Mirror of the service selection
    std::string m_cacheRoot;                    ///< Shown in the header
    std::string m_userName;
    std::string m_statusMessage;
    /// @}

    /// @name Dialogs
    /// @{
    bool m_openConfirmDelete = false;
    bool m_openNothingSelected = false;
    bool m_openOutcomes = false;
    bool m_requestCachePath = false;
    std::vector<DeletionOutcome> m_lastOutcomes;
    /// @}

    /// @name Background Refresh
    /// @{
    std::atomic<bool> m_isRefreshing{false};
    std::atomic<bool> m_refreshComplete{false};
    std::atomic<bool> m_rowsDirty{false};       ///< Set by the tree-changed callback
    std::jthread m_refreshThread;
    std::mutex m_refreshMutex;
    std::string m_refreshError;                 ///< Set by the refresh thread
    int m_frameCount = 0;
    /// @}
};

} // namespace FxCacheManager
