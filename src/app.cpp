#include "app.hpp"
#include "debug.hpp"
#include "cache_root.hpp"
#include "cache_service.hpp"
#include "reference_source.hpp"
#include "ui/cache_path_dialog.hpp"
#include "ui/cache_tree_view.hpp"

#include "imgui.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"

#define GL_GLEXT_PROTOTYPES
#include <GL/gl.h>
#include <GLFW/glfw3.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>

namespace FxCacheManager {

namespace {

std::string envOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : fallback;
}

unsigned workerCountFromEnv() {
    const char* value = std::getenv("FXCACHE_WORKERS");
    if (!value) {
        return 0;
    }
    char* end = nullptr;
    unsigned long parsed = std::strtoul(value, &end, 10);
    if (end == value || *end != '\0') {
        WARN_LOG("Ignoring invalid FXCACHE_WORKERS='" << value << "'");
        return 0;
    }
    return static_cast<unsigned>(parsed);
}

} // namespace

App::App() = default;

App::~App() = default;

bool App::init() {
    DEBUG_LOG("App::init() starting");

    // Initialize GLFW
    if (!glfwInit()) {
        DEBUG_LOG("glfwInit failed");
        return false;
    }
    DEBUG_LOG("GLFW initialized");

    // OpenGL 3.3 Core
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_FLOATING, GLFW_TRUE);

    m_window = glfwCreateWindow(1400, 700, "FX Cache Manager", nullptr, nullptr);
    if (!m_window) {
        DEBUG_LOG("Window creation failed");
        glfwTerminate();
        return false;
    }
    glfwSetWindowSizeLimits(m_window, 1400, 700, 1700, 1000);
    DEBUG_LOG("Window created");

    glfwMakeContextCurrent(m_window);
    glfwSwapInterval(1);

    // Initialize Dear ImGui
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    const char* fontPaths[] = {
        "/usr/share/fonts/opentype/inter/Inter-Regular.otf",
        "/usr/share/fonts/truetype/inter/Inter-Regular.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        nullptr
    };
    for (const char** path = fontPaths; *path != nullptr; ++path) {
        if (std::filesystem::exists(*path)) {
            io.Fonts->AddFontFromFileTTF(*path, 16.0f);
            DEBUG_LOG("Loaded font: " << *path);
            break;
        }
    }
    if (io.Fonts->Fonts.empty()) {
        io.Fonts->AddFontDefault();
    }

    applyTheme();

    ImGui_ImplGlfw_InitForOpenGL(m_window, true);
    ImGui_ImplOpenGL3_Init("#version 330");
    DEBUG_LOG("ImGui backends initialized");

    // Initialize components
    m_environment = std::make_unique<ProcessEnvironment>();
    m_pathDialog = std::make_unique<CachePathDialog>(m_window);
    m_resolver = std::make_unique<CacheRootResolver>(*m_environment, *m_pathDialog, envOr("HIPNAME", ""));
    m_references = std::make_unique<JsonReferenceFile>(envOr("FXCACHE_REFERENCES", ""));
    m_service = std::make_unique<CacheService>(*m_resolver, *m_references, workerCountFromEnv());
    m_treeView = std::make_unique<CacheTreeView>();

    m_userName = envOr("USER", envOr("USERNAME", ""));

    m_service->setTreeChangedCallback([this]() {
        m_rowsDirty = true;
    });

    m_treeView->setSelectCallback([this](const std::string& id, bool additive) {
        handleSelect(id, additive);
    });

    m_treeView->setMetadataCallback([this](const std::string& id, const CacheMetadata& metadata) {
        if (m_isRefreshing) {
            m_statusMessage = "Wait for the refresh to finish before editing";
            return;
        }
        if (!m_service->updateMetadata(id, metadata)) {
            m_statusMessage = "Could not update metadata for " + id;
        }
    });

    if (resolveCacheRoot()) {
        startBackgroundRefresh();
    }

    DEBUG_LOG("App::init() complete");
    return true;
}

void App::applyTheme() {
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowPadding = ImVec2(12, 12);
    style.FramePadding = ImVec2(8, 4);
    style.ItemSpacing = ImVec2(8, 6);
    style.IndentSpacing = 20.0f;
    style.ScrollbarSize = 14.0f;
    style.WindowRounding = 6.0f;
    style.FrameRounding = 4.0f;
    style.PopupRounding = 4.0f;

    ImVec4* colors = style.Colors;
    colors[ImGuiCol_WindowBg] = ImVec4(0.12f, 0.12f, 0.12f, 1.0f);
    colors[ImGuiCol_ChildBg] = ImVec4(0.12f, 0.12f, 0.12f, 1.0f);
    colors[ImGuiCol_PopupBg] = ImVec4(0.15f, 0.15f, 0.15f, 0.98f);
    colors[ImGuiCol_Border] = ImVec4(0.25f, 0.25f, 0.25f, 1.0f);
    colors[ImGuiCol_FrameBg] = ImVec4(0.18f, 0.18f, 0.18f, 1.0f);
    colors[ImGuiCol_TableRowBg] = ImVec4(0.12f, 0.12f, 0.12f, 1.0f);
    colors[ImGuiCol_TableRowBgAlt] = ImVec4(0.14f, 0.14f, 0.14f, 1.0f);
    colors[ImGuiCol_Header] = ImVec4(0.35f, 0.45f, 0.60f, 0.45f);
    colors[ImGuiCol_HeaderHovered] = ImVec4(0.35f, 0.45f, 0.60f, 0.60f);
    colors[ImGuiCol_HeaderActive] = ImVec4(0.35f, 0.45f, 0.60f, 0.80f);
    colors[ImGuiCol_Button] = ImVec4(0.25f, 0.25f, 0.25f, 1.0f);
    colors[ImGuiCol_ButtonHovered] = ImVec4(0.35f, 0.35f, 0.35f, 1.0f);
    colors[ImGuiCol_ButtonActive] = ImVec4(0.45f, 0.45f, 0.45f, 1.0f);
    colors[ImGuiCol_Separator] = ImVec4(0.25f, 0.25f, 0.25f, 1.0f);
}

bool App::resolveCacheRoot() {
    try {
        m_cacheRoot = m_service->resolveCacheRoot().string();
    } catch (const CacheRootUnresolvedError& e) {
        m_statusMessage = e.what();
        DEBUG_LOG(e.what());
        return false;
    }

    if (m_references->path().empty()) {
        m_references->setPath(std::filesystem::path(m_cacheRoot) / "active_references.json");
    }
    m_statusMessage = "$CACHEPATH: " + m_cacheRoot;
    return true;
}

void App::run() {
    DEBUG_LOG("App::run() entered, starting main loop");

    while (!glfwWindowShouldClose(m_window)) {
        auto frameStart = std::chrono::steady_clock::now();
        glfwPollEvents();
        m_frameCount++;

        if (m_rowsDirty.exchange(false)) {
            reloadRows();
        }
        checkBackgroundRefreshComplete();

        // The prompt runs its own frames, so it cannot start inside one
        if (m_requestCachePath) {
            m_requestCachePath = false;
            if (resolveCacheRoot()) {
                startBackgroundRefresh();
            }
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        int displayW, displayH;
        glfwGetFramebufferSize(m_window, &displayW, &displayH);
        glViewport(0, 0, displayW, displayH);
        glClearColor(0.1f, 0.1f, 0.1f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);

        renderUI();

        ImGui::Render();
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        glfwSwapBuffers(m_window);

        auto frameMs = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - frameStart).count();
        if (frameMs > 100) {
            DEBUG_LOG("SLOW FRAME " << m_frameCount << ": " << frameMs << "ms");
        }
    }
}

void App::shutdown() {
    // Wait for any background refresh to complete
    if (m_refreshThread.joinable()) {
        m_refreshThread.join();
    }

    m_service->setTreeChangedCallback(nullptr);

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    glfwDestroyWindow(m_window);
    glfwTerminate();
}

void App::startBackgroundRefresh() {
    if (m_isRefreshing) return;  // Already refreshing

    m_isRefreshing = true;
    m_refreshComplete = false;

    m_refreshThread = std::jthread([this]() {
        DEBUG_LOG("Background refresh starting");
        std::string error;
        try {
            m_service->refresh();
        } catch (const std::exception& e) {
            error = e.what();
            WARN_LOG("Refresh failed: " << e.what());
        }

        {
            std::lock_guard<std::mutex> lock(m_refreshMutex);
            m_refreshError = std::move(error);
        }
        m_refreshComplete = true;
    });
}

void App::checkBackgroundRefreshComplete() {
    if (!m_refreshComplete) {
        return;
    }

    if (m_refreshThread.joinable()) {
        m_refreshThread.join();
    }
    m_isRefreshing = false;
    m_refreshComplete = false;

    std::lock_guard<std::mutex> lock(m_refreshMutex);
    if (!m_refreshError.empty()) {
        m_statusMessage = "Refresh failed: " + m_refreshError;
    } else {
        m_statusMessage = "Scanned " + std::to_string(m_rows.size()) + " folders";
    }
}

void App::reloadRows() {
    m_rows = m_service->rows();
    auto selected = m_service->selection();
    m_selection = std::set<std::string>(selected.begin(), selected.end());
    DEBUG_LOG("Transferred " << m_rows.size() << " rows to main thread");
}

void App::handleSelect(const std::string& id, bool additive) {
    if (m_isRefreshing) {
        return;
    }

    if (additive) {
        if (m_service->isSelected(id)) {
            m_service->deselect(id);
        } else {
            m_service->select(id);
        }
    } else {
        m_service->clearSelection();
        m_service->select(id);
    }

    auto selected = m_service->selection();
    m_selection = std::set<std::string>(selected.begin(), selected.end());
}

void App::deleteSelected() {
    auto outcomes = m_service->deleteSelected();

    size_t deleted = std::count_if(outcomes.begin(), outcomes.end(),
        [](const DeletionOutcome& outcome) { return outcome.succeeded(); });
    m_statusMessage = "Deleted " + std::to_string(deleted) + " of " + std::to_string(outcomes.size()) + " folders";

    if (deleted != outcomes.size()) {
        m_lastOutcomes = std::move(outcomes);
        m_openOutcomes = true;
    }
}

void App::openCacheFolder() {
    std::string command = m_service->openCacheFolderCommand();
    if (command.empty()) {
        return;
    }
    int rc = std::system(command.c_str());
    if (rc != 0) {
        WARN_LOG("File manager command failed (" << rc << "): " << command);
        m_statusMessage = "Could not open the cache folder";
    }
}

void App::renderUI() {
    ImGuiWindowFlags windowFlags = ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoCollapse |
                                   ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove |
                                   ImGuiWindowFlags_NoBringToFrontOnFocus;

    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);

    ImGui::Begin("MainWindow", nullptr, windowFlags);

    renderHeader();

    // Reserve space for the button row and status bar
    float footerHeight = ImGui::GetFrameHeightWithSpacing() * 2 + 12;
    ImGui::BeginChild("Tree", ImVec2(0, -footerHeight), true);
    if (m_isRefreshing && m_rows.empty()) {
        ImGui::TextDisabled("Scanning cache folders...");
    } else if (m_rows.empty()) {
        ImGui::TextDisabled(m_cacheRoot.empty() ? "No cache path set." : "The cache folder is empty.");
    } else {
        m_treeView->render(m_rows, m_selection);
    }
    ImGui::EndChild();

    renderButtons();
    renderStatusBar();

    renderConfirmDeleteDialog();
    renderOutcomeDialog();

    ImGui::End();
}

void App::renderHeader() {
    ImGui::TextColored(ImVec4(0.52f, 0.52f, 0.52f, 1.0f), "Welcome, %s", m_userName.c_str());
    ImGui::SetWindowFontScale(1.3f);
    ImGui::Text("Target : %s", m_cacheRoot.empty() ? "(not set)" : m_cacheRoot.c_str());
    ImGui::SetWindowFontScale(1.0f);
    ImGui::Spacing();
}

void App::renderButtons() {
    float available = ImGui::GetContentRegionAvail().x;
    float spacing = ImGui::GetStyle().ItemSpacing.x;

    ImGui::BeginDisabled(m_isRefreshing.load());

    if (m_cacheRoot.empty()) {
        if (ImGui::Button("Set Cache Path...", ImVec2(available, 0))) {
            m_requestCachePath = true;
        }
    } else {
        // Delete takes most of the row; Refresh and Open share the rest
        float deleteWidth = (available - 2 * spacing) * 0.7f;
        float otherWidth = (available - 2 * spacing) * 0.15f;

        if (ImGui::Button("Delete Selected", ImVec2(deleteWidth, 0))) {
            if (m_selection.empty()) {
                m_openNothingSelected = true;
            } else {
                m_openConfirmDelete = true;
            }
        }
        ImGui::SameLine();
        if (ImGui::Button("Refresh", ImVec2(otherWidth, 0))) {
            startBackgroundRefresh();
        }
        ImGui::SameLine();
        if (ImGui::Button("Open Cache Folder", ImVec2(otherWidth, 0))) {
            openCacheFolder();
        }
    }

    ImGui::EndDisabled();
}

void App::renderStatusBar() {
    ImGui::Separator();

    ImDrawList* drawList = ImGui::GetWindowDrawList();
    ImVec2 pos = ImGui::GetCursorScreenPos();
    float radius = 5.0f;
    ImVec2 center = ImVec2(pos.x + radius + 2, pos.y + ImGui::GetTextLineHeight() / 2);

    if (m_isRefreshing) {
        float pulse = (sinf(static_cast<float>(m_frameCount) * 0.15f) + 1.0f) * 0.5f;
        drawList->AddCircleFilled(center, radius, IM_COL32(220, 60, 60, static_cast<int>(180 + 75 * pulse)));
    } else {
        drawList->AddCircleFilled(center, radius, IM_COL32(60, 180, 60, 200));
    }
    ImGui::Dummy(ImVec2(radius * 2 + 8, 0));
    ImGui::SameLine();

    if (m_isRefreshing) {
        ImGui::TextColored(ImVec4(0.9f, 0.4f, 0.4f, 1.0f), "Scanning");
    } else {
        ImGui::TextColored(ImVec4(0.4f, 0.8f, 0.4f, 1.0f), "Ready");
    }
    ImGui::SameLine();
    ImGui::TextDisabled(" | %zu selected | %s", m_selection.size(), m_statusMessage.c_str());
}

void App::renderConfirmDeleteDialog() {
    if (m_openNothingSelected) {
        ImGui::OpenPopup("Warning");
        m_openNothingSelected = false;
    }
    if (m_openConfirmDelete) {
        ImGui::OpenPopup("Confirm Deletion");
        m_openConfirmDelete = false;
    }

    ImVec2 center = ImGui::GetMainViewport()->GetCenter();

    ImGui::SetNextWindowPos(center, ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));
    if (ImGui::BeginPopupModal("Warning", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::Text("You have not selected any folder");
        if (ImGui::Button("OK", ImVec2(120, 0))) {
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }

    ImGui::SetNextWindowPos(center, ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));
    if (ImGui::BeginPopupModal("Confirm Deletion", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::Text("Are you sure you want to delete the selected folders?");
        ImGui::Spacing();
        for (const auto& id : m_selection) {
            ImGui::BulletText("%s", id.c_str());
        }
        ImGui::Spacing();

        if (ImGui::Button("Yes", ImVec2(120, 0))) {
            ImGui::CloseCurrentPopup();
            deleteSelected();
        }
        ImGui::SameLine();
        if (ImGui::Button("No", ImVec2(120, 0))) {
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

void App::renderOutcomeDialog() {
    if (m_openOutcomes) {
        ImGui::OpenPopup("Deletion Problems");
        m_openOutcomes = false;
    }

    ImGui::SetNextWindowPos(ImGui::GetMainViewport()->GetCenter(), ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));
    if (ImGui::BeginPopupModal("Deletion Problems", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
        for (const auto& outcome : m_lastOutcomes) {
            if (outcome.succeeded()) {
                continue;
            }
            ImVec4 color = outcome.status == DeletionStatus::NotLeaf
                ? ImVec4(0.95f, 0.35f, 0.35f, 1.0f)
                : ImVec4(0.95f, 0.75f, 0.30f, 1.0f);
            ImGui::TextColored(color, "[%s]", toString(outcome.status));
            ImGui::SameLine();
            ImGui::TextUnformatted(outcome.message.c_str());
        }
        ImGui::Spacing();
        if (ImGui::Button("OK", ImVec2(120, 0))) {
            m_lastOutcomes.clear();
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

} // namespace FxCacheManager
