#include "cache_path_dialog.hpp"
#include "../debug.hpp"

#include "imgui.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"

#define GL_GLEXT_PROTOTYPES
#include <GL/gl.h>
#include <GLFW/glfw3.h>

namespace FxCacheManager {

std::optional<std::string> CachePathDialog::askCachePath() {
    DEBUG_LOG("CachePathDialog opened");
    m_pathBuffer[0] = '\0';

    State state = State::Open;
    while (state == State::Open) {
        if (glfwWindowShouldClose(m_window)) {
            state = State::Cancelled;
            break;
        }

        glfwPollEvents();

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        state = renderFrame();

        ImGui::Render();
        int displayW, displayH;
        glfwGetFramebufferSize(m_window, &displayW, &displayH);
        glViewport(0, 0, displayW, displayH);
        glClearColor(0.1f, 0.1f, 0.1f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        glfwSwapBuffers(m_window);
    }

    if (state == State::Cancelled) {
        DEBUG_LOG("CachePathDialog cancelled");
        return std::nullopt;
    }
    return std::string(m_pathBuffer);
}

CachePathDialog::State CachePathDialog::renderFrame() {
    State state = State::Open;

    ImGui::OpenPopup("Set Cache Path");
    ImGui::SetNextWindowPos(ImGui::GetMainViewport()->GetCenter(), ImGuiCond_Always, ImVec2(0.5f, 0.5f));
    if (ImGui::BeginPopupModal("Set Cache Path", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::Text("Enter the cache path for $CACHEPATH:");
        ImGui::TextDisabled("The scene name is appended to it.");
        ImGui::SetNextItemWidth(480.0f);
        bool submitted = ImGui::InputText("##cachepath", m_pathBuffer, sizeof(m_pathBuffer),
                                          ImGuiInputTextFlags_EnterReturnsTrue);

        if (ImGui::Button("OK", ImVec2(120, 0)) || submitted) {
            state = State::Confirmed;
            ImGui::CloseCurrentPopup();
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel", ImVec2(120, 0))) {
            state = State::Cancelled;
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }

    return state;
}

} // namespace FxCacheManager
