#include "cache_tree_view.hpp"
#include "imgui.h"
#include <algorithm>
#include <cstring>

namespace FxCacheManager {

namespace {

const ImVec4 kInUseColor = ImVec4(1.0f, 0.65f, 0.0f, 1.0f);
const ImU32 kCommentLineColor = IM_COL32(111, 111, 111, 150);

// Text in the current table cell, underlined when the row carries a comment
void cellText(const std::string& text, bool underline) {
    ImVec2 start = ImGui::GetCursorScreenPos();
    float width = ImGui::GetContentRegionAvail().x;
    ImGui::TextUnformatted(text.c_str());
    if (underline) {
        float y = ImGui::GetItemRectMax().y;
        ImGui::GetWindowDrawList()->AddLine(ImVec2(start.x, y), ImVec2(start.x + width, y), kCommentLineColor);
    }
}

// Copy into a fixed buffer without cutting a multi-byte UTF-8 sequence in half
void copyUtf8(char* buffer, size_t bufferSize, const std::string& text) {
    size_t length = std::min(text.size(), bufferSize - 1);
    if (length < text.size()) {
        size_t lead = length;
        while (lead > 0 && (static_cast<unsigned char>(text[lead]) & 0xC0) == 0x80) {
            --lead;
        }
        length = lead;
    }
    std::memcpy(buffer, text.data(), length);
    buffer[length] = '\0';
}

} // namespace

void CacheTreeView::render(const std::vector<CacheRow>& rows, const std::set<std::string>& selection) {
    ImGuiTableFlags flags = ImGuiTableFlags_Resizable | ImGuiTableFlags_BordersInnerV |
                            ImGuiTableFlags_RowBg | ImGuiTableFlags_ScrollY;

    if (ImGui::BeginTable("CacheTree", 4, flags)) {
        ImGui::TableSetupScrollFreeze(0, 1);
        ImGui::TableSetupColumn("name", ImGuiTableColumnFlags_WidthStretch, 2.0f);
        ImGui::TableSetupColumn("comment", ImGuiTableColumnFlags_WidthStretch, 3.0f);
        ImGui::TableSetupColumn("size", ImGuiTableColumnFlags_WidthFixed, 100.0f);
        ImGui::TableSetupColumn("date", ImGuiTableColumnFlags_WidthFixed, 110.0f);
        ImGui::TableHeadersRow();

        renderRows(rows, 0, 0, selection);

        ImGui::EndTable();
    }

    renderCommentEditor();
}

size_t CacheTreeView::renderRows(const std::vector<CacheRow>& rows, size_t index, int depth, const std::set<std::string>& selection) {
    while (index < rows.size() && rows[index].depth == depth) {
        const CacheRow& row = rows[index];
        bool opened = false;
        renderRow(row, selection, opened);
        ++index;

        if (opened) {
            index = renderRows(rows, index, depth + 1, selection);
            ImGui::TreePop();
        } else {
            // Skip the collapsed subtree
            while (index < rows.size() && rows[index].depth > depth) {
                ++index;
            }
        }
    }
    return index;
}

void CacheTreeView::renderRow(const CacheRow& row, const std::set<std::string>& selection, bool& opened) {
    ImGui::TableNextRow();
    ImGui::PushID(row.id.c_str());

    bool isRowSelected = selection.count(row.id) > 0;
    bool underline = !row.comment.empty();

    if (row.inUse) {
        ImGui::PushStyleColor(ImGuiCol_Text, kInUseColor);
    } else if (row.isProtected) {
        ImGui::PushStyleColor(ImGuiCol_Text, ImGui::GetStyleColorVec4(ImGuiCol_TextDisabled));
    }

    // Name column
    ImGui::TableNextColumn();
    ImGuiTreeNodeFlags nodeFlags = ImGuiTreeNodeFlags_SpanFullWidth | ImGuiTreeNodeFlags_OpenOnArrow |
                                   ImGuiTreeNodeFlags_DefaultOpen;
    if (!row.hasChildren) {
        nodeFlags |= ImGuiTreeNodeFlags_Leaf | ImGuiTreeNodeFlags_NoTreePushOnOpen;
    }
    if (isRowSelected) {
        nodeFlags |= ImGuiTreeNodeFlags_Selected;
    }

    std::string label = row.isProtected ? "[locked] " + row.name : row.name;
    bool nodeOpen = ImGui::TreeNodeEx(label.c_str(), nodeFlags);
    opened = nodeOpen && row.hasChildren;

    if (ImGui::IsItemClicked() && !ImGui::IsItemToggledOpen() && !row.isProtected) {
        if (m_selectCallback) {
            m_selectCallback(row.id, ImGui::GetIO().KeyCtrl);
        }
    }

    if (row.isLeaf && ImGui::BeginPopupContextItem("RowContext")) {
        renderContextMenu(row);
        ImGui::EndPopup();
    }

    if (row.inUse && ImGui::IsItemHovered()) {
        ImGui::SetTooltip("Used by the current scene");
    }

    // Comment, size and date columns
    ImGui::TableNextColumn();
    cellText(row.comment, underline);

    ImGui::TableNextColumn();
    cellText(row.formattedSize, underline);

    ImGui::TableNextColumn();
    cellText(row.formattedDate, underline);

    if (row.inUse || row.isProtected) {
        ImGui::PopStyleColor();
    }

    ImGui::PopID();
}

void CacheTreeView::renderContextMenu(const CacheRow& row) {
    if (ImGui::MenuItem("Edit Comment...")) {
        m_editingId = row.id;
        m_editingProtected = row.isProtected;
        copyUtf8(m_commentBuffer, sizeof(m_commentBuffer), row.comment);
        m_openCommentEditor = true;
    }

    if (ImGui::MenuItem(row.isProtected ? "Unprotect" : "Protect")) {
        if (m_metadataCallback) {
            m_metadataCallback(row.id, CacheMetadata{row.comment, !row.isProtected});
        }
    }
}

void CacheTreeView::renderCommentEditor() {
    if (m_openCommentEditor) {
        ImGui::OpenPopup("Edit Comment");
        m_openCommentEditor = false;
    }

    ImGui::SetNextWindowPos(ImGui::GetMainViewport()->GetCenter(), ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));
    if (ImGui::BeginPopupModal("Edit Comment", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::Text("%s", m_editingId.c_str());
        ImGui::SetNextItemWidth(400.0f);
        ImGui::InputText("##comment", m_commentBuffer, sizeof(m_commentBuffer));

        if (ImGui::Button("Save", ImVec2(120, 0))) {
            if (m_metadataCallback) {
                m_metadataCallback(m_editingId, CacheMetadata{m_commentBuffer, m_editingProtected});
            }
            ImGui::CloseCurrentPopup();
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel", ImVec2(120, 0))) {
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

} // namespace FxCacheManager
