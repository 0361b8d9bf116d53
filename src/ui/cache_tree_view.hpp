/**
 * @file cache_tree_view.hpp
 * @brief Table/tree view of the cache directories.
 */

#pragma once

#include "../cache_service.hpp"
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace FxCacheManager {

/**
 * @brief Renders cache rows as an expandable table.
 *
 * Columns are name, comment, size and date. Versions used by the open
 * scene are drawn in orange, rows with a comment are underlined and
 * protected versions carry a lock marker and cannot be selected.
 *
 * Click selects a single row, Ctrl+click toggles rows in and out of the
 * selection. The view never changes the selection itself; it reports
 * clicks through the select callback and reads the current selection
 * passed to render().
 */
class CacheTreeView {
public:
    /**
     * @brief Callback type for row clicks.
     * @param id Node id of the clicked row
     * @param additive true when Ctrl was held
     */
    using SelectCallback = std::function<void(const std::string& id, bool additive)>;

    /**
     * @brief Callback type for sidecar edits from the context menu.
     */
    using MetadataCallback = std::function<void(const std::string& id, const CacheMetadata& metadata)>;

    CacheTreeView() = default;

    /**
     * @brief Render the view.
     *
     * Must be called within an ImGui context.
     *
     * @param rows Pre-order rows from CacheService::rows()
     * @param selection Currently selected node ids
     */
    void render(const std::vector<CacheRow>& rows, const std::set<std::string>& selection);

    void setSelectCallback(SelectCallback callback) { m_selectCallback = std::move(callback); }
    void setMetadataCallback(MetadataCallback callback) { m_metadataCallback = std::move(callback); }

private:
    size_t renderRows(const std::vector<CacheRow>& rows, size_t index, int depth, const std::set<std::string>& selection);
    void renderRow(const CacheRow& row, const std::set<std::string>& selection, bool& opened);
    void renderContextMenu(const CacheRow& row);
    void renderCommentEditor();

    SelectCallback m_selectCallback;
    MetadataCallback m_metadataCallback;

    /// @name Comment Editor
    /// @{
    bool m_openCommentEditor = false;
    std::string m_editingId;
    bool m_editingProtected = false;
    char m_commentBuffer[512] = {0};
    /// @}
};

} // namespace FxCacheManager
