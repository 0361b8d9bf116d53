/**
 * @file size_aggregator.hpp
 * @brief Directory size totals and display formatting.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace FxCacheManager {

/**
 * @brief Computes on-disk sizes of cache directories.
 *
 * Also hosts the formatting helpers used for the size and date columns
 * so that every view renders them identically.
 */
class SizeAggregator {
public:
    /**
     * @brief Sum the sizes of all regular files below a directory.
     *
     * Walks every nested directory. Files that cannot be stat'ed (for
     * example because they were removed mid-walk) are skipped.
     *
     * @param path Directory to measure
     * @return Total bytes, or 0 if the path does not exist
     */
    static std::uintmax_t directorySize(const std::filesystem::path& path);

    /**
     * @brief Format a byte count with binary units.
     *
     * Picks the largest of B/KB/MB/GB/TB where the value stays below 1024
     * and shows one decimal place. The decimal is truncated, so the
     * displayed amount never exceeds the real byte count.
     *
     * @par Examples:
     * - 0 → "0.0 B"
     * - 1536 → "1.5 KB"
     * - 1048575 → "1023.9 KB"
     */
    static std::string formatSize(std::uintmax_t bytes);

    /**
     * @brief Format a modification time as local "MM-DD  HH:MM".
     * @return Empty string for an unknown time (file_time_type::min())
     */
    static std::string formatDate(const std::filesystem::file_time_type& time);
};

} // namespace FxCacheManager
