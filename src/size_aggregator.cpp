#include "size_aggregator.hpp"
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace FxCacheManager {

std::uintmax_t SizeAggregator::directorySize(const std::filesystem::path& path) {
    std::error_code ec;
    std::uintmax_t total = 0;

    auto options = std::filesystem::directory_options::skip_permission_denied |
                   std::filesystem::directory_options::follow_directory_symlink;
    std::filesystem::recursive_directory_iterator it(path, options, ec);
    if (ec) {
        return 0;
    }

    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            // Entry vanished while walking; keep going with the rest
            ec.clear();
            continue;
        }

        std::error_code entryEc;
        if (!it->is_regular_file(entryEc)) {
            continue;
        }
        auto fileSize = it->file_size(entryEc);
        if (!entryEc) {
            total += fileSize;
        }
    }

    return total;
}

std::string SizeAggregator::formatSize(std::uintmax_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unitIndex = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unitIndex < 4) {
        size /= 1024.0;
        ++unitIndex;
    }

    // Truncate to one decimal instead of rounding up
    double truncated = std::floor(size * 10.0) / 10.0;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << truncated << " " << units[unitIndex];
    return oss.str();
}

std::string SizeAggregator::formatDate(const std::filesystem::file_time_type& time) {
    // last_write_time reports failure as min()
    if (time == std::filesystem::file_time_type::min()) {
        return "";
    }
    auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        time - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now()
    );
    std::time_t tt = std::chrono::system_clock::to_time_t(sctp);
    std::tm tm{};
    localtime_r(&tt, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%m-%d  %H:%M");
    return oss.str();
}

} // namespace FxCacheManager
