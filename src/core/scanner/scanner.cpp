#include "scanner.hpp"
#include <stack>
#include <spdlog/spdlog.h>

namespace copysort::core {

namespace fs = std::filesystem;

auto relative_key(const fs::path& source_root, const fs::path& file) -> std::string {
    return file.lexically_relative(source_root).string();
}

auto is_excluded_path(const fs::path& path) -> bool {
    // Подстрока, а не компонент пути: "a/xRECYCLE.BINx/b" тоже исключается
    return path.native().find(kRecycleBinMarker) != std::string::npos;
}

auto scan_source(const fs::path& source_root,
                 const extensions::ManifestSet& manifest) -> ScanResult
{
    ScanResult result;
    std::uint64_t unreadable_dirs = 0;

    std::stack<fs::path> pending;
    pending.push(source_root);

    while (!pending.empty()) {
        const fs::path dir = std::move(pending.top());
        pending.pop();

        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            ++unreadable_dirs;
            spdlog::debug("Skipping unreadable directory {}: {}", dir.string(), ec.message());
            continue;
        }

        for (; it != fs::directory_iterator{}; it.increment(ec)) {
            if (ec) break;
            const auto& entry = *it;

            std::error_code type_ec;
            // Символические ссылки на каталоги не обходим
            if (entry.is_directory(type_ec) && !entry.is_symlink(type_ec)) {
                pending.push(entry.path());
                continue;
            }
            if (!entry.is_regular_file(type_ec)) continue;

            const auto& path = entry.path();
            if (is_excluded_path(path)) continue;

            if (manifest.contains(relative_key(source_root, path))) {
                ++result.already_copied;
            } else {
                result.jobs.push_back(path);
            }
        }
        if (ec) {
            ++unreadable_dirs;
            spdlog::debug("Stopped listing {}: {}", dir.string(), ec.message());
        }
    }

    spdlog::debug("Scan of {}: {} pending, {} already copied, {} unreadable directories",
                  source_root.string(), result.jobs.size(), result.already_copied, unreadable_dirs);
    return result;
}

} // namespace copysort::core
