// manifest.cpp
#include "manifest.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace copysort::extensions {

auto load_manifest(const std::filesystem::path& manifest_file) -> ManifestSet
{
    ManifestSet entries;

    std::ifstream in(manifest_file);
    if (!in) {
        spdlog::debug("Manifest {} not readable, starting with empty history",
                      manifest_file.string());
        return entries;
    }

    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        entries.insert(std::move(line));
        line.clear();
    }

    spdlog::debug("Loaded {} manifest entries from {}", entries.size(), manifest_file.string());
    return entries;
}

ManifestWriter::ManifestWriter(std::filesystem::path path, std::ofstream stream)
    : path_(std::move(path))
    , stream_(std::move(stream))
    , mutex_(std::make_unique<std::mutex>())
{}

auto ManifestWriter::open(const std::filesystem::path& manifest_file)
    -> infra::Result<ManifestWriter>
{
    std::ofstream stream(manifest_file, std::ios::out | std::ios::app);
    if (!stream) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ManifestUnavailable,
            fmt::format("Failed to open manifest {}", manifest_file.string())));
    }
    return ManifestWriter{manifest_file, std::move(stream)};
}

auto ManifestWriter::append(std::string_view relative_path) -> infra::VoidResult
{
    std::lock_guard lock(*mutex_);

    stream_.write(relative_path.data(), static_cast<std::streamsize>(relative_path.size()));
    stream_.put('\n');
    stream_.flush();

    if (!stream_) {
        stream_.clear();
        return std::unexpected(infra::make_error(infra::ErrorCode::WriteFailed,
            fmt::format("Failed to append '{}' to manifest {}", relative_path, path_.string())));
    }
    return {};
}

} // namespace copysort::extensions
