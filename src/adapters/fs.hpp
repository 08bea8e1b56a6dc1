#pragma once

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include "infra/error_handler/error.hpp"

namespace copysort::adapters::fs {

enum class CopyStrategy {
    Buffered,    // < 1 MB и > 100 MB
    MMap,        // 1 MB – 100 MB
};

struct FileInfo {
    std::uint64_t size = 0;
    std::timespec mtime{};
};

inline constexpr std::size_t kDefaultBufferSize = 1024 * 1024;

[[nodiscard]] auto select_strategy(std::uint64_t file_size) -> CopyStrategy;

// stat(2) с переходом по символическим ссылкам
[[nodiscard]] auto stat_file(const std::filesystem::path& path)
    -> infra::Result<FileInfo>;

// Создаёт все родительские каталоги dst; повторный вызов не ошибка
[[nodiscard]] auto ensure_parent_directories(const std::filesystem::path& dst)
    -> infra::VoidResult;

/// Копирует содержимое src в dst (dst создаётся или обрезается).
/// Возвращает число записанных байт. При ошибке dst может остаться
/// частично записанным.
[[nodiscard]] auto copy_file(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    CopyStrategy strategy = CopyStrategy::Buffered,
    std::size_t buffer_size = kDefaultBufferSize
) -> infra::Result<std::uint64_t>;

[[nodiscard]] auto copy_file_buffered(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    std::size_t buffer_size = kDefaultBufferSize
) -> infra::Result<std::uint64_t>;

[[nodiscard]] auto copy_file_mmap(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::Result<std::uint64_t>;

} // namespace copysort::adapters::fs
