#pragma once

#include <ctime>
#include <filesystem>
#include "infra/error_handler/error.hpp"

namespace copysort::extensions {

// Выставляет atime и mtime файла dst равными mtime источника
[[nodiscard]] auto apply_timestamps(const std::filesystem::path& dst,
                                    const std::timespec& mtime)
    -> infra::VoidResult;

} // namespace copysort::extensions
