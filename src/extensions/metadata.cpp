// metadata.cpp
#include "metadata.hpp"
#include <cerrno>
#include <system_error>
#include <fmt/core.h>

#include <fcntl.h>
#include <sys/stat.h>

namespace copysort::extensions {

auto apply_timestamps(const std::filesystem::path& dst,
                      const std::timespec& mtime)
    -> infra::VoidResult
{
    const std::timespec times[2] = {mtime, mtime};
    if (::utimensat(AT_FDCWD, dst.c_str(), times, 0) != 0) {
        return std::unexpected(infra::make_system_error(infra::ErrorCode::MetadataFailed,
            fmt::format("Cannot set times on {}", dst.string()),
            std::error_code{errno, std::generic_category()}));
    }
    return {};
}

} // namespace copysort::extensions
