#include "error.hpp"
#include <cstdlib>
#include <fmt/core.h>

namespace copysort::infra {

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::InvalidArguments:
        case ErrorCode::HomeNotFound:
        case ErrorCode::ManifestUnavailable:
        case ErrorCode::InvalidConfig:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    if (code == ErrorCode::InvalidArguments) return 2;
    return EXIT_FAILURE;
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, message, loc};
}

Error make_system_error(ErrorCode code, std::string_view context,
                        std::error_code ec,
                        const std::source_location& loc) {
    return Error{code, fmt::format("{}: {}", context, ec.message()), loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::debug;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        static_cast<int>(err.code), err.message
    );
    return std::move(err);
}

} // namespace copysort::infra
