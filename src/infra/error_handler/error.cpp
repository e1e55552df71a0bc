#include "error.hpp"
#include <array>
#include <cstdlib>
#include <utility>
#include <fmt/core.h>

namespace objcp::infra {

namespace {

struct CodeName {
    ErrorCode code;
    std::string_view name;
};

constexpr std::array kCodeNames{
    CodeName{ErrorCode::SourceNotFound,   "SourceNotFound"},
    CodeName{ErrorCode::IsFolder,         "IsFolder"},
    CodeName{ErrorCode::ObjectNotFound,   "ObjectNotFound"},
    CodeName{ErrorCode::PermissionDenied, "PermissionDenied"},
    CodeName{ErrorCode::ChecksumMismatch, "ChecksumMismatch"},
    CodeName{ErrorCode::StorageError,     "StorageError"},
    CodeName{ErrorCode::NetworkTimeout,   "NetworkTimeout"},
    CodeName{ErrorCode::InvalidArgument,  "InvalidArgument"},
    CodeName{ErrorCode::InvalidDuration,  "InvalidDuration"},
    CodeName{ErrorCode::InvalidMetadata,  "InvalidMetadata"},
    CodeName{ErrorCode::SessionIO,        "SessionIO"},
    CodeName{ErrorCode::SessionNotFound,  "SessionNotFound"},
    CodeName{ErrorCode::CorruptSession,   "CorruptSession"},
    CodeName{ErrorCode::Interrupted,      "Interrupted"},
    CodeName{ErrorCode::Unknown,          "Unknown"},
};

} // namespace

auto to_string(ErrorCode code) -> std::string_view {
    for (const auto& entry : kCodeNames) {
        if (entry.code == code) return entry.name;
    }
    return "Unknown";
}

auto error_code_from_string(std::string_view name) -> ErrorCode {
    for (const auto& entry : kCodeNames) {
        if (entry.name == name) return entry.code;
    }
    return ErrorCode::Unknown;
}

bool Error::is_fatal() const {
    return !is_ignorable() && !is_interrupted();
}

int Error::to_exit_code() const {
    if (is_interrupted()) return 130; // SIGINT
    return EXIT_FAILURE;
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error wrap_error(Error err, std::string_view context) {
    err.message = fmt::format("{}: {}", context, err.message);
    return err;
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level, "{} ({})", err.message, to_string(err.code));
    spdlog::debug("  at {}:{} in {}", err.file, err.line, err.function);
    return std::move(err);
}

} // namespace objcp::infra
