#include "metadata.hpp"
#include <cerrno>
#include <cstring>
#include <vector>
#include <fmt/core.h>

#ifdef __linux__
    #include <sys/xattr.h>
#endif

namespace objcp::extensions {

auto copy_metadata(const std::filesystem::path& src,
                   const std::filesystem::path& dst)
    -> infra::VoidResult
{
    std::error_code ec;

    // Временные метки
    auto time = std::filesystem::last_write_time(src, ec);
    if (!ec) {
        std::filesystem::last_write_time(dst, time, ec);
    }

    // Права (только POSIX)
    if (!ec) {
        auto perms = std::filesystem::status(src, ec).permissions();
        if (!ec) {
            std::filesystem::permissions(dst, perms, ec);
        }
    }

    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::StorageError,
                             fmt::format("Metadata copy failed: {}", ec.message())));
    }
    return {};
}

auto write_user_metadata(const std::filesystem::path& dst,
                         const std::map<std::string, std::string>& metadata)
    -> infra::VoidResult
{
#ifdef __linux__
    for (const auto& [key, value] : metadata) {
        const auto name = "user." + key;
        if (::setxattr(dst.c_str(), name.c_str(), value.data(), value.size(), 0) != 0) {
            return std::unexpected(infra::make_error(infra::ErrorCode::StorageError,
                fmt::format("Cannot set {} on {}: {}", name, dst.string(), std::strerror(errno))));
        }
    }
    return {};
#else
    if (metadata.empty()) return {};
    return std::unexpected(infra::make_error(infra::ErrorCode::StorageError,
                                             "User metadata is not supported on this platform"));
#endif
}

auto read_user_metadata(const std::filesystem::path& path, const std::string& key)
    -> infra::Result<std::string>
{
#ifdef __linux__
    const auto name = "user." + key;
    auto size = ::getxattr(path.c_str(), name.c_str(), nullptr, 0);
    if (size < 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ObjectNotFound,
            fmt::format("No {} on {}: {}", name, path.string(), std::strerror(errno))));
    }
    std::vector<char> buffer(static_cast<std::size_t>(size));
    size = ::getxattr(path.c_str(), name.c_str(), buffer.data(), buffer.size());
    if (size < 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::StorageError,
            fmt::format("Cannot read {} on {}: {}", name, path.string(), std::strerror(errno))));
    }
    return std::string(buffer.data(), static_cast<std::size_t>(size));
#else
    return std::unexpected(infra::make_error(infra::ErrorCode::StorageError,
                                             "User metadata is not supported on this platform"));
#endif
}

auto parse_user_metadata(std::string_view attr)
    -> infra::Result<std::map<std::string, std::string>>
{
    std::map<std::string, std::string> metadata;
    if (attr.empty()) return metadata;

    while (true) {
        const auto end = attr.find(';');
        const auto entry = attr.substr(0, end);
        const auto eq = entry.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidMetadata,
                "specified metadata should be of form key1=value1;key2=value2;... and so on"));
        }
        metadata[std::string(entry.substr(0, eq))] = std::string(entry.substr(eq + 1));

        if (end == std::string_view::npos) break;
        attr.remove_prefix(end + 1);
    }
    return metadata;
}

} // namespace objcp::extensions
