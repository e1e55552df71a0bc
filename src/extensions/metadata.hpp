#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include "../infra/error_handler/error.hpp"

namespace objcp::extensions {

// Время модификации и права доступа (POSIX)
[[nodiscard]] auto copy_metadata(const std::filesystem::path& src,
                                 const std::filesystem::path& dst)
    -> infra::VoidResult;

// Пользовательские метаданные сохраняются как xattr "user.<key>"
[[nodiscard]] auto write_user_metadata(const std::filesystem::path& dst,
                                       const std::map<std::string, std::string>& metadata)
    -> infra::VoidResult;

[[nodiscard]] auto read_user_metadata(const std::filesystem::path& path,
                                      const std::string& key)
    -> infra::Result<std::string>;

/// "k1=v1;k2=v2" -> {k1: v1, k2: v2}. InvalidMetadata при нарушении формы.
[[nodiscard]] auto parse_user_metadata(std::string_view attr)
    -> infra::Result<std::map<std::string, std::string>>;

} // namespace objcp::extensions
