#include "storage_client.hpp"

namespace objcp::adapters {

auto Location::url() const -> std::string {
    if (alias.empty()) return path;
    return join_path(alias, path);
}

auto join_path(std::string_view dir, std::string_view name) -> std::string {
    while (!name.empty() && name.front() == '/') name.remove_prefix(1);
    if (dir.empty()) return std::string(name);
    if (name.empty()) return std::string(dir);

    std::string result(dir);
    if (result.back() != '/') result.push_back('/');
    result.append(name);
    return result;
}

auto base_name(std::string_view path) -> std::string {
    while (path.size() > 1 && path.back() == '/') path.remove_suffix(1);
    auto pos = path.find_last_of('/');
    if (pos == std::string_view::npos || path.size() == 1) return std::string(path);
    return std::string(path.substr(pos + 1));
}

} // namespace objcp::adapters
