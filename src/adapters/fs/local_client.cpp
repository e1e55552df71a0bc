#include "local_client.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

#include "../../extensions/metadata.hpp"
#include "../../infra/hash/xxhash_verifier.hpp"

namespace objcp::adapters::fs {

namespace {

constexpr std::size_t kBufferSize = 64 * 1024;
constexpr std::size_t kMapChunk = 4 * 1024 * 1024; // между проверками stop

auto errno_error(int err, std::string_view what, const std::filesystem::path& path) -> infra::Error {
    auto code = infra::ErrorCode::StorageError;
    if (err == ENOENT) code = infra::ErrorCode::ObjectNotFound;
    else if (err == EACCES || err == EPERM) code = infra::ErrorCode::PermissionDenied;
    return infra::make_error(code, fmt::format("{} {}: {}", what, path.string(), std::strerror(err)));
}

auto interrupted() -> infra::Error {
    return infra::make_error(infra::ErrorCode::Interrupted, "Cancelled");
}

// Закрывает дескриптор при выходе из области видимости
class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { if (fd_ >= 0) ::close(fd_); }
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] auto get() const -> int { return fd_; }
    [[nodiscard]] auto valid() const -> bool { return fd_ >= 0; }

    // Явное закрытие, чтобы увидеть ошибку отложенной записи
    auto close() -> int {
        int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_;
};

auto write_all(int fd, const char* data, std::size_t size) -> bool {
    while (size > 0) {
        auto written = ::write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += written;
        size -= static_cast<std::size_t>(written);
    }
    return true;
}

auto to_system_time(std::filesystem::file_time_type ftime) -> std::chrono::system_clock::time_point {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(ftime));
}

// =============== Buffered I/O ===============
auto copy_file_buffered(int src_fd, int dst_fd,
                        const std::filesystem::path& src,
                        const std::filesystem::path& dst,
                        std::stop_token stop) -> infra::VoidResult
{
    std::vector<char> buffer(kBufferSize);
    while (true) {
        if (stop.stop_requested()) {
            return std::unexpected(interrupted());
        }
        auto got = ::read(src_fd, buffer.data(), buffer.size());
        if (got < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_error(errno, "Cannot read", src));
        }
        if (got == 0) break;
        if (!write_all(dst_fd, buffer.data(), static_cast<std::size_t>(got))) {
            return std::unexpected(errno_error(errno, "Cannot write", dst));
        }
    }
    return {};
}

// =============== Memory-mapped I/O ===============
auto copy_file_mmap(int src_fd, int dst_fd, std::size_t size,
                    const std::filesystem::path& src,
                    const std::filesystem::path& dst,
                    std::stop_token stop) -> infra::VoidResult
{
    void* src_map = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, src_fd, 0);
    if (src_map == MAP_FAILED) {
        // не все ФС поддерживают mmap
        spdlog::debug("mmap failed for {}, falling back to buffered copy", src.string());
        return copy_file_buffered(src_fd, dst_fd, src, dst, stop);
    }

    infra::VoidResult result{};
    const auto* data = static_cast<const char*>(src_map);
    for (std::size_t offset = 0; offset < size; offset += kMapChunk) {
        if (stop.stop_requested()) {
            result = std::unexpected(interrupted());
            break;
        }
        const auto chunk = std::min(kMapChunk, size - offset);
        if (!write_all(dst_fd, data + offset, chunk)) {
            result = std::unexpected(errno_error(errno, "Cannot write", dst));
            break;
        }
    }
    ::munmap(src_map, size);
    return result;
}

} // namespace

auto select_strategy(std::uintmax_t file_size) -> CopyStrategy {
    if (file_size < 1'000'000) return CopyStrategy::Buffered;      // < 1 MB
    return CopyStrategy::MMap;
}

LocalClient::LocalClient(LocalClientOptions options)
    : options_(std::move(options)) {}

auto LocalClient::resolve(std::string_view url) const -> Location {
    auto slash = url.find('/');
    auto head = url.substr(0, slash);
    if (!head.empty() && options_.aliases.contains(std::string(head))) {
        auto rest = slash == std::string_view::npos ? std::string_view{} : url.substr(slash + 1);
        return Location{.alias = std::string(head), .path = std::string(rest)};
    }
    return Location{.alias = {}, .path = std::string(url)};
}

auto LocalClient::to_path(const Location& location) const
    -> infra::Result<std::filesystem::path>
{
    if (location.alias.empty()) {
        return std::filesystem::path(location.path);
    }
    auto it = options_.aliases.find(location.alias);
    if (it == options_.aliases.end()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("Unknown alias '{}'", location.alias)));
    }
    auto relative = std::filesystem::path(location.path).relative_path();
    return it->second / relative;
}

auto LocalClient::stat(const Location& location) -> infra::Result<ObjectInfo> {
    auto path = to_path(location);
    if (!path) return std::unexpected(std::move(path.error()));

    std::error_code ec;
    auto status = std::filesystem::status(*path, ec);
    if (ec || !std::filesystem::exists(status)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ObjectNotFound,
            fmt::format("Object {} does not exist", location.url())));
    }

    ObjectInfo info{.location = location};
    info.is_dir = std::filesystem::is_directory(status);
    if (!info.is_dir) {
        info.size = std::filesystem::file_size(*path, ec);
    }
    auto mtime = std::filesystem::last_write_time(*path, ec);
    if (!ec) info.mod_time = to_system_time(mtime);
    return info;
}

auto LocalClient::list(const Location& location, bool recursive,
                       std::stop_token stop, const ListVisitor& visit)
    -> infra::VoidResult
{
    auto root = to_path(location);
    if (!root) return std::unexpected(std::move(root.error()));

    std::error_code ec;
    auto status = std::filesystem::status(*root, ec);
    if (ec || !std::filesystem::exists(status)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SourceNotFound,
            fmt::format("Source {} does not exist", location.url())));
    }

    if (std::filesystem::is_regular_file(status)) {
        auto info = stat(location);
        if (!info) return std::unexpected(std::move(info.error()));
        visit(*info);
        return {};
    }

    if (!std::filesystem::is_directory(status)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SourceNotFound,
            fmt::format("Source {} is not a regular file", location.url())));
    }

    if (!recursive) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IsFolder,
            fmt::format("{} is a folder, use recursive suffix", location.url())));
    }

    auto options = std::filesystem::directory_options::skip_permission_denied;
    std::filesystem::recursive_directory_iterator it(*root, options, ec);
    if (ec) {
        return std::unexpected(errno_error(ec.value(), "Cannot list", *root));
    }
    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return std::unexpected(infra::make_error(infra::ErrorCode::StorageError,
                fmt::format("Cannot list {}: {}", root->string(), ec.message())));
        }
        if (stop.stop_requested()) {
            return std::unexpected(interrupted());
        }
        if (!it->is_regular_file(ec)) continue;

        auto relative = it->path().lexically_relative(*root).generic_string();
        ObjectInfo info{
            .location = Location{.alias = location.alias,
                                 .path = join_path(location.path, relative)},
            .size = it->file_size(ec),
        };
        auto mtime = it->last_write_time(ec);
        if (!ec) info.mod_time = to_system_time(mtime);

        if (!visit(info)) {
            return {};
        }
    }
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::StorageError,
            fmt::format("Cannot list {}: {}", root->string(), ec.message())));
    }
    return {};
}

auto LocalClient::copy(const Location& source, const Location& target,
                       const Metadata& metadata,
                       const Metadata& user_metadata,
                       std::stop_token stop) -> infra::VoidResult
{
    if (stop.stop_requested()) {
        return std::unexpected(interrupted());
    }

    auto src = to_path(source);
    if (!src) return std::unexpected(std::move(src.error()));
    auto dst = to_path(target);
    if (!dst) return std::unexpected(std::move(dst.error()));

    FileDescriptor src_fd(::open(src->c_str(), O_RDONLY | O_CLOEXEC));
    if (!src_fd.valid()) {
        return std::unexpected(errno_error(errno, "Cannot open", *src));
    }
    struct stat sb{};
    if (::fstat(src_fd.get(), &sb) != 0) {
        return std::unexpected(errno_error(errno, "Cannot stat", *src));
    }
    if (S_ISDIR(sb.st_mode)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IsFolder,
            fmt::format("{} is a folder", source.url())));
    }

    std::error_code ec;
    if (dst->has_parent_path()) {
        std::filesystem::create_directories(dst->parent_path(), ec);
        if (ec) {
            return std::unexpected(errno_error(ec.value(), "Cannot create folder", dst->parent_path()));
        }
    }

    // Пишем во временный файл рядом и переименовываем: целевой объект
    // либо старый, либо полностью новый
    auto part = dst->parent_path() / fmt::format(".{}.objcp.part", dst->filename().string());
    FileDescriptor dst_fd(::open(part.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!dst_fd.valid()) {
        return std::unexpected(errno_error(errno, "Cannot create", part));
    }

    const auto size = static_cast<std::size_t>(sb.st_size);
    auto copied = select_strategy(size) == CopyStrategy::MMap
        ? copy_file_mmap(src_fd.get(), dst_fd.get(), size, *src, part, stop)
        : copy_file_buffered(src_fd.get(), dst_fd.get(), *src, part, stop);
    if (copied && dst_fd.close() != 0) {
        copied = std::unexpected(errno_error(errno, "Cannot write", part));
    }
    if (!copied) {
        std::filesystem::remove(part, ec);
        return copied;
    }

    if (auto res = extensions::copy_metadata(*src, part); !res) {
        spdlog::warn("Failed to copy metadata for {}: {}", src->string(), res.error().message);
    }

    Metadata attributes = user_metadata;
    for (const auto& [key, value] : metadata) {
        attributes.emplace(key, value);
    }
    if (!attributes.empty()) {
        if (auto res = extensions::write_user_metadata(part, attributes); !res) {
            spdlog::warn("Failed to store metadata for {}: {}", target.url(), res.error().message);
        }
    }

    std::filesystem::rename(part, *dst, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(part, ignored);
        return std::unexpected(errno_error(ec.value(), "Cannot rename into", *dst));
    }

    if (options_.verify) {
        if (auto res = infra::XXHashVerifier::verify_files(*src, *dst); !res) {
            return res;
        }
    }
    return {};
}

} // namespace objcp::adapters::fs
