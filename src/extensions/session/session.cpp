// session.cpp
#include "session.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <random>
#include <sstream>
#include <fmt/core.h>
#include <fmt/chrono.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <fcntl.h>
#include <unistd.h>

namespace objcp::extensions {

namespace {

constexpr std::size_t kIdLength = 8;
constexpr const char* kHeaderSuffix = ".yaml";
constexpr const char* kDataSuffix = ".data";

auto io_error(std::string_view what, const std::filesystem::path& path, int err = errno) -> infra::Error {
    return infra::make_error(infra::ErrorCode::SessionIO,
        fmt::format("{} {}: {}", what, path.string(), std::strerror(err)));
}

auto new_random_id() -> std::string {
    static constexpr std::string_view letters = "abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> dist(0, letters.size() - 1);

    std::string id(kIdLength, 'a');
    for (auto& c : id) c = letters[dist(rng)];
    return id;
}

auto now_iso8601() -> std::string {
    auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", now);
}

auto fsync_path(const std::filesystem::path& path, int flags) -> bool {
    int fd = ::open(path.c_str(), flags | O_CLOEXEC);
    if (fd < 0) return false;
    bool ok = ::fsync(fd) == 0;
    ::close(fd);
    return ok;
}

// =============== Формат заголовка ===============

auto header_to_yaml(const SessionHeader& header) -> std::string {
    YAML::Emitter out;
    out << YAML::BeginMap
        << YAML::Key << "version" << YAML::Value << header.version
        << YAML::Key << "id" << YAML::Value << header.id
        << YAML::Key << "command_type" << YAML::Value << header.command_type
        << YAML::Key << "command_args" << YAML::Value << YAML::BeginSeq;
    for (const auto& arg : header.command_args) {
        out << YAML::DoubleQuoted << arg;
    }
    out << YAML::EndSeq
        << YAML::Key << "flags" << YAML::Value << YAML::BeginMap
        << YAML::Key << "recursive" << YAML::Value << header.options.recursive
        << YAML::Key << "older_than" << YAML::Value << YAML::DoubleQuoted << header.options.older_than
        << YAML::Key << "newer_than" << YAML::Value << YAML::DoubleQuoted << header.options.newer_than
        << YAML::Key << "storage_class" << YAML::Value << YAML::DoubleQuoted << header.options.storage_class
        << YAML::Key << "encrypt_key" << YAML::Value << YAML::DoubleQuoted << header.options.encrypt_key
        << YAML::Key << "encrypt" << YAML::Value << YAML::DoubleQuoted << header.options.encrypt
        << YAML::EndMap
        << YAML::Key << "user_metadata" << YAML::Value << YAML::BeginMap;
    for (const auto& [key, value] : header.user_metadata) {
        out << YAML::Key << YAML::DoubleQuoted << key << YAML::Value << YAML::DoubleQuoted << value;
    }
    out << YAML::EndMap
        << YAML::Key << "root_path" << YAML::Value << YAML::DoubleQuoted << header.root_path
        << YAML::Key << "created" << YAML::Value << YAML::DoubleQuoted << header.created
        << YAML::Key << "total_bytes" << YAML::Value << header.total_bytes
        << YAML::Key << "total_objects" << YAML::Value << header.total_objects
        << YAML::Key << "scan_complete" << YAML::Value << header.scan_complete
        << YAML::Key << "last_completed" << YAML::Value << YAML::DoubleQuoted << header.last_completed
        << YAML::EndMap;
    std::string text = out.c_str();
    text.push_back('\n');
    return text;
}

auto header_from_yaml(const std::filesystem::path& path) -> infra::Result<SessionHeader> {
    try {
        YAML::Node node = YAML::LoadFile(path.string());

        SessionHeader header;
        header.version = node["version"].as<int>(0);
        if (header.version != SessionHeader::kVersion) {
            return std::unexpected(infra::make_error(infra::ErrorCode::CorruptSession,
                fmt::format("Unsupported session version {} in {}", header.version, path.string())));
        }
        header.id = node["id"].as<std::string>();
        header.command_type = node["command_type"].as<std::string>();
        header.command_args = node["command_args"].as<std::vector<std::string>>();

        if (const auto flags = node["flags"]) {
            header.options.recursive = flags["recursive"].as<bool>(false);
            header.options.older_than = flags["older_than"].as<std::string>("");
            header.options.newer_than = flags["newer_than"].as<std::string>("");
            header.options.storage_class = flags["storage_class"].as<std::string>("");
            header.options.encrypt_key = flags["encrypt_key"].as<std::string>("");
            header.options.encrypt = flags["encrypt"].as<std::string>("");
        }
        if (const auto metadata = node["user_metadata"]) {
            header.user_metadata = metadata.as<std::map<std::string, std::string>>();
        }
        header.root_path = node["root_path"].as<std::string>("");
        header.created = node["created"].as<std::string>("");
        header.total_bytes = node["total_bytes"].as<std::uint64_t>(0);
        header.total_objects = node["total_objects"].as<std::uint64_t>(0);
        header.scan_complete = node["scan_complete"].as<bool>(false);
        header.last_completed = node["last_completed"].as<std::string>("");
        return header;

    } catch (const YAML::BadFile&) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SessionNotFound,
            fmt::format("Session file {} not found", path.string())));
    } catch (const YAML::Exception& e) {
        return std::unexpected(infra::make_error(infra::ErrorCode::CorruptSession,
            fmt::format("Unable to parse {}: {}", path.string(), e.what())));
    }
}

// Запись через временный файл + fsync + rename + fsync каталога
auto write_atomically(const std::filesystem::path& path, const std::string& content)
    -> infra::VoidResult
{
    auto tmp = path;
    tmp += ".tmp";

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        return std::unexpected(io_error("Cannot create", tmp));
    }

    const char* data = content.data();
    std::size_t left = content.size();
    while (left > 0) {
        auto written = ::write(fd, data, left);
        if (written < 0) {
            if (errno == EINTR) continue;
            auto err = io_error("Cannot write", tmp);
            ::close(fd);
            return std::unexpected(std::move(err));
        }
        data += written;
        left -= static_cast<std::size_t>(written);
    }
    if (::fsync(fd) != 0) {
        auto err = io_error("Cannot sync", tmp);
        ::close(fd);
        return std::unexpected(std::move(err));
    }
    if (::close(fd) != 0) {
        return std::unexpected(io_error("Cannot close", tmp));
    }
    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        return std::unexpected(io_error("Cannot rename", path));
    }
    const auto folder = path.parent_path().empty() ? std::filesystem::path(".") : path.parent_path();
    if (!fsync_path(folder, O_RDONLY | O_DIRECTORY)) {
        return std::unexpected(io_error("Cannot sync folder of", path));
    }
    return {};
}

} // namespace

// =============== WorkLogReader ===============

WorkLogReader::WorkLogReader(std::ifstream stream, std::filesystem::path path)
    : stream_(std::move(stream)), path_(std::move(path)) {}

auto WorkLogReader::next() -> std::optional<infra::Result<core::TransferUnit>> {
    std::string line;
    while (std::getline(stream_, line)) {
        ++lines_;
        if (line.empty()) continue;
        return core::from_line(line);
    }
    if (stream_.bad()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SessionIO,
            fmt::format("Error reading {}", path_.string())));
    }
    return std::nullopt;
}

// =============== Session ===============

Session::Session(std::filesystem::path dir, SessionHeader header)
    : dir_(std::move(dir)), header_(std::move(header)) {}

Session::~Session() = default;

auto Session::header_path() const -> std::filesystem::path {
    return dir_ / (header_.id + kHeaderSuffix);
}

auto Session::data_path() const -> std::filesystem::path {
    return dir_ / (header_.id + kDataSuffix);
}

auto Session::create(const std::filesystem::path& dir, SessionHeader header)
    -> infra::Result<Session>
{
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SessionIO,
            fmt::format("Cannot create session folder {}: {}", dir.string(), ec.message())));
    }

    do {
        header.id = new_random_id();
    } while (session_exists(dir, header.id));
    if (header.created.empty()) {
        header.created = now_iso8601();
    }
    header.version = SessionHeader::kVersion;

    Session session(dir, std::move(header));
    if (auto res = session.save(); !res) {
        return std::unexpected(std::move(res.error()));
    }
    if (auto res = session.open_writer_(); !res) {
        return std::unexpected(std::move(res.error()));
    }
    spdlog::debug("Created session {} in {}", session.id(), dir.string());
    return session;
}

auto Session::load(const std::filesystem::path& dir, const std::string& id)
    -> infra::Result<Session>
{
    if (!session_exists(dir, id)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SessionNotFound,
            fmt::format("Session '{}' not found", id)));
    }
    auto header = header_from_yaml(dir / (id + kHeaderSuffix));
    if (!header) {
        return std::unexpected(std::move(header.error()));
    }
    return Session(dir, std::move(*header));
}

auto Session::has_work_log() const -> bool {
    if (!header_.scan_complete) return false;
    std::error_code ec;
    auto size = std::filesystem::file_size(data_path(), ec);
    return !ec && size > 0;
}

auto Session::open_writer_() -> infra::VoidResult {
    writer_.reset(std::fopen(data_path().c_str(), "ab"));
    if (!writer_) {
        return std::unexpected(io_error("Cannot open", data_path()));
    }
    return {};
}

auto Session::sync_writer_() -> infra::VoidResult {
    if (!writer_) return {};
    if (std::fflush(writer_.get()) != 0 || ::fsync(::fileno(writer_.get())) != 0) {
        return std::unexpected(io_error("Cannot sync", data_path()));
    }
    return {};
}

auto Session::reset_work_log() -> infra::VoidResult {
    writer_.reset(std::fopen(data_path().c_str(), "wb"));
    if (!writer_) {
        return std::unexpected(io_error("Cannot truncate", data_path()));
    }
    header_.scan_complete = false;
    header_.total_bytes = 0;
    header_.total_objects = 0;
    header_.last_completed.clear();
    return save();
}

auto Session::append_unit(const core::TransferUnit& unit) -> infra::VoidResult {
    if (!writer_) {
        if (auto res = open_writer_(); !res) return res;
    }
    auto line = core::to_line(unit);
    line.push_back('\n');
    if (std::fwrite(line.data(), 1, line.size(), writer_.get()) != line.size()) {
        return std::unexpected(io_error("Cannot append to", data_path()));
    }
    return {};
}

auto Session::finalize_scan(std::uint64_t total_bytes, std::uint64_t total_objects)
    -> infra::VoidResult
{
    if (auto res = sync_writer_(); !res) return res;
    writer_.reset();

    header_.total_bytes = total_bytes;
    header_.total_objects = total_objects;
    header_.scan_complete = true;
    return save();
}

auto Session::new_reader() const -> infra::Result<WorkLogReader> {
    std::ifstream stream(data_path());
    if (!stream) {
        return std::unexpected(io_error("Cannot open", data_path()));
    }
    return WorkLogReader(std::move(stream), data_path());
}

auto Session::set_checkpoint(const std::string& unit_id) -> infra::VoidResult {
    header_.last_completed = unit_id;
    return save();
}

auto Session::save() -> infra::VoidResult {
    return write_atomically(header_path(), header_to_yaml(header_));
}

auto Session::remove() -> infra::VoidResult {
    writer_.reset();
    std::error_code ec;
    std::filesystem::remove(data_path(), ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SessionIO,
            fmt::format("Cannot remove {}: {}", data_path().string(), ec.message())));
    }
    std::filesystem::remove(header_path(), ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SessionIO,
            fmt::format("Cannot remove {}: {}", header_path().string(), ec.message())));
    }
    spdlog::debug("Removed session {}", id());
    return {};
}

auto Session::close() -> infra::VoidResult {
    if (auto res = sync_writer_(); !res) return res;
    writer_.reset();
    return save();
}

// =============== Каталог сессий ===============

auto session_exists(const std::filesystem::path& dir, const std::string& id) -> bool {
    std::error_code ec;
    return std::filesystem::exists(dir / (id + kHeaderSuffix), ec);
}

auto list_sessions(const std::filesystem::path& dir)
    -> infra::Result<std::vector<SessionHeader>>
{
    std::vector<SessionHeader> headers;
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        return headers;
    }

    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.path().extension() != kHeaderSuffix) continue;
        auto header = header_from_yaml(entry.path());
        if (!header) {
            spdlog::warn("Skipping {}: {}", entry.path().string(), header.error().message);
            continue;
        }
        headers.push_back(std::move(*header));
    }
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SessionIO,
            fmt::format("Cannot list {}: {}", dir.string(), ec.message())));
    }

    std::ranges::sort(headers, {}, &SessionHeader::created);
    return headers;
}

auto clear_sessions(const std::filesystem::path& dir) -> infra::VoidResult {
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        return {};
    }

    // Все файлы сессий, в том числе с битым заголовком
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        const auto ext = entry.path().extension();
        if (ext == kHeaderSuffix || ext == kDataSuffix) {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SessionIO,
            fmt::format("Cannot list {}: {}", dir.string(), ec.message())));
    }

    for (const auto& file : files) {
        std::filesystem::remove(file, ec);
        if (ec) {
            return std::unexpected(infra::make_error(infra::ErrorCode::SessionIO,
                fmt::format("Cannot remove {}: {}", file.string(), ec.message())));
        }
    }
    spdlog::debug("Cleared {} session files in {}", files.size(), dir.string());
    return {};
}

} // namespace objcp::extensions
