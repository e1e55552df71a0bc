#include "transfer_unit.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/core.h>

namespace objcp::core {

namespace {

using Nanos = std::chrono::nanoseconds;

void emit_metadata(YAML::Emitter& out, const adapters::Metadata& metadata) {
    out << YAML::BeginMap;
    for (const auto& [key, value] : metadata) {
        out << YAML::Key << key << YAML::Value << value;
    }
    out << YAML::EndMap;
}

void emit_content(YAML::Emitter& out, const Content& content) {
    out << YAML::BeginMap
        << YAML::Key << "alias" << YAML::Value << content.location.alias
        << YAML::Key << "path" << YAML::Value << content.location.path
        << YAML::Key << "size" << YAML::Value << content.size
        << YAML::Key << "mtime" << YAML::Value
        << static_cast<long long>(std::chrono::duration_cast<Nanos>(
               content.mod_time.time_since_epoch()).count());
    if (!content.metadata.empty()) {
        out << YAML::Key << "metadata" << YAML::Value;
        emit_metadata(out, content.metadata);
    }
    if (!content.user_metadata.empty()) {
        out << YAML::Key << "user_metadata" << YAML::Value;
        emit_metadata(out, content.user_metadata);
    }
    out << YAML::EndMap;
}

auto parse_metadata(const YAML::Node& node) -> adapters::Metadata {
    adapters::Metadata metadata;
    if (!node) return metadata;
    for (const auto& entry : node) {
        metadata[entry.first.as<std::string>()] = entry.second.as<std::string>();
    }
    return metadata;
}

auto parse_content(const YAML::Node& node) -> Content {
    Content content;
    content.location.alias = node["alias"].as<std::string>("");
    content.location.path = node["path"].as<std::string>();
    content.size = node["size"].as<std::uint64_t>(0);
    content.mod_time = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            Nanos(node["mtime"].as<long long>(0))));
    content.metadata = parse_metadata(node["metadata"]);
    content.user_metadata = parse_metadata(node["user_metadata"]);
    return content;
}

} // namespace

auto to_line(const TransferUnit& unit) -> std::string {
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted); // '\n' в именах экранируется

    out << YAML::BeginMap
        << YAML::Key << "source_alias" << YAML::Value << unit.source_alias
        << YAML::Key << "target_alias" << YAML::Value << unit.target_alias
        << YAML::Key << "source" << YAML::Value;
    emit_content(out, unit.source);
    out << YAML::Key << "target" << YAML::Value;
    emit_content(out, unit.target);
    out << YAML::Key << "total_count" << YAML::Value << unit.total_count
        << YAML::Key << "total_size" << YAML::Value << unit.total_size;
    if (unit.error) {
        out << YAML::Key << "error" << YAML::Value << YAML::BeginMap
            << YAML::Key << "code" << YAML::Value << std::string(infra::to_string(unit.error->code))
            << YAML::Key << "message" << YAML::Value << unit.error->message
            << YAML::EndMap;
    }
    out << YAML::EndMap;
    return out.c_str();
}

auto from_line(std::string_view line) -> infra::Result<TransferUnit> {
    try {
        auto node = YAML::Load(std::string(line));
        if (!node.IsMap() || !node["source"] || !node["target"]) {
            return std::unexpected(infra::make_error(infra::ErrorCode::CorruptSession,
                fmt::format("Not a transfer unit: {}", line)));
        }

        TransferUnit unit;
        unit.source_alias = node["source_alias"].as<std::string>("");
        unit.target_alias = node["target_alias"].as<std::string>("");
        unit.source = parse_content(node["source"]);
        unit.target = parse_content(node["target"]);
        unit.total_count = node["total_count"].as<std::uint64_t>(0);
        unit.total_size = node["total_size"].as<std::uint64_t>(0);
        if (const auto error = node["error"]) {
            unit.error = infra::make_error(
                infra::error_code_from_string(error["code"].as<std::string>("Unknown")),
                error["message"].as<std::string>(""));
        }
        return unit;
    } catch (const YAML::Exception& e) {
        return std::unexpected(infra::make_error(infra::ErrorCode::CorruptSession,
            fmt::format("Unable to parse '{}': {}", line, e.what())));
    }
}

} // namespace objcp::core
