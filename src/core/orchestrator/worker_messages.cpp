#include "worker_messages.hpp"

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

namespace objcp::core {

auto make_completion_event(const CopyOutcome& outcome) -> CompletionEvent {
    CompletionEvent event;
    event.tag = std::string(outcome_tag(outcome));
    if (const auto* success = std::get_if<Succeeded>(&outcome)) {
        event.bytes_transferred = success->bytes_transferred;
        event.elapsed_seconds = success->elapsed.count();
    } else if (const auto* skipped = std::get_if<Skipped>(&outcome)) {
        event.message = skipped->message;
    } else if (const auto* failed = std::get_if<Failed>(&outcome)) {
        event.bytes_transferred = failed->bytes_transferred;
        event.elapsed_seconds = failed->elapsed.count();
        event.aborts_run = failed->scope == FailureScope::Run;
        event.error_code = failed->error.code;
        event.message = failed->error.message;
    }
    return event;
}

auto encode_shape(const NamingShape& shape) -> std::string {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "source" << YAML::Value << shape.source;
    out << YAML::Key << "expanded_source" << YAML::Value << shape.expanded_source;
    out << YAML::Key << "names_container" << YAML::Value << shape.names_container;
    out << YAML::Key << "multi_source" << YAML::Value << shape.is_multi_source_request;
    if (shape.destination_had_existing_container) {
        out << YAML::Key << "existing_container" << YAML::Value << *shape.destination_had_existing_container;
    }
    out << YAML::EndMap;
    return out.c_str();
}

auto decode_shape(const std::string& payload) -> infra::Result<NamingShape> {
    try {
        const YAML::Node node = YAML::Load(payload);
        NamingShape shape;
        shape.source = node["source"].as<std::string>();
        shape.expanded_source = node["expanded_source"].as<std::string>();
        shape.names_container = node["names_container"].as<bool>();
        shape.is_multi_source_request = node["multi_source"].as<bool>();
        if (node["existing_container"]) {
            shape.destination_had_existing_container = node["existing_container"].as<bool>();
        }
        return shape;
    } catch (const YAML::Exception& e) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
            fmt::format("Malformed job frame: {}", e.what())));
    }
}

auto encode_event(const CompletionEvent& event) -> std::string {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "tag" << YAML::Value << event.tag;
    out << YAML::Key << "bytes" << YAML::Value << event.bytes_transferred;
    out << YAML::Key << "elapsed" << YAML::Value << event.elapsed_seconds;
    out << YAML::Key << "aborts_run" << YAML::Value << event.aborts_run;
    out << YAML::Key << "code" << YAML::Value << static_cast<int>(event.error_code);
    out << YAML::Key << "message" << YAML::Value << event.message;
    out << YAML::EndMap;
    return out.c_str();
}

auto decode_event(const std::string& payload) -> infra::Result<CompletionEvent> {
    try {
        const YAML::Node node = YAML::Load(payload);
        CompletionEvent event;
        event.tag = node["tag"].as<std::string>();
        event.bytes_transferred = node["bytes"].as<std::uint64_t>();
        event.elapsed_seconds = node["elapsed"].as<double>();
        event.aborts_run = node["aborts_run"].as<bool>();
        event.error_code = static_cast<infra::ErrorCode>(node["code"].as<int>());
        event.message = node["message"].as<std::string>();
        return event;
    } catch (const YAML::Exception& e) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
            fmt::format("Malformed completion frame: {}", e.what())));
    }
}

} // namespace objcp::core
