#include "session/transcript_writer.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace toolpilot::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

// Message text can carry raw program output; bad UTF-8 becomes U+FFFD.
std::string to_line(const json& event) {
    return event.dump(-1, ' ', false, json::error_handler_t::replace);
}

json message_to_json(const protocol::Message& message) {
    json payload;
    payload["role"] = protocol::to_string(message.role);
    payload["content"] = message.content;
    if (!message.tool_calls.empty()) {
        payload["tool_calls"] = json::array();
        for (const auto& call : message.tool_calls) {
            payload["tool_calls"].push_back(
                {{"id", call.id}, {"name", call.name}, {"arguments", call.arguments}});
        }
    }
    if (message.tool_call_id.has_value()) {
        payload["tool_call_id"] = message.tool_call_id.value();
    }
    if (message.name.has_value()) {
        payload["name"] = message.name.value();
    }
    return payload;
}

}  // namespace

TranscriptWriter::TranscriptWriter(std::filesystem::path transcript_path,
                                   std::string session_id)
    : transcript_path_(std::move(transcript_path)), session_id_(std::move(session_id)) {}

core::errors::Result<std::filesystem::path> TranscriptWriter::append_event(
    const std::string& event_json) const {
    if (transcript_path_.empty()) {
        return AgentError{ErrorCategory::Input, "Transcript path cannot be empty.",
                          "invalid_transcript_path"};
    }

    std::error_code ec;
    const auto parent = transcript_path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return AgentError{ErrorCategory::Internal,
                              "Unable to create transcript directory: " + parent.string(),
                              "transcript_dir_create_failed"};
        }
    }

    std::ofstream out(transcript_path_, std::ios::app);
    if (!out.is_open()) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to open transcript file: " + transcript_path_.string(),
                          "transcript_open_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to write transcript event: " + transcript_path_.string(),
                          "transcript_write_failed"};
    }

    return transcript_path_;
}

core::errors::Result<std::filesystem::path> TranscriptWriter::write_request(
    const std::string& model, const std::string& prompt) const {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "request";
    event["session_id"] = session_id_;
    event["payload"] = {{"model", model}, {"prompt", prompt}};
    return append_event(to_line(event));
}

core::errors::Result<std::filesystem::path> TranscriptWriter::write_message(
    const protocol::Message& message) const {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "message";
    event["session_id"] = session_id_;
    event["payload"] = message_to_json(message);
    return append_event(to_line(event));
}

core::errors::Result<std::filesystem::path> TranscriptWriter::write_final(
    const bool success, const std::string& answer,
    const std::optional<std::string>& error_message) const {
    json payload;
    payload["status"] = success ? "completed" : "failed";
    payload["answer"] = answer;
    payload["error_message"] = error_message.has_value() ? error_message.value() : "";

    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = "final";
    event["session_id"] = session_id_;
    event["payload"] = payload;
    return append_event(to_line(event));
}

}  // namespace toolpilot::session
