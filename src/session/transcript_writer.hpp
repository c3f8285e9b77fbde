#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/agent_errors.hpp"
#include "protocol/message_contract.hpp"

namespace toolpilot::session {

// Appends one JSON object per line: {ts_unix_ms, event, session_id, payload}.
class TranscriptWriter {
public:
    TranscriptWriter(std::filesystem::path transcript_path, std::string session_id);

    core::errors::Result<std::filesystem::path> write_request(
        const std::string& model, const std::string& prompt) const;

    core::errors::Result<std::filesystem::path> write_message(
        const protocol::Message& message) const;

    core::errors::Result<std::filesystem::path> write_final(
        bool success, const std::string& answer,
        const std::optional<std::string>& error_message = std::nullopt) const;

    const std::filesystem::path& path() const { return transcript_path_; }

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& event_json) const;

    std::filesystem::path transcript_path_;
    std::string session_id_;
};

}  // namespace toolpilot::session
