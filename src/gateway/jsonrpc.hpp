#pragma once

#include <string>

#include "nlohmann/json.hpp"

namespace gateway::jsonrpc {

constexpr char kVersion[] = "2.0";

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json MakeError(const nlohmann::json& id, int code, const std::string& message);
nlohmann::json MakeNotification(const std::string& method, const nlohmann::json& params);

// {"content": [{"type": "text", "text": text}]}
nlohmann::json MakeTextContent(const std::string& text);

// Compact serialization; invalid UTF-8 from plugin output is replaced, not thrown.
std::string Serialize(const nlohmann::json& payload);

// One Server-Sent-Events frame. The payload is serialized on a single line.
std::string FormatSseFrame(const nlohmann::json& payload, const std::string& event = {});
std::string FormatSseComment(const std::string& comment);

}  // namespace gateway::jsonrpc
