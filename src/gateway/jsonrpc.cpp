#include "gateway/jsonrpc.hpp"

namespace gateway::jsonrpc {

nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result) {
  return {{"jsonrpc", kVersion}, {"id", id}, {"result", result}};
}

nlohmann::json MakeError(const nlohmann::json& id, int code, const std::string& message) {
  return {{"jsonrpc", kVersion}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

nlohmann::json MakeNotification(const std::string& method, const nlohmann::json& params) {
  return {{"jsonrpc", kVersion}, {"method", method}, {"params", params}};
}

nlohmann::json MakeTextContent(const std::string& text) {
  return {{"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})}};
}

std::string FormatSseFrame(const nlohmann::json& payload, const std::string& event) {
  std::string frame;
  if (!event.empty()) {
    frame += "event: " + event + "\n";
  }
  // dump() escapes control characters, so the data line never spans lines.
  frame += "data: " + Serialize(payload) + "\n\n";
  return frame;
}

std::string Serialize(const nlohmann::json& payload) {
  return payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string FormatSseComment(const std::string& comment) { return ": " + comment + "\n\n"; }

}  // namespace gateway::jsonrpc
