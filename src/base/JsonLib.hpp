#pragma once

#include "Headers.hpp"
#include "HarborError.hpp"
#include "nlohmann/json.hpp"

/**
 * @brief Lightweight wrapper that exposes `nlohmann::json` as `json`.
 */
using json = nlohmann::json;

namespace hb {
inline json toJson(const ServerSnapshot& server) {
  json j;
  j["ownerId"] = server.ownerid();
  j["status"] = statusName(server.status());
  if (server.pid() > 0) {
    j["pid"] = server.pid();
  }
  if (server.port() > 0) {
    j["port"] = server.port();
    j["url"] = server.url();
  }
  if (server.startedatms() > 0) {
    j["startedAt"] = server.startedatms();
  }
  if (server.lasterrorcode() != NO_ERROR) {
    j["lastErrorCode"] = errorCodeName(server.lasterrorcode());
    j["lastError"] = server.lasterror();
  }
  return j;
}

inline json toJson(const SessionSnapshot& session) {
  json j;
  j["sessionId"] = session.sessionid();
  j["status"] = statusName(session.status());
  if (session.pid() > 0) {
    j["pid"] = session.pid();
  }
  j["workingDirectory"] = session.workingdirectory();
  j["createdAt"] = session.createdatms();
  j["bytesIn"] = session.bytesin();
  j["bytesOut"] = session.bytesout();
  j["commandsExecuted"] = session.commandsexecuted();
  json context = json::object();
  for (const auto& kv : session.context()) {
    context[kv.key()] = kv.value();
  }
  j["context"] = context;
  return j;
}

inline json toJson(const CommandReply& reply) {
  json j;
  j["ok"] = isOk(reply);
  if (!isOk(reply)) {
    j["error"] = errorCodeName(reply.error());
  }
  if (!reply.message().empty()) {
    j["message"] = reply.message();
  }
  if (reply.has_server()) {
    j["server"] = toJson(reply.server());
  }
  if (reply.has_session()) {
    j["session"] = toJson(reply.session());
  }
  if (reply.servers_size() || reply.sessions_size()) {
    json servers = json::array();
    for (const auto& server : reply.servers()) {
      servers.push_back(toJson(server));
    }
    json sessions = json::array();
    for (const auto& session : reply.sessions()) {
      sessions.push_back(toJson(session));
    }
    j["servers"] = servers;
    j["sessions"] = sessions;
  }
  return j;
}

inline json toJson(const ProgressEvent& event) {
  json j;
  j["type"] = "progress";
  j["sourceId"] = event.sourceid();
  j["kind"] = event.kind() == DEV_SERVER ? "server" : "session";
  j["status"] = statusName(event.status());
  j["timestamp"] = event.timestampms();
  if (event.error() != NO_ERROR) {
    j["error"] = errorCodeName(event.error());
  }
  if (!event.message().empty()) {
    j["message"] = event.message();
  }
  return j;
}

inline json toJson(const ExitEvent& event) {
  json j;
  j["type"] = "exit";
  j["sourceId"] = event.sourceid();
  j["kind"] = event.kind() == DEV_SERVER ? "server" : "session";
  if (event.has_exitcode()) {
    j["exitCode"] = event.exitcode();
  }
  if (event.signal() > 0) {
    j["signal"] = event.signal();
  }
  j["reason"] = event.reason();
  return j;
}

inline json toJson(const OutputEvent& event) {
  json j;
  j["type"] = event.gap() ? "gap" : "output";
  j["sourceId"] = event.sourceid();
  j["sequence"] = event.sequence();
  j["timestamp"] = event.timestampms();
  if (event.gap()) {
    j["firstDroppedSequence"] = event.firstdroppedsequence();
  } else {
    // Not necessarily UTF-8; dump with error_handler_t::replace.
    j["payload"] = event.payload();
  }
  return j;
}

/** @brief One JSON line; invalid UTF-8 becomes U+FFFD. */
inline string toJsonLine(const json& j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}
}  // namespace hb
