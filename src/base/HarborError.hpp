#ifndef __HB_HARBOR_ERROR__
#define __HB_HARBOR_ERROR__

#include "Headers.hpp"

namespace hb {
/**
 * @brief Completion callback shared by every supervisor command.
 *
 * Commands never throw domain errors; the reply carries an `ErrorCode` and a
 * human readable message instead, and is delivered on the control thread.
 */
typedef function<void(const CommandReply&)> CommandCallback;

inline const char* errorCodeName(ErrorCode code) {
  switch (code) {
    case NO_ERROR:
      return "NoError";
    case ALREADY_RUNNING:
      return "AlreadyRunning";
    case PORT_EXHAUSTED:
      return "PortExhausted";
    case SPAWN_FAILURE:
      return "SpawnFailure";
    case HEALTH_CHECK_TIMEOUT:
      return "HealthCheckTimeout";
    case UNEXPECTED_EXIT:
      return "UnexpectedExit";
    case UNKNOWN_SESSION:
      return "UnknownSession";
    case DUPLICATE_SESSION:
      return "DuplicateSession";
    case SESSION_CLOSED:
      return "SessionClosed";
    case WRITE_AFTER_CLOSE:
      return "WriteAfterClose";
    case INVALID_REQUEST:
      return "InvalidRequest";
  }
  return "Unknown";
}

inline const char* statusName(ProcessStatus status) {
  switch (status) {
    case STOPPED:
      return "STOPPED";
    case STARTING:
      return "STARTING";
    case RUNNING:
      return "RUNNING";
    case STOPPING:
      return "STOPPING";
    case FAILED:
      return "FAILED";
    case EXITED:
      return "EXITED";
  }
  return "UNKNOWN";
}

inline CommandReply makeErrorReply(ErrorCode code, const string& message) {
  CommandReply reply;
  reply.set_error(code);
  reply.set_message(message);
  return reply;
}

inline CommandReply makeOkReply() {
  CommandReply reply;
  reply.set_error(NO_ERROR);
  return reply;
}

inline bool isOk(const CommandReply& reply) {
  return reply.error() == NO_ERROR;
}
}  // namespace hb

#endif  // __HB_HARBOR_ERROR__
