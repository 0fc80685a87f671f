#ifndef __HB_SESSION_MANAGER__
#define __HB_SESSION_MANAGER__

#include "EventListener.hpp"
#include "EventLoop.hpp"
#include "HarborError.hpp"
#include "Headers.hpp"
#include "IOBroker.hpp"
#include "ProcessTerminator.hpp"
#include "PseudoTerminal.hpp"
#include "SupervisorConfig.hpp"
#include "WriteBuffer.hpp"

namespace hb {
/** @brief One interactive shell on a pty. */
struct TerminalSession {
  string sessionId;
  string workingDirectory;
  map<string, string> context;
  ProcessStatus status = STOPPED;
  pid_t pid = -1;
  int64_t createdAtMs = 0;

  int64_t bytesIn = 0;
  int64_t bytesOut = 0;
  int64_t commandsExecuted = 0;

  int64_t generation = 0;
  shared_ptr<PseudoTerminal> terminal;
  // Input waiting for the pty to become writable.
  WriteBuffer toTerminal;
  ExitStatus exitStatus;
  vector<CommandCallback> pendingKills;

  SessionSnapshot snapshot() const;
};

/**
 * @brief Owns interactive pty sessions, independent of any consumer.
 *
 * Attaching and detaching consumers happens on the IOBroker and never
 * touches a session's lifecycle. A session whose shell exits on its own
 * stays behind as an EXITED tombstone so that late writes are rejected with
 * `SessionClosed`; opening the same id again replaces it.
 *
 * Loop-thread only.
 */
class SessionManager {
 public:
  SessionManager(shared_ptr<EventLoop> _loop, shared_ptr<IOBroker> _broker,
                 shared_ptr<ProcessTerminator> _terminator,
                 const SessionConfig& _config);
  ~SessionManager();

  void setListener(shared_ptr<EventListener> _listener) {
    listener = _listener;
  }

  /** @brief Spawns a shell. An empty session id gets a generated one. */
  void open(const SessionOpenRequest& request, CommandCallback done);

  /** @brief Queues input; it reaches the shell once coalesced. */
  CommandReply write(const string& sessionId, const string& data);

  /** @brief Applies a window size. A failed resize is not an error. */
  CommandReply resize(const string& sessionId, int rows, int cols);

  /** @brief Terminates and forgets the session. Idempotent. */
  void kill(const string& sessionId, CommandCallback done);

  /** @brief Kills every session; `done` runs once all exits are seen. */
  void killAll(function<void()> done);

  CommandReply status(const string& sessionId) const;

  vector<SessionSnapshot> list() const;

  int liveCount() const;

 protected:
  shared_ptr<EventLoop> loop;
  shared_ptr<IOBroker> broker;
  shared_ptr<ProcessTerminator> terminator;
  shared_ptr<EventListener> listener;
  SessionConfig config;
  string shell;

  map<string, shared_ptr<TerminalSession>> sessions;
  int64_t nextGeneration;

  shared_ptr<TerminalSession> lookup(const string& sessionId,
                                     int64_t generation) const;
  CommandReply checkWritable(const string& sessionId,
                             shared_ptr<TerminalSession>* session) const;

  void onTerminalReadable(const string& sessionId, int64_t generation);
  void onTerminalWritable(const string& sessionId, int64_t generation);
  void onInput(const string& sessionId, int64_t generation,
               const string& data, bool complete);
  void onChildExit(const string& sessionId, int64_t generation,
                   const ExitStatus& exitStatus);
  void onKilled(const string& sessionId, int64_t generation,
                const ExitStatus& exitStatus);

  void flushToTerminal(shared_ptr<TerminalSession> session);
  void detachTerminal(shared_ptr<TerminalSession> session);
  void emitProgress(const TerminalSession& session, ErrorCode error = NO_ERROR,
                    const string& message = "");
  void emitExit(const TerminalSession& session, const string& reason);
};
}  // namespace hb

#endif  // __HB_SESSION_MANAGER__
