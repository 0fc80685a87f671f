#ifndef __HB_CHILD_PROCESS__
#define __HB_CHILD_PROCESS__

#include "Headers.hpp"

namespace hb {
/** @brief Builds a NULL-terminated envp: the current environment + overlay. */
class Environment {
 public:
  explicit Environment(const map<string, string>& overlay);

  char** data() { return pointers.data(); }

 protected:
  vector<string> entries;
  vector<char*> pointers;
};

/**
 * @brief A `/bin/sh -c` child in its own process group with stdout and
 * stderr captured on non-blocking pipes.
 *
 * The caller owns reaping (through the event loop) and signalling (through
 * ProcessTerminator); this class only owns the descriptors.
 */
class ChildProcess {
 public:
  ChildProcess();
  ~ChildProcess();

  /**
   * @brief Forks and execs `command`.
   *
   * A failing `chdir` or `exec` in the child is reported back synchronously
   * through a close-on-exec status pipe.
   *
   * @param error Filled with a description when spawning fails.
   * @return false on failure; no process is left behind.
   */
  bool spawn(const string& command, const string& workingDirectory,
             const map<string, string>& environment, string* error);

  pid_t getPid() const { return pid; }
  int getStdoutFd() const { return stdoutFd; }
  int getStderrFd() const { return stderrFd; }

  void closeStdout();
  void closeStderr();

 protected:
  pid_t pid;
  int stdoutFd;
  int stderrFd;
};

/**
 * @brief Child side of a spawn: reports `errno` for the failed `stage` on
 * the status pipe and exits. Only async-signal-safe calls.
 */
void reportChildFailure(int statusFd, char stage) __attribute__((noreturn));

/**
 * @brief Parent side of a spawn: reads the status pipe until the child
 * execs (EOF) or reports a failure.
 * @return true when the child exec'd.
 */
bool waitForExec(int statusFd, string* error);

/** @brief Restores default signal state before exec. */
void resetChildSignals();

/**
 * @brief Appends what is currently readable on a non-blocking descriptor.
 * @return false once the descriptor reached EOF or failed (a pty whose
 * slave side closed reports EIO, which counts as EOF).
 */
bool readAvailable(int fd, string* data);
}  // namespace hb

#endif  // __HB_CHILD_PROCESS__
