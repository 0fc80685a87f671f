#ifndef __HB_PSEUDO_TERMINAL__
#define __HB_PSEUDO_TERMINAL__

#include "Headers.hpp"

namespace hb {
/**
 * @brief An interactive shell attached to the slave side of a pty.
 *
 * The master descriptor is non-blocking and owned by this object.
 */
class PseudoTerminal {
 public:
  PseudoTerminal();
  ~PseudoTerminal();

  /**
   * @brief forkpty()s `shell` in `workingDirectory` with `environment`
   * merged over the inherited environment.
   * @return false with `error` filled when the shell could not be started.
   */
  bool spawn(const string& shell, const string& workingDirectory,
             const map<string, string>& environment, int rows, int cols,
             string* error);

  /** @brief Applies a new window size. Failures are logged only. */
  bool setSize(int rows, int cols);

  pid_t getPid() const { return pid; }
  int getFd() const { return masterFd; }

  void closeFd();

 protected:
  pid_t pid;
  int masterFd;
};
}  // namespace hb

#endif  // __HB_PSEUDO_TERMINAL__
