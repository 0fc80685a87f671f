#include "PseudoTerminal.hpp"

#include "ChildProcess.hpp"

namespace hb {
PseudoTerminal::PseudoTerminal() : pid(-1), masterFd(-1) {}

PseudoTerminal::~PseudoTerminal() { closeFd(); }

void PseudoTerminal::closeFd() {
  if (masterFd >= 0) {
    ::close(masterFd);
    masterFd = -1;
  }
}

bool PseudoTerminal::spawn(const string& shell, const string& workingDirectory,
                           const map<string, string>& environment, int rows,
                           int cols, string* error) {
  int statusPipe[2];
  if (::pipe(statusPipe) < 0) {
    *error = string("pipe failed: ") + strerror(GetErrno());
    return false;
  }
  FATAL_FAIL(fcntl(statusPipe[0], F_SETFD, FD_CLOEXEC));
  FATAL_FAIL(fcntl(statusPipe[1], F_SETFD, FD_CLOEXEC));

  map<string, string> overlay = environment;
  overlay["TERM"] = "xterm-256color";
  overlay["HB_VERSION"] = HB_VERSION;
  Environment env(overlay);
  const char* cwd = workingDirectory.empty() ? NULL : workingDirectory.c_str();
  string shellName = shell.substr(shell.find_last_of('/') + 1);

  winsize size;
  memset(&size, 0, sizeof(size));
  size.ws_row = rows;
  size.ws_col = cols;

  int fd = -1;
  pid_t childPid = forkpty(&fd, NULL, NULL, &size);
  switch (childPid) {
    case -1: {
      *error = string("forkpty failed: ") + strerror(GetErrno());
      ::close(statusPipe[0]);
      ::close(statusPipe[1]);
      return false;
    }
    case 0: {
      // child
      ::close(statusPipe[0]);
      if (cwd && chdir(cwd) < 0) {
        reportChildFailure(statusPipe[1], 'c');
      }
      // Shells remember the SIGCHLD disposition they were started with as
      // the "original" one, so a SIG_IGN inherited here could never be reset
      // from inside the session. Hand them SIG_DFL.
      resetChildSignals();
      execle(shell.c_str(), shellName.c_str(), (char*)NULL, env.data());
      reportChildFailure(statusPipe[1], 'e');
    }
    default:
      break;
  }

  // parent
  ::close(statusPipe[1]);
  bool execd = waitForExec(statusPipe[0], error);
  ::close(statusPipe[0]);
  if (!execd) {
    LOG(WARNING) << "Spawning shell " << shell << " failed: " << *error;
    ::close(fd);
    int throwaway;
    while (waitpid(childPid, &throwaway, 0) < 0 && GetErrno() == EINTR) {
    }
    return false;
  }

  pid = childPid;
  masterFd = fd;
  setNonBlocking(masterFd);
  VLOG(1) << "pty opened " << masterFd << " for shell " << shell << " pid "
          << pid;
  return true;
}

bool PseudoTerminal::setSize(int rows, int cols) {
  if (masterFd < 0) {
    return false;
  }
  winsize size;
  memset(&size, 0, sizeof(size));
  size.ws_row = rows;
  size.ws_col = cols;
  if (ioctl(masterFd, TIOCSWINSZ, &size) < 0) {
    LOG(WARNING) << "Resize of pty " << masterFd << " failed: "
                 << strerror(GetErrno());
    return false;
  }
  return true;
}
}  // namespace hb
