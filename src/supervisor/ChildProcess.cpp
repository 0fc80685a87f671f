#include "ChildProcess.hpp"

extern char** environ;

namespace hb {
Environment::Environment(const map<string, string>& overlay) {
  for (char** env = environ; env && *env; env++) {
    string entry(*env);
    auto eq = entry.find('=');
    string key = eq == string::npos ? entry : entry.substr(0, eq);
    if (overlay.find(key) != overlay.end()) {
      continue;
    }
    entries.push_back(entry);
  }
  for (auto& it : overlay) {
    entries.push_back(it.first + "=" + it.second);
  }
  for (auto& entry : entries) {
    pointers.push_back(&entry[0]);
  }
  pointers.push_back(NULL);
}

void reportChildFailure(int statusFd, char stage) {
  int localErrno = errno;
  char message[1 + sizeof(int)];
  message[0] = stage;
  memcpy(message + 1, &localErrno, sizeof(int));
  ssize_t rc = ::write(statusFd, message, sizeof(message));
  (void)rc;
  _exit(127);
}

bool waitForExec(int statusFd, string* error) {
  char message[1 + sizeof(int)];
  size_t pos = 0;
  while (pos < sizeof(message)) {
    ssize_t rc = ::read(statusFd, message + pos, sizeof(message) - pos);
    if (rc < 0) {
      if (GetErrno() == EINTR) {
        continue;
      }
      *error = string("Cannot read spawn status: ") + strerror(GetErrno());
      return false;
    }
    if (rc == 0) {
      break;
    }
    pos += rc;
  }
  if (pos == 0) {
    return true;
  }
  if (pos < sizeof(message)) {
    *error = "Truncated spawn status";
    return false;
  }
  int childErrno;
  memcpy(&childErrno, message + 1, sizeof(int));
  string stage;
  switch (message[0]) {
    case 'c':
      stage = "chdir";
      break;
    case 'e':
      stage = "exec";
      break;
    default:
      stage = "setup";
      break;
  }
  *error = stage + " failed: " + strerror(childErrno);
  return false;
}

void resetChildSignals() {
  sigset_t empty;
  sigemptyset(&empty);
  sigprocmask(SIG_SETMASK, &empty, NULL);
  // See the note in PseudoTerminal::spawn about SIGCHLD.
  signal(SIGCHLD, SIG_DFL);
  signal(SIGPIPE, SIG_DFL);
  signal(SIGINT, SIG_DFL);
  signal(SIGTERM, SIG_DFL);
}

bool readAvailable(int fd, string* data) {
  char buf[16 * 1024];
  // Bounded so one chatty process cannot starve the loop.
  for (int i = 0; i < 4; i++) {
    ssize_t rc = ::read(fd, buf, sizeof(buf));
    if (rc > 0) {
      data->append(buf, rc);
      continue;
    }
    if (rc == 0) {
      return false;
    }
    auto localErrno = GetErrno();
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
      return true;
    }
    if (localErrno == EINTR) {
      continue;
    }
    if (localErrno != EIO) {
      LOG(WARNING) << "Error reading fd " << fd << ": " << strerror(localErrno);
    }
    return false;
  }
  return true;
}

ChildProcess::ChildProcess() : pid(-1), stdoutFd(-1), stderrFd(-1) {}

ChildProcess::~ChildProcess() {
  closeStdout();
  closeStderr();
}

void ChildProcess::closeStdout() {
  if (stdoutFd >= 0) {
    ::close(stdoutFd);
    stdoutFd = -1;
  }
}

void ChildProcess::closeStderr() {
  if (stderrFd >= 0) {
    ::close(stderrFd);
    stderrFd = -1;
  }
}

bool ChildProcess::spawn(const string& command,
                         const string& workingDirectory,
                         const map<string, string>& environment,
                         string* error) {
  int outPipe[2];
  int errPipe[2];
  int statusPipe[2];
  if (::pipe(outPipe) < 0) {
    *error = string("pipe failed: ") + strerror(GetErrno());
    return false;
  }
  if (::pipe(errPipe) < 0) {
    *error = string("pipe failed: ") + strerror(GetErrno());
    ::close(outPipe[0]);
    ::close(outPipe[1]);
    return false;
  }
  if (::pipe(statusPipe) < 0) {
    *error = string("pipe failed: ") + strerror(GetErrno());
    ::close(outPipe[0]);
    ::close(outPipe[1]);
    ::close(errPipe[0]);
    ::close(errPipe[1]);
    return false;
  }
  FATAL_FAIL(fcntl(statusPipe[1], F_SETFD, FD_CLOEXEC));

  // Everything the child needs is prepared before fork.
  Environment env(environment);
  const char* cwd = workingDirectory.empty() ? NULL : workingDirectory.c_str();

  pid_t childPid = fork();
  switch (childPid) {
    case -1: {
      *error = string("fork failed: ") + strerror(GetErrno());
      ::close(outPipe[0]);
      ::close(outPipe[1]);
      ::close(errPipe[0]);
      ::close(errPipe[1]);
      ::close(statusPipe[0]);
      ::close(statusPipe[1]);
      return false;
    }
    case 0: {
      // child
      ::close(statusPipe[0]);
      ::close(outPipe[0]);
      ::close(errPipe[0]);
      setpgid(0, 0);
      int devNull = ::open("/dev/null", O_RDONLY);
      if (devNull < 0 || dup2(devNull, STDIN_FILENO) < 0 ||
          dup2(outPipe[1], STDOUT_FILENO) < 0 ||
          dup2(errPipe[1], STDERR_FILENO) < 0) {
        reportChildFailure(statusPipe[1], 's');
      }
      ::close(devNull);
      ::close(outPipe[1]);
      ::close(errPipe[1]);
      if (cwd && chdir(cwd) < 0) {
        reportChildFailure(statusPipe[1], 'c');
      }
      resetChildSignals();
      execle("/bin/sh", "sh", "-c", command.c_str(), (char*)NULL, env.data());
      reportChildFailure(statusPipe[1], 'e');
    }
    default:
      break;
  }

  // parent
  ::close(statusPipe[1]);
  ::close(outPipe[1]);
  ::close(errPipe[1]);
  // Both sides set the group to avoid racing a signal against the child.
  setpgid(childPid, childPid);

  bool execd = waitForExec(statusPipe[0], error);
  ::close(statusPipe[0]);
  if (!execd) {
    LOG(WARNING) << "Spawning '" << command << "' failed: " << *error;
    ::close(outPipe[0]);
    ::close(errPipe[0]);
    int throwaway;
    while (waitpid(childPid, &throwaway, 0) < 0 && GetErrno() == EINTR) {
    }
    return false;
  }

  pid = childPid;
  stdoutFd = outPipe[0];
  stderrFd = errPipe[0];
  setNonBlocking(stdoutFd);
  setNonBlocking(stderrFd);
  LOG(INFO) << "Spawned '" << command << "' as pid " << pid << " in "
            << (cwd ? workingDirectory : string("."));
  return true;
}
}  // namespace hb
