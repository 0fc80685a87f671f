#include "ProcessTerminator.hpp"

namespace hb {
namespace {
const chrono::milliseconds MIN_FALLBACK(500);
}

ExitStatus ExitStatus::fromWaitStatus(int waitStatus) {
  ExitStatus status;
  if (waitStatus == -1) {
    return status;
  }
  status.observed = true;
  if (WIFEXITED(waitStatus)) {
    status.exitCode = WEXITSTATUS(waitStatus);
  } else if (WIFSIGNALED(waitStatus)) {
    status.signal = WTERMSIG(waitStatus);
  }
  return status;
}

string ExitStatus::describe() const {
  if (!observed) {
    return "exit not observed";
  }
  if (signal) {
    return string("killed by signal ") + to_string(signal) + " (" +
           strsignal(signal) + ")";
  }
  return "exited with code " + to_string(exitCode);
}

ProcessTerminator::ProcessTerminator(shared_ptr<EventLoop> _loop)
    : loop(_loop) {}

ProcessTerminator::~ProcessTerminator() {
  for (auto& it : pending) {
    LOG(WARNING) << "Abandoning termination of " << it.first;
    loop->unwatchChild(it.first);
    if (it.second.killTimer) {
      loop->cancel(it.second.killTimer);
    }
    if (it.second.fallbackTimer) {
      loop->cancel(it.second.fallbackTimer);
    }
  }
  for (auto& it : sweeps) {
    loop->cancel(it.second);
    signalGroup(it.first, SIGKILL);
  }
}

void ProcessTerminator::terminate(pid_t pid, chrono::milliseconds grace,
                                  DoneCallback done) {
  auto it = pending.find(pid);
  if (it != pending.end()) {
    it->second.waiters.push_back(done);
    return;
  }

  LOG(INFO) << "Terminating process group " << pid << " (grace "
            << grace.count() << " ms)";
  Pending p;
  p.grace = grace;
  p.waiters.push_back(done);
  p.killTimer = 0;
  p.fallbackTimer = 0;
  pending[pid] = p;

  loop->watchChild(pid, [this, pid](int waitStatus) {
    complete(pid, ExitStatus::fromWaitStatus(waitStatus));
  });

  if (grace.count() <= 0) {
    sendSignal(pid, SIGKILL);
  } else {
    sendSignal(pid, SIGTERM);
    pending[pid].killTimer = loop->schedule(grace, [this, pid]() {
      auto it = pending.find(pid);
      if (it == pending.end()) {
        return;
      }
      it->second.killTimer = 0;
      LOG(INFO) << "Process " << pid
                << " outlived its grace period, sending SIGKILL";
      sendSignal(pid, SIGKILL);
    });
  }

  pending[pid].fallbackTimer =
      loop->schedule(max(grace * 2, MIN_FALLBACK), [this, pid]() {
        auto it = pending.find(pid);
        if (it == pending.end()) {
          return;
        }
        it->second.fallbackTimer = 0;
        LOG(WARNING) << "Exit of " << pid
                     << " was never observed, releasing it anyway";
        loop->unwatchChild(pid);
        complete(pid, ExitStatus());
      });
}

void ProcessTerminator::sendSignal(pid_t pid, int sig) {
  if (::kill(-pid, sig) == 0) {
    return;
  }
  auto groupErrno = GetErrno();
  // Not a group leader (or the group is gone): signal the process itself.
  if (::kill(pid, sig) == 0) {
    return;
  }
  auto localErrno = GetErrno();
  if (localErrno == ESRCH) {
    VLOG(1) << "Process " << pid << " already gone when sending signal " << sig;
  } else {
    LOG(WARNING) << "Failed to send signal " << sig << " to " << pid << ": "
                 << strerror(groupErrno) << " / " << strerror(localErrno);
  }
}

void ProcessTerminator::sweepGroup(pid_t pgid, chrono::milliseconds grace) {
  if (pgid <= 0 || isSweeping(pgid)) {
    return;
  }
  if (grace.count() <= 0) {
    signalGroup(pgid, SIGKILL);
    return;
  }
  if (!signalGroup(pgid, SIGTERM)) {
    return;
  }
  LOG(INFO) << "Process group " << pgid
            << " outlived its leader, sent SIGTERM";
  sweeps[pgid] = loop->schedule(grace, [this, pgid]() {
    sweeps.erase(pgid);
    if (signalGroup(pgid, SIGKILL)) {
      LOG(INFO) << "Process group " << pgid
                << " outlived its grace period, sent SIGKILL";
    }
  });
}

bool ProcessTerminator::signalGroup(pid_t pgid, int sig) {
  if (::kill(-pgid, sig) == 0) {
    return true;
  }
  auto localErrno = GetErrno();
  if (localErrno != ESRCH) {
    LOG(WARNING) << "Failed to send signal " << sig << " to group " << pgid
                 << ": " << strerror(localErrno);
  }
  return false;
}

void ProcessTerminator::complete(pid_t pid, const ExitStatus& status) {
  auto it = pending.find(pid);
  if (it == pending.end()) {
    return;
  }
  Pending p = it->second;
  pending.erase(it);
  if (p.killTimer) {
    loop->cancel(p.killTimer);
  }
  if (p.fallbackTimer) {
    loop->cancel(p.fallbackTimer);
  }
  LOG(INFO) << "Process " << pid << " terminated: " << status.describe();
  if (status.observed) {
    sweepGroup(pid, p.grace);
  }
  for (auto& waiter : p.waiters) {
    waiter(status);
  }
}
}  // namespace hb
