#include "EventLoop.hpp"

namespace hb {
EventLoop::EventLoop()
    : nextTimerId(1), stopped(false), loopThreadKnown(false) {
  FATAL_FAIL(::pipe(wakeupPipe));
  setNonBlocking(wakeupPipe[0]);
  setNonBlocking(wakeupPipe[1]);
}

EventLoop::~EventLoop() {
  ::close(wakeupPipe[0]);
  ::close(wakeupPipe[1]);
}

void EventLoop::addReader(int fd, Callback callback) {
  readers[fd] = callback;
}

void EventLoop::removeReader(int fd) { readers.erase(fd); }

void EventLoop::addWriter(int fd, Callback callback) {
  writers[fd] = callback;
}

void EventLoop::removeWriter(int fd) { writers.erase(fd); }

EventLoop::TimerId EventLoop::schedule(chrono::milliseconds delay,
                                       Callback callback) {
  TimerId id = nextTimerId++;
  Timer timer;
  timer.deadline = now() + delay;
  timer.callback = callback;
  timerQueue.insert(make_pair(timer.deadline, id));
  timers[id] = timer;
  return id;
}

void EventLoop::cancel(TimerId id) {
  auto it = timers.find(id);
  if (it == timers.end()) {
    return;
  }
  timerQueue.erase(make_pair(it->second.deadline, id));
  timers.erase(it);
}

void EventLoop::post(Callback callback) {
  {
    lock_guard<mutex> guard(postMutex);
    posted.push_back(callback);
  }
  wakeup();
}

void EventLoop::watchChild(pid_t pid, ChildCallback callback) {
  children[pid] = callback;
}

void EventLoop::unwatchChild(pid_t pid) { children.erase(pid); }

void EventLoop::wakeup() {
  char c = 1;
  // A full pipe already guarantees a wake-up.
  ssize_t rc = ::write(wakeupPipe[1], &c, 1);
  (void)rc;
}

bool EventLoop::isLoopThread() const {
  return !loopThreadKnown || loopThreadId == this_thread::get_id();
}

void EventLoop::stop() {
  stopped = true;
  wakeup();
}

void EventLoop::run() {
  stopped = false;
  while (!stopped) {
    runOnce(chrono::milliseconds(1000));
  }
}

bool EventLoop::runUntil(const function<bool()>& predicate,
                         chrono::milliseconds timeout) {
  auto deadline = now() + timeout;
  while (!predicate()) {
    auto remaining =
        chrono::duration_cast<chrono::milliseconds>(deadline - now());
    if (remaining.count() <= 0) {
      return predicate();
    }
    runOnce(min(remaining, chrono::milliseconds(CHILD_POLL_MS)));
  }
  return true;
}

void EventLoop::runOnce(chrono::milliseconds maxWait) {
  loopThreadId = this_thread::get_id();
  loopThreadKnown = true;

  auto wait = maxWait;
  if (!timerQueue.empty()) {
    auto untilTimer = chrono::duration_cast<chrono::milliseconds>(
        timerQueue.begin()->first - now());
    if (untilTimer.count() < 0) {
      untilTimer = chrono::milliseconds(0);
    }
    wait = min(wait, untilTimer);
  }
  if (!children.empty()) {
    wait = min(wait, chrono::milliseconds(CHILD_POLL_MS));
  }
  {
    lock_guard<mutex> guard(postMutex);
    if (!posted.empty()) {
      wait = chrono::milliseconds(0);
    }
  }

  fd_set rfds;
  fd_set wfds;
  FD_ZERO(&rfds);
  FD_ZERO(&wfds);
  int maxFd = wakeupPipe[0];
  FD_SET(wakeupPipe[0], &rfds);
  for (auto& it : readers) {
    FD_SET(it.first, &rfds);
    maxFd = max(maxFd, it.first);
  }
  for (auto& it : writers) {
    FD_SET(it.first, &wfds);
    maxFd = max(maxFd, it.first);
  }
  if (maxFd >= FD_SETSIZE) {
    STFATAL << "Tried to select() on too many FDs";
  }

  timeval tv;
  tv.tv_sec = wait.count() / 1000;
  tv.tv_usec = (wait.count() % 1000) * 1000;
  int numFdsSet = select(maxFd + 1, &rfds, &wfds, NULL, &tv);
  if (numFdsSet < 0) {
    if (GetErrno() != EINTR) {
      FATAL_FAIL(numFdsSet);
    }
    FD_ZERO(&rfds);
    FD_ZERO(&wfds);
  }

  if (FD_ISSET(wakeupPipe[0], &rfds)) {
    drainWakeupPipe();
  }

  // Callbacks may add or remove handlers, so snapshot the ready set first
  // and re-check membership before each call.
  vector<int> readyReaders;
  vector<int> readyWriters;
  if (numFdsSet > 0) {
    for (auto& it : readers) {
      if (FD_ISSET(it.first, &rfds)) readyReaders.push_back(it.first);
    }
    for (auto& it : writers) {
      if (FD_ISSET(it.first, &wfds)) readyWriters.push_back(it.first);
    }
  }
  for (int fd : readyReaders) {
    auto it = readers.find(fd);
    if (it != readers.end()) {
      Callback callback = it->second;
      callback();
    }
  }
  for (int fd : readyWriters) {
    auto it = writers.find(fd);
    if (it != writers.end()) {
      Callback callback = it->second;
      callback();
    }
  }

  reapChildren();
  runDueTimers();
  runPosted();
}

void EventLoop::drainWakeupPipe() {
  char buf[256];
  while (::read(wakeupPipe[0], buf, sizeof(buf)) > 0) {
  }
}

void EventLoop::runPosted() {
  vector<Callback> toRun;
  {
    lock_guard<mutex> guard(postMutex);
    toRun.swap(posted);
  }
  for (auto& callback : toRun) {
    callback();
  }
}

void EventLoop::runDueTimers() {
  auto currentTime = now();
  while (!timerQueue.empty() && timerQueue.begin()->first <= currentTime) {
    TimerId id = timerQueue.begin()->second;
    timerQueue.erase(timerQueue.begin());
    auto it = timers.find(id);
    if (it == timers.end()) {
      continue;
    }
    Callback callback = it->second.callback;
    timers.erase(it);
    callback();
  }
}

void EventLoop::reapChildren() {
  vector<pair<pid_t, int>> exited;
  for (auto& it : children) {
    int status = 0;
    pid_t rc = ::waitpid(it.first, &status, WNOHANG);
    if (rc == it.first) {
      exited.push_back(make_pair(it.first, status));
    } else if (rc < 0 && GetErrno() == ECHILD) {
      LOG(WARNING) << "Child " << it.first << " was reaped elsewhere";
      exited.push_back(make_pair(it.first, -1));
    }
  }
  for (auto& it : exited) {
    auto child = children.find(it.first);
    if (child == children.end()) {
      continue;
    }
    ChildCallback callback = child->second;
    children.erase(child);
    VLOG(1) << "Reaped child " << it.first << " status " << it.second;
    callback(it.second);
  }
}
}  // namespace hb
