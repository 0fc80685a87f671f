#include "PipeSocketHandler.hpp"

namespace hb {
namespace {
sockaddr_un makeAddress(const string& path) {
  sockaddr_un address;
  memset(&address, 0, sizeof(sockaddr_un));
  if (path.length() >= sizeof(address.sun_path)) {
    throw std::runtime_error("Socket path too long: " + path);
  }
  address.sun_family = AF_UNIX;
  strncpy(address.sun_path, path.c_str(), sizeof(address.sun_path) - 1);
  return address;
}
}  // namespace

PipeSocketHandler::PipeSocketHandler() {}

PipeSocketHandler::~PipeSocketHandler() {
  lock_guard<recursive_mutex> guard(globalMutex);
  for (int fd : activeSockets) {
    ::close(fd);
  }
  for (auto& it : pipeServerSockets) {
    ::close(it.second);
    ::unlink(it.first.c_str());
  }
}

bool PipeSocketHandler::hasData(int fd) {
  fd_set input;
  FD_ZERO(&input);
  FD_SET(fd, &input);
  timeval timeout;
  timeout.tv_sec = 0;
  timeout.tv_usec = 0;
  int n = select(fd + 1, &input, NULL, NULL, &timeout);
  return n > 0 && FD_ISSET(fd, &input);
}

ssize_t PipeSocketHandler::read(int fd, void* buf, size_t count) {
  if (fd < 0) {
    STFATAL << "Tried to read from an invalid socket: " << fd;
  }
  ssize_t readBytes = ::read(fd, buf, count);
  auto localErrno = GetErrno();
  if (readBytes < 0 && localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
    LOG(WARNING) << "Error reading: " << localErrno << " "
                 << strerror(localErrno);
  }
  SetErrno(localErrno);
  return readBytes;
}

ssize_t PipeSocketHandler::write(int fd, const void* buf, size_t count) {
  if (fd < 0) {
    STFATAL << "Tried to write to an invalid socket: " << fd;
  }
  VLOG(4) << "Pipe socket write to fd: " << fd << " " << count;
#ifdef MSG_NOSIGNAL
  return ::send(fd, buf, count, MSG_NOSIGNAL);
#else
  return ::write(fd, buf, count);
#endif
}

int PipeSocketHandler::connect(const string& path) {
  lock_guard<recursive_mutex> guard(globalMutex);
  sockaddr_un remote = makeAddress(path);

  int sockFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(sockFd);
  VLOG(3) << "Connecting to " << path << " with fd " << sockFd;
  // Connect while blocking: local sockets either succeed or fail right away.
  int result =
      ::connect(sockFd, (struct sockaddr*)&remote, sizeof(sockaddr_un));
  if (result < 0) {
    auto localErrno = GetErrno();
    LOG(INFO) << "Error connecting to " << path << ": " << localErrno << " "
              << strerror(localErrno);
    ::close(sockFd);
    SetErrno(localErrno);
    return -1;
  }
  initSocket(sockFd);
  activeSockets.insert(sockFd);
  LOG(INFO) << "Connected to endpoint " << path;
  return sockFd;
}

int PipeSocketHandler::listen(const string& path) {
  lock_guard<recursive_mutex> guard(globalMutex);
  if (pipeServerSockets.find(path) != pipeServerSockets.end()) {
    throw runtime_error("Tried to listen twice on the same path");
  }

  sockaddr_un local = makeAddress(path);
  int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(fd);
  initSocket(fd);
  ::unlink(local.sun_path);

  if (::bind(fd, (struct sockaddr*)&local, sizeof(sockaddr_un)) == -1) {
    auto localErrno = GetErrno();
    ::close(fd);
    throw runtime_error("Cannot bind " + path + ": " + strerror(localErrno));
  }
  FATAL_FAIL(::listen(fd, 16));
  FATAL_FAIL(::chmod(local.sun_path, S_IRUSR | S_IWUSR | S_IXUSR));

  pipeServerSockets[path] = fd;
  LOG(INFO) << "Listening on " << path;
  return fd;
}

int PipeSocketHandler::accept(int sockFd) {
  sockaddr_un client;
  socklen_t c = sizeof(sockaddr_un);
  int clientFd = ::accept(sockFd, (sockaddr*)&client, &c);
  if (clientFd < 0) {
    auto acceptErrno = GetErrno();
    if (acceptErrno != EAGAIN && acceptErrno != EWOULDBLOCK &&
        acceptErrno != EINTR) {
      LOG(WARNING) << "accept failed: " << strerror(acceptErrno);
    }
    SetErrno(acceptErrno);
    return -1;
  }
  lock_guard<recursive_mutex> guard(globalMutex);
  initSocket(clientFd);
  activeSockets.insert(clientFd);
  VLOG(3) << "Socket " << sockFd << " accepted client " << clientFd;
  return clientFd;
}

void PipeSocketHandler::stopListening(const string& path) {
  lock_guard<recursive_mutex> guard(globalMutex);
  auto it = pipeServerSockets.find(path);
  if (it == pipeServerSockets.end()) {
    STERROR << "Tried to stop listening to a pipe that we weren't listening on:"
            << path;
    return;
  }
  FATAL_FAIL(::close(it->second));
  ::unlink(path.c_str());
  pipeServerSockets.erase(it);
}

void PipeSocketHandler::close(int fd) {
  lock_guard<recursive_mutex> guard(globalMutex);
  if (fd == -1) {
    return;
  }
  auto it = activeSockets.find(fd);
  if (it == activeSockets.end()) {
    STERROR << "Tried to close a connection that doesn't exist: " << fd;
    return;
  }
  VLOG(1) << "Closing connection: " << fd;
  FATAL_FAIL(::close(fd));
  activeSockets.erase(it);
}

void PipeSocketHandler::initSocket(int fd) {
#ifndef MSG_NOSIGNAL
  {
    int val = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, (void*)&val, sizeof(val)) ==
        -1) {
      ::signal(SIGPIPE, SIG_IGN);
    }
  }
#endif
  setNonBlocking(fd);
}
}  // namespace hb
