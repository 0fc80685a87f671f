#include "PortAllocator.hpp"

namespace hb {
PortAllocator::PortAllocator(const PortConfig& _config) : config(_config) {}

int PortAllocator::allocate(int base) { return allocate(base, config.end, 0); }

int PortAllocator::allocate(int base, int end, int preferred) {
  lock_guard<mutex> guard(poolMutex);
  if (base <= 0) {
    base = config.base;
  }
  if (end <= 0 || end > 65535) {
    end = config.end;
  }
  int probesLeft = config.maxProbes;
  if (preferred > 0 && tryLease(preferred, &probesLeft)) {
    VLOG(1) << "Leased preferred port " << preferred;
    return preferred;
  }
  for (int port = base; port <= end; port++) {
    if (tryLease(port, &probesLeft)) {
      VLOG(1) << "Leased port " << port;
      return port;
    }
    if (probesLeft <= 0) {
      LOG(WARNING) << "Gave up after " << config.maxProbes
                   << " busy ports starting at " << base;
      break;
    }
  }
  LOG(WARNING) << "No free port in [" << base << ", " << end << "]";
  return -1;
}

void PortAllocator::release(int port) {
  lock_guard<mutex> guard(poolMutex);
  if (leased.erase(port)) {
    VLOG(1) << "Released port " << port;
  }
}

bool PortAllocator::isLeased(int port) const {
  lock_guard<mutex> guard(poolMutex);
  return leased.find(port) != leased.end() ||
         config.reserved.find(port) != config.reserved.end();
}

set<int> PortAllocator::leasedPorts() const {
  lock_guard<mutex> guard(poolMutex);
  return leased;
}

bool PortAllocator::tryLease(int port, int* probesLeft) {
  if (port <= 0 || port > 65535) {
    return false;
  }
  if (leased.find(port) != leased.end() ||
      config.reserved.find(port) != config.reserved.end()) {
    return false;
  }
  if (config.probe) {
    (*probesLeft)--;
    if (!isPortFree(port)) {
      VLOG(1) << "Port " << port << " is busy outside the pool";
      return false;
    }
  }
  leased.insert(port);
  return true;
}

bool PortAllocator::isPortFree(int port) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    LOG(WARNING) << "Cannot create probe socket: " << strerror(GetErrno());
    // Without a probe, trust the pool.
    return true;
  }
  sockaddr_in address;
  memset(&address, 0, sizeof(address));
  address.sin_family = AF_INET;
  address.sin_addr.s_addr = htonl(INADDR_ANY);
  address.sin_port = htons(port);
  int rc = ::bind(fd, (sockaddr*)&address, sizeof(address));
  ::close(fd);
  return rc == 0;
}
}  // namespace hb
