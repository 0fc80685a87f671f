#ifndef __HB_PORT_ALLOCATOR__
#define __HB_PORT_ALLOCATOR__

#include "Headers.hpp"
#include "SupervisorConfig.hpp"

namespace hb {
/**
 * @brief Leases TCP ports to dev servers without collisions.
 *
 * The pool is the set of leased ports plus the configured reserved ports.
 * Every method is thread-safe; the pool is never touched from anywhere
 * else.
 */
class PortAllocator {
 public:
  explicit PortAllocator(const PortConfig& _config);
  virtual ~PortAllocator() {}

  /**
   * @brief Leases the smallest free port in [base, config end].
   * @return the port, or -1 if the range is exhausted.
   */
  int allocate(int base);

  /**
   * @brief Leases `preferred` if it is free, otherwise scans [base, end].
   * @param preferred Ignored when <= 0.
   * @return the port, or -1 if the range is exhausted.
   */
  int allocate(int base, int end, int preferred);

  /** @brief Returns a leased port to the pool. Idempotent. */
  void release(int port);

  bool isLeased(int port) const;

  set<int> leasedPorts() const;

  const PortConfig& getConfig() const { return config; }

 protected:
  /**
   * @brief Checks that nothing outside the allocator is bound to the port.
   */
  virtual bool isPortFree(int port);

  bool tryLease(int port, int* probesLeft);

  PortConfig config;
  mutable mutex poolMutex;
  set<int> leased;
};
}  // namespace hb

#endif  // __HB_PORT_ALLOCATOR__
