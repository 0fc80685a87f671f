#include "PortAllocator.hpp"

#include "TestHeaders.hpp"

using namespace hb;

namespace {
/** @brief Pretends some ports are held by processes outside the pool. */
class FakeProbePortAllocator : public PortAllocator {
 public:
  explicit FakeProbePortAllocator(const PortConfig& config)
      : PortAllocator(config), probes(0) {}

  set<int> busy;
  int probes;

 protected:
  virtual bool isPortFree(int port) {
    probes++;
    return busy.find(port) == busy.end();
  }
};

PortConfig makePortConfig() {
  PortConfig config;
  config.base = 3000;
  config.end = 3010;
  config.reserved = {3000, 3001};
  config.probe = true;
  config.maxProbes = 64;
  return config;
}
}  // namespace

TEST_CASE("PortAllocator hands out the smallest free port", "[PortAllocator]") {
  FakeProbePortAllocator allocator(makePortConfig());

  REQUIRE(allocator.allocate(3000) == 3002);
  REQUIRE(allocator.allocate(3000) == 3003);
  REQUIRE(allocator.isLeased(3002));
  REQUIRE(allocator.isLeased(3000));
  REQUIRE(allocator.leasedPorts() == set<int>({3002, 3003}));

  allocator.release(3002);
  REQUIRE_FALSE(allocator.isLeased(3002));
  REQUIRE(allocator.allocate(3000) == 3002);
}

TEST_CASE("PortAllocator never hands out reserved ports", "[PortAllocator]") {
  FakeProbePortAllocator allocator(makePortConfig());
  set<int> handedOut;
  int port;
  while ((port = allocator.allocate(3000)) > 0) {
    handedOut.insert(port);
  }
  REQUIRE(handedOut.size() == 9);
  REQUIRE(handedOut.count(3000) == 0);
  REQUIRE(handedOut.count(3001) == 0);
  REQUIRE(allocator.allocate(3000) == -1);
}

TEST_CASE("PortAllocator release is idempotent", "[PortAllocator]") {
  FakeProbePortAllocator allocator(makePortConfig());
  int port = allocator.allocate(3000);
  allocator.release(port);
  allocator.release(port);
  allocator.release(4242);
  // Reserved ports cannot be released into the pool.
  allocator.release(3000);
  REQUIRE(allocator.isLeased(3000));
  REQUIRE(allocator.leasedPorts().empty());
}

TEST_CASE("PortAllocator skips ports busy outside the pool",
          "[PortAllocator]") {
  FakeProbePortAllocator allocator(makePortConfig());
  allocator.busy = {3002, 3003};
  REQUIRE(allocator.allocate(3000) == 3004);

  SECTION("and bounds the number of probes") {
    PortConfig config = makePortConfig();
    config.maxProbes = 3;
    FakeProbePortAllocator bounded(config);
    bounded.busy = {3002, 3003, 3004, 3005};
    REQUIRE(bounded.allocate(3000) == -1);
    REQUIRE(bounded.probes == 3);
  }
}

TEST_CASE("PortAllocator prefers the requested port when free",
          "[PortAllocator]") {
  FakeProbePortAllocator allocator(makePortConfig());
  REQUIRE(allocator.allocate(0, 0, 3007) == 3007);
  // Already leased: falls back to the scan.
  REQUIRE(allocator.allocate(0, 0, 3007) == 3002);
  // Reserved: same.
  REQUIRE(allocator.allocate(0, 0, 3001) == 3003);
}

TEST_CASE("PortAllocator honors a custom range", "[PortAllocator]") {
  FakeProbePortAllocator allocator(makePortConfig());
  REQUIRE(allocator.allocate(3008, 3009, 0) == 3008);
  REQUIRE(allocator.allocate(3008, 3009, 0) == 3009);
  REQUIRE(allocator.allocate(3008, 3009, 0) == -1);
}

TEST_CASE("PortAllocator is safe under concurrent allocation",
          "[PortAllocator]") {
  PortConfig config = makePortConfig();
  config.end = 3200;
  config.probe = false;
  PortAllocator allocator(config);

  mutex resultsMutex;
  vector<int> results;
  vector<thread> threads;
  for (int t = 0; t < 8; t++) {
    threads.push_back(thread([&]() {
      for (int i = 0; i < 20; i++) {
        int port = allocator.allocate(3000);
        lock_guard<mutex> guard(resultsMutex);
        results.push_back(port);
      }
    }));
  }
  for (auto& t : threads) {
    t.join();
  }
  set<int> unique(results.begin(), results.end());
  REQUIRE(results.size() == 160);
  REQUIRE(unique.size() == 160);
  REQUIRE(unique.count(-1) == 0);
}
