#include "EventLoop.hpp"
#include "RawFdUtils.hpp"
#include "TestHeaders.hpp"

using namespace aic;

TEST_CASE("Timers fire in deadline order", "[EventLoop]") {
  EventLoop loop;
  vector<int> fired;
  loop.addTimer(30, [&fired]() { fired.push_back(2); });
  loop.addTimer(10, [&fired]() { fired.push_back(1); });
  loop.addTimer(30, [&fired]() { fired.push_back(3); });

  REQUIRE(loop.runUntil([&fired]() { return fired.size() == 3; }, 1000));
  REQUIRE(fired == vector<int>({1, 2, 3}));
  REQUIRE(loop.numTimers() == 0);
}

TEST_CASE("Cancelled timers never fire", "[EventLoop]") {
  EventLoop loop;
  bool fired = false;
  bool other = false;
  auto id = loop.addTimer(10, [&fired]() { fired = true; });
  loop.addTimer(40, [&other]() { other = true; });

  REQUIRE(loop.cancelTimer(id));
  REQUIRE_FALSE(loop.cancelTimer(id));
  REQUIRE(loop.runUntil([&other]() { return other; }, 1000));
  REQUIRE_FALSE(fired);
}

TEST_CASE("A timer callback can cancel a sibling due in the same batch",
          "[EventLoop]") {
  EventLoop loop;
  bool secondFired = false;
  EventLoop::TimerId second = EventLoop::INVALID_TIMER;
  loop.addTimer(0, [&]() { loop.cancelTimer(second); });
  second = loop.addTimer(0, [&secondFired]() { secondFired = true; });

  ::usleep(5 * 1000);
  loop.runOnce(0);
  REQUIRE_FALSE(secondFired);
}

TEST_CASE("Posted callbacks run on the next iteration", "[EventLoop]") {
  EventLoop loop;
  int count = 0;
  loop.post([&]() {
    count++;
    loop.post([&count]() { count++; });
  });
  REQUIRE(count == 0);

  loop.runOnce(0);
  REQUIRE(count == 1);
  loop.runOnce(0);
  REQUIRE(count == 2);
}

TEST_CASE("Watched fds are dispatched when readable", "[EventLoop]") {
  EventLoop loop;
  int fds[2];
  FATAL_FAIL(::pipe(fds));
  string received;
  loop.watchFd(fds[0], [&]() {
    char buf[16];
    ssize_t rc = ::read(fds[0], buf, sizeof(buf));
    if (rc > 0) {
      received.append(buf, rc);
    }
  });
  REQUIRE(loop.isWatching(fds[0]));

  REQUIRE(::write(fds[1], "ping", 4) == 4);
  REQUIRE(loop.runUntil([&received]() { return received == "ping"; }, 1000));

  loop.unwatchFd(fds[0]);
  REQUIRE_FALSE(loop.isWatching(fds[0]));
  REQUIRE(loop.numWatchedFds() == 0);
  ::close(fds[0]);
  ::close(fds[1]);
}

TEST_CASE("Write watches fire once a full fd drains", "[EventLoop]") {
  EventLoop loop;
  int fds[2];
  FATAL_FAIL(::pipe(fds));
  RawFdUtils::setNonBlocking(fds[1]);
  string block(4096, 'x');
  while (RawFdUtils::writeAvailable(fds[1], block.data(), block.length()) >
         0) {
  }

  int writableCalls = 0;
  loop.watchFdWritable(fds[1], [&]() {
    writableCalls++;
    loop.unwatchFdWritable(fds[1]);
  });
  REQUIRE(loop.isWatchingWritable(fds[1]));
  REQUIRE(loop.numWatchedFds() == 0);
  REQUIRE_FALSE(loop.runUntil([&]() { return writableCalls > 0; }, 100));

  // Reading from the other end makes room
  loop.watchFd(fds[0], [&]() {
    string drained;
    RawFdUtils::readAvailable(fds[0], &drained, 64 * 1024);
  });
  REQUIRE(loop.runUntil([&]() { return writableCalls > 0; }, 1000));
  REQUIRE(writableCalls == 1);
  REQUIRE(loop.numWriteWatches() == 0);
  loop.unwatchFd(fds[0]);
  ::close(fds[0]);
  ::close(fds[1]);
}

TEST_CASE("runUntil reports a timeout", "[EventLoop]") {
  EventLoop loop;
  int64_t start = EventLoop::nowMs();
  REQUIRE_FALSE(loop.runUntil([]() { return false; }, 50));
  REQUIRE(EventLoop::nowMs() - start >= 50);
}

TEST_CASE("runUntil refuses to wait on nothing", "[EventLoop]") {
  EventLoop loop;
  REQUIRE_THROWS_AS(loop.runUntil([]() { return false; }), std::logic_error);
}

TEST_CASE("waitFor returns the value or rethrows the rejection",
          "[EventLoop]") {
  EventLoop loop;

  auto good = make_shared<Deferred<string>>();
  loop.addTimer(10, [good]() { good->resolve("done"); });
  REQUIRE(loop.waitFor(good) == "done");

  auto bad = make_shared<Deferred<string>>();
  loop.addTimer(10, [bad]() {
    bad->reject(make_exception_ptr(std::runtime_error("nope")));
  });
  REQUIRE_THROWS_AS(loop.waitFor(bad), std::runtime_error);
}

TEST_CASE("Deferred settles exactly once", "[EventLoop]") {
  Deferred<int> d;
  REQUIRE_FALSE(d.isSettled());
  REQUIRE_THROWS_AS(d.get(), std::logic_error);

  REQUIRE(d.resolve(1));
  REQUIRE_FALSE(d.resolve(2));
  REQUIRE_FALSE(d.reject(make_exception_ptr(std::runtime_error("late"))));
  REQUIRE(d.get() == 1);
  REQUIRE_FALSE(d.isRejected());
}
