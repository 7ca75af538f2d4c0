#include "internal/matching/ride_timers.hpp"

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/util/time.hpp"

namespace {

using dispatch::matching::RideTimers;

struct Fired {
  std::mutex                                      mutex;
  std::condition_variable                         cv;
  std::vector<std::pair<std::string, uint32_t>>   calls;

  RideTimers::Callback Callback() {
    return [this](const std::string& ride_id, uint32_t batch) {
      {
        std::lock_guard lock(mutex);
        calls.emplace_back(ride_id, batch);
      }
      cv.notify_all();
    };
  }

  bool WaitFor(std::size_t count, std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex);
    return cv.wait_for(lock, timeout, [&] { return calls.size() >= count; });
  }

  std::vector<std::pair<std::string, uint32_t>> Snapshot() {
    std::lock_guard lock(mutex);
    return calls;
  }
};

void TestDeadlinesFireInOrder() {
  Fired      fired;
  RideTimers timers(fired.Callback());
  timers.Start();

  const uint64_t now = dispatch::util::NowMillis();
  timers.Arm("ride-late", now + 120, 2);
  timers.Arm("ride-early", now + 40, 1);
  assert(timers.Armed() == 2);

  assert(fired.WaitFor(2, std::chrono::seconds(2)));
  const auto calls = fired.Snapshot();
  assert(calls[0] == std::make_pair(std::string("ride-early"), 1u));
  assert(calls[1] == std::make_pair(std::string("ride-late"), 2u));
  assert(timers.Armed() == 0);
  timers.Stop();
}

void TestCancelledDeadlineNeverFires() {
  Fired      fired;
  RideTimers timers(fired.Callback());
  timers.Start();

  timers.Arm("ride-1", dispatch::util::NowMillis() + 50, 1);
  assert(timers.IsArmed("ride-1"));
  assert(timers.Cancel("ride-1"));
  assert(!timers.Cancel("ride-1"));

  assert(!fired.WaitFor(1, std::chrono::milliseconds(200)));
  timers.Stop();
}

void TestRearmReplacesPreviousDeadline() {
  Fired      fired;
  RideTimers timers(fired.Callback());
  timers.Start();

  const uint64_t now = dispatch::util::NowMillis();
  timers.Arm("ride-1", now + 30, 1);
  timers.Arm("ride-1", now + 100, 2);
  assert(timers.Armed() == 1);

  assert(fired.WaitFor(1, std::chrono::seconds(2)));
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  const auto calls = fired.Snapshot();
  assert(calls.size() == 1);
  assert(calls[0].second == 2);
  timers.Stop();
}

void TestPastDeadlineFiresImmediately() {
  Fired      fired;
  RideTimers timers(fired.Callback());
  timers.Start();

  timers.Arm("ride-1", dispatch::util::NowMillis() - 1000, 3);
  assert(fired.WaitFor(1, std::chrono::seconds(1)));
  timers.Stop();
}

void TestThrowingCallbackKeepsTimerAlive() {
  Fired      fired;
  bool       first = true;
  RideTimers timers([&](const std::string& ride_id, uint32_t batch) {
    if (first) {
      first = false;
      throw std::runtime_error("boom");
    }
    fired.Callback()(ride_id, batch);
  });
  timers.Start();

  const uint64_t now = dispatch::util::NowMillis();
  timers.Arm("ride-1", now + 10, 1);
  timers.Arm("ride-2", now + 60, 1);
  assert(fired.WaitFor(1, std::chrono::seconds(2)));
  assert(fired.Snapshot()[0].first == "ride-2");
  timers.Stop();
}

} // namespace

int main() {
  TestDeadlinesFireInOrder();
  TestCancelledDeadlineNeverFires();
  TestRearmReplacesPreviousDeadline();
  TestPastDeadlineFiresImmediately();
  TestThrowingCallbackKeepsTimerAlive();

  std::cout << "dispatch_unit_ride_timers: pass\n";
  return 0;
}
