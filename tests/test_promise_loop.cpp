#include "test_framework.hpp"
#include "fakes.hpp"

#include <chrono>

using namespace hooktrace;

TEST(then_runs_when_resolved) {
  Promise<int> p;
  int seen = 0;
  auto q = p.then([&seen](const int& v) { seen = v; return v + 1; });
  TEST_ASSERT(!q.settled(), "pending until the source settles");
  p.resolve(41);
  TEST_ASSERT_EQ(seen, 41, "continuation saw the value");
  TEST_ASSERT_EQ(q.get(), 42, "mapped value");
}

TEST(then_on_settled_promise_runs_inline) {
  auto p = Promise<std::string>::ready("done");
  std::string seen;
  p.then([&seen](const std::string& s) { seen = s; });
  TEST_ASSERT_EQ(seen, std::string("done"), "ran immediately");
}

TEST(then_flattens_returned_promise) {
  Promise<int> inner;
  auto outer = Promise<void>::ready().then([inner] { return inner; });
  TEST_ASSERT(!outer.settled(), "waits for the inner promise");
  inner.resolve(7);
  TEST_ASSERT_EQ(outer.get(), 7, "inner value forwarded");
}

TEST(rejection_skips_then_and_reaches_recover) {
  Promise<int> p;
  bool ran = false;
  auto q = p.then([&ran](const int& v) { ran = true; return v; })
               .recover([](std::exception_ptr e) {
                 return describe(e) == "boom" ? -1 : -2;
               });
  p.reject(std::make_exception_ptr(std::runtime_error("boom")));
  TEST_ASSERT(!ran, "then skipped on rejection");
  TEST_ASSERT_EQ(q.get(), -1, "recover mapped the error");
}

TEST(throwing_continuation_rejects) {
  auto q = Promise<int>::ready(1).then([](const int&) -> int { throw std::logic_error("bad"); });
  TEST_ASSERT(q.rejected(), "exception became a rejection");
  TEST_ASSERT_THROWS(q.get(), std::logic_error, "get rethrows the same type");
}

TEST(first_settlement_wins) {
  Promise<int> p;
  p.resolve(1);
  p.resolve(2);
  p.reject(std::make_exception_ptr(std::runtime_error("late")));
  TEST_ASSERT(p.fulfilled(), "still fulfilled");
  TEST_ASSERT_EQ(p.get(), 1, "first value kept");
}

TEST(on_settled_runs_for_both_outcomes) {
  int calls = 0;
  auto ok = Promise<int>::ready(5).on_settled([&calls] { ++calls; });
  auto err = Promise<int>::failed(std::make_exception_ptr(std::runtime_error("x"))).on_settled([&calls] { ++calls; });
  TEST_ASSERT_EQ(calls, 2, "ran twice");
  TEST_ASSERT_EQ(ok.get(), 5, "value forwarded");
  TEST_ASSERT(err.rejected(), "rejection forwarded");
}

TEST(pending_get_throws) {
  Promise<void> p;
  TEST_ASSERT_THROWS(p.get(), std::logic_error, "not settled yet");
}

TEST(forward_to_copies_outcome) {
  Promise<int> src, dst;
  src.forward_to(dst);
  src.resolve(9);
  TEST_ASSERT_EQ(dst.get(), 9, "forwarded");
}

TEST(loop_runs_tasks_in_post_order) {
  Loop loop;
  std::string order;
  loop.post([&] { order += "a"; loop.post([&] { order += "c"; }); });
  loop.post([&] { order += "b"; });
  TEST_ASSERT_EQ(loop.pending(), size_t(2), "two queued");
  TEST_ASSERT_EQ(loop.run(), size_t(3), "three ran");
  TEST_ASSERT_EQ(order, std::string("abc"), "fifo order");
  TEST_ASSERT_EQ(loop.pending(), size_t(0), "drained");
}

TEST(loop_timers_wait_and_keep_order) {
  Loop loop;
  std::string order;
  const auto t0 = std::chrono::steady_clock::now();
  loop.post_after(20, [&] { order += "late"; });
  loop.post_after(5, [&] { order += "early,"; });
  loop.post([&] { order += "now,"; });
  loop.run();
  const auto waited = std::chrono::steady_clock::now() - t0;
  TEST_ASSERT_EQ(order, std::string("now,early,late"), "ready tasks before timers, timers by deadline");
  TEST_ASSERT(waited >= std::chrono::milliseconds(20), "waited for the last timer");
}

TEST(loop_delay_resolves_promise) {
  Loop loop;
  bool fired = false;
  loop.delay(1).then([&fired] { fired = true; });
  TEST_ASSERT(!fired, "not before the loop runs");
  TEST_ASSERT(loop.run_until([&fired] { return fired; }), "resolved by the loop");
}

TEST(run_until_stops_early) {
  Loop loop;
  int count = 0;
  for (int i = 0; i < 5; ++i) loop.post([&count] { ++count; });
  loop.run_until([&count] { return count == 2; });
  TEST_ASSERT_EQ(count, 2, "stopped at the predicate");
  TEST_ASSERT_EQ(loop.pending(), size_t(3), "rest still queued");
}

int main(int argc, char** argv) {
  spdlog::set_level(spdlog::level::warn);
  return run_tests(argc, argv);
}
