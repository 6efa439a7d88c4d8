#include "test_framework.hpp"
#include "fakes.hpp"

using namespace hooktrace;

namespace {

using Record = fakes::FakeBackend::Record;

std::unique_ptr<fakes::FakeBackend> backend(const std::shared_ptr<Record>& rec, Loop* loop = nullptr) {
  auto b = std::make_unique<fakes::FakeBackend>(rec, loop);
  b->profile = fakes::sample_profile();
  return b;
}

} // namespace

TEST(no_backend_is_a_no_op) {
  ProfilerSession session(nullptr);
  TEST_ASSERT(session.start().fulfilled(), "start resolves");
  TEST_ASSERT(!session.active(), "nothing running");
  auto stopped = session.stop();
  TEST_ASSERT(stopped.fulfilled() && !stopped.get().has_value(), "no sample");
  TEST_ASSERT(session.destroy().fulfilled(), "destroy resolves");
}

TEST(start_sends_profiler_commands_in_order) {
  auto rec = std::make_shared<Record>();
  ProfilerSession session(backend(rec), 250);
  TEST_ASSERT(session.start().fulfilled(), "started");
  TEST_ASSERT(session.active(), "active");
  TEST_ASSERT_EQ(rec->connects, 1, "connected once");
  TEST_ASSERT_EQ(rec->methods.size(), size_t(3), "three commands");
  TEST_ASSERT_EQ(rec->methods[0], std::string("Profiler.enable"), "enable first");
  TEST_ASSERT_EQ(rec->methods[1], std::string("Profiler.setSamplingInterval"), "interval second");
  TEST_ASSERT_EQ(rec->params[1].at("interval").get<int64_t>(), int64_t(250), "interval in microseconds");
  TEST_ASSERT_EQ(rec->methods[2], std::string("Profiler.start"), "start last");
}

TEST(commands_wait_for_acknowledgement) {
  Loop loop;
  auto rec = std::make_shared<Record>();
  ProfilerSession session(backend(rec, &loop));
  Promise<void> started = session.start();
  TEST_ASSERT_EQ(rec->methods.size(), size_t(1), "second command waits for the first answer");
  TEST_ASSERT(!started.settled(), "pending");
  loop.run();
  TEST_ASSERT(started.fulfilled(), "resolved after the loop delivered answers");
  TEST_ASSERT_EQ(rec->methods.size(), size_t(3), "all sent");
}

TEST(stop_returns_parsed_sample) {
  auto rec = std::make_shared<Record>();
  ProfilerSession session(backend(rec));
  session.start();
  auto stopped = session.stop();
  TEST_ASSERT(stopped.fulfilled(), "resolved");
  const auto& sample = stopped.get();
  TEST_ASSERT(sample.has_value(), "sample present");
  TEST_ASSERT_EQ(sample->start_time, uint64_t(1000), "start time");
  TEST_ASSERT_EQ(sample->end_time, uint64_t(5000), "end time");
  TEST_ASSERT_EQ(sample->nodes.size(), size_t(2), "nodes");
  TEST_ASSERT_EQ(sample->nodes[1].function_name, std::string("compile"), "call frame");
  TEST_ASSERT_EQ(sample->nodes[0].children.size(), size_t(1), "tree kept");
  TEST_ASSERT(Json(*sample) == fakes::sample_profile(), "payload preserved as reported");
  TEST_ASSERT(!session.active(), "stopped");
}

TEST(connect_failure_degrades) {
  auto rec = std::make_shared<Record>();
  auto b = backend(rec);
  b->fail_connect = true;
  ProfilerSession session(std::move(b));
  TEST_ASSERT(session.start().fulfilled(), "start still resolves");
  TEST_ASSERT(rec->methods.empty(), "no commands after a failed connect");
  TEST_ASSERT(!session.stop().get().has_value(), "no sample");
  session.destroy();
  TEST_ASSERT_EQ(rec->disconnects, 0, "nothing to disconnect");
}

TEST(post_failure_degrades_and_still_disconnects_once) {
  auto rec = std::make_shared<Record>();
  auto b = backend(rec);
  b->fail_method = "Profiler.setSamplingInterval";
  ProfilerSession session(std::move(b));
  TEST_ASSERT(session.start().fulfilled(), "failure swallowed into a warning");
  TEST_ASSERT(!session.active(), "not active");
  TEST_ASSERT_EQ(rec->methods.size(), size_t(2), "stopped at the failing command");
  TEST_ASSERT(!session.stop().get().has_value(), "no sample");
  session.destroy();
  session.destroy();
  TEST_ASSERT_EQ(rec->disconnects, 1, "released exactly once");
  TEST_ASSERT(session.destroyed(), "destroyed");
}

TEST(stop_failure_yields_empty_sample) {
  auto rec = std::make_shared<Record>();
  auto b = backend(rec);
  b->fail_method = "Profiler.stop";
  ProfilerSession session(std::move(b));
  session.start();
  TEST_ASSERT(!session.stop().get().has_value(), "failure becomes no sample");
}

TEST(malformed_profile_yields_empty_sample) {
  auto rec = std::make_shared<Record>();
  auto b = backend(rec);
  b->profile = Json::object({{"nodes", Json::array()}});
  ProfilerSession session(std::move(b));
  session.start();
  TEST_ASSERT(!session.stop().get().has_value(), "missing times rejected");
}

TEST(node_without_call_frame_yields_empty_sample) {
  auto rec = std::make_shared<Record>();
  auto b = backend(rec);
  b->profile = fakes::sample_profile();
  b->profile["nodes"][1].erase("callFrame");
  ProfilerSession session(std::move(b));
  session.start();
  TEST_ASSERT(!session.stop().get().has_value(), "json error treated like any other failure");
}

TEST(destructor_releases_backend) {
  auto rec = std::make_shared<Record>();
  {
    ProfilerSession session(backend(rec));
    session.start();
  }
  TEST_ASSERT_EQ(rec->disconnects, 1, "released on scope exit");
}

TEST(profile_builder_folds_stacks) {
  using Frame = ProfileBuilder::Frame;
  ProfileBuilder b;
  const Frame entry{"main", "app", -1, -1};
  const Frame parse{"parse", "app", -1, -1};
  const Frame emit{"emit", "app", -1, -1};
  b.add_sample(1100, {entry, parse});
  b.add_sample(1200, {entry, parse});
  b.add_sample(1300, {entry, emit});
  b.add_sample(1400, {});
  ProfileSample s = b.finish(1000, 1500);

  TEST_ASSERT_EQ(s.nodes.size(), size_t(5), "root, main, parse, emit, program");
  TEST_ASSERT_EQ(s.nodes[0].function_name, std::string("(root)"), "root first");
  TEST_ASSERT_EQ(s.nodes[0].id, uint32_t(1), "root id");
  TEST_ASSERT_EQ(s.nodes[1].children.size(), size_t(2), "main has two callees");
  TEST_ASSERT_EQ(s.nodes[2].hit_count, uint32_t(2), "parse hit twice");
  TEST_ASSERT_EQ(s.nodes[4].function_name, std::string("(program)"), "empty stack");
  TEST_ASSERT_EQ(s.samples.size(), size_t(4), "one entry per sample");
  TEST_ASSERT_EQ(s.samples[0], s.samples[1], "same leaf");
  TEST_ASSERT_EQ(s.time_deltas[0], int64_t(100), "first delta from start");
  TEST_ASSERT_EQ(s.time_deltas[3], int64_t(100), "later deltas between samples");

  Json v = s;
  TEST_ASSERT_EQ(v.at("startTime").get<int64_t>(), int64_t(1000), "serialized start");
  TEST_ASSERT_EQ(v.at("nodes").at(1).at("callFrame").at("functionName").get<std::string>(), std::string("main"),
                 "serialized frame");
  TEST_ASSERT(v.at("nodes").at(2).find("children") == v.at("nodes").at(2).end(), "leaves carry no children");
  ProfileSample back = v.get<ProfileSample>();
  TEST_ASSERT_EQ(back.nodes.size(), size_t(5), "parsed back");
  TEST_ASSERT_EQ(back.nodes[1].children, s.nodes[1].children, "children parsed back");
}

TEST(profile_times_must_be_ordered) {
  Json v = Json::object({{"startTime", 10}, {"endTime", 5}});
  TEST_ASSERT_THROWS(v.get<ProfileSample>(), std::invalid_argument, "end before start");
}

#if defined(__linux__)
TEST(perf_sampler_speaks_profiler_protocol) {
  PerfSampler sampler;
  bool failed = false;
  sampler.post("Profiler.enable", Json(), [&failed](std::exception_ptr e, Json) { failed = e != nullptr; });
  TEST_ASSERT(failed, "commands before connect fail");

  ProfilerSession session(std::make_unique<PerfSampler>(), 1000);
  session.start();
  if (!session.active()) return;  // kernel refused perf_event_open here; degradation covered above

  volatile uint64_t sink = 0;
  const uint64_t until = now_us() + 50000;
  while (now_us() < until) sink += 1;

  auto stopped = session.stop();
  TEST_ASSERT(stopped.fulfilled(), "stop resolved");
  TEST_ASSERT(stopped.get().has_value(), "sample collected");
  const ProfileSample& s = *stopped.get();
  TEST_ASSERT(s.end_time >= s.start_time, "ordered window");
  TEST_ASSERT(!s.nodes.empty() && s.nodes[0].function_name == "(root)", "rooted tree");
  TEST_ASSERT_EQ(s.samples.size(), s.time_deltas.size(), "one delta per sample");
}
#endif

int main(int argc, char** argv) {
  spdlog::set_level(spdlog::level::err);
  return run_tests(argc, argv);
}
