// Build: c++ -std=c++17 -O2 -pthread -rdynamic examples/perf_profile.cpp -I. -lspdlog -lfmt -lz -ldl -o ex_perf_profile
// Samples the main thread with the perf backend, then writes the cpuProfile next to a
// couple of hand-made spans into ex_perf_profile.json.gz.
#include "hooktrace.hpp"

#include <chrono>
#include <cmath>

namespace {

double churn(int rounds) {
  double acc = 0;
  for (int i = 1; i < rounds; ++i) acc += std::sqrt((double)i) / (1.0 + std::log((double)i));
  return acc;
}

double parse_phase() { return churn(4000000); }
double optimize_phase() { return churn(8000000); }

} // namespace

int main() {
  spdlog::set_level(spdlog::level::debug);

  hooktrace::TraceLog log("ex_perf_profile.json.gz");
  hooktrace::ProfilerSession session(hooktrace::default_backend(), 200);
  session.start();
  if (!session.active()) HOOKTRACE_LOG_WARN("perf sampling unavailable, trace will have spans only");

  auto phase = [&log](const char* name, int n, double (*fn)()) {
    auto spec = std::make_shared<hooktrace::SpanSpec>();
    spec->name = name;
    spec->categories = {HOOKTRACE_HOOK_CATEGORY};
    spec->args = hooktrace::Json::object({{"phase", n}});
    hooktrace::Span span(log, spec);
    const double r = fn();
    span.close();
    return r;
  };
  double result = phase("parse", 1, parse_phase);
  result += phase("optimize", 2, optimize_phase);

  session.stop().then([&log](const std::optional<hooktrace::ProfileSample>& sample) {
    if (!sample) return;
    hooktrace::TraceEvent ev;
    ev.name = "CpuProfile";
    ev.categories = {"disabled-by-default-devtools.timeline"};
    ev.ts_us = sample->end_time;
    ev.args = hooktrace::Json::object({{"data", hooktrace::Json::object({{"cpuProfile", hooktrace::Json(*sample)}})}});
    log.instant(std::move(ev));
    HOOKTRACE_LOG_INFO("{} samples over {} nodes", sample->samples.size(), sample->nodes.size());
  });
  session.destroy();

  try {
    log.flush();
  } catch (const hooktrace::SinkError& e) {
    HOOKTRACE_LOG_ERROR("{}", e.what());
    return 1;
  }
  HOOKTRACE_LOG_INFO("checksum {:.3f}, trace in {}", result, log.path());
  return 0;
}
