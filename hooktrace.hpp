/* SPDX-License-Identifier: MIT
 * Copyright (c) 2025 The hooktrace authors
 * This file is part of hooktrace (v0.1.0). The full MIT license text is in the project’s LICENSE file.
 */


#ifndef HOOKTRACE_HPP_INCLUDED
#define HOOKTRACE_HPP_INCLUDED
/*
 * hooktrace.hpp: header-only hook tracer with CPU profile overlay
 * version: 0.1.0
 *
 * About:
 *   Wraps every tap of a tree of named hooks (sync, callback-async and promise taps)
 *   so that each invocation leaves a matched begin/end pair in a Chrome Trace JSON
 *   log. A sampling profiler runs for the lifetime of the build; when the host says
 *   it is done, the profile is folded into the same timeline and the log is written
 *   to disk. Open the result in Perfetto, chrome://tracing or the DevTools
 *   performance panel.
 *
 * Build flags (define at compile time):
 *   -DHOOKTRACE_DEFAULT_PATH="file.json"    Output file (default "events.json")
 *   -DHOOKTRACE_SAMPLING_INTERVAL_US=N      Profiler sampling interval (default 100)
 *   -DHOOKTRACE_DRAIN_DELAY_MS=N            Delay between "done" and draining (default 2000)
 *   -DHOOKTRACE_HOOK_CATEGORY="cat"         Category of hook spans (default "blink.user_timing")
 *   -DHOOKTRACE_RING_PAGES=N                perf ring size in pages, power of two (default 64)
 *
 * Public API, examples:
 *   // One-shot: let the plugin instrument a host and write the trace
 *   hooktrace::Loop loop;
 *   hooktrace::Config cfg;
 *   cfg.output_path = "out/events.json.gz";          // .gz => gzip via zlib
 *   hooktrace::ProfilingPlugin plugin(loop, cfg);    // default_backend(): perf on Linux
 *   plugin.apply(host);                              // host implements BuildHost
 *   host.run();                                      // fires hooks, then "done"
 *   loop.run();                                      // drains, merges, flushes
 *
 *   // Hooks
 *   hooktrace::HookRegistry reg("Compiler");
 *   auto& run = reg.add<int(int)>("run");
 *   run.tap("double", [](int x) { return 2 * x; });
 *   run.tap_async("later", [](int x, hooktrace::Callback<int> cb) { cb(nullptr, x); });
 *   run.promise(21).then([](const int& v) { ... });
 *
 *   // Manual instrumentation
 *   hooktrace::TraceLog log("trace.json");
 *   hooktrace::InterceptorFactory factory(log);
 *   hooktrace::intercept_all(reg, factory, "Compiler");
 *   log.flush();
 *
 * Notes:
 *   • Everything runs on one cooperative Loop; nothing here is thread-safe except the
 *     perf sampler's private ring reader.
 *   • Hook spans are written as B/E pairs with a shared id; the profile is written as
 *     two X events and one CpuProfile instant.
 *   • Logging goes through the spdlog logger named "hooktrace".
 *   • PerfSampler symbolizes with dladdr(); link executables with -rdynamic to get
 *     names for functions in the main binary.
 *
 * Requirements: C++17+, nlohmann/json, spdlog, zlib. The perf sampler is Linux-only.
 */


#if !defined(__cplusplus) || __cplusplus < 201703L
#  error "hooktrace.hpp requires C++17 or later"
#endif

#ifndef HOOKTRACE_DEFAULT_PATH
#define HOOKTRACE_DEFAULT_PATH "events.json"
#endif

#ifndef HOOKTRACE_SAMPLING_INTERVAL_US
#define HOOKTRACE_SAMPLING_INTERVAL_US 100
#endif

#ifndef HOOKTRACE_DRAIN_DELAY_MS
#define HOOKTRACE_DRAIN_DELAY_MS 2000
#endif

#ifndef HOOKTRACE_HOOK_CATEGORY
#define HOOKTRACE_HOOK_CATEGORY "blink.user_timing"
#endif

#ifndef HOOKTRACE_RING_PAGES
#define HOOKTRACE_RING_PAGES 64
#endif

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cmath>
#include <deque>
#include <exception>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <zlib.h>

#include <cerrno>
#if defined(_WIN32)
  #define WIN32_LEAN_AND_MEAN
  #include <windows.h>
  #include <processthreadsapi.h>
  #include <sys/stat.h>
  #include <direct.h>
#elif defined(__APPLE__)
  #include <pthread.h>
  #include <sys/types.h>
  #include <unistd.h>
  #include <sys/stat.h>
#else
  #include <sys/syscall.h>
  #include <sys/types.h>
  #include <unistd.h>
  #include <sys/stat.h>
#endif

#if defined(__linux__)
  #include <linux/perf_event.h>
  #include <sys/ioctl.h>
  #include <sys/mman.h>
  #include <dlfcn.h>
  #include <cxxabi.h>
  #include <time.h>
#endif

namespace hooktrace {

// ---- Logging --------------------------------------------------------------

// Library logger. Reuses a logger the application registered under the same name.
inline std::shared_ptr<spdlog::logger> logger() {
  static std::shared_ptr<spdlog::logger> L = [] {
    if (auto existing = spdlog::get("hooktrace")) return existing;
    return spdlog::stderr_color_mt("hooktrace");
  }();
  return L;
}

#define HOOKTRACE_LOG_DEBUG(...) ::hooktrace::logger()->debug(__VA_ARGS__)
#define HOOKTRACE_LOG_INFO(...)  ::hooktrace::logger()->info(__VA_ARGS__)
#define HOOKTRACE_LOG_WARN(...)  ::hooktrace::logger()->warn(__VA_ARGS__)
#define HOOKTRACE_LOG_ERROR(...) ::hooktrace::logger()->error(__VA_ARGS__)

// Human-readable text of a captured exception, for log lines.
inline std::string describe(const std::exception_ptr& e) {
  if (!e) return "no error";
  try {
    std::rethrow_exception(e);
  } catch (const std::exception& ex) {
    return ex.what();
  } catch (...) {
    return "non-standard exception";
  }
}

// ---- Platform helpers -----------------------------------------------------

inline uint32_t pid() {
#if defined(_WIN32)
  return static_cast<uint32_t>(::GetCurrentProcessId());
#else
  return static_cast<uint32_t>(::getpid());
#endif
}

inline uint32_t tid() {
#if defined(_WIN32)
  return static_cast<uint32_t>(::GetCurrentThreadId());
#elif defined(__APPLE__)
  uint64_t tid64 = 0;
  pthread_threadid_np(nullptr, &tid64);
  return static_cast<uint32_t>(tid64);
#elif defined(__linux__)
  return static_cast<uint32_t>(::syscall(SYS_gettid));
#else
  return static_cast<uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
#endif
}

// Create parent directories for a target path.
inline void mkpath(const std::string& path) {
  if (path.empty()) return;
  std::string tmp = path;
#if defined(_WIN32)
  for (char& c : tmp) if (c == '/') c = '\\';
  size_t start = 0;
  if (tmp.size() > 2 && tmp[1] == ':' && tmp[2] == '\\') start = 3;
  for (size_t i = start; i < tmp.size(); ++i) {
    if (tmp[i] == '\\') { tmp[i] = 0; _mkdir(tmp.c_str()); tmp[i] = '\\'; }
  }
#else
  for (size_t i = 1; i < tmp.size(); ++i) {
    if (tmp[i] != '/') continue;
    tmp[i] = 0;
    if (mkdir(tmp.c_str(), 0755) != 0 && errno != EEXIST) {
      HOOKTRACE_LOG_DEBUG("mkdir {} failed: {}", tmp.c_str(), std::strerror(errno));
    }
    tmp[i] = '/';
  }
#endif
}

inline bool ends_with(std::string_view s, std::string_view suff) {
  return suff.size() <= s.size() && s.compare(s.size() - suff.size(), suff.size(), suff) == 0;
}

// ---- Timestamp source -----------------------------------------------------
struct Timebase {
  using clk = std::chrono::steady_clock;

  static clk::time_point epoch() {
    static const clk::time_point t0 = clk::now();
    return t0;
  }

  // Returns microseconds since first use.
  static uint64_t now_us() {
    auto d = clk::now() - epoch();
    return (uint64_t)std::chrono::duration_cast<std::chrono::microseconds>(d).count();
  }

  // Maps a CLOCK_MONOTONIC reading onto this timebase. steady_clock reads the same
  // clock on Linux; readings taken before the epoch clamp to 0.
  static uint64_t from_monotonic_ns(uint64_t ns) {
    const int64_t e = (int64_t)std::chrono::duration_cast<std::chrono::nanoseconds>(
        epoch().time_since_epoch()).count();
    const int64_t d = (int64_t)ns - e;
    return d > 0 ? (uint64_t)(d / 1000) : 0;
  }
};

inline uint64_t now_us() { return Timebase::now_us(); }

// ---- Structured values ----------------------------------------------------

// Insertion-ordered JSON used for event args, profiler messages and profiles.
using Json = nlohmann::ordered_json;

// ---- Tiny JSON helpers ----------------------------------------------------

inline void json_escape_append(std::string& out, std::string_view s) {
  out.push_back('"');
  for (unsigned char c : s) {
    switch (c) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          out += buf;
        } else {
          out.push_back((char)c);
        }
    }
  }
  out.push_back('"');
}

// ---- Trace event model ----------------------------------------------------

enum class Phase : uint8_t { Instant, Begin, End, Complete };

inline const char* phase_code(Phase ph) {
  switch (ph) {
    case Phase::Instant:  return "I";
    case Phase::Begin:    return "B";
    case Phase::End:      return "E";
    case Phase::Complete: return "X";
  }
  return "?";
}

struct TraceEvent {
  std::string name;
  uint64_t id = 0;                      // 0 = no id
  std::vector<std::string> categories;
  Phase ph = Phase::Instant;
  uint64_t ts_us = 0;
  std::optional<uint64_t> dur_us;       // complete events only
  Json args;
};

// Output layout of the trace file.
enum class Format : uint8_t {
  Array,   // [ev,ev,...]
  Object,  // {"traceEvents":[...],"displayTimeUnit":"ms"}
  Lines    // one event per line
};

inline void write_event_json(std::string& out, const TraceEvent& e, uint32_t pid, uint32_t tid) {
  char buf[64];
  out += "{\"name\":"; json_escape_append(out, e.name);
  if (e.id) {
    std::snprintf(buf, sizeof(buf), ",\"id\":%" PRIu64, e.id);
    out += buf;
  }

  std::string cat;
  for (size_t i = 0; i < e.categories.size(); ++i) {
    if (i) cat.push_back(',');
    cat += e.categories[i];
  }
  out += ",\"cat\":"; json_escape_append(out, cat);

  out += ",\"ph\":\""; out += phase_code(e.ph); out += "\"";
  std::snprintf(buf, sizeof(buf), ",\"ts\":%" PRIu64, e.ts_us);
  out += buf;
  if (e.ph == Phase::Complete) {
    std::snprintf(buf, sizeof(buf), ",\"dur\":%" PRIu64, e.dur_us.value_or(0));
    out += buf;
  }
  std::snprintf(buf, sizeof(buf), ",\"pid\":%" PRIu32 ",\"tid\":%" PRIu32, pid, tid);
  out += buf;

  // instant scope (thread)
  if (e.ph == Phase::Instant) out += ",\"s\":\"t\"";

  if (!e.args.is_null()) {
    out += ",\"args\":";
    out += e.args.dump(-1, ' ', false, Json::error_handler_t::replace);
  }
  out.push_back('}');
}

// Thrown by TraceLog::flush when the output cannot be opened, written or moved into place.
class SinkError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Process-wide id source shared by the log, the interceptors and the merge step.
class IdCounter {
 public:
  uint64_t next() { return ++last_; }
  uint64_t last() const { return last_; }

 private:
  uint64_t last_ = 0;
};

// ---- gzip -----------------------------------------------------------------

// Stream-compress a whole file to gzip (.gz) using zlib.
inline bool compress_file_to_gzip(const std::string& in_path, const std::string& out_path, int level /*1..9*/) {
  FILE* fin = std::fopen(in_path.c_str(), "rb");
  if (!fin) return false;
  FILE* fout = std::fopen(out_path.c_str(), "wb");
  if (!fout) { std::fclose(fin); return false; }

  z_stream zs{};
  // windowBits=15, +16 -> gzip header/trailer
  int rc = deflateInit2(&zs, level, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY);
  if (rc != Z_OK) { std::fclose(fin); std::fclose(fout); return false; }

  const size_t IN_CHUNK  = 64 * 1024;
  const size_t OUT_CHUNK = 64 * 1024;
  std::vector<unsigned char> inbuf(IN_CHUNK);
  std::vector<unsigned char> outbuf(OUT_CHUNK);

  bool ok = true;
  for (;;) {
    zs.avail_in = (uInt)std::fread(inbuf.data(), 1, IN_CHUNK, fin);
    zs.next_in  = inbuf.data();
    if (std::ferror(fin)) { ok = false; break; }
    int flush = std::feof(fin) ? Z_FINISH : Z_NO_FLUSH;

    do {
      zs.avail_out = (uInt)OUT_CHUNK;
      zs.next_out  = outbuf.data();
      rc = deflate(&zs, flush);
      if (rc == Z_STREAM_ERROR) { ok = false; break; }
      size_t have = OUT_CHUNK - zs.avail_out;
      if (have && std::fwrite(outbuf.data(), 1, have, fout) != have) { ok = false; break; }
    } while (zs.avail_out == 0);

    if (!ok || flush == Z_FINISH) break;
  }

  deflateEnd(&zs);
  std::fclose(fin);
  if (std::fclose(fout) != 0) ok = false;
  if (!ok) std::remove(out_path.c_str());
  return ok;
}

// ---- Trace event log ------------------------------------------------------

namespace detail {

struct FileCloser {
  void operator()(FILE* f) const { if (f) std::fclose(f); }
};
using FilePtr = std::unique_ptr<FILE, FileCloser>;

// Removes the temp file on every exit path unless it was moved into place.
struct TempFile {
  std::string path;
  bool committed = false;
  explicit TempFile(std::string p) : path(std::move(p)) {}
  ~TempFile() { if (!committed) std::remove(path.c_str()); }
  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;
};

inline void write_all(FILE* f, const std::string& s, const std::string& path) {
  if (s.empty()) return;
  if (std::fwrite(s.data(), 1, s.size(), f) != s.size()) {
    throw SinkError("short write to " + path + ": " + std::strerror(errno));
  }
}

} // namespace detail

// Append-only trace event log, buffered in memory and written once by flush().
class TraceLog {
 public:
  explicit TraceLog(std::string path = HOOKTRACE_DEFAULT_PATH,
                    Format format = Format::Array,
                    std::string frame_url = "webpack")
  : path_(std::move(path)), format_(format), pid_(hooktrace::pid()), tid_(hooktrace::tid()) {
    emit_bootstrap(frame_url);
  }

  TraceLog(const TraceLog&) = delete;
  TraceLog& operator=(const TraceLog&) = delete;

  void instant(TraceEvent e)  { append(std::move(e), Phase::Instant); }
  void begin(TraceEvent e)    { append(std::move(e), Phase::Begin); }
  void end(TraceEvent e)      { append(std::move(e), Phase::End); }
  void complete(TraceEvent e) { append(std::move(e), Phase::Complete); }

  // Writes the whole log to path() and seals it. Throws SinkError.
  void flush();

  IdCounter& ids() { return ids_; }
  uint64_t next_id() { return ids_.next(); }

  const std::vector<TraceEvent>& events() const { return events_; }
  std::vector<uint64_t> open_spans() const { return std::vector<uint64_t>(open_.begin(), open_.end()); }
  size_t dropped() const { return dropped_; }
  bool finalized() const { return finalized_; }
  const std::string& path() const { return path_; }
  Format format() const { return format_; }

 private:
  void emit_bootstrap(const std::string& frame_url);
  void append(TraceEvent&& e, Phase ph);

  std::string path_;
  Format format_;
  uint32_t pid_;
  uint32_t tid_;
  IdCounter ids_;
  std::vector<TraceEvent> events_;
  std::string body_;          // serialized events, separators included
  std::set<uint64_t> open_;   // begin ids awaiting their end
  size_t dropped_ = 0;
  bool finalized_ = false;
};

inline void TraceLog::emit_bootstrap(const std::string& frame_url) {
  const uint64_t ts = now_us();

  TraceEvent page;
  page.name = "TracingStartedInPage";
  page.categories = {"disabled-by-default-devtools.timeline"};
  page.ts_us = ts;
  page.args = Json::object({
      {"data", Json::object({
          {"sessionId", "-1"},
          {"page", "0xfff"},
          {"frames", Json::array({
              Json::object({{"frame", "0xfff"}, {"url", frame_url}, {"name", ""}})})}})}});
  instant(std::move(page));

  TraceEvent browser;
  browser.name = "TracingStartedInBrowser";
  browser.categories = {"disabled-by-default-devtools.timeline"};
  browser.ts_us = ts;
  browser.args = Json::object({{"data", Json::object({{"sessionId", "-1"}})}});
  instant(std::move(browser));
}

inline void TraceLog::append(TraceEvent&& e, Phase ph) {
  if (finalized_) {
    ++dropped_;
    HOOKTRACE_LOG_DEBUG("dropping '{}' ({}): log already flushed", e.name, phase_code(ph));
    return;
  }
  if (e.name.empty()) throw std::invalid_argument("trace event without a name");
  if (ph == Phase::Complete && !e.dur_us) {
    throw std::invalid_argument("complete event '" + e.name + "' has no duration");
  }
  if (ph != Phase::Complete && e.dur_us) {
    throw std::invalid_argument("event '" + e.name + "' carries a duration but is not complete");
  }
  if (ph == Phase::Begin || ph == Phase::End) {
    if (e.id == 0) throw std::invalid_argument("span event '" + e.name + "' has no id");
    if (ph == Phase::Begin && !open_.insert(e.id).second) {
      throw std::invalid_argument("span id " + std::to_string(e.id) + " is already open");
    }
    if (ph == Phase::End && open_.erase(e.id) == 0) {
      throw std::invalid_argument("end for span id " + std::to_string(e.id) + " that is not open");
    }
  }
  e.ph = ph;

  if (!events_.empty()) body_ += (format_ == Format::Lines) ? "\n" : ",\n";
  write_event_json(body_, e, pid_, tid_);
  events_.push_back(std::move(e));
}

inline void TraceLog::flush() {
  if (finalized_) {
    HOOKTRACE_LOG_DEBUG("trace log {} already flushed", path_);
    return;
  }
  finalized_ = true;
  if (!open_.empty()) {
    HOOKTRACE_LOG_WARN("{} span(s) still open at flush, first id {}", open_.size(), *open_.begin());
  }

  std::string head, tail;
  switch (format_) {
    case Format::Array:  head = "[\n"; tail = "\n]\n"; break;
    case Format::Object: head = "{\n\"traceEvents\":[\n"; tail = "\n],\n\"displayTimeUnit\":\"ms\"\n}\n"; break;
    case Format::Lines:  tail = "\n"; break;
  }

  mkpath(path_);
  const bool gzip = ends_with(path_, ".gz");
  detail::TempFile tmp(path_ + ".tmp");

  // 1) Write plain JSON into tmp file
  detail::FilePtr f(std::fopen(tmp.path.c_str(), "wb"));
  if (!f) throw SinkError("cannot open " + tmp.path + ": " + std::strerror(errno));
  detail::write_all(f.get(), head, tmp.path);
  detail::write_all(f.get(), body_, tmp.path);
  detail::write_all(f.get(), tail, tmp.path);
  if (std::fclose(f.release()) != 0) {
    throw SinkError("cannot close " + tmp.path + ": " + std::strerror(errno));
  }

  // 2) gzip or move into place
  if (gzip) {
    if (!compress_file_to_gzip(tmp.path, path_, 6)) throw SinkError("gzip compression failed for " + path_);
  } else {
    std::remove(path_.c_str());
    if (std::rename(tmp.path.c_str(), path_.c_str()) != 0) {
      throw SinkError("cannot move " + tmp.path + " to " + path_ + ": " + std::strerror(errno));
    }
    tmp.committed = true;
  }
  HOOKTRACE_LOG_INFO("wrote {} trace events to {}", events_.size(), path_);
}

// ---- Cooperative promises -------------------------------------------------

template <class T> class Promise;

namespace detail {

struct Unit {};

template <class T> struct is_promise : std::false_type {};
template <class T> struct is_promise<Promise<T>> : std::true_type {};

template <class R> struct unwrap_promise { using type = R; };
template <class R> struct unwrap_promise<Promise<R>> { using type = R; };

template <class F, class T> struct continuation_result { using type = std::invoke_result_t<F&, const T&>; };
template <class F> struct continuation_result<F, void> { using type = std::invoke_result_t<F&>; };

template <class U, class F, class... A>
void settle_from(Promise<U>& next, F& f, A&&... a);

} // namespace detail

// Single-threaded promise. Continuations run inline when the promise settles, or
// immediately when attached to an already settled promise. Copies share state.
template <class T>
class Promise {
  using Stored = std::conditional_t<std::is_void_v<T>, detail::Unit, T>;

  struct State {
    std::optional<Stored> value;
    std::exception_ptr error;
    std::vector<std::function<void()>> waiters;
  };

 public:
  using value_type = T;

  Promise() : st_(std::make_shared<State>()) {}

  template <class... V>
  static Promise ready(V&&... v) {
    Promise p;
    p.resolve(std::forward<V>(v)...);
    return p;
  }
  static Promise failed(std::exception_ptr e) {
    Promise p;
    p.reject(std::move(e));
    return p;
  }

  // First settlement wins; later calls are ignored.
  template <class... V>
  void resolve(V&&... v) {
    if (settled()) return;
    st_->value.emplace(std::forward<V>(v)...);
    fire();
  }
  void reject(std::exception_ptr e) {
    if (settled()) return;
    st_->error = e ? std::move(e) : std::make_exception_ptr(std::logic_error("promise rejected without an error"));
    fire();
  }

  bool settled() const { return st_->value.has_value() || st_->error != nullptr; }
  bool fulfilled() const { return st_->value.has_value(); }
  bool rejected() const { return st_->error != nullptr; }
  std::exception_ptr error() const { return st_->error; }

  // Rethrows the rejection; throws std::logic_error while pending.
  template <class U = T, std::enable_if_t<!std::is_void_v<U>, int> = 0>
  const U& get() const { check_settled(); return *st_->value; }
  template <class U = T, std::enable_if_t<std::is_void_v<U>, int> = 0>
  void get() const { check_settled(); }

  void on_complete(std::function<void()> w) const {
    if (settled()) { w(); return; }
    st_->waiters.push_back(std::move(w));
  }

  template <class F>
  auto then(F f) -> Promise<typename detail::unwrap_promise<typename detail::continuation_result<F, T>::type>::type> {
    using U = typename detail::unwrap_promise<typename detail::continuation_result<F, T>::type>::type;
    Promise<U> next;
    Promise self = *this;
    on_complete([self, next, f]() mutable {
      if (self.rejected()) { next.reject(self.error()); return; }
      try {
        if constexpr (std::is_void_v<T>) detail::settle_from(next, f);
        else detail::settle_from(next, f, std::as_const(*self.st_->value));
      } catch (...) {
        next.reject(std::current_exception());
      }
    });
    return next;
  }

  // f(std::exception_ptr) maps a rejection back to a value (or rethrows).
  template <class F>
  Promise<T> recover(F f) {
    Promise<T> next;
    Promise self = *this;
    on_complete([self, next, f]() mutable {
      if (!self.rejected()) { self.forward_to(next); return; }
      try {
        detail::settle_from(next, f, self.error());
      } catch (...) {
        next.reject(std::current_exception());
      }
    });
    return next;
  }

  // Runs f() on either outcome, then settles like this promise (or with f's exception).
  template <class F>
  Promise<T> on_settled(F f) {
    Promise<T> next;
    Promise self = *this;
    on_complete([self, next, f]() mutable {
      try {
        f();
      } catch (...) {
        next.reject(std::current_exception());
        return;
      }
      self.forward_to(next);
    });
    return next;
  }

  void forward_to(Promise<T> other) const {
    Promise self = *this;
    on_complete([self, other]() mutable {
      if (self.rejected()) other.reject(self.error());
      else if constexpr (std::is_void_v<T>) other.resolve();
      else other.resolve(*self.st_->value);
    });
  }

 private:
  template <class> friend class Promise;

  void check_settled() const {
    if (st_->error) std::rethrow_exception(st_->error);
    if (!st_->value) throw std::logic_error("promise is still pending");
  }

  void fire() {
    auto waiters = std::move(st_->waiters);
    st_->waiters.clear();
    for (auto& w : waiters) w();
  }

  std::shared_ptr<State> st_;
};

namespace detail {

template <class U, class F, class... A>
void settle_from(Promise<U>& next, F& f, A&&... a) {
  using R = std::invoke_result_t<F&, A&&...>;
  if constexpr (is_promise<R>::value) {
    f(std::forward<A>(a)...).forward_to(next);
  } else if constexpr (std::is_void_v<R>) {
    f(std::forward<A>(a)...);
    next.resolve();
  } else {
    next.resolve(f(std::forward<A>(a)...));
  }
}

} // namespace detail

// ---- Cooperative loop -----------------------------------------------------

// Run-to-completion task queue with millisecond timers. Tasks posted with the same
// deadline run in posting order.
class Loop {
 public:
  using Task = std::function<void()>;
  using Clock = std::chrono::steady_clock;

  void post(Task t) { ready_.push_back(std::move(t)); }

  void post_after(uint32_t delay_ms, Task t) {
    timers_.emplace(Clock::now() + std::chrono::milliseconds(delay_ms), std::move(t));
  }

  Promise<void> delay(uint32_t delay_ms) {
    Promise<void> p;
    post_after(delay_ms, [p]() mutable { p.resolve(); });
    return p;
  }

  // Runs one task, sleeping until the next timer if nothing is ready.
  // Returns false when the loop has no work left.
  bool run_one() {
    promote_due();
    if (ready_.empty()) {
      if (timers_.empty()) return false;
      std::this_thread::sleep_until(timers_.begin()->first);
      promote_due();
    }
    Task t = std::move(ready_.front());
    ready_.pop_front();
    t();
    return true;
  }

  size_t run() {
    size_t n = 0;
    while (run_one()) ++n;
    return n;
  }

  template <class Pred>
  bool run_until(Pred done) {
    while (!done()) {
      if (!run_one()) return done();
    }
    return true;
  }

  size_t pending() const { return ready_.size() + timers_.size(); }

 private:
  void promote_due() {
    const auto now = Clock::now();
    while (!timers_.empty() && timers_.begin()->first <= now) {
      ready_.push_back(std::move(timers_.begin()->second));
      timers_.erase(timers_.begin());
    }
  }

  std::deque<Task> ready_;
  std::multimap<Clock::time_point, Task> timers_;
};

// ---- Taps -----------------------------------------------------------------

enum class TapType : uint8_t { Sync, Async, Promise };

inline const char* tap_type_name(TapType t) {
  switch (t) {
    case TapType::Sync:    return "sync";
    case TapType::Async:   return "async";
    case TapType::Promise: return "promise";
  }
  return "unknown";
}

namespace detail {
template <class R> struct callback_of { using type = std::function<void(std::exception_ptr, R)>; };
template <> struct callback_of<void> { using type = std::function<void(std::exception_ptr)>; };
} // namespace detail

// Continuation of a callback-style tap: (error) or (error, result).
template <class R> using Callback = typename detail::callback_of<R>::type;

template <class Sig> struct Tap;

// A named callable registered on a hook. Exactly one of sync/async/promise is set,
// matching type.
template <class R, class... Args>
struct Tap<R(Args...)> {
  using SyncFn    = std::function<R(Args...)>;
  using AsyncFn   = std::function<void(Args..., Callback<R>)>;
  using PromiseFn = std::function<Promise<R>(Args...)>;

  std::string name;
  TapType type = TapType::Sync;
  SyncFn sync;
  AsyncFn async;
  PromiseFn promise;
};

template <class Sig>
struct HookBinding {
  std::string hook_name;
  std::string source_label;
  Tap<Sig> tap;
};

// ---- Interceptor factory --------------------------------------------------

// What every span of one wrapped tap carries.
struct SpanSpec {
  std::string name;
  std::vector<std::string> categories;
  Json args;
};

// One begin/end pair. The id is taken and the begin emitted in the constructor;
// close() emits the end once.
class Span {
 public:
  Span(TraceLog& log, std::shared_ptr<const SpanSpec> spec)
  : log_(&log), spec_(std::move(spec)), id_(log.next_id()) {
    TraceEvent e;
    e.name = spec_->name;
    e.id = id_;
    e.categories = spec_->categories;
    e.ts_us = now_us();
    e.args = spec_->args;
    log_->begin(std::move(e));
  }

  void close() {
    if (closed_) return;
    closed_ = true;
    TraceEvent e;
    e.name = spec_->name;
    e.id = id_;
    e.categories = spec_->categories;
    e.ts_us = now_us();
    log_->end(std::move(e));
  }

  uint64_t id() const { return id_; }
  bool closed() const { return closed_; }

 private:
  TraceLog* log_;
  std::shared_ptr<const SpanSpec> spec_;
  uint64_t id_;
  bool closed_ = false;
};

namespace detail {

// Continuation that closes the span, then forwards exactly what it received.
template <class... Cs>
std::function<void(Cs...)> close_then(std::shared_ptr<Span> span, std::function<void(Cs...)> next) {
  return [span = std::move(span), next = std::move(next)](Cs... results) {
    span->close();
    if (next) next(std::forward<Cs>(results)...);
  };
}

} // namespace detail

class InterceptorFactory {
 public:
  explicit InterceptorFactory(TraceLog& log, std::string category = HOOKTRACE_HOOK_CATEGORY)
  : log_(&log), category_(std::move(category)) {}

  TraceLog& log() const { return *log_; }
  const std::string& category() const { return category_; }

  // Returns a tap that behaves like binding.tap and brackets each call with a span.
  template <class Sig>
  Tap<Sig> wrap(HookBinding<Sig> binding) const {
    switch (binding.tap.type) {
      case TapType::Sync:
        if (binding.tap.sync) return wrap_sync(std::move(binding));
        break;
      case TapType::Async:
        if (binding.tap.async) return wrap_async(std::move(binding));
        break;
      case TapType::Promise:
        if (binding.tap.promise) return wrap_promise(std::move(binding));
        break;
    }
    return std::move(binding.tap);
  }

  // Register-style interceptor for one hook.
  template <class Sig>
  std::function<Tap<Sig>(Tap<Sig>)> interceptor_for(std::string hook_name, std::string source_label) const {
    return [this, hook_name, source_label](Tap<Sig> tap) {
      return wrap(HookBinding<Sig>{hook_name, source_label, std::move(tap)});
    };
  }

 private:
  template <class Sig>
  std::shared_ptr<const SpanSpec> spec_for(const HookBinding<Sig>& b) const {
    auto spec = std::make_shared<SpanSpec>();
    spec->name = b.tap.name.empty() ? b.hook_name : b.tap.name;
    spec->categories = {category_};
    spec->args = Json::object({{"hook", b.hook_name}, {"source", b.source_label}});
    return spec;
  }

  template <class R, class... Args>
  Tap<R(Args...)> wrap_sync(HookBinding<R(Args...)> b) const {
    Tap<R(Args...)> t{b.tap.name, TapType::Sync, {}, {}, {}};
    t.sync = [log = log_, spec = spec_for(b), fn = std::move(b.tap.sync)](Args... args) -> R {
      Span span(*log, spec);
      try {
        if constexpr (std::is_void_v<R>) {
          fn(std::forward<Args>(args)...);
          span.close();
        } else {
          R r = fn(std::forward<Args>(args)...);
          span.close();
          return r;
        }
      } catch (...) {
        span.close();
        throw;
      }
    };
    return t;
  }

  template <class R, class... Args>
  Tap<R(Args...)> wrap_async(HookBinding<R(Args...)> b) const {
    Tap<R(Args...)> t{b.tap.name, TapType::Async, {}, {}, {}};
    t.async = [log = log_, spec = spec_for(b), fn = std::move(b.tap.async)](Args... args, Callback<R> done) {
      auto span = std::make_shared<Span>(*log, spec);
      try {
        fn(std::forward<Args>(args)..., detail::close_then(span, std::move(done)));
      } catch (...) {
        span->close();
        throw;
      }
    };
    return t;
  }

  template <class R, class... Args>
  Tap<R(Args...)> wrap_promise(HookBinding<R(Args...)> b) const {
    Tap<R(Args...)> t{b.tap.name, TapType::Promise, {}, {}, {}};
    t.promise = [log = log_, spec = spec_for(b), fn = std::move(b.tap.promise)](Args... args) -> Promise<R> {
      auto span = std::make_shared<Span>(*log, spec);
      Promise<R> p;
      try {
        p = fn(std::forward<Args>(args)...);
      } catch (...) {
        span->close();
        throw;
      }
      return p.on_settled([span] { span->close(); });
    };
    return t;
  }

  TraceLog* log_;
  std::string category_;
};

// ---- Hooks ----------------------------------------------------------------

class HookBase {
 public:
  virtual ~HookBase() = default;

  const std::string& name() const { return name_; }
  virtual size_t tap_count() const = 0;

  // Wraps every current and future tap through the factory, once per hook.
  bool instrument(InterceptorFactory& factory, const std::string& source_label) {
    if (instrumented_) return false;
    instrumented_ = true;
    install(factory, source_label);
    return true;
  }
  bool instrumented() const { return instrumented_; }

 protected:
  explicit HookBase(std::string name) : name_(std::move(name)) {}
  virtual void install(InterceptorFactory& factory, const std::string& source_label) = 0;

 private:
  std::string name_;
  bool instrumented_ = false;
};

template <class Sig> class Hook;

template <class R, class... Args>
class Hook<R(Args...)> : public HookBase {
 public:
  using TapT = Tap<R(Args...)>;
  using Interceptor = std::function<TapT(TapT)>;

  explicit Hook(std::string name) : HookBase(std::move(name)) {}

  void tap(std::string tap_name, typename TapT::SyncFn fn) {
    add(TapT{std::move(tap_name), TapType::Sync, std::move(fn), {}, {}});
  }
  void tap_async(std::string tap_name, typename TapT::AsyncFn fn) {
    add(TapT{std::move(tap_name), TapType::Async, {}, std::move(fn), {}});
  }
  void tap_promise(std::string tap_name, typename TapT::PromiseFn fn) {
    add(TapT{std::move(tap_name), TapType::Promise, {}, {}, std::move(fn)});
  }
  void add(TapT t) {
    for (const auto& i : interceptors_) t = i(std::move(t));
    taps_.push_back(std::move(t));
  }

  // Rewrites the taps already registered, and every tap registered later.
  void intercept(Interceptor i) {
    for (auto& t : taps_) t = i(std::move(t));
    interceptors_.push_back(std::move(i));
  }

  size_t tap_count() const override { return taps_.size(); }
  const std::vector<TapT>& taps() const { return taps_; }

  // Calls every tap in order. All taps must be sync; for non-void R the result
  // of the last tap is returned.
  auto call(Args... args) {
    const std::vector<TapT> taps = taps_;
    if constexpr (std::is_void_v<R>) {
      for (const TapT& t : taps) sync_of(t)(args...);
    } else {
      std::optional<R> last;
      for (const TapT& t : taps) last = sync_of(t)(args...);
      return last;
    }
  }

  // Runs taps in series, whatever their type, and stops at the first error.
  void call_async(Args... args, Callback<R> done) {
    auto s = std::make_shared<Series>(Series{taps_, std::tuple<Args...>(args...), std::move(done), {}});
    step(std::move(s), 0);
  }

  Promise<R> promise(Args... args) {
    Promise<R> p;
    if constexpr (std::is_void_v<R>) {
      call_async(args..., [p](std::exception_ptr e) mutable {
        if (e) p.reject(e); else p.resolve();
      });
    } else {
      call_async(args..., [p](std::exception_ptr e, R r) mutable {
        if (e) p.reject(e); else p.resolve(std::move(r));
      });
    }
    return p;
  }

 protected:
  void install(InterceptorFactory& factory, const std::string& source_label) override {
    intercept(factory.interceptor_for<R(Args...)>(name(), source_label));
  }

 private:
  using Last = std::conditional_t<std::is_void_v<R>, detail::Unit, std::optional<R>>;

  struct Series {
    std::vector<TapT> taps;
    std::tuple<Args...> argv;
    Callback<R> done;
    Last last;
  };

  const typename TapT::SyncFn& sync_of(const TapT& t) const {
    if (t.type != TapType::Sync || !t.sync) {
      throw std::logic_error("hook '" + name() + "': tap '" + t.name + "' is " +
                             tap_type_name(t.type) + ", use call_async()");
    }
    return t.sync;
  }

  static void finish(const std::shared_ptr<Series>& s, std::exception_ptr e) {
    if (!s->done) return;
    if constexpr (std::is_void_v<R>) s->done(e);
    else s->done(e, (!e && s->last) ? *s->last : R{});
  }

  static void step(std::shared_ptr<Series> s, size_t i) {
    if (i >= s->taps.size()) { finish(s, nullptr); return; }
    const TapT& t = s->taps[i];
    switch (t.type) {
      case TapType::Sync: {
        try {
          if constexpr (std::is_void_v<R>) std::apply(t.sync, s->argv);
          else s->last = std::apply(t.sync, s->argv);
        } catch (...) {
          finish(s, std::current_exception());
          return;
        }
        step(std::move(s), i + 1);
        return;
      }
      case TapType::Async: {
        Callback<R> next;
        if constexpr (std::is_void_v<R>) {
          next = [s, i](std::exception_ptr e) {
            if (e) finish(s, e); else step(s, i + 1);
          };
        } else {
          next = [s, i](std::exception_ptr e, R r) {
            if (e) { finish(s, e); return; }
            s->last = std::move(r);
            step(s, i + 1);
          };
        }
        try {
          std::apply([&](auto&... a) { t.async(a..., next); }, s->argv);
        } catch (...) {
          finish(s, std::current_exception());
        }
        return;
      }
      case TapType::Promise: {
        Promise<R> p;
        try {
          p = std::apply(t.promise, s->argv);
        } catch (...) {
          finish(s, std::current_exception());
          return;
        }
        p.on_complete([s, i, p] {
          if (p.rejected()) { finish(s, p.error()); return; }
          if constexpr (!std::is_void_v<R>) s->last = p.get();
          step(s, i + 1);
        });
        return;
      }
    }
    step(std::move(s), i + 1);
  }

  std::vector<TapT> taps_;
  std::vector<Interceptor> interceptors_;
};

// Hooks created on demand per key (e.g. one parser hook per module type).
template <class Sig>
class HookMap : public HookBase {
 public:
  using HookT = Hook<Sig>;

  explicit HookMap(std::string name) : HookBase(std::move(name)) {}

  HookT& for_key(const std::string& key) {
    auto it = hooks_.find(key);
    if (it != hooks_.end()) return *it->second;
    auto h = std::make_unique<HookT>(name() + "/" + key);
    for (const auto& f : on_create_) f(*h);
    return *hooks_.emplace(key, std::move(h)).first->second;
  }

  HookT* find(const std::string& key) {
    auto it = hooks_.find(key);
    return it == hooks_.end() ? nullptr : it->second.get();
  }

  // Applies the interceptor to every keyed hook, present and future.
  void intercept(typename HookT::Interceptor i) {
    for_each_hook([&i](HookT& h) { h.intercept(i); });
    on_create_.push_back([i](HookT& h) { h.intercept(i); });
  }

  std::vector<std::string> keys() const {
    std::vector<std::string> out;
    for (const auto& kv : hooks_) out.push_back(kv.first);
    return out;
  }

  size_t tap_count() const override {
    size_t n = 0;
    for (const auto& kv : hooks_) n += kv.second->tap_count();
    return n;
  }

 protected:
  void install(InterceptorFactory& factory, const std::string& source_label) override {
    InterceptorFactory* f = &factory;
    for_each_hook([f, &source_label](HookT& h) { h.instrument(*f, source_label); });
    on_create_.push_back([f, source_label](HookT& h) { h.instrument(*f, source_label); });
  }

 private:
  template <class F>
  void for_each_hook(F&& fn) {
    for (auto& kv : hooks_) fn(*kv.second);
  }

  std::map<std::string, std::unique_ptr<HookT>> hooks_;
  std::vector<std::function<void(HookT&)>> on_create_;
};

// Named, ordered collection of hooks of mixed signatures.
class HookRegistry {
 public:
  explicit HookRegistry(std::string name) : name_(std::move(name)) {}
  HookRegistry(const HookRegistry&) = delete;
  HookRegistry& operator=(const HookRegistry&) = delete;

  const std::string& name() const { return name_; }

  template <class Sig>
  Hook<Sig>& add(const std::string& hook_name) {
    return emplace<Hook<Sig>>(hook_name);
  }

  template <class Sig>
  HookMap<Sig>& add_map(const std::string& map_name) {
    return emplace<HookMap<Sig>>(map_name);
  }

  // Throws std::out_of_range for an unknown name, std::invalid_argument for a
  // signature mismatch.
  template <class Sig>
  Hook<Sig>& get(const std::string& hook_name) {
    return typed<Hook<Sig>>(hook_name);
  }

  template <class Sig>
  HookMap<Sig>& get_map(const std::string& map_name) {
    return typed<HookMap<Sig>>(map_name);
  }

  HookBase* find(const std::string& hook_name) {
    for (auto& h : hooks_) if (h->name() == hook_name) return h.get();
    return nullptr;
  }

  std::vector<std::string> names() const {
    std::vector<std::string> out;
    out.reserve(hooks_.size());
    for (const auto& h : hooks_) out.push_back(h->name());
    return out;
  }

  template <class F>
  void for_each(F&& fn) {
    for (auto& h : hooks_) fn(*h);
  }

  size_t size() const { return hooks_.size(); }

 private:
  template <class H>
  H& emplace(const std::string& hook_name) {
    if (find(hook_name)) {
      throw std::invalid_argument("registry '" + name_ + "' already has a hook named '" + hook_name + "'");
    }
    auto h = std::make_unique<H>(hook_name);
    H& ref = *h;
    hooks_.push_back(std::move(h));
    return ref;
  }

  template <class H>
  H& typed(const std::string& hook_name) {
    HookBase* b = find(hook_name);
    if (!b) throw std::out_of_range("registry '" + name_ + "' has no hook named '" + hook_name + "'");
    H* h = dynamic_cast<H*>(b);
    if (!h) throw std::invalid_argument("hook '" + hook_name + "' in '" + name_ + "' has a different signature");
    return *h;
  }

  std::string name_;
  std::vector<std::unique_ptr<HookBase>> hooks_;
};

// Source label of each registry reached by intercept_all().
using LabelFn = std::function<std::string(const HookRegistry&)>;

// Instruments every hook of every root registry. Returns the number of hooks
// newly instrumented. An empty label_of labels each registry by its name().
inline size_t intercept_all(const std::vector<HookRegistry*>& roots, InterceptorFactory& factory,
                            const LabelFn& label_of = {}) {
  size_t n = 0;
  for (HookRegistry* r : roots) {
    if (!r) continue;
    const std::string label = label_of ? label_of(*r) : r->name();
    r->for_each([&](HookBase& h) {
      if (h.instrument(factory, label)) ++n;
    });
  }
  return n;
}

inline size_t intercept_all(HookRegistry& registry, InterceptorFactory& factory, const std::string& label) {
  return intercept_all({&registry}, factory, [&label](const HookRegistry&) { return label; });
}

// ---- Host interface -------------------------------------------------------

// Registries the host creates for one compilation.
struct BuildUnit {
  HookRegistry* compilation = nullptr;
  HookRegistry* normal_module_factory = nullptr;
  HookRegistry* context_module_factory = nullptr;
  HookMap<void(HookRegistry&)>* parser = nullptr;  // keyed by module type; called with each new parser's hooks
  std::vector<HookRegistry*> templates;            // labelled by their own name()
};

class BuildHost {
 public:
  virtual ~BuildHost() = default;

  virtual HookRegistry& hooks() = 0;
  virtual HookRegistry& resolver_hooks() = 0;
  virtual Hook<void(BuildUnit&)>& build_unit_hook() = 0;
  virtual Hook<void()>& done_hook() = 0;
};

// ---- CPU profile ----------------------------------------------------------

struct ProfileNode {
  uint32_t id = 0;
  std::string function_name;
  std::string url;
  int line_number = -1;
  int column_number = -1;
  uint32_t hit_count = 0;
  std::vector<uint32_t> children;
};

// Chrome cpuProfile. Times are microseconds on the run's Timebase.
struct ProfileSample {
  uint64_t start_time = 0;
  uint64_t end_time = 0;
  std::vector<ProfileNode> nodes;
  std::vector<uint32_t> samples;
  std::vector<int64_t> time_deltas;
  Json payload;  // the profile as the backend reported it
};

inline void to_json(Json& j, const ProfileNode& n) {
  j = Json::object({
      {"id", n.id},
      {"callFrame", Json::object({
          {"functionName", n.function_name},
          {"scriptId", "0"},
          {"url", n.url},
          {"lineNumber", n.line_number},
          {"columnNumber", n.column_number}})},
      {"hitCount", n.hit_count}});
  if (!n.children.empty()) j["children"] = n.children;
}

inline void from_json(const Json& j, ProfileNode& n) {
  j.at("id").get_to(n.id);
  const Json& frame = j.at("callFrame");
  n.function_name = frame.value("functionName", std::string());
  n.url = frame.value("url", std::string());
  n.line_number = frame.value("lineNumber", -1);
  n.column_number = frame.value("columnNumber", -1);
  n.hit_count = j.value("hitCount", 0u);
  n.children.clear();
  if (auto kids = j.find("children"); kids != j.end()) kids->get_to(n.children);
}

// A sample parsed from a backend serializes back to exactly what the backend sent.
inline void to_json(Json& j, const ProfileSample& s) {
  if (!s.payload.is_null()) {
    j = s.payload;
    return;
  }
  j = Json::object({
      {"nodes", s.nodes},
      {"startTime", s.start_time},
      {"endTime", s.end_time},
      {"samples", s.samples},
      {"timeDeltas", s.time_deltas}});
}

// Throws std::invalid_argument when startTime/endTime are missing or inverted, and
// nlohmann::json::exception when a node is malformed.
inline void from_json(const Json& j, ProfileSample& s) {
  const auto start = j.find("startTime");
  const auto end = j.find("endTime");
  if (start == j.end() || !start->is_number() || end == j.end() || !end->is_number()) {
    throw std::invalid_argument("profile has no numeric startTime/endTime");
  }
  s = ProfileSample{};
  s.start_time = (uint64_t)std::max<int64_t>(0, start->get<int64_t>());
  s.end_time = (uint64_t)std::max<int64_t>(0, end->get<int64_t>());
  if (s.end_time < s.start_time) throw std::invalid_argument("profile ends before it starts");

  if (auto it = j.find("nodes"); it != j.end()) it->get_to(s.nodes);
  if (auto it = j.find("samples"); it != j.end()) it->get_to(s.samples);
  if (auto it = j.find("timeDeltas"); it != j.end()) it->get_to(s.time_deltas);
  s.payload = j;
}

// Folds root-to-leaf stacks into a cpuProfile node tree. Node 1 is "(root)".
class ProfileBuilder {
 public:
  struct Frame {
    std::string function_name;
    std::string url;
    int line_number = -1;
    int column_number = -1;
  };

  ProfileBuilder() {
    ProfileNode root;
    root.id = 1;
    root.function_name = "(root)";
    nodes_.push_back(std::move(root));
  }

  // stack is ordered root first. An empty stack counts as "(program)".
  void add_sample(uint64_t ts_us, const std::vector<Frame>& stack) {
    uint32_t node = 1;
    if (stack.empty()) {
      node = child_of(node, Frame{"(program)", "", -1, -1});
    } else {
      for (const Frame& f : stack) node = child_of(node, f);
    }
    nodes_[node - 1].hit_count++;
    samples_.push_back(node);
    stamps_.push_back(ts_us);
  }

  size_t sample_count() const { return samples_.size(); }

  ProfileSample finish(uint64_t start_time, uint64_t end_time) const {
    ProfileSample s;
    s.start_time = start_time;
    s.end_time = std::max(start_time, end_time);
    s.nodes = nodes_;
    s.samples = samples_;
    uint64_t prev = start_time;
    for (uint64_t ts : stamps_) {
      s.time_deltas.push_back((int64_t)ts - (int64_t)prev);
      prev = ts;
    }
    return s;
  }

 private:
  uint32_t child_of(uint32_t parent, const Frame& f) {
    auto key = std::make_tuple(parent, f.function_name, f.url, f.line_number);
    auto it = index_.find(key);
    if (it != index_.end()) return it->second;
    ProfileNode n;
    n.id = (uint32_t)nodes_.size() + 1;
    n.function_name = f.function_name;
    n.url = f.url;
    n.line_number = f.line_number;
    n.column_number = f.column_number;
    nodes_.push_back(std::move(n));
    nodes_[parent - 1].children.push_back((uint32_t)nodes_.size());
    index_.emplace(std::move(key), (uint32_t)nodes_.size());
    return (uint32_t)nodes_.size();
  }

  std::vector<ProfileNode> nodes_;
  std::map<std::tuple<uint32_t, std::string, std::string, int>, uint32_t> index_;
  std::vector<uint32_t> samples_;
  std::vector<uint64_t> stamps_;
};

// ---- Sampling backend -----------------------------------------------------

// Inspector-style sampling profiler. post() answers through the callback, either
// synchronously or later on the caller's loop; a non-null error means failure.
class SamplingBackend {
 public:
  using PostCallback = std::function<void(std::exception_ptr, Json)>;

  virtual ~SamplingBackend() = default;
  virtual void connect() = 0;
  virtual void post(const std::string& method, const Json& params, PostCallback done) = 0;
  virtual void disconnect() = 0;
};

// Owns the backend for one run. Failures degrade to a no-op session with a warning.
class ProfilerSession {
 public:
  explicit ProfilerSession(std::unique_ptr<SamplingBackend> backend,
                           uint32_t interval_us = HOOKTRACE_SAMPLING_INTERVAL_US)
  : backend_(std::move(backend)), interval_us_(interval_us) {}

  ~ProfilerSession() {
    if (!destroyed_) destroy();
  }

  ProfilerSession(const ProfilerSession&) = delete;
  ProfilerSession& operator=(const ProfilerSession&) = delete;

  Promise<void> start() {
    if (!backend_) {
      HOOKTRACE_LOG_DEBUG("no sampling backend, CPU profile disabled");
      return Promise<void>::ready();
    }
    try {
      backend_->connect();
      connected_ = true;
    } catch (const std::exception& e) {
      HOOKTRACE_LOG_WARN("sampling backend unavailable: {}", e.what());
      return Promise<void>::ready();
    }
    return send("Profiler.enable")
        .then([this](const Json&) {
          return send("Profiler.setSamplingInterval", Json::object({{"interval", interval_us_}}));
        })
        .then([this](const Json&) { return send("Profiler.start"); })
        .then([this](const Json&) { started_ = true; })
        .recover([](std::exception_ptr e) {
          HOOKTRACE_LOG_WARN("CPU profiler failed to start: {}", describe(e));
        });
  }

  // Empty when nothing was started or the backend failed.
  Promise<std::optional<ProfileSample>> stop() {
    using Result = std::optional<ProfileSample>;
    if (!started_) return Promise<Result>::ready(std::nullopt);
    started_ = false;
    return send("Profiler.stop")
        .then([](const Json& r) -> Result {
          const auto profile = r.find("profile");
          if (profile == r.end()) throw std::invalid_argument("Profiler.stop returned no profile");
          return profile->get<ProfileSample>();
        })
        .recover([](std::exception_ptr e) -> Result {
          HOOKTRACE_LOG_WARN("CPU profile lost: {}", describe(e));
          return std::nullopt;
        });
  }

  // Disconnects the backend the first time; later calls do nothing.
  Promise<void> destroy() {
    if (destroyed_) return Promise<void>::ready();
    destroyed_ = true;
    started_ = false;
    if (backend_ && connected_) {
      connected_ = false;
      try {
        backend_->disconnect();
      } catch (const std::exception& e) {
        HOOKTRACE_LOG_WARN("sampling backend disconnect failed: {}", e.what());
      }
    }
    backend_.reset();
    return Promise<void>::ready();
  }

  bool has_backend() const { return backend_ != nullptr; }
  bool active() const { return started_; }
  bool destroyed() const { return destroyed_; }
  uint32_t interval_us() const { return interval_us_; }

 private:
  Promise<Json> send(const std::string& method, Json params = Json()) {
    Promise<Json> p;
    try {
      backend_->post(method, params, [p](std::exception_ptr e, Json result) mutable {
        if (e) p.reject(e); else p.resolve(std::move(result));
      });
    } catch (...) {
      p.reject(std::current_exception());
    }
    return p;
  }

  std::unique_ptr<SamplingBackend> backend_;
  uint32_t interval_us_;
  bool connected_ = false;
  bool started_ = false;
  bool destroyed_ = false;
};

// ---- perf_event sampler (Linux) -------------------------------------------
#if defined(__linux__)

namespace detail {

inline std::string demangle(const char* name) {
  int status = 0;
  char* d = abi::__cxa_demangle(name, nullptr, nullptr, &status);
  std::string out = (status == 0 && d) ? d : name;
  std::free(d);
  return out;
}

inline ProfileBuilder::Frame resolve_frame(uintptr_t addr) {
  ProfileBuilder::Frame f;
  Dl_info info{};
  if (dladdr(reinterpret_cast<void*>(addr), &info) && info.dli_sname) {
    f.function_name = demangle(info.dli_sname);
  } else {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "0x%" PRIxPTR, addr);
    f.function_name = buf;
  }
  if (info.dli_fname) {
    const char* base = std::strrchr(info.dli_fname, '/');
    f.url = base ? base + 1 : info.dli_fname;
  }
  return f;
}

} // namespace detail

// CPU sampler on perf_event_open(PERF_COUNT_SW_TASK_CLOCK) for the thread that starts
// it, which is the thread running the Loop. Other threads are not sampled.
// Speaks the Profiler.* methods ProfilerSession sends.
class PerfSampler : public SamplingBackend {
 public:
  PerfSampler() = default;
  ~PerfSampler() override { disconnect(); }

  PerfSampler(const PerfSampler&) = delete;
  PerfSampler& operator=(const PerfSampler&) = delete;

  // Probes that the kernel lets this thread sample itself.
  void connect() override {
    perf_event_attr attr = make_attr(interval_us_);
    long fd = open_event(attr);
    if (fd < 0) {
      throw std::system_error(errno, std::generic_category(), "perf_event_open");
    }
    ::close((int)fd);
    connected_ = true;
  }

  void post(const std::string& method, const Json& params, PostCallback done) override {
    Json result = Json::object();
    try {
      if (!connected_) throw std::logic_error("perf sampler is not connected");
      if (method == "Profiler.enable") {
        enabled_ = true;
      } else if (method == "Profiler.setSamplingInterval") {
        const auto interval = params.find("interval");
        if (interval == params.end() || !interval->is_number() || interval->get<int64_t>() <= 0) {
          throw std::invalid_argument("Profiler.setSamplingInterval needs a positive interval");
        }
        interval_us_ = interval->get<uint32_t>();
      } else if (method == "Profiler.start") {
        if (!enabled_) throw std::logic_error("Profiler.start before Profiler.enable");
        start_sampling();
      } else if (method == "Profiler.stop") {
        result["profile"] = stop_sampling();
      } else {
        throw std::invalid_argument("unsupported method " + method);
      }
    } catch (...) {
      done(std::current_exception(), Json());
      return;
    }
    done(nullptr, std::move(result));
  }

  void disconnect() noexcept override {
    halt();
    connected_ = false;
    enabled_ = false;
  }

 private:
  static perf_event_attr make_attr(uint32_t interval_us) {
    perf_event_attr attr{};
    attr.type = PERF_TYPE_SOFTWARE;
    attr.size = sizeof(attr);
    attr.config = PERF_COUNT_SW_TASK_CLOCK;
    attr.sample_period = (uint64_t)interval_us * 1000;  // task clock counts ns
    attr.sample_type = PERF_SAMPLE_TID | PERF_SAMPLE_TIME | PERF_SAMPLE_CALLCHAIN;
    attr.disabled = 1;
    attr.exclude_kernel = 1;
    attr.exclude_hv = 1;
    attr.use_clockid = 1;
    attr.clockid = CLOCK_MONOTONIC;
    return attr;
  }

  static long open_event(perf_event_attr& attr) {
    return ::syscall(SYS_perf_event_open, &attr, 0 /*calling thread*/, -1 /*any cpu*/, -1, PERF_FLAG_FD_CLOEXEC);
  }

  void start_sampling() {
    if (running_) throw std::logic_error("profiler already started");
    perf_event_attr attr = make_attr(interval_us_);
    long fd = open_event(attr);
    if (fd < 0) throw std::system_error(errno, std::generic_category(), "perf_event_open");
    fd_ = (int)fd;

    page_size_ = (size_t)::sysconf(_SC_PAGESIZE);
    ring_len_ = page_size_ * (1 + HOOKTRACE_RING_PAGES);
    ring_ = ::mmap(nullptr, ring_len_, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, 0);
    if (ring_ == MAP_FAILED) {
      const int err = errno;
      ring_ = nullptr;
      ::close(fd_);
      fd_ = -1;
      throw std::system_error(err, std::generic_category(), "mmap perf ring");
    }

    raw_.clear();
    start_us_ = now_us();
    ::ioctl(fd_, PERF_EVENT_IOC_RESET, 0);
    if (::ioctl(fd_, PERF_EVENT_IOC_ENABLE, 0) != 0) {
      const int err = errno;
      release();
      throw std::system_error(err, std::generic_category(), "PERF_EVENT_IOC_ENABLE");
    }
    running_ = true;
    reader_ = std::thread([this] {
      while (running_.load(std::memory_order_relaxed)) {
        {
          std::lock_guard<std::mutex> lock(mu_);
          drain();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
    });
    HOOKTRACE_LOG_DEBUG("perf sampler started, period {} us", interval_us_);
  }

  ProfileSample stop_sampling() {
    if (!running_) throw std::logic_error("profiler not started");
    const uint64_t end_us = now_us();
    halt();

    ProfileBuilder builder;
    std::map<uint64_t, ProfileBuilder::Frame> symbols;
    std::vector<ProfileBuilder::Frame> stack;
    for (const RawSample& r : raw_) {
      stack.clear();
      // callchain is leaf first; return addresses point after the call
      for (size_t i = r.ips.size(); i-- > 0;) {
        const uint64_t ip = (i == 0) ? r.ips[i] : r.ips[i] - 1;
        auto it = symbols.find(ip);
        if (it == symbols.end()) it = symbols.emplace(ip, detail::resolve_frame((uintptr_t)ip)).first;
        stack.push_back(it->second);
      }
      builder.add_sample(Timebase::from_monotonic_ns(r.time_ns), stack);
    }
    HOOKTRACE_LOG_DEBUG("perf sampler stopped, {} samples", builder.sample_count());
    raw_.clear();
    return builder.finish(start_us_, end_us);
  }

  // Stops the reader, takes the last records and releases the event.
  void halt() noexcept {
    if (fd_ >= 0) ::ioctl(fd_, PERF_EVENT_IOC_DISABLE, 0);
    if (running_) {
      running_ = false;
      if (reader_.joinable()) reader_.join();
      std::lock_guard<std::mutex> lock(mu_);
      drain();
    }
    release();
  }

  void release() noexcept {
    if (ring_) { ::munmap(ring_, ring_len_); ring_ = nullptr; }
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
  }

  // Copies len bytes at ring offset pos, handling wrap-around.
  void copy_ring(uint64_t pos, void* out, size_t len) const {
    const uint8_t* data = static_cast<const uint8_t*>(ring_) + page_size_;
    const size_t size = page_size_ * HOOKTRACE_RING_PAGES;
    uint8_t* dst = static_cast<uint8_t*>(out);
    for (size_t i = 0; i < len; ++i) dst[i] = data[(pos + i) % size];
  }

  // Moves complete sample records from the ring into raw_. Caller holds mu_.
  void drain() {
    if (!ring_) return;
    auto* meta = static_cast<perf_event_mmap_page*>(ring_);
    const uint64_t head = __atomic_load_n(&meta->data_head, __ATOMIC_ACQUIRE);
    uint64_t tail = meta->data_tail;
    std::vector<uint8_t> rec;
    while (tail < head) {
      perf_event_header h;
      copy_ring(tail, &h, sizeof(h));
      if (h.size < sizeof(h)) break;
      if (h.type == PERF_RECORD_SAMPLE) {
        rec.resize(h.size);
        copy_ring(tail, rec.data(), h.size);
        parse_sample(rec.data() + sizeof(h), h.size - sizeof(h));
      }
      tail += h.size;
    }
    __atomic_store_n(&meta->data_tail, tail, __ATOMIC_RELEASE);
  }

  // Layout for TID|TIME|CALLCHAIN: u32 pid, u32 tid, u64 time, u64 nr, u64 ips[nr].
  void parse_sample(const uint8_t* p, size_t len) {
    if (len < 3 * sizeof(uint64_t)) return;
    RawSample s;
    std::memcpy(&s.time_ns, p + 8, sizeof(uint64_t));
    uint64_t nr = 0;
    std::memcpy(&nr, p + 16, sizeof(uint64_t));
    const size_t avail = (len - 24) / sizeof(uint64_t);
    if (nr > avail) nr = avail;
    for (uint64_t i = 0; i < nr; ++i) {
      uint64_t ip = 0;
      std::memcpy(&ip, p + 24 + i * sizeof(uint64_t), sizeof(uint64_t));
      if (ip >= PERF_CONTEXT_MAX) continue;  // context markers, not addresses
      s.ips.push_back(ip);
    }
    raw_.push_back(std::move(s));
  }

  struct RawSample {
    uint64_t time_ns = 0;
    std::vector<uint64_t> ips;  // leaf first
  };

  uint32_t interval_us_ = HOOKTRACE_SAMPLING_INTERVAL_US;
  bool connected_ = false;
  bool enabled_ = false;
  int fd_ = -1;
  void* ring_ = nullptr;
  size_t ring_len_ = 0;
  size_t page_size_ = 4096;
  uint64_t start_us_ = 0;
  std::atomic<bool> running_{false};
  std::thread reader_;
  std::mutex mu_;
  std::vector<RawSample> raw_;
};

#endif // __linux__

// Built-in backend for this platform, or nullptr.
inline std::unique_ptr<SamplingBackend> default_backend() {
#if defined(__linux__)
  return std::make_unique<PerfSampler>();
#else
  return nullptr;
#endif
}

// ---- Profiling plugin -----------------------------------------------------

struct Config {
  std::string output_path = HOOKTRACE_DEFAULT_PATH;
  Format format = Format::Array;
  uint32_t sampling_interval_us = HOOKTRACE_SAMPLING_INTERVAL_US;
  uint32_t drain_delay_ms = HOOKTRACE_DRAIN_DELAY_MS;
  std::string frame_url = "webpack";
  std::vector<std::string> parser_module_types = {
      "javascript/auto", "javascript/esm", "json", "webassembly/experimental"};
  // Unset leaves the "hooktrace" logger at whatever level it already has.
  std::optional<spdlog::level::level_enum> log_level;
};

enum class State : uint8_t { Idle, Profiling, AwaitingCompletion, Draining, Finalized };

inline const char* state_name(State s) {
  switch (s) {
    case State::Idle:               return "idle";
    case State::Profiling:          return "profiling";
    case State::AwaitingCompletion: return "awaiting-completion";
    case State::Draining:           return "draining";
    case State::Finalized:          return "finalized";
  }
  return "unknown";
}

// Instruments a BuildHost, samples the CPU for the build and writes the merged trace
// once the host signals done.
class ProfilingPlugin {
 public:
  static constexpr const char* kTapName = "ProfilingPlugin";

  ProfilingPlugin(Loop& loop, Config config = Config{},
                  std::unique_ptr<SamplingBackend> backend = default_backend())
  : loop_(loop),
    config_(std::move(config)),
    profiler_(std::move(backend), config_.sampling_interval_us) {
    if (config_.log_level) logger()->set_level(*config_.log_level);
  }

  ProfilingPlugin(const ProfilingPlugin&) = delete;
  ProfilingPlugin& operator=(const ProfilingPlugin&) = delete;

  // Resolves once the host's hooks are instrumented.
  Promise<void> apply(BuildHost& host) {
    if (state_ != State::Idle) throw std::logic_error("ProfilingPlugin applied twice");
    log_ = std::make_unique<TraceLog>(config_.output_path, config_.format, config_.frame_url);
    factory_ = std::make_unique<InterceptorFactory>(*log_);
    state_ = State::Profiling;
    BuildHost* h = &host;
    return profiler_.start().then([this, h] {
      install(*h);
      state_ = State::AwaitingCompletion;
    });
  }

  // Instruments the registries of a freshly created build unit.
  void instrument_build_unit(BuildUnit& unit) {
    if (!factory_ || state_ == State::Finalized) return;
    std::map<const HookRegistry*, std::string> labels;
    std::vector<HookRegistry*> roots;
    auto add = [&](HookRegistry* r, const char* label) {
      if (!r) return;
      roots.push_back(r);
      if (label) labels[r] = label;
    };
    add(unit.compilation, "Compilation");
    add(unit.normal_module_factory, "Normal Module Factory");
    add(unit.context_module_factory, "Context Module Factory");
    for (HookRegistry* t : unit.templates) add(t, nullptr);
    intercept_all(roots, *factory_, [&labels](const HookRegistry& r) {
      auto it = labels.find(&r);
      return it != labels.end() ? it->second : r.name();
    });

    // A host may hand the same parser map to several build units.
    if (unit.parser && tapped_parsers_.insert(unit.parser).second) {
      for (const std::string& type : config_.parser_module_types) {
        unit.parser->for_key(type).tap(kTapName, [this](HookRegistry& parser) {
          intercept_all(parser, *factory_, "Parser");
        });
      }
    }
  }

  State state() const { return state_; }
  Promise<void> finished() const { return finished_; }
  ProfilerSession& profiler() { return profiler_; }
  const Config& config() const { return config_; }

  TraceLog& log() {
    if (!log_) throw std::logic_error("ProfilingPlugin has not been applied");
    return *log_;
  }

 private:
  void install(BuildHost& host) {
    HookRegistry* compiler = &host.hooks();
    HookRegistry* resolver = &host.resolver_hooks();
    const size_t n = intercept_all({compiler, resolver}, *factory_, [compiler](const HookRegistry& r) {
      return &r == compiler ? std::string("Compiler") : std::string("Resolver");
    });
    HOOKTRACE_LOG_DEBUG("instrumented {} compiler/resolver hooks", n);

    host.build_unit_hook().tap(kTapName, [this](BuildUnit& unit) { instrument_build_unit(unit); });
    host.done_hook().tap(kTapName, [this] { on_done(); });
  }

  void on_done() {
    if (state_ != State::AwaitingCompletion || drain_scheduled_) return;
    drain_scheduled_ = true;
    HOOKTRACE_LOG_DEBUG("build done, draining in {} ms", config_.drain_delay_ms);
    loop_.post_after(config_.drain_delay_ms, [this] { drain(); });
  }

  void drain() {
    state_ = State::Draining;
    profiler_.stop()
        .then([this](const std::optional<ProfileSample>& sample) {
          if (sample) merge(*sample);
          else HOOKTRACE_LOG_DEBUG("no CPU profile collected");
        })
        .recover([](std::exception_ptr e) {
          HOOKTRACE_LOG_WARN("CPU profile not merged: {}", describe(e));
        })
        .then([this] { return profiler_.destroy(); })
        .then([this] {
          state_ = State::Finalized;
          log_->flush();
        })
        .recover([this](std::exception_ptr e) {
          state_ = State::Finalized;
          HOOKTRACE_LOG_ERROR("writing trace to {} failed: {}", config_.output_path, describe(e));
          std::rethrow_exception(e);
        })
        .forward_to(finished_);
  }

  // Frames the profile window and attaches the profile itself.
  void merge(const ProfileSample& sample) {
    const uint64_t start = sample.start_time;
    const uint64_t end = std::max(sample.start_time, sample.end_time);

    TraceEvent task;
    task.name = "TaskQueueManager::ProcessTaskFromWorkQueue";
    task.id = log_->next_id();
    task.categories = {"toplevel"};
    task.ts_us = start;
    task.dur_us = end - start;
    task.args = Json::object({{"src_file", "../../ipc/ipc_moji_bootstrap.cc"}, {"src_func", "Accept"}});
    log_->complete(std::move(task));

    TraceEvent script;
    script.name = "EvaluateScript";
    script.id = log_->next_id();
    script.categories = {"devtools.timeline"};
    script.ts_us = start;
    script.dur_us = end - start;
    script.args = Json::object({
        {"data", Json::object({
            {"url", config_.frame_url},
            {"lineNumber", 1},
            {"columnNumber", 1},
            {"frame", "0xFFF"}})}});
    log_->complete(std::move(script));

    TraceEvent profile;
    profile.name = "CpuProfile";
    profile.id = log_->next_id();
    profile.categories = {"disabled-by-default-devtools.timeline"};
    profile.ts_us = end;
    profile.args = Json::object({{"data", Json::object({{"cpuProfile", Json(sample)}})}});
    log_->instant(std::move(profile));

    HOOKTRACE_LOG_INFO("merged CPU profile: {} nodes, {} samples, {} us",
                       sample.nodes.size(), sample.samples.size(), end - start);
  }

  Loop& loop_;
  Config config_;
  ProfilerSession profiler_;
  std::unique_ptr<TraceLog> log_;
  std::unique_ptr<InterceptorFactory> factory_;
  std::set<const HookMap<void(HookRegistry&)>*> tapped_parsers_;
  State state_ = State::Idle;
  bool drain_scheduled_ = false;
  Promise<void> finished_;
};

} // namespace hooktrace

#endif // HOOKTRACE_HPP_INCLUDED
