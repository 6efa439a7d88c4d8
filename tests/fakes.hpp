// Scripted collaborators shared by the hooktrace tests.

#pragma once

#include "hooktrace.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace fakes {

// Sampling backend that records every call and answers from a script.
// With a loop, answers are delivered as loop tasks; otherwise inline.
class FakeBackend : public hooktrace::SamplingBackend {
 public:
  struct Record {
    int connects = 0;
    int disconnects = 0;
    std::vector<std::string> methods;
    std::vector<hooktrace::Json> params;
  };

  explicit FakeBackend(std::shared_ptr<Record> record, hooktrace::Loop* loop = nullptr)
  : record_(std::move(record)), loop_(loop) {}

  // Method that answers with an error instead of a result.
  std::string fail_method;
  bool fail_connect = false;
  hooktrace::Json profile;  // returned by Profiler.stop

  void connect() override {
    record_->connects++;
    if (fail_connect) throw std::runtime_error("inspector unavailable");
  }

  void post(const std::string& method, const hooktrace::Json& params, PostCallback done) override {
    record_->methods.push_back(method);
    record_->params.push_back(params);
    std::exception_ptr err;
    hooktrace::Json result = hooktrace::Json::object();
    if (method == fail_method) {
      err = std::make_exception_ptr(std::runtime_error(method + " refused"));
    } else if (method == "Profiler.stop") {
      result["profile"] = profile;
    }
    if (loop_) {
      loop_->post([done, err, result] { done(err, result); });
    } else {
      done(err, result);
    }
  }

  void disconnect() override { record_->disconnects++; }

 private:
  std::shared_ptr<Record> record_;
  hooktrace::Loop* loop_;
};

// The profile from the merge scenario: 1000 us .. 5000 us.
inline hooktrace::Json sample_profile() {
  using hooktrace::Json;
  return Json::object({
      {"nodes", Json::array({
          Json::object({
              {"id", 1},
              {"callFrame", Json::object({{"functionName", "(root)"}, {"url", ""},
                                           {"lineNumber", -1}, {"columnNumber", -1}})},
              {"hitCount", 0},
              {"children", Json::array({2})}}),
          Json::object({
              {"id", 2},
              {"callFrame", Json::object({{"functionName", "compile"}, {"url", "build.js"},
                                           {"lineNumber", 10}, {"columnNumber", 4}})},
              {"hitCount", 3}})})},
      {"startTime", 1000},
      {"endTime", 5000},
      {"samples", Json::array({2, 2, 2})},
      {"timeDeltas", Json::array({100, 1000, 1000})}});
}

// A build host with one hook of each tap style per registry and a build() that
// drives the usual lifecycle: run, build unit, parser creation, done.
class FakeHost : public hooktrace::BuildHost {
 public:
  FakeHost()
  : compiler_("Compiler"),
    resolver_("ResolverFactory"),
    compilation_("Compilation"),
    nmf_("NormalModuleFactory"),
    cmf_("ContextModuleFactory"),
    main_template_("MainTemplate"),
    chunk_template_("ChunkTemplate"),
    parser_hooks_("Parser") {
    run_ = &compiler_.add<int(int)>("run");
    emit_ = &compiler_.add<void(std::string)>("emit");
    build_unit_ = &compiler_.add<void(hooktrace::BuildUnit&)>("compilation");
    done_ = &compiler_.add<void()>("done");
    resolve_ = &resolver_.add<void(std::string)>("resolver");
    seal_ = &compilation_.add<void()>("seal");
    before_resolve_ = &nmf_.add<void(std::string)>("beforeResolve");
    parser_map_ = &nmf_.add_map<void(hooktrace::HookRegistry&)>("parser");
    context_ = &cmf_.add<void()>("contextModuleFiles");
    render_ = &main_template_.add<void()>("render");
    chunk_render_ = &chunk_template_.add<void()>("render");
    statement_ = &parser_hooks_.add<void(std::string)>("statement");
  }

  hooktrace::HookRegistry& hooks() override { return compiler_; }
  hooktrace::HookRegistry& resolver_hooks() override { return resolver_; }
  hooktrace::Hook<void(hooktrace::BuildUnit&)>& build_unit_hook() override { return *build_unit_; }
  hooktrace::Hook<void()>& done_hook() override { return *done_; }

  hooktrace::BuildUnit unit() {
    hooktrace::BuildUnit u;
    u.compilation = &compilation_;
    u.normal_module_factory = &nmf_;
    u.context_module_factory = &cmf_;
    u.parser = parser_map_;
    u.templates = {&main_template_, &chunk_template_};
    return u;
  }

  // Fires the lifecycle with the host's own taps installed beforehand.
  void build() {
    run_->call(21);
    hooktrace::BuildUnit u = unit();
    build_unit_->call(u);
    parser_map_->for_key("javascript/auto").call(parser_hooks_);
    statement_->call("import x");
    seal_->call();
    render_->call();
    emit_->call("bundle.js");
    done_->call();
  }

  void tap_defaults() {
    run_->tap("build", [](int x) { return x * 2; });
    emit_->tap("write-assets", [](std::string) {});
    resolve_->tap("resolve-paths", [](std::string) {});
    seal_->tap("optimize", [] {});
    render_->tap("render-main", [] {});
    statement_->tap("harmony", [](std::string) {});
  }

  hooktrace::HookRegistry compiler_, resolver_, compilation_, nmf_, cmf_, main_template_, chunk_template_,
      parser_hooks_;
  hooktrace::Hook<int(int)>* run_;
  hooktrace::Hook<void(std::string)>* emit_;
  hooktrace::Hook<void(hooktrace::BuildUnit&)>* build_unit_;
  hooktrace::Hook<void()>* done_;
  hooktrace::Hook<void(std::string)>* resolve_;
  hooktrace::Hook<void()>* seal_;
  hooktrace::Hook<void(std::string)>* before_resolve_;
  hooktrace::HookMap<void(hooktrace::HookRegistry&)>* parser_map_;
  hooktrace::Hook<void()>* context_;
  hooktrace::Hook<void()>* render_;
  hooktrace::Hook<void()>* chunk_render_;
  hooktrace::Hook<void(std::string)>* statement_;
};

inline std::string read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline size_t count_of(const std::string& haystack, const std::string& needle) {
  size_t n = 0;
  for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) ++n;
  return n;
}

// Events of the log with the given name, in log order.
inline std::vector<const hooktrace::TraceEvent*> named(const hooktrace::TraceLog& log, const std::string& name) {
  std::vector<const hooktrace::TraceEvent*> out;
  for (const auto& e : log.events()) if (e.name == name) out.push_back(&e);
  return out;
}

inline std::string temp_path(const std::string& leaf) {
  return "hooktrace_test_out/" + leaf;
}

} // namespace fakes
