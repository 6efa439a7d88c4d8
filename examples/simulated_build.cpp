// Build: c++ -std=c++17 -O2 -pthread -rdynamic examples/simulated_build.cpp -I. -lspdlog -lfmt -lz -ldl -o ex_simulated_build
// Drives a small bundler-shaped host through the profiling plugin and writes
// ex_simulated_build.json. Open it in Perfetto or the DevTools performance panel.
#include "hooktrace.hpp"

#include <chrono>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

void busy_for(std::chrono::microseconds d) {
  const auto until = std::chrono::steady_clock::now() + d;
  volatile uint64_t sink = 0;
  while (std::chrono::steady_clock::now() < until) sink += 1;
}

class Bundler : public hooktrace::BuildHost {
 public:
  explicit Bundler(hooktrace::Loop& loop)
  : loop_(loop),
    compiler_("Compiler"),
    resolver_("ResolverFactory"),
    compilation_("Compilation"),
    nmf_("NormalModuleFactory"),
    cmf_("ContextModuleFactory"),
    main_template_("MainTemplate"),
    parser_("JavascriptParser") {
    run_ = &compiler_.add<void(std::string)>("run");
    make_ = &compiler_.add<int(int)>("make");
    emit_ = &compiler_.add<void(std::string)>("emit");
    unit_hook_ = &compiler_.add<void(hooktrace::BuildUnit&)>("compilation");
    done_ = &compiler_.add<void()>("done");
    resolve_ = &resolver_.add<std::string(std::string)>("resolve");
    seal_ = &compilation_.add<void()>("seal");
    parser_map_ = &nmf_.add_map<void(hooktrace::HookRegistry&)>("parser");
    context_ = &cmf_.add<void()>("contextModuleFiles");
    render_ = &main_template_.add<void()>("render");
    statement_ = &parser_.add<void(std::string)>("statement");

    run_->tap("CachePlugin", [](std::string) { busy_for(300us); });
    make_->tap_async("EntryPlugin", [this](int n, hooktrace::Callback<int> cb) {
      loop_.post_after(3, [cb, n] { busy_for(500us); cb(nullptr, n * 2); });
    });
    resolve_->tap_promise("AliasPlugin", [this](std::string req) {
      return loop_.delay(1).then([req] { return "/src/" + req + ".js"; });
    });
    seal_->tap("SplitChunksPlugin", [] { busy_for(1ms); });
    render_->tap("BannerPlugin", [] { busy_for(200us); });
    statement_->tap("HarmonyImportPlugin", [](std::string) { busy_for(50us); });
    emit_->tap_async("AssetEmitter", [this](std::string, hooktrace::Callback<void> cb) {
      loop_.post_after(2, [cb] { cb(nullptr); });
    });
  }

  hooktrace::HookRegistry& hooks() override { return compiler_; }
  hooktrace::HookRegistry& resolver_hooks() override { return resolver_; }
  hooktrace::Hook<void(hooktrace::BuildUnit&)>& build_unit_hook() override { return *unit_hook_; }
  hooktrace::Hook<void()>& done_hook() override { return *done_; }

  // Runs the lifecycle on the loop; "done" fires after the last asset is written.
  void run() {
    run_->call("main");
    make_->call_async(21, [this](std::exception_ptr e, int modules) {
      if (e) {
        HOOKTRACE_LOG_ERROR("make failed: {}", hooktrace::describe(e));
        return;
      }
      hooktrace::BuildUnit unit;
      unit.compilation = &compilation_;
      unit.normal_module_factory = &nmf_;
      unit.context_module_factory = &cmf_;
      unit.parser = parser_map_;
      unit.templates = {&main_template_};
      unit_hook_->call(unit);

      parser_map_->for_key("javascript/auto").call(parser_);
      for (int i = 0; i < modules; ++i) statement_->call("import m" + std::to_string(i));
      context_->call();

      resolve_->promise("index")
          .then([this](const std::string& path) {
            HOOKTRACE_LOG_INFO("resolved entry to {}", path);
            seal_->call();
            render_->call();
            emit_->call_async("main.js", [this](std::exception_ptr err) {
              if (err) HOOKTRACE_LOG_ERROR("emit failed: {}", hooktrace::describe(err));
              done_->call();
            });
          });
    });
  }

 private:
  hooktrace::Loop& loop_;
  hooktrace::HookRegistry compiler_, resolver_, compilation_, nmf_, cmf_, main_template_, parser_;
  hooktrace::Hook<void(std::string)>* run_;
  hooktrace::Hook<int(int)>* make_;
  hooktrace::Hook<void(std::string)>* emit_;
  hooktrace::Hook<void(hooktrace::BuildUnit&)>* unit_hook_;
  hooktrace::Hook<void()>* done_;
  hooktrace::Hook<std::string(std::string)>* resolve_;
  hooktrace::Hook<void()>* seal_;
  hooktrace::HookMap<void(hooktrace::HookRegistry&)>* parser_map_;
  hooktrace::Hook<void()>* context_;
  hooktrace::Hook<void()>* render_;
  hooktrace::Hook<void(std::string)>* statement_;
};

} // namespace

int main() {
  hooktrace::Loop loop;
  hooktrace::Config cfg;
  cfg.output_path = "ex_simulated_build.json";
  cfg.drain_delay_ms = 50;
  cfg.log_level = spdlog::level::debug;

  Bundler bundler(loop);
  hooktrace::ProfilingPlugin plugin(loop, cfg);
  plugin.apply(bundler).then([&bundler] { bundler.run(); });
  loop.run();

  hooktrace::Promise<void> finished = plugin.finished();
  if (!finished.fulfilled()) {
    HOOKTRACE_LOG_ERROR("trace not written: {}",
                        finished.rejected() ? hooktrace::describe(finished.error()) : "still pending");
    return 1;
  }
  HOOKTRACE_LOG_INFO("wrote {} events to {}", plugin.log().events().size(), cfg.output_path);
  return 0;
}
