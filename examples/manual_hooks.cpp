// Build: c++ -std=c++17 -O2 -pthread examples/manual_hooks.cpp -I. -lspdlog -lfmt -lz -ldl -o ex_manual_hooks
// Instruments a registry without the plugin and writes the same spans in all three
// output layouts: ex_hooks_array.json, ex_hooks_object.json, ex_hooks_lines.jsonl.
#include "hooktrace.hpp"

#include <string>

namespace {

struct Output {
  const char* path;
  hooktrace::Format format;
};

bool trace_into(const Output& out) {
  hooktrace::Loop loop;
  hooktrace::HookRegistry reg("Compiler");
  auto& compile = reg.add<int(int)>("compile");
  auto& optimize = reg.add<void(std::string)>("optimize");
  auto& emit = reg.add<std::string(std::string)>("emit");

  compile.tap("count-modules", [](int n) { return n + 1; });
  compile.tap_async("load-cache", [&loop](int n, hooktrace::Callback<int> cb) {
    loop.post_after(2, [cb, n] { cb(nullptr, n * 10); });
  });
  optimize.tap("minify", [](std::string) {});
  optimize.tap("tree-shake", [](std::string chunk) {
    if (chunk.empty()) throw std::invalid_argument("empty chunk");
  });
  emit.tap_promise("write", [&loop](std::string name) {
    return loop.delay(1).then([name] { return "dist/" + name; });
  });

  hooktrace::TraceLog log(out.path, out.format);
  hooktrace::InterceptorFactory factory(log);
  const size_t n = hooktrace::intercept_all(reg, factory, "Compiler");
  HOOKTRACE_LOG_DEBUG("{} hooks instrumented", n);

  compile.call_async(4, [&](std::exception_ptr e, int modules) {
    if (e) {
      HOOKTRACE_LOG_ERROR("compile failed: {}", hooktrace::describe(e));
      return;
    }
    optimize.call("main");
    try {
      optimize.call("");
    } catch (const std::invalid_argument& err) {
      HOOKTRACE_LOG_INFO("optimize rejected a chunk: {}", err.what());
    }
    emit.promise("main.js").then([modules](const std::string& path) {
      HOOKTRACE_LOG_INFO("{} modules written to {}", modules, path);
    });
  });
  loop.run();

  try {
    log.flush();
  } catch (const hooktrace::SinkError& e) {
    HOOKTRACE_LOG_ERROR("{}", e.what());
    return false;
  }
  return true;
}

} // namespace

int main() {
  const Output outputs[] = {
      {"ex_hooks_array.json", hooktrace::Format::Array},
      {"ex_hooks_object.json", hooktrace::Format::Object},
      {"ex_hooks_lines.jsonl", hooktrace::Format::Lines},
  };
  int failures = 0;
  for (const Output& out : outputs) {
    if (!trace_into(out)) ++failures;
  }
  return failures == 0 ? 0 : 1;
}
