#pragma once
#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace mini {

struct TestCase { std::string name; std::function<void()> fn; };
inline std::vector<TestCase>& registry() { static std::vector<TestCase> r; return r; }

struct Registrar {
  Registrar(const std::string& name, std::function<void()> fn) { registry().push_back({name, std::move(fn)}); }
};

struct AssertionError : public std::runtime_error { using std::runtime_error::runtime_error; };

inline std::string where(const char* file, int line) {
  std::string_view f(file);
  if (auto slash = f.rfind('/'); slash != std::string_view::npos) f.remove_prefix(slash + 1);
  return std::string(f) + ":" + std::to_string(line) + ": ";
}

inline void json_escape(std::ostream& os, const std::string& s) {
  for (const char c : s) {
    if (c == '"' || c == '\\') os << '\\' << c;
    else if (c == '\n') os << "\\n";
    else os << c;
  }
}

// Arguments are substring filters on test names; "--list" prints the names.
// HERD_TEST_JSON=1 switches to one JSON object per line.
inline int run_all(int argc = 0, char** argv = nullptr) {
  const char* json_env = std::getenv("HERD_TEST_JSON");
  bool json = json_env && (*json_env == '1' || *json_env == 't' || *json_env == 'T' || *json_env == 'y' || *json_env == 'Y');
  bool list = false;
  std::vector<std::string> filters;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--list") list = true; else filters.push_back(a);
  }
  auto selected = [&](const std::string& name) {
    if (filters.empty()) return true;
    for (const auto& f : filters)
      if (name.find(f) != std::string::npos) return true;
    return false;
  };

  int failed = 0; int passed = 0;
  for (auto& t : registry()) {
    if (!selected(t.name)) continue;
    if (list) { std::cout << t.name << "\n"; continue; }
    std::string error;
    auto t0 = std::chrono::steady_clock::now();
    try {
      t.fn();
    } catch (const std::exception& e) {
      error = e.what();
    } catch (...) {
      error = "unknown exception";
    }
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
    if (error.empty()) ++passed; else ++failed;
    if (json) {
      std::cout << "{\"event\":\"test\",\"name\":\"" << t.name << "\",\"status\":\""
                << (error.empty() ? "pass" : "fail") << "\",\"ms\":" << ms;
      if (!error.empty()) { std::cout << ",\"error\":\""; json_escape(std::cout, error); std::cout << "\""; }
      std::cout << "}\n";
    } else if (error.empty()) {
      std::cout << "[PASS] " << t.name << " (" << ms << " ms)\n";
    } else {
      std::cerr << "[FAIL] " << t.name << ": " << error << "\n";
    }
  }
  if (list) return 0;
  if (json) {
    std::cout << "{\"event\":\"summary\",\"passed\":" << passed << ",\"failed\":" << failed << "}" << "\n";
  } else {
    std::cout << "\n" << passed << " passed, " << failed << " failed\n";
  }
  return failed == 0 ? 0 : 1;
}

} // namespace mini

#define TEST(name) \
  static void name(); \
  static ::mini::Registrar name##_registrar{#name, name}; \
  static void name()

#define MINI_FAIL(msg) throw ::mini::AssertionError(::mini::where(__FILE__, __LINE__) + (msg))

#define ASSERT_TRUE(expr) do { if(!(expr)) MINI_FAIL(std::string("ASSERT_TRUE failed: ") + #expr); } while(0)
#define ASSERT_FALSE(expr) do { if((expr)) MINI_FAIL(std::string("ASSERT_FALSE failed: ") + #expr); } while(0)
#define ASSERT_EQ(a,b) do { if(!((a)==(b))) MINI_FAIL(std::string("ASSERT_EQ failed: ") + #a " == " #b); } while(0)
#define ASSERT_NE(a,b) do { if(!((a)!=(b))) MINI_FAIL(std::string("ASSERT_NE failed: ") + #a " != " #b); } while(0)
