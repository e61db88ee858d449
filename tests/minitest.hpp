#pragma once
#include <cmath>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace mini {

struct TestCase { std::string name; std::function<void()> fn; };
inline std::vector<TestCase>& registry() { static std::vector<TestCase> r; return r; }

struct Registrar {
  Registrar(const std::string& name, std::function<void()> fn) { registry().push_back({name, std::move(fn)}); }
};

inline int run_tests(const std::vector<TestCase>& tests) {
  const char* json_env = std::getenv("HOSTPULSE_TEST_JSON");
  bool json = json_env && (*json_env == '1' || *json_env == 't' || *json_env == 'T' || *json_env == 'y' || *json_env == 'Y');
  int failed = 0; int passed = 0;
  for (const auto& t : tests) {
    try {
      t.fn();
      ++passed;
      if (json) {
        std::cout << "{\"event\":\"test\",\"name\":\"" << t.name << "\",\"status\":\"pass\"}" << "\n";
      } else {
        std::cout << "[PASS] " << t.name << "\n";
      }
    } catch (const std::exception& e) {
      ++failed;
      if (json) {
        std::cout << "{\"event\":\"test\",\"name\":\"" << t.name << "\",\"status\":\"fail\",\"error\":\"";
        for (const char c : std::string(e.what())) {
          if (c == '"' || c == '\\') std::cout << '\\' << c; else if (c == '\n') std::cout << "\\n"; else std::cout << c;
        }
        std::cout << "\"}" << "\n";
      } else {
        std::cerr << "[FAIL] " << t.name << ": " << e.what() << "\n";
      }
    } catch (...) {
      ++failed;
      if (json) {
        std::cout << "{\"event\":\"test\",\"name\":\"" << t.name << "\",\"status\":\"fail\",\"error\":\"unknown exception\"}" << "\n";
      } else {
        std::cerr << "[FAIL] " << t.name << ": unknown exception\n";
      }
    }
  }
  if (json) {
    std::cout << "{\"event\":\"summary\",\"passed\":" << passed << ",\"failed\":" << failed << "}" << "\n";
  } else {
    std::cout << "\n" << passed << " passed, " << failed << " failed\n";
  }
  return failed == 0 ? 0 : 1;
}

// HOSTPULSE_TEST_FILTER=substr runs only matching tests
inline int run_all() {
  const char* filter = std::getenv("HOSTPULSE_TEST_FILTER");
  std::vector<TestCase> selected;
  for (const auto& t : registry())
    if (!filter || !*filter || t.name.find(filter) != std::string::npos) selected.push_back(t);
  return run_tests(selected);
}

struct AssertionError : public std::runtime_error { using std::runtime_error::runtime_error; };

inline std::string near_message(const char* a, const char* b, double va, double vb) {
  std::ostringstream os;
  os << "ASSERT_NEAR failed: " << a << " (" << va << ") ~= " << b << " (" << vb << ")";
  return os.str();
}

} // namespace mini

#define TEST(name) \
  static void name(); \
  static ::mini::Registrar name##_registrar{#name, name}; \
  static void name()

#define ASSERT_TRUE(expr) do { if(!(expr)) throw ::mini::AssertionError(std::string("ASSERT_TRUE failed: ") + #expr); } while(0)
#define ASSERT_EQ(a,b) do { if(!((a)==(b))) { throw ::mini::AssertionError(std::string("ASSERT_EQ failed: ") + #a " == " #b); } } while(0)
#define ASSERT_NE(a,b) do { if(!((a)!=(b))) { throw ::mini::AssertionError(std::string("ASSERT_NE failed: ") + #a " != " #b); } } while(0)
#define ASSERT_NEAR(a,b,eps) do { double va_ = (a), vb_ = (b); if(!(std::fabs(va_ - vb_) <= (eps))) { throw ::mini::AssertionError(::mini::near_message(#a, #b, va_, vb_)); } } while(0)
