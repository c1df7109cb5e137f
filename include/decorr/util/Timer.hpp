#pragma once

#include <chrono>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace decorr::util {

class WallTimer {
public:
  using clock = std::chrono::steady_clock;

  WallTimer() : t0_(clock::now()) {}

  void reset() { t0_ = clock::now(); }

  double elapsed_seconds() const {
    return std::chrono::duration_cast<std::chrono::duration<double>>(clock::now() - t0_).count();
  }

private:
  clock::time_point t0_;
};

// Named pipeline stages and their wall time, in the order they ran.
class StageTimes {
public:
  // Times `fn()` and records it under `name`; returns what fn returns.
  template <typename Fn>
  auto time(const std::string& name, Fn&& fn) {
    WallTimer t;
    if constexpr (std::is_void_v<decltype(fn())>) {
      fn();
      stages_.emplace_back(name, t.elapsed_seconds());
    } else {
      auto result = fn();
      stages_.emplace_back(name, t.elapsed_seconds());
      return result;
    }
  }

  const std::vector<std::pair<std::string, double>>& stages() const { return stages_; }

  double total_seconds() const {
    double s = 0.0;
    for (const auto& st : stages_) s += st.second;
    return s;
  }

private:
  std::vector<std::pair<std::string, double>> stages_;
};

} // namespace decorr::util
