#pragma once
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

class RollingHist {
public:
  explicit RollingHist(size_t cap = 512) : cap_(cap) {}
  void add(double x) {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.size() == cap_) vals_.pop_front();
    vals_.push_back(x);
  }
  // Percentile p in [0,100]
  double perc(double p) const {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.empty()) return 0.0;
    std::vector<double> v(vals_.begin(), vals_.end());
    std::sort(v.begin(), v.end());
    double rank = (p / 100.0) * static_cast<double>(v.size() - 1);
    size_t lo = static_cast<size_t>(rank);
    size_t hi = std::min(v.size() - 1, lo + 1);
    double frac = rank - static_cast<double>(lo);
    return v[lo] + (v[hi] - v[lo]) * frac;
  }
  size_t size() const {
    std::lock_guard<std::mutex> g(mu_);
    return vals_.size();
  }

private:
  size_t cap_;
  mutable std::mutex mu_;
  std::deque<double> vals_;
};

struct StatSnapshot {
  double analysis_p50{0}, analysis_p95{0}, analysis_p99{0};
  uint64_t analyses{0};
  uint64_t demo_fallbacks{0};
  uint64_t parse_errors{0};
  double fallback_rate{0};
};

class MetricsRegistry {
public:
  void add_analysis_ms(double ms) { analysis_.add(ms); }

  void inc_analysis() { analyses_total_.fetch_add(1, std::memory_order_relaxed); }
  void inc_fallback() { fallback_total_.fetch_add(1, std::memory_order_relaxed); }
  void inc_parse_error() { parse_errors_total_.fetch_add(1, std::memory_order_relaxed); }

  uint64_t analyses_total() const { return analyses_total_.load(std::memory_order_relaxed); }
  uint64_t fallback_total() const { return fallback_total_.load(std::memory_order_relaxed); }
  uint64_t parse_errors_total() const {
    return parse_errors_total_.load(std::memory_order_relaxed);
  }

  StatSnapshot snapshot() const;
  std::string prometheus_text(const StatSnapshot& s) const;

private:
  RollingHist analysis_;
  std::atomic<uint64_t> analyses_total_{0};
  std::atomic<uint64_t> fallback_total_{0};
  std::atomic<uint64_t> parse_errors_total_{0};
};
