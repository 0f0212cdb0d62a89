#include "metrics.hpp"
#include <sstream>

StatSnapshot MetricsRegistry::snapshot() const {
  StatSnapshot s{};
  s.analysis_p50 = analysis_.perc(50);
  s.analysis_p95 = analysis_.perc(95);
  s.analysis_p99 = analysis_.perc(99);
  s.analyses = analyses_total_.load();
  s.demo_fallbacks = fallback_total_.load();
  s.parse_errors = parse_errors_total_.load();
  s.fallback_rate =
      s.analyses ? (static_cast<double>(s.demo_fallbacks) / static_cast<double>(s.analyses)) : 0.0;
  return s;
}

std::string MetricsRegistry::prometheus_text(const StatSnapshot& s) const {
  std::ostringstream os;
  os << "strokecoach_analysis_ms{quantile=\"0.5\"} "  << s.analysis_p50 << "\n";
  os << "strokecoach_analysis_ms{quantile=\"0.95\"} " << s.analysis_p95 << "\n";
  os << "strokecoach_analysis_ms{quantile=\"0.99\"} " << s.analysis_p99 << "\n";

  os << "strokecoach_analyses_total " << s.analyses << "\n";
  os << "strokecoach_demo_fallback_total " << s.demo_fallbacks << "\n";
  os << "strokecoach_parse_errors_total " << s.parse_errors << "\n";

  os << "strokecoach_demo_fallback_rate " << s.fallback_rate << "\n";
  return os.str();
}
