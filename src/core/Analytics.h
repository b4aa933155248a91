#pragma once

#include <map>
#include <string>
#include <string_view>

using AnalyticsParams = std::map<std::string, std::string>;

// Receives gameplay events; implementations may throw, callers are expected to contain it.
class AnalyticsSink {
 public:
  virtual ~AnalyticsSink() = default;
  virtual void logEvent(std::string_view name, const AnalyticsParams& params) = 0;
};

// Writes one line per event through Log.
class LogAnalyticsSink : public AnalyticsSink {
 public:
  void logEvent(std::string_view name, const AnalyticsParams& params) override;
};

class NullAnalyticsSink : public AnalyticsSink {
 public:
  void logEvent(std::string_view name, const AnalyticsParams& params) override {
    (void)name;
    (void)params;
  }
};

std::string formatAnalyticsParams(const AnalyticsParams& params);
