#include "core/Analytics.h"

#include "util/Log.h"

std::string formatAnalyticsParams(const AnalyticsParams& params) {
  std::string out;
  for (const auto& [key, value] : params) {
    if (!out.empty())
      out += ' ';
    out += key;
    out += '=';
    out += value;
  }
  return out;
}

void LogAnalyticsSink::logEvent(std::string_view name, const AnalyticsParams& params) {
  if (params.empty()) {
    Log::infof("analytics", "{}", name);
    return;
  }
  Log::infof("analytics", "{} {}", name, formatAnalyticsParams(params));
}
