/*
 * 설명: 구조화 로그와 디코딩 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "replay/observability.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

namespace replay {

LogLevel ParseLogLevel(const std::string& level) {
  if (level == "debug") {
    return LogLevel::kDebug;
  }
  if (level == "warn") {
    return LogLevel::kWarn;
  }
  if (level == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

const char* ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel min_level, std::string trace_prefix)
    : Observability(min_level, std::move(trace_prefix), std::cout) {}

Observability::Observability(LogLevel min_level, std::string trace_prefix, std::ostream& out)
    : min_level_(min_level), trace_prefix_(std::move(trace_prefix)), out_(&out) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << trace_prefix_ << "-" << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementDecoded() { attributes_decoded_.fetch_add(1); }

void Observability::IncrementUnknown() { attributes_unknown_.fetch_add(1); }

void Observability::IncrementFailure() { decode_failures_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.attributes_decoded = attributes_decoded_.load();
  snapshot.attributes_unknown = attributes_unknown_.load();
  snapshot.decode_failures = decode_failures_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["level"] = ToString(ctx.level);
  if (ctx.owner_index) {
    log_json["ownerIndex"] = *ctx.owner_index;
  }
  if (ctx.code) {
    log_json["code"] = *ctx.code;
  }
  if (!ctx.detail.empty()) {
    log_json["detail"] = ctx.detail;
  }
  *out_ << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

}  // namespace replay
