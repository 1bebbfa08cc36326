/*
 * 설명: 구조화 로그와 디코딩 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: replay/tests/unit/attribute_decode_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace replay {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(const std::string& level);
const char* ToString(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::string name;
  LogLevel level{LogLevel::kInfo};
  std::optional<int> owner_index;
  std::optional<std::uint16_t> code;
  std::string detail;
};

struct MetricsSnapshot {
  std::uint64_t attributes_decoded{0};
  std::uint64_t attributes_unknown{0};
  std::uint64_t decode_failures{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo, std::string trace_prefix = "replay");
  Observability(LogLevel min_level, std::string trace_prefix, std::ostream& out);

  std::string NextTraceId();
  void IncrementDecoded();
  void IncrementUnknown();
  void IncrementFailure();
  MetricsSnapshot Snapshot() const;
  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::string trace_prefix_;
  std::ostream* out_;
  std::atomic<std::uint64_t> attributes_decoded_{0};
  std::atomic<std::uint64_t> attributes_unknown_{0};
  std::atomic<std::uint64_t> decode_failures_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace replay
