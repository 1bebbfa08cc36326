/*
 * 설명: 환경 변수에서 디코더 설정을 읽고 잘못된 값은 기본값으로 되돌린다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: replay/tests/unit/config_test.cpp
 */
#include "replay/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace replay {
namespace {
std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseFlag(const std::string& value) {
  auto lowered = Lower(value);
  return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

std::string NormalizeLevel(const std::string& value) {
  auto lowered = Lower(value);
  if (lowered == "debug" || lowered == "info" || lowered == "warn" || lowered == "error") {
    return lowered;
  }
  return "info";
}
}  // namespace

DecoderConfig DefaultConfig() { return DecoderConfig{"info", false, "replay"}; }

DecoderConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  DecoderConfig cfg;
  cfg.log_level = NormalizeLevel(get_env("REPLAY_LOG_LEVEL", "info"));
  cfg.strict_decode = ParseFlag(get_env("REPLAY_STRICT_DECODE", "0"));
  cfg.trace_prefix = get_env("REPLAY_TRACE_PREFIX", "replay");
  return cfg;
}

}  // namespace replay
