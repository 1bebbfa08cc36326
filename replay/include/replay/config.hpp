/*
 * 설명: 디코더 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: replay/tests/unit/config_test.cpp
 */
#pragma once

#include <string>

namespace replay {

struct DecoderConfig {
  std::string log_level;
  bool strict_decode;
  std::string trace_prefix;
};

DecoderConfig DefaultConfig();
DecoderConfig LoadConfigFromEnv();

}  // namespace replay
