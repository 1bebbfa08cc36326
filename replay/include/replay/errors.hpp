/*
 * 설명: 속성 디코딩과 신원 모델에서 발생하는 예외 계층을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: replay/tests/unit/attribute_decode_test.cpp, replay/tests/unit/player_identity_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace replay {

class ReplayError : public std::runtime_error {
 public:
  ReplayError(const std::string& message, std::string code, bool recoverable)
      : std::runtime_error(message), code(std::move(code)), recoverable(recoverable) {}
  std::string code;
  bool recoverable;
};

// 보조 코드 테이블에 값이 없음. 레코드 단위로 잡아서 계속 진행할 수 있다.
class UnknownCode : public ReplayError {
 public:
  UnknownCode(const std::string& message, std::string key)
      : ReplayError(message, "unknown_code", true), key(std::move(key)) {}
  std::string key;
};

class InvalidValue : public ReplayError {
 public:
  explicit InvalidValue(const std::string& message) : ReplayError(message, "invalid_value", true) {}
};

class IllegalState : public ReplayError {
 public:
  explicit IllegalState(const std::string& message) : ReplayError(message, "illegal_state", false) {}
};

class IncompleteIdentity : public ReplayError {
 public:
  explicit IncompleteIdentity(const std::string& message) : ReplayError(message, "incomplete_identity", false) {}
};

class MissingField : public ReplayError {
 public:
  MissingField(const std::string& message, std::string field)
      : ReplayError(message, "missing_field", false), field(std::move(field)) {}
  std::string field;
};

class LengthMismatch : public ReplayError {
 public:
  explicit LengthMismatch(const std::string& message) : ReplayError(message, "length_mismatch", false) {}
};

class UnknownStatCode : public ReplayError {
 public:
  UnknownStatCode(const std::string& message, std::string stat)
      : ReplayError(message, "unknown_stat_code", false), stat(std::move(stat)) {}
  std::string stat;
};

}  // namespace replay
