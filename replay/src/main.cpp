/*
 * 설명: 원시 속성 레코드(JSON 배열)를 읽어 디코딩 결과를 JSON 줄로 출력하는 진입점.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "replay/attribute.hpp"
#include "replay/config.hpp"
#include "replay/errors.hpp"
#include "replay/observability.hpp"

namespace {

std::vector<replay::RawAttributeRecord> ParseRecords(const nlohmann::json& input) {
  if (!input.is_array()) {
    throw std::invalid_argument("입력은 레코드 배열이어야 합니다");
  }
  std::vector<replay::RawAttributeRecord> records;
  records.reserve(input.size());
  for (const auto& item : input) {
    replay::RawAttributeRecord record;
    record.header = item.value("header", 0);
    record.code = item.at("code").get<std::uint16_t>();
    record.owner_index = item.at("owner").get<int>();
    record.raw_value = item.at("value").get<std::string>();
    records.push_back(std::move(record));
  }
  return records;
}

}  // namespace

int main(int argc, char** argv) {
  using namespace replay;
  DecoderConfig config = LoadConfigFromEnv();
  Observability observability(ParseLogLevel(config.log_level), config.trace_prefix, std::cerr);

  try {
    nlohmann::json input;
    if (argc > 1) {
      std::ifstream file(argv[1]);
      if (!file) {
        std::cerr << "입력 파일을 열 수 없습니다: " << argv[1] << "\n";
        return 2;
      }
      input = nlohmann::json::parse(file);
    } else {
      input = nlohmann::json::parse(std::cin);
    }

    DecodeReport report = DecodeAll(ParseRecords(input), config, observability);
    for (const auto& attribute : report.attributes) {
      std::cout << attribute.ToJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    }
    return 0;
  } catch (const nlohmann::json::exception& ex) {
    std::cerr << "입력 JSON 오류: " << ex.what() << "\n";
    return 2;
  } catch (const std::invalid_argument& ex) {
    std::cerr << ex.what() << "\n";
    return 2;
  } catch (const ReplayError& ex) {
    std::cerr << ex.code << ": " << ex.what() << "\n";
    return 1;
  }
}
