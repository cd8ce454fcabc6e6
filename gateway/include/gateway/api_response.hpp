/*
 * 설명: REST 응답 엔벨로프와 WS 아웃바운드 이벤트 엔벨로프 생성을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace gateway {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

// 업스트림 프레임 하나를 출처 chatId와 함께 감싼 클라이언트 전송 단위.
struct OutboundEnvelope {
  std::string chat_id;
  std::string event;
  nlohmann::json payload;
};

nlohmann::json ToWsJson(const OutboundEnvelope& env);

}  // namespace gateway
