/*
 * 설명: 클라이언트가 보내는 구독 제어 메시지를 해석한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/unit/control_message_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gateway {

enum class ControlType { kSubscribe, kSubscribeMany, kUnsubscribe };

struct ControlMessage {
  ControlType type;
  std::string chat_id;
  std::vector<std::string> chat_ids;
  bool replay{false};
};

// 형식이 잘못된 메시지, 알 수 없는 type은 std::nullopt. 호출자는 조용히 무시한다.
std::optional<ControlMessage> ParseControlMessage(std::string_view text);

}  // namespace gateway
