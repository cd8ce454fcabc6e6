/*
 * 설명: subscribe / subscribeMany / unsubscribe 제어 메시지를 JSON에서 해석한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/unit/control_message_test.cpp
 */
#include "gateway/control_message.hpp"

#include <nlohmann/json.hpp>

namespace gateway {
namespace {
// 문자열과 정수 id만 허용한다. 그 외 타입이나 빈 문자열이면 std::nullopt.
std::optional<std::string> ChatIdFromJson(const nlohmann::json& value) {
  if (value.is_string()) {
    auto id = value.get<std::string>();
    if (id.empty()) {
      return std::nullopt;
    }
    return id;
  }
  if (value.is_number_integer()) {
    return value.dump();
  }
  return std::nullopt;
}

bool ReadReplay(const nlohmann::json& message, bool default_value, bool& replay) {
  auto it = message.find("replay");
  if (it == message.end() || it->is_null()) {
    replay = default_value;
    return true;
  }
  if (!it->is_boolean()) {
    return false;
  }
  replay = it->get<bool>();
  return true;
}
}  // namespace

std::optional<ControlMessage> ParseControlMessage(std::string_view text) {
  nlohmann::json message;
  try {
    message = nlohmann::json::parse(text.begin(), text.end());
  } catch (const nlohmann::json::parse_error&) {
    return std::nullopt;
  }
  if (!message.is_object()) {
    return std::nullopt;
  }
  auto type_it = message.find("type");
  if (type_it == message.end() || !type_it->is_string()) {
    return std::nullopt;
  }
  const auto& type = type_it->get_ref<const std::string&>();

  if (type == "subscribe" || type == "unsubscribe") {
    auto id_it = message.find("chatId");
    if (id_it == message.end()) {
      return std::nullopt;
    }
    auto chat_id = ChatIdFromJson(*id_it);
    if (!chat_id) {
      return std::nullopt;
    }
    ControlMessage result{type == "subscribe" ? ControlType::kSubscribe : ControlType::kUnsubscribe,
                          *chat_id, {}, false};
    // 단일 구독은 replay가 없으면 항상 처음부터 다시 받는다.
    if (result.type == ControlType::kSubscribe && !ReadReplay(message, true, result.replay)) {
      return std::nullopt;
    }
    return result;
  }

  if (type == "subscribeMany") {
    auto ids_it = message.find("chatIds");
    if (ids_it == message.end() || !ids_it->is_array()) {
      return std::nullopt;
    }
    ControlMessage result{ControlType::kSubscribeMany, {}, {}, false};
    if (!ReadReplay(message, false, result.replay)) {
      return std::nullopt;
    }
    for (const auto& entry : *ids_it) {
      auto chat_id = ChatIdFromJson(entry);
      if (chat_id) {
        result.chat_ids.push_back(std::move(*chat_id));
      }
    }
    return result;
  }

  return std::nullopt;
}

}  // namespace gateway
