/*
 * 설명: event:/data: 형식의 업스트림 텍스트 스트림을 청크 경계와 무관하게 프레임 단위로 분해한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/unit/frame_parser_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace gateway {

inline constexpr const char* kDefaultEventName = "message";

struct Frame {
  std::string event;
  nlohmann::json payload;
};

// 빈 줄로 끝난 프레임 본문 하나를 해석한다.
// event: 줄이 여러 번 나오면 마지막 값을 쓰고, data: 줄은 나온 순서대로 이어 붙인다.
// data가 비었거나 JSON이 아니면 std::nullopt.
std::optional<Frame> ParseFrame(std::string_view block);

class FrameParser {
 public:
  // 청크를 버퍼에 붙이고 완성된 프레임을 모두 꺼낸다. 남은 부분은 다음 호출까지 보관한다.
  std::vector<Frame> Feed(std::string_view chunk);
  void Reset();
  std::size_t Buffered() const { return buffer_.size(); }
  // 경계까지 도달했지만 버려진 프레임 수 (빈 data, 잘못된 JSON).
  std::size_t DroppedFrames() const { return dropped_; }

 private:
  std::string buffer_;
  std::size_t dropped_{0};
};

}  // namespace gateway
