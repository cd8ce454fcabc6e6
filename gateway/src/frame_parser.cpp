/*
 * 설명: 업스트림 이벤트 스트림의 증분 프레임 파서.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/unit/frame_parser_test.cpp
 */
#include "gateway/frame_parser.hpp"

#include <algorithm>

namespace gateway {
namespace {
constexpr std::string_view kEventMarker = "event:";
constexpr std::string_view kDataMarker = "data:";

std::string_view Trim(std::string_view value) {
  const char* whitespace = " \t\r\n";
  auto begin = value.find_first_not_of(whitespace);
  if (begin == std::string_view::npos) {
    return {};
  }
  auto end = value.find_last_not_of(whitespace);
  return value.substr(begin, end - begin + 1);
}

bool StartsWith(std::string_view line, std::string_view prefix) {
  return line.size() >= prefix.size() && line.compare(0, prefix.size(), prefix) == 0;
}

// 빈 줄 경계("\n\n" 또는 "\n\r\n")의 시작 위치와 길이를 찾는다.
bool FindBoundary(const std::string& buffer, std::size_t from, std::size_t& pos, std::size_t& length) {
  auto nl = buffer.find('\n', from);
  while (nl != std::string::npos) {
    if (nl + 1 < buffer.size() && buffer[nl + 1] == '\n') {
      pos = nl;
      length = 2;
      return true;
    }
    if (nl + 2 < buffer.size() && buffer[nl + 1] == '\r' && buffer[nl + 2] == '\n') {
      pos = nl;
      length = 3;
      return true;
    }
    nl = buffer.find('\n', nl + 1);
  }
  return false;
}
}  // namespace

std::optional<Frame> ParseFrame(std::string_view block) {
  std::string event = kDefaultEventName;
  std::string data;
  std::size_t pos = 0;
  while (pos <= block.size()) {
    auto nl = block.find('\n', pos);
    auto line = block.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (StartsWith(line, kEventMarker)) {
      event = std::string(Trim(line.substr(kEventMarker.size())));
    } else if (StartsWith(line, kDataMarker)) {
      data += Trim(line.substr(kDataMarker.size()));
    }
    if (nl == std::string_view::npos) {
      break;
    }
    pos = nl + 1;
  }

  if (data.empty()) {
    return std::nullopt;
  }
  try {
    return Frame{std::move(event), nlohmann::json::parse(data)};
  } catch (const nlohmann::json::parse_error&) {
    return std::nullopt;
  }
}

std::vector<Frame> FrameParser::Feed(std::string_view chunk) {
  std::vector<Frame> frames;
  // 남은 버퍼에는 완성된 경계가 없다. 걸쳐 있는 경계는 끝의 두 바이트 안에서 시작한다.
  std::size_t search_from = buffer_.size() >= 2 ? buffer_.size() - 2 : 0;
  buffer_.append(chunk.data(), chunk.size());

  std::size_t consumed = 0;
  std::size_t pos = 0;
  std::size_t length = 0;
  while (FindBoundary(buffer_, std::max(consumed, search_from), pos, length)) {
    auto frame = ParseFrame(std::string_view(buffer_).substr(consumed, pos - consumed));
    if (frame) {
      frames.push_back(std::move(*frame));
    } else {
      ++dropped_;
    }
    consumed = pos + length;
  }
  buffer_.erase(0, consumed);
  return frames;
}

void FrameParser::Reset() { buffer_.clear(); }

}  // namespace gateway
