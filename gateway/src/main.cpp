/*
 * 설명: 게이트웨이 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: gateway/tests/e2e/gateway_flow_test.cpp
 */
#include <iostream>
#include <stdexcept>

#include "gateway/app.hpp"

int main() {
  using namespace gateway;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::invalid_argument& ex) {
    std::cerr << "설정 오류: " << ex.what() << "\n";
    return 1;
  }

  ServerApp app(config);
  app.Run();
  return 0;
}
