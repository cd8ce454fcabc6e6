#include <memory>
#include <set>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "gateway/connection_registry.hpp"

TEST(ConnectionRegistryTest, ConnectionIdsAreRandomHex) {
  std::ostringstream sink;
  auto observability = std::make_shared<gateway::Observability>(gateway::LogLevel::kError, sink);
  auto registry = std::make_shared<gateway::ConnectionRegistry>();
  registry->SetObservability(observability);

  std::set<std::string> ids;
  for (int i = 0; i < 64; ++i) {
    auto id = registry->NextConnectionId();
    ASSERT_EQ(id.size(), 32u);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
    ids.insert(id);
  }
  EXPECT_EQ(ids.size(), 64u);
  EXPECT_EQ(observability->Snapshot().request_errors, 0u);
  EXPECT_TRUE(sink.str().empty());
}

TEST(ConnectionRegistryTest, EmptyRegistryOperationsAreNoops) {
  auto registry = std::make_shared<gateway::ConnectionRegistry>();
  registry->Unregister("missing", nullptr);
  registry->CloseAll();
  EXPECT_EQ(registry->ActiveConnections(), 0u);
}
