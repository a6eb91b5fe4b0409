#include "internal/factory.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/broker_fixtures.hpp"

namespace {

using livetv::config::ConfigLoader;
using livetv::runtime::config::RuntimeConfig;
using livetv::testing::Throws;
using livetv::testing::TunerRequest;

namespace factory = livetv::factory;
namespace util    = livetv::util;

void StopWorkers(factory::Application& app) {
  for (auto& worker : app.background_workers) worker->Stop();
}

void TestValidateConfigRejectsBadCredentials() {
  assert(Throws<util::InvalidArgument>([] {
    factory::ValidateConfig(ConfigLoader::LoadFromYamlString("credentials:\n  - id: 0\n    max_connections: 1\n"));
  }));
  assert(Throws<util::InvalidArgument>([] {
    factory::ValidateConfig(ConfigLoader::LoadFromYamlString(R"(credentials:
  - id: 4
    max_connections: 1
  - id: 4
    max_connections: 2
)"));
  }));
  assert(Throws<util::InvalidArgument>([] {
    factory::ValidateConfig(ConfigLoader::LoadFromYamlString("credentials:\n  - id: 1\n    max_connections: 0\n"));
  }));
  assert(Throws<util::InvalidArgument>([] {
    factory::ValidateConfig(ConfigLoader::LoadFromYamlString("liveness:\n  stale_threshold: \"0s\"\n"));
  }));
  assert(Throws<util::InvalidArgument>([] {
    factory::ValidateConfig(ConfigLoader::LoadFromYamlString("liveness:\n  stale_threshold: \"-5s\"\n"));
  }));

  factory::ValidateConfig(RuntimeConfig{});
  factory::ValidateConfig(ConfigLoader::LoadFromYamlString("liveness:\n  stale_threshold: \"0.5s\"\n"));
}

void TestBrokerOptionsDefaults() {
  const auto options = factory::BuildBrokerOptions(RuntimeConfig{});

  assert(options.tuner_count == 0);
  assert(options.credentials.empty());
  assert(options.stale_threshold == std::chrono::seconds(90));
  assert(options.queue_timeout == std::chrono::minutes(5));
  assert(options.failed_cooldown.count() == 0);
  assert(options.max_failures == 3);
  assert(options.eviction_log_size == 1024);
  assert(options.priorities.admin == 0);
  assert(options.priorities.premium == 50);
  assert(options.priorities.standard == 100);
}

void TestBrokerOptionsFromConfig() {
  const auto options = factory::BuildBrokerOptions(ConfigLoader::LoadFromYamlString(R"(tuners:
  count: 4
  max_failures: 5
  failed_cooldown: "120s"
credentials:
  - id: 9
    provider_id: "acme"
    name: "Acme"
    max_connections: 3
liveness:
  stale_threshold: "45s"
  queue_timeout: "60s"
  eviction_log_size: 10
priorities:
  standard: 70
)"));

  assert(options.tuner_count == 4);
  assert(options.max_failures == 5);
  assert(options.failed_cooldown == std::chrono::seconds(120));
  assert(options.stale_threshold == std::chrono::seconds(45));
  assert(options.queue_timeout == std::chrono::seconds(60));
  assert(options.eviction_log_size == 10);

  assert(options.credentials.size() == 1);
  assert(options.credentials[0].id == 9);
  assert(options.credentials[0].provider_id == "acme");
  assert(options.credentials[0].max_connections == 3);
  assert(options.credentials[0].active_connections == 0);

  assert(options.priorities.admin == 0);
  assert(options.priorities.premium == 50);
  assert(options.priorities.standard == 70);
}

void TestResolverOptions() {
  auto defaults = factory::BuildResolverOptions(RuntimeConfig{});
  assert(defaults.stream_port == 5004);
  assert(!defaults.hls_output);
  assert(defaults.accounts.empty());

  auto options = factory::BuildResolverOptions(ConfigLoader::LoadFromYamlString(R"(tuners:
  hdhomerun_url: "http://10.0.0.2"
  stream_port: 6000
  hls_output: true
credentials:
  - id: 2
    max_connections: 1
    server_url: "http://iptv.example.com"
    username: "u"
    password: "p"
    stream_extension: "ts"
)"));

  assert(options.hdhomerun_url == "http://10.0.0.2");
  assert(options.stream_port == 6000);
  assert(options.hls_output);
  assert(options.accounts.size() == 1);
  assert(options.accounts.at(2).server_url == "http://iptv.example.com");
  assert(options.accounts.at(2).stream_extension == "ts");
}

void TestBuildWithMemoryStore() {
  auto app = factory::Build(ConfigLoader::LoadFromYamlString(R"(tuners:
  count: 2
  hdhomerun_url: "http://192.168.1.50"
liveness:
  sweep_interval: "1s"
)"));

  assert(app.repository);
  assert(app.broker);
  assert(app.grpc_services.size() == 2);
  assert(app.background_workers.size() == 1);
  assert(app.background_workers.front()->Running());

  auto granted = app.broker->RequestChannel(TunerRequest("alice", "10.1"));
  assert(granted.Granted());
  assert(granted.session->stream_url == "http://192.168.1.50:5004/auto/v10.1");

  StopWorkers(app);
  assert(!app.background_workers.front()->Running());
}

void TestBuildRejectsInvalidConfig() {
  assert(Throws<util::InvalidArgument>([] {
    factory::Build(ConfigLoader::LoadFromYamlString("credentials:\n  - id: 1\n    max_connections: 0\n"));
  }));
}

#if LIVETV_DB_SQLITE
void TestBuildRestoresSessionsFromSqlite() {
  const auto dir = std::filesystem::temp_directory_path() / "livetv_factory_tests";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  const auto path = (dir / "broker.db").string();

  const std::string yaml = "tuners:\n  count: 1\n  hdhomerun_url: \"http://10.0.0.9\"\n"
                           "database:\n  sqlite:\n    path: \"" +
                           path + "\"\n  restore_sessions: true\n";

  std::string session_id;
  {
    auto app     = factory::Build(ConfigLoader::LoadFromYamlString(yaml));
    auto granted = app.broker->RequestChannel(TunerRequest("alice", "4.1"));
    assert(granted.Granted());
    session_id = granted.session->id;
    StopWorkers(app);
  }

  auto app      = factory::Build(ConfigLoader::LoadFromYamlString(yaml));
  auto restored = app.broker->GetSession(session_id);
  assert(restored.user_id == "alice");
  assert(restored.channel_key == "4.1");
  assert(app.broker->GetStatus().tuners.at(0).tuned_channel == "4.1");
  StopWorkers(app);

  std::filesystem::remove_all(dir);
}
#endif

} // namespace

int main() {
  TestValidateConfigRejectsBadCredentials();
  TestBrokerOptionsDefaults();
  TestBrokerOptionsFromConfig();
  TestResolverOptions();
  TestBuildWithMemoryStore();
  TestBuildRejectsInvalidConfig();
#if LIVETV_DB_SQLITE
  TestBuildRestoresSessionsFromSqlite();
#endif

  std::cout << "livetv_unit_factory: pass\n";
  return 0;
}
