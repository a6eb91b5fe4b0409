#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using livetv::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "livetv_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "/var/lib/livetv/broker.db"
    wal_mode: true
  restore_sessions: true
tuners:
  count: 3
  hdhomerun_url: "http://192.168.1.50"
  stream_port: 5004
  hls_output: false
  max_failures: 2
  failed_cooldown: "300s"
credentials:
  - id: 1
    provider_id: "acme"
    name: "Acme primary"
    max_connections: 2
    server_url: "http://iptv.example.com:8080"
    username: "viewer"
    password: "secret"
  - id: 2
    provider_id: "acme"
    max_connections: 1
liveness:
  sweep_interval: "30s"
  stale_threshold: "90s"
  queue_timeout: "300s"
  eviction_log_size: 64
priorities:
  admin: 0
  premium: 10
logging:
  level: "debug"
  file_path: "/var/log/livetv/broker.log"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());

  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().wal_mode());
  assert(config.database().restore_sessions());

  assert(config.tuners().count() == 3);
  assert(config.tuners().hdhomerun_url() == "http://192.168.1.50");
  assert(config.tuners().max_failures() == 2);
  assert(config.tuners().failed_cooldown().seconds() == 300);

  assert(config.credentials_size() == 2);
  assert(config.credentials(0).id() == 1);
  assert(config.credentials(0).provider_id() == "acme");
  assert(config.credentials(0).password() == "secret");
  assert(config.credentials(1).max_connections() == 1);

  assert(config.liveness().sweep_interval().seconds() == 30);
  assert(config.liveness().stale_threshold().seconds() == 90);
  assert(config.liveness().queue_timeout().seconds() == 300);
  assert(config.liveness().eviction_log_size() == 64);

  assert(config.priorities().has_admin() && config.priorities().admin() == 0);
  assert(config.priorities().has_premium() && config.priorities().premium() == 10);
  assert(!config.priorities().has_standard());

  assert(config.logging().level() == "debug");
}

void TestQuotedScalarsStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(credentials:
  - id: 5
    provider_id: "007"
    username: "1234"
    password: "true"
)");

  assert(config.credentials(0).provider_id() == "007");
  assert(config.credentials(0).username() == "1234");
  assert(config.credentials(0).password() == "true");
}

void TestEscapedStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "line1\nline2☃"
database:
  sqlite:
    path: "C:\\livetv\\\"quoted\"\\db.sqlite"
)");

  assert(config.server().bind_address() == std::string("line1\nline2☃"));
  assert(config.database().sqlite().path() == "C:\\livetv\\\"quoted\"\\db.sqlite");
}

void TestEmptyDocumentYieldsDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(!config.has_server());
  assert(config.tuners().count() == 0);
  assert(config.credentials_size() == 0);
}

void TestInvalidInputIsRejected() {
  assert(Rejects("unknown_field: 123\n"));
  assert(Rejects("tuners:\n  count: 2\n  antennas: 4\n"));
  assert(Rejects("liveness:\n  stale_threshold: \"ninety\"\n"));
  assert(Rejects("tuners: [1, 2\n"));

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/livetv/broker.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "ConfigLoader must report unreadable files.");
}

void TestLargeIdsKeepPrecision() {
  auto config = ConfigLoader::LoadFromYamlString(R"(credentials:
  - id: 18446744073709551557
    max_connections: 1
  - id: 9007199254740993
    max_connections: 1
)");

  assert(config.credentials(0).id() == 18446744073709551557ULL);
  assert(config.credentials(1).id() == 9007199254740993ULL);
}

std::string ErrorText(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const livetv::config::ConfigError& e) {
    return e.what();
  }
  return {};
}

void TestErrorsNameTheirSource() {
  const std::string syntax = ErrorText("tuners:\n  count: 2\n  hdhomerun_url: [\"a\"\n");
  assert(syntax.rfind("<string>:", 0) == 0);

  const std::string unknown = ErrorText("antennas: 4\n");
  assert(unknown.find("<string>: invalid configuration") == 0);

  assert(!ErrorText("- tuners\n- credentials\n").empty());

  std::string missing;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/livetv/broker.yaml");
  } catch (const livetv::config::ConfigError& e) {
    missing = e.what();
  }
  assert(missing.find("/nonexistent/livetv/broker.yaml") == 0);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestQuotedScalarsStayStrings();
  TestEscapedStrings();
  TestEmptyDocumentYieldsDefaults();
  TestInvalidInputIsRejected();
  TestLargeIdsKeepPrecision();
  TestErrorsNameTheirSource();

  std::cout << "livetv_unit_config_loader: pass\n";
  return 0;
}
