#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "checkout_manager_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigLoads() {
  const auto yaml_path = WriteYaml("full", R"(server:
  bind_address: "0.0.0.0:50051"
database:
  sqlite:
    path: "/tmp/checkout.db"
locks:
  ttl_ms: 3000
  redis:
    uri: "tcp://127.0.0.1:6379"
checkout:
  cancel_after_ms: 86400000
payment:
  api_key: "secret"
  reference_prefix: "DH"
scheduler:
  poll_interval_ms: 500
  batch_size: 16
  max_attempts: 4
  retry_backoff_ms: 1000
cache:
  memory: {}
logging:
  level: debug
observability:
  tracing_enabled: false
  transport: OTLP_TRANSPORT_HTTP
)");

  ::unsetenv("CHECKOUT_PAYMENT_API_KEY");
  auto config = checkout::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/tmp/checkout.db");
  assert(config.locks().ttl_ms() == 3000);
  assert(config.locks().has_redis());
  assert(config.checkout().cancel_after_ms() == 86400000);
  assert(config.payment().api_key() == "secret");
  assert(config.scheduler().batch_size() == 16);
  assert(config.cache().has_memory());
  assert(config.logging().level() == "debug");
  assert(config.observability().transport() == checkout::runtime::config::OTLP_TRANSPORT_HTTP);
}

void TestQuotedNumericStaysString() {
  auto config = checkout::config::ConfigLoader::LoadFromString(R"(payment:
  api_key: "12345"
  reference_prefix: "DH"
)");
  assert(config.payment().api_key() == "12345");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash", R"(database:
  sqlite:
    path: "C:\\checkout\\\"quoted\"\\db.sqlite"
)");

  auto config = checkout::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\checkout\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    (void)checkout::config::ConfigLoader::LoadFromString(R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "ConfigLoader must reject unknown fields.");

  threw = false;
  try {
    (void)checkout::config::ConfigLoader::LoadFromString(R"(locks:
  ttl: 3000
)");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "ConfigLoader must reject unknown nested fields.");
}

void TestEmptyDocumentYieldsDefaults() {
  auto config = checkout::config::ConfigLoader::LoadFromString("");
  assert(!config.has_database());
  assert(config.locks().ttl_ms() == 0);
}

void TestApiKeyEnvironmentOverride() {
  ::setenv("CHECKOUT_PAYMENT_API_KEY", "from-env", 1);
  auto config = checkout::config::ConfigLoader::LoadFromString(R"(payment:
  api_key: "from-file"
)");
  ::unsetenv("CHECKOUT_PAYMENT_API_KEY");

  assert(config.payment().api_key() == "from-env");
}

} // namespace

int main() {
  TestFullConfigLoads();
  TestQuotedNumericStaysString();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestEmptyDocumentYieldsDefaults();
  TestApiKeyEnvironmentOverride();

  std::cout << "checkout_manager_unit_config_loader: pass\n";
  return 0;
}
