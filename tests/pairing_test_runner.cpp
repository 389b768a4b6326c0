#include "device_registry.hpp"
#include "pairing_authority.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace {

using libreconnect::test::TestCase;
using libreconnect::test::TestContext;
using libreconnect::test::expect;
using libreconnect::test::expect_eq;

DeviceInfo phone(const std::string& id, const std::string& name = "Phone") {
  DeviceInfo info;
  info.id = id;
  info.name = name;
  info.device_type = DeviceType::Mobile;
  info.capabilities = {Capability::ClipboardSync, Capability::FileTransfer};
  return info;
}

RequestPairingWithKey keyed_request(const std::string& id, const std::string& key) {
  RequestPairingWithKey request;
  request.id = id;
  request.name = "Phone " + id;
  request.device_type = "mobile";
  request.capabilities = {"ClipboardSync", "BatteryStatus", "Teleport"};
  request.pairing_key = key;
  return request;
}

// Deterministic codes: 100000, 100001, ...
PairingAuthority::CodeGenerator counting_codes() {
  auto next = std::make_shared<int>(100000);
  return [next](){ return std::to_string((*next)++); };
}

bool test_missing_file_is_empty(TestContext& ctx) {
  auto root = libreconnect::test::prepare_workspace("registry_missing");
  DeviceRegistry registry(root / "nowhere", ctx.logger);
  if(!expect_eq(registry.load(), std::size_t(0), "nothing loaded")) return false;
  return expect_eq(registry.paired_count(), std::size_t(0), "paired set empty");
}

bool test_reload_after_restart(TestContext& ctx) {
  auto root = libreconnect::test::prepare_workspace("registry_reload");
  {
    DeviceRegistry registry(root, ctx.logger);
    registry.load();
    if(!expect(registry.upsert_paired(phone("p1")), "first device persisted")) return false;
    if(!expect(registry.upsert_paired(phone("p2", "Tablet")), "second device persisted")) return false;
    if(!expect(registry.upsert_paired(phone("p1", "Renamed")), "upsert replaces")) return false;
  }

  auto doc = nlohmann::json::parse(libreconnect::test::read_file(root / DeviceRegistry::kPairedDevicesFile));
  if(!expect(doc.is_array() && doc.size() == 2, "file holds a JSON array of two devices")) return false;
  if(!expect(!std::filesystem::exists(root / "paired_devices.json.tmp"), "temporary file renamed away")) return false;

  DeviceRegistry reloaded(root, ctx.logger);
  if(!expect_eq(reloaded.load(), std::size_t(2), "both devices reloaded")) return false;
  auto p1 = reloaded.find_paired("p1");
  if(!expect(p1.has_value(), "p1 found")) return false;
  if(!expect_eq(p1->name, std::string("Renamed"), "latest name kept")) return false;
  return expect(p1->capabilities == phone("p1").capabilities, "capabilities kept");
}

bool test_malformed_file_starts_empty(TestContext& ctx) {
  auto root = libreconnect::test::prepare_workspace("registry_malformed");
  libreconnect::test::write_file(root / DeviceRegistry::kPairedDevicesFile, "[{\"id\": \"p1\", ");
  DeviceRegistry registry(root, ctx.logger);
  if(!expect_eq(registry.load(), std::size_t(0), "malformed file yields nothing")) return false;
  if(!expect(ctx.logs.contains("Failed to parse"), "parse failure logged")) return false;

  libreconnect::test::write_file(root / DeviceRegistry::kPairedDevicesFile, "{\"id\": \"p1\"}");
  return expect_eq(registry.load(), std::size_t(0), "non-array file yields nothing");
}

bool test_discovered_set_is_separate(TestContext& ctx) {
  auto root = libreconnect::test::prepare_workspace("registry_discovered");
  DeviceRegistry registry(root, ctx.logger);
  registry.upsert_discovered(phone("peer._libreconnect._tcp.local."));
  if(!expect_eq(registry.discovered_count(), std::size_t(1), "one discovered device")) return false;
  if(!expect(!registry.is_paired("peer._libreconnect._tcp.local."), "discovered is not paired")) return false;
  if(!expect(!std::filesystem::exists(registry.storage_path()), "discovery never writes the file")) return false;
  if(!expect(registry.remove_discovered("peer._libreconnect._tcp.local."), "removed")) return false;
  return expect(!registry.remove_discovered("peer._libreconnect._tcp.local."), "second removal is a no-op");
}

bool test_keyed_pairing_accepts_once(TestContext& ctx) {
  auto root = libreconnect::test::prepare_workspace("pairing_keyed");
  auto registry = std::make_shared<DeviceRegistry>(root, ctx.logger);
  PairingAuthority authority(registry, ctx.logger, counting_codes());
  if(!expect_eq(authority.current_code(), std::string("100000"), "first code")) return false;

  auto reply = authority.handle_keyed(keyed_request("p1", "100000"));
  auto* accepted = std::get_if<PairingAccepted>(&reply);
  if(!expect(accepted && accepted->device_id == "p1", "correct key accepted")) return false;
  if(!expect_eq(authority.current_code(), std::string("100001"), "code rotated after success")) return false;

  auto stored = registry->find_paired("p1");
  if(!expect(stored.has_value(), "device stored")) return false;
  if(!expect(stored->device_type == DeviceType::Mobile, "device type parsed case-insensitively")) return false;
  if(!expect_eq(stored->capabilities.size(), std::size_t(2), "unknown capability dropped")) return false;

  auto replay = authority.handle_keyed(keyed_request("p2", "100000"));
  auto* rejected = std::get_if<PairingRejected>(&replay);
  if(!expect(rejected != nullptr, "stale code rejected")) return false;
  if(!expect_eq(rejected->reason, std::string(PairingAuthority::kInvalidKeyReason), "rejection reason")) return false;
  if(!expect(!registry->is_paired("p2"), "rejected device not stored")) return false;
  return expect(ctx.logs.contains("Pairing code: 100001"), "new code is logged");
}

bool test_wrong_key_keeps_code(TestContext& ctx) {
  auto root = libreconnect::test::prepare_workspace("pairing_wrong");
  auto registry = std::make_shared<DeviceRegistry>(root, ctx.logger);
  PairingAuthority authority(registry, ctx.logger, counting_codes());
  auto reply = authority.handle_keyed(keyed_request("p1", "999999"));
  if(!expect(std::holds_alternative<PairingRejected>(reply), "wrong key rejected")) return false;
  return expect_eq(authority.current_code(), std::string("100000"), "code unchanged after failure");
}

bool test_concurrent_keyed_requests(TestContext& ctx) {
  auto root = libreconnect::test::prepare_workspace("pairing_race");
  auto registry = std::make_shared<DeviceRegistry>(root, ctx.logger);
  PairingAuthority authority(registry, ctx.logger, counting_codes());
  const auto code = authority.current_code();

  std::atomic<int> accepted{0};
  std::vector<std::thread> threads;
  for(int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i](){
      auto reply = authority.handle_keyed(keyed_request("p" + std::to_string(i), code));
      if(std::holds_alternative<PairingAccepted>(reply)) ++accepted;
    });
  }
  for(auto& thread : threads) thread.join();
  if(!expect_eq(accepted.load(), 1, "exactly one request wins the code")) return false;
  return expect_eq(registry->paired_count(), std::size_t(1), "one device stored");
}

bool test_legacy_pairing(TestContext& ctx) {
  auto root = libreconnect::test::prepare_workspace("pairing_legacy");
  auto registry = std::make_shared<DeviceRegistry>(root, ctx.logger);
  PairingAuthority authority(registry, ctx.logger, counting_codes());

  auto reply = authority.handle_legacy(RequestPairing{phone("old")});
  if(!expect(std::holds_alternative<PairingAccepted>(reply), "legacy accepted by default")) return false;
  if(!expect(registry->is_paired("old"), "legacy device stored")) return false;
  if(!expect(ctx.logs.contains("without key"), "legacy acceptance warns")) return false;

  authority.set_allow_legacy(false);
  reply = authority.handle_legacy(RequestPairing{phone("older")});
  auto* rejected = std::get_if<PairingRejected>(&reply);
  if(!expect(rejected != nullptr, "legacy rejected when disabled")) return false;
  return expect_eq(rejected->reason, std::string(PairingAuthority::kLegacyDisabledReason), "legacy rejection reason");
}

bool test_generated_codes(TestContext&) {
  for(int i = 0; i < 200; ++i) {
    auto code = generate_pairing_code();
    if(!expect_eq(code.size(), std::size_t(6), "six digits")) return false;
    auto value = std::stoi(code);
    if(!expect(value >= 100000 && value <= 999999, "code within range")) return false;
  }
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"missing_file_is_empty", test_missing_file_is_empty},
    {"reload_after_restart", test_reload_after_restart},
    {"malformed_file_starts_empty", test_malformed_file_starts_empty},
    {"discovered_set_is_separate", test_discovered_set_is_separate},
    {"keyed_pairing_accepts_once", test_keyed_pairing_accepts_once},
    {"wrong_key_keeps_code", test_wrong_key_keeps_code},
    {"concurrent_keyed_requests", test_concurrent_keyed_requests},
    {"legacy_pairing", test_legacy_pairing},
    {"generated_codes", test_generated_codes}
  };
  return libreconnect::test::run_suite("pairing", tests, argc, argv);
}
