// tests/test_vault_config.cpp
#include "vault_config.hpp"
#include "vault_errors.hpp"
#include "test_helpers.hpp"

using namespace MediaVault;
using Config::EngineConfig;

static void writeText(const fs::path& path, const std::string& text) {
    writeFile(path, std::vector<char>(text.begin(), text.end()));
}

bool test_defaults_and_derived_paths() {
    std::cout << "Testing defaults and derived paths..." << std::endl;
    EngineConfig config;
    TEST_ASSERT(config.chunk_size == EngineConfig::DEFAULT_CHUNK_SIZE, "Default chunk size mismatch");
    TEST_ASSERT(config.hash_mode == Config::HashMode::Fast, "Fast hashing should be the default");
    TEST_ASSERT(config.max_concurrent_transfers == 5 && config.max_concurrent_file_ops == 10, "Default ceilings mismatch");

    config.archive_root = "/mnt/vault";
    TEST_ASSERT(config.stagingDirPath() == fs::path("/mnt/vault/.staging"), "Staging should default under the archive");
    TEST_ASSERT(config.databaseFilePath() == fs::path("/mnt/vault/backup_metadata.db"), "Database should default under the archive");
    config.staging_dir = "/tmp/staging";
    TEST_ASSERT(config.stagingDirPath() == fs::path("/tmp/staging"), "Explicit staging dir should win");
    std::cout << "PASS: defaults and derived paths" << std::endl;
    return true;
}

bool test_load_partial_file(const fs::path& dir) {
    std::cout << "Testing loading a partial config file..." << std::endl;
    fs::path file = dir / "config.json";
    writeText(file, R"({"archive_root": "/data/photos", "hash_mode": "full", "max_concurrent_transfers": 2})");
    EngineConfig config = EngineConfig::loadFromFile(file);
    TEST_ASSERT(config.archive_root == fs::path("/data/photos"), "archive_root should be read");
    TEST_ASSERT(config.hash_mode == Config::HashMode::Full, "hash_mode should be read");
    TEST_ASSERT(config.max_concurrent_transfers == 2, "Transfer ceiling should be read");
    TEST_ASSERT(config.max_concurrent_file_ops == 10, "Absent keys keep their defaults");

    nlohmann::json j = config;
    EngineConfig again = j.get<EngineConfig>();
    TEST_ASSERT(again.archive_root == config.archive_root && again.hash_mode == config.hash_mode,
                "Serialized config should load back");
    std::cout << "PASS: loading a partial config file" << std::endl;
    return true;
}

bool test_sweep_can_be_disabled(const fs::path& dir) {
    std::cout << "Testing a disabled expiry sweep..." << std::endl;
    writeText(dir / "no_sweep.json", R"({"sweep_interval_seconds": 0})");
    EngineConfig config = EngineConfig::loadFromFile(dir / "no_sweep.json");
    TEST_ASSERT(config.sweep_interval_seconds == 0, "Zero sweep interval should load, got " << config.sweep_interval_seconds);
    config.validate();
    std::cout << "PASS: disabled expiry sweep" << std::endl;
    return true;
}

bool test_invalid_configs(const fs::path& dir) {
    std::cout << "Testing invalid configs..." << std::endl;
    TEST_THROWS(EngineConfig::loadFromFile(dir / "missing.json"), Errors::ConfigError, "Missing file must raise ConfigError");

    writeText(dir / "broken.json", "{ not json");
    TEST_THROWS(EngineConfig::loadFromFile(dir / "broken.json"), Errors::ConfigError, "Malformed JSON must raise ConfigError");

    writeText(dir / "mode.json", R"({"hash_mode": "sometimes"})");
    TEST_THROWS(EngineConfig::loadFromFile(dir / "mode.json"), Errors::ConfigError, "Unknown hash mode must raise ConfigError");

    writeText(dir / "zero.json", R"({"max_concurrent_file_ops": 0})");
    TEST_THROWS(EngineConfig::loadFromFile(dir / "zero.json"), Errors::ConfigError, "Zero ceiling must raise ConfigError");

    writeText(dir / "sweep.json", R"({"sweep_interval_seconds": -1})");
    TEST_THROWS(EngineConfig::loadFromFile(dir / "sweep.json"), Errors::ConfigError, "Negative sweep interval must raise ConfigError");

    writeText(dir / "type.json", R"({"chunk_size": "big"})");
    TEST_THROWS(EngineConfig::loadFromFile(dir / "type.json"), Errors::ConfigError, "Wrong value type must raise ConfigError");
    std::cout << "PASS: invalid configs" << std::endl;
    return true;
}

int main() {
    std::cout << "Running EngineConfig Tests..." << std::endl;
    ScratchDir scratch("config");

    test_defaults_and_derived_paths();
    test_load_partial_file(scratch.path());
    test_sweep_can_be_disabled(scratch.path());
    test_invalid_configs(scratch.path());

    return reportResults("ENGINE CONFIG");
}
