// include/vault_config.hpp
#pragma once

#include <string>
#include <cstddef>    // For size_t
#include <cstdint>
#include <filesystem> // For std::filesystem::path

#include <nlohmann/json.hpp>

namespace MediaVault
{
    namespace Config
    {

        enum class HashMode
        {
            Full,
            Fast
        };

        std::string toString(HashMode mode);
        HashMode hashModeFromString(const std::string &name);

        // Engine-wide settings. Passed by value to the TransferEngine at construction.
        struct EngineConfig
        {
            // Define the default chunk size for network uploads (10MB)
            static const size_t DEFAULT_CHUNK_SIZE = 10 * 1024 * 1024;
            static const size_t DEFAULT_FAST_SAMPLE_SIZE = 1024 * 1024;

            static const std::string STAGING_DIR_NAME;
            static const std::string DATABASE_FILE_NAME;
            static const std::string ENCRYPTED_DIR_NAME;

            size_t chunk_size = DEFAULT_CHUNK_SIZE;
            size_t max_concurrent_transfers = 5;
            size_t max_concurrent_file_ops = 10;
            HashMode hash_mode = HashMode::Fast;
            size_t fast_hash_sample_size = DEFAULT_FAST_SAMPLE_SIZE;
            int64_t session_timeout_seconds = 24 * 60 * 60;
            int64_t sweep_interval_seconds = 60; // 0 disables the background sweep
            std::filesystem::path archive_root = "backup";

            // Empty paths are derived from archive_root.
            std::filesystem::path staging_dir;
            std::filesystem::path database_path;

            int storage_retry_limit = 3;
            int storage_retry_backoff_ms = 50;
            uint64_t max_upload_size = 5ULL * 1024 * 1024 * 1024;

            bool encryption_enabled = false;
            std::filesystem::path encryption_key_path;
            std::filesystem::path encrypted_root;

            int history_retention_days = 7;

            std::filesystem::path stagingDirPath() const;
            std::filesystem::path databaseFilePath() const;
            std::filesystem::path encryptedRootPath() const;
            std::filesystem::path encryptionKeyPath() const;

            // Throws Errors::ConfigError when a setting cannot be honoured.
            void validate() const;

            static EngineConfig loadFromFile(const std::filesystem::path &config_path);
        };

        void to_json(nlohmann::json &j, const EngineConfig &c);
        void from_json(const nlohmann::json &j, EngineConfig &c);

        // Creates the directory (and parents) if it doesn't exist and returns it.
        std::filesystem::path ensureDirectoryExists(const std::filesystem::path &dir_path);

    } // namespace Config
} // namespace MediaVault
