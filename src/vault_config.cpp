// src/vault_config.cpp
#include "vault_config.hpp"
#include "vault_errors.hpp"
#include <fstream>
#include <iostream>  // For logging

namespace fs = std::filesystem;

namespace MediaVault
{
    namespace Config
    {

        const std::string EngineConfig::STAGING_DIR_NAME = ".staging";
        const std::string EngineConfig::DATABASE_FILE_NAME = "backup_metadata.db";
        const std::string EngineConfig::ENCRYPTED_DIR_NAME = "encrypted";

        std::string toString(HashMode mode)
        {
            return mode == HashMode::Full ? "full" : "fast";
        }

        HashMode hashModeFromString(const std::string &name)
        {
            if (name == "full")
            {
                return HashMode::Full;
            }
            if (name == "fast")
            {
                return HashMode::Fast;
            }
            throw Errors::ConfigError("Unknown hash_mode '" + name + "' (expected 'full' or 'fast')");
        }

        fs::path ensureDirectoryExists(const fs::path &dir_path)
        {
            try
            {
                if (!fs::exists(dir_path))
                {
                    if (fs::create_directories(dir_path))
                    {
                        std::cout << "Created directory: " << dir_path << std::endl;
                    }
                    else
                    {
                        // Another worker may have created it in the meantime.
                        if (!fs::exists(dir_path))
                        {
                            throw Errors::StorageWriteError("Failed to create directory: " + dir_path.string());
                        }
                    }
                }
            }
            catch (const fs::filesystem_error &e)
            {
                throw Errors::StorageWriteError("Filesystem error creating directory " + dir_path.string() + ": " + e.what());
            }
            return dir_path;
        }

        fs::path EngineConfig::stagingDirPath() const
        {
            return staging_dir.empty() ? archive_root / STAGING_DIR_NAME : staging_dir;
        }

        fs::path EngineConfig::databaseFilePath() const
        {
            return database_path.empty() ? archive_root / DATABASE_FILE_NAME : database_path;
        }

        fs::path EngineConfig::encryptedRootPath() const
        {
            return encrypted_root.empty() ? archive_root / ENCRYPTED_DIR_NAME : encrypted_root;
        }

        fs::path EngineConfig::encryptionKeyPath() const
        {
            return encryption_key_path.empty() ? archive_root / ".encryption_key" : encryption_key_path;
        }

        void EngineConfig::validate() const
        {
            if (chunk_size == 0)
            {
                throw Errors::ConfigError("chunk_size must be greater than zero");
            }
            if (max_concurrent_transfers == 0 || max_concurrent_file_ops == 0)
            {
                throw Errors::ConfigError("Concurrency ceilings must be greater than zero");
            }
            if (session_timeout_seconds <= 0)
            {
                throw Errors::ConfigError("session_timeout_seconds must be positive");
            }
            if (sweep_interval_seconds < 0)
            {
                throw Errors::ConfigError("sweep_interval_seconds must not be negative");
            }
            if (storage_retry_limit < 0 || storage_retry_backoff_ms < 0)
            {
                throw Errors::ConfigError("Storage retry settings must not be negative");
            }
            if (archive_root.empty())
            {
                throw Errors::ConfigError("archive_root must be set");
            }
        }

        void to_json(nlohmann::json &j, const EngineConfig &c)
        {
            j = nlohmann::json{
                {"chunk_size", c.chunk_size},
                {"max_concurrent_transfers", c.max_concurrent_transfers},
                {"max_concurrent_file_ops", c.max_concurrent_file_ops},
                {"hash_mode", toString(c.hash_mode)},
                {"fast_hash_sample_size", c.fast_hash_sample_size},
                {"session_timeout_seconds", c.session_timeout_seconds},
                {"sweep_interval_seconds", c.sweep_interval_seconds},
                {"archive_root", c.archive_root.string()},
                {"staging_dir", c.staging_dir.string()},
                {"database_path", c.database_path.string()},
                {"storage_retry_limit", c.storage_retry_limit},
                {"storage_retry_backoff_ms", c.storage_retry_backoff_ms},
                {"max_upload_size", c.max_upload_size},
                {"encryption_enabled", c.encryption_enabled},
                {"encryption_key_path", c.encryption_key_path.string()},
                {"encrypted_root", c.encrypted_root.string()},
                {"history_retention_days", c.history_retention_days}};
        }

        // Keys that are absent keep their defaults.
        void from_json(const nlohmann::json &j, EngineConfig &c)
        {
            c.chunk_size = j.value("chunk_size", c.chunk_size);
            c.max_concurrent_transfers = j.value("max_concurrent_transfers", c.max_concurrent_transfers);
            c.max_concurrent_file_ops = j.value("max_concurrent_file_ops", c.max_concurrent_file_ops);
            if (j.contains("hash_mode"))
            {
                c.hash_mode = hashModeFromString(j.at("hash_mode").get<std::string>());
            }
            c.fast_hash_sample_size = j.value("fast_hash_sample_size", c.fast_hash_sample_size);
            c.session_timeout_seconds = j.value("session_timeout_seconds", c.session_timeout_seconds);
            c.sweep_interval_seconds = j.value("sweep_interval_seconds", c.sweep_interval_seconds);
            c.archive_root = j.value("archive_root", c.archive_root.string());
            c.staging_dir = j.value("staging_dir", c.staging_dir.string());
            c.database_path = j.value("database_path", c.database_path.string());
            c.storage_retry_limit = j.value("storage_retry_limit", c.storage_retry_limit);
            c.storage_retry_backoff_ms = j.value("storage_retry_backoff_ms", c.storage_retry_backoff_ms);
            c.max_upload_size = j.value("max_upload_size", c.max_upload_size);
            c.encryption_enabled = j.value("encryption_enabled", c.encryption_enabled);
            c.encryption_key_path = j.value("encryption_key_path", c.encryption_key_path.string());
            c.encrypted_root = j.value("encrypted_root", c.encrypted_root.string());
            c.history_retention_days = j.value("history_retention_days", c.history_retention_days);
        }

        EngineConfig EngineConfig::loadFromFile(const fs::path &config_path)
        {
            if (!fs::exists(config_path))
            {
                throw Errors::ConfigError("Config file not found: " + config_path.string());
            }

            std::ifstream ifs(config_path);
            if (!ifs.is_open())
            {
                throw Errors::ConfigError("Failed to open config file for reading: " + config_path.string());
            }

            nlohmann::json j;
            try
            {
                ifs >> j;
            }
            catch (const nlohmann::json::exception &e)
            {
                throw Errors::ConfigError("Error parsing config file " + config_path.string() + ": " + e.what());
            }

            EngineConfig config;
            try
            {
                j.get_to(config);
            }
            catch (const nlohmann::json::exception &e)
            {
                throw Errors::ConfigError("Invalid value in config file " + config_path.string() + ": " + e.what());
            }
            config.validate();
            return config;
        }

    } // namespace Config
} // namespace MediaVault
