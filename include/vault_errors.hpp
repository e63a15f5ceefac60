// include/vault_errors.hpp
#pragma once

#include <string>
#include <cstdint>
#include <stdexcept> // For std::runtime_error

namespace MediaVault
{
    namespace Errors
    {

        class VaultError : public std::runtime_error
        {
        public:
            explicit VaultError(const std::string &message) : std::runtime_error(message) {}
        };

        // Source bytes could not be fully consumed. Retryable by resubmitting.
        class ReadError : public VaultError
        {
        public:
            explicit ReadError(const std::string &message) : VaultError(message) {}
        };

        // Declared and actual byte counts disagree. Fatal to the session.
        class SizeMismatch : public VaultError
        {
        public:
            explicit SizeMismatch(const std::string &message) : VaultError(message) {}
        };

        // Staging or archive I/O failed on every retry.
        class StorageWriteError : public VaultError
        {
        public:
            explicit StorageWriteError(const std::string &message) : VaultError(message) {}
        };

        class SessionError : public VaultError
        {
        public:
            SessionError(const std::string &token, const std::string &message)
                : VaultError(message), session_token(token) {}

            const std::string &token() const { return session_token; }

        private:
            std::string session_token;
        };

        // The session timed out. The caller has to open a fresh session.
        class ExpiredSession : public SessionError
        {
        public:
            explicit ExpiredSession(const std::string &token)
                : SessionError(token, "Upload session expired: " + token) {}
        };

        class SessionNotFound : public SessionError
        {
        public:
            explicit SessionNotFound(const std::string &token)
                : SessionError(token, "Upload session not found: " + token) {}
        };

        // The session is COMPLETED or FAILED and accepts no more work.
        class SessionClosed : public SessionError
        {
        public:
            SessionClosed(const std::string &token, const std::string &state)
                : SessionError(token, "Upload session " + token + " is " + state) {}
        };

        class InvalidRange : public SessionError
        {
        public:
            InvalidRange(const std::string &token, const std::string &message)
                : SessionError(token, message) {}
        };

        // A chunk's bytes do not match the checksum the sender supplied. Fatal to the session.
        class ChecksumMismatch : public SessionError
        {
        public:
            ChecksumMismatch(const std::string &token, const std::string &message)
                : SessionError(token, message) {}
        };

        // Finalize was requested before every byte arrived.
        class IncompleteSession : public SessionError
        {
        public:
            IncompleteSession(const std::string &token, uint64_t missing_bytes)
                : SessionError(token, "Upload session " + token + " is missing " + std::to_string(missing_bytes) + " bytes") {}
        };

        // No stored file has the requested fingerprint.
        class RecordNotFound : public VaultError
        {
        public:
            explicit RecordNotFound(const std::string &fingerprint)
                : VaultError("No stored file with fingerprint " + fingerprint) {}
        };

        class DatabaseError : public VaultError
        {
        public:
            explicit DatabaseError(const std::string &message) : VaultError(message) {}
        };

        class ConfigError : public VaultError
        {
        public:
            explicit ConfigError(const std::string &message) : VaultError(message) {}
        };

        class EncryptionError : public VaultError
        {
        public:
            explicit EncryptionError(const std::string &message) : VaultError(message) {}
        };

    } // namespace Errors
} // namespace MediaVault
