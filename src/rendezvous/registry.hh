#pragma once

#include "core/types.hh"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace qx {

// ============================================================================
// Registry Entries
// ============================================================================

struct TokenEntry {
    std::string token;
    std::string ephemeral_public_key;
    std::string manifest_hash;
    std::vector<std::string> relay_hints;
    std::optional<std::string> sender_address;
    system_time_t created_at{};
    system_time_t expires_at{};
    std::string registration_id;

    [[nodiscard]] bool is_expired(system_time_t now) const { return now > expires_at; }
};

struct UserEntry {
    std::string username;
    std::string public_key;
    std::string fingerprint;
    std::vector<std::string> relay_hints;
    std::optional<std::string> direct_address;
    system_time_t registered_at{};
    system_time_t last_seen{};
};

// ============================================================================
// Token Registry
// ============================================================================

class TokenRegistry {
public:
    TokenRegistry() = default;

    // Tokens are write-once. An already-expired entry is accepted but
    // looks up as EXPIRED until swept.
    enum class RegisterResult {
        SUCCESS,
        DUPLICATE_TOKEN,
        INVALID_INPUT,
    };
    RegisterResult register_token(TokenEntry entry);

    struct Lookup {
        enum class Status {
            FOUND,
            NOT_FOUND,
            EXPIRED,
        };
        Status status = Status::NOT_FOUND;
        std::optional<TokenEntry> entry;  // Set only when FOUND

        [[nodiscard]] bool found() const { return status == Status::FOUND; }
    };

    // Never removes entries, expired or not
    [[nodiscard]] Lookup lookup_token(const std::string& token) const;
    [[nodiscard]] Lookup lookup_token(const std::string& token, system_time_t now) const;

    // Removes entries with expires_at < now; returns how many were removed
    std::size_t cleanup_expired();
    std::size_t cleanup_expired(system_time_t now);

    // Stored entries, including expired ones not yet swept
    [[nodiscard]] std::size_t count() const;

private:
    std::unordered_map<std::string, TokenEntry> tokens_;
    mutable std::mutex mutex_;
};

using TokenLookup = TokenRegistry::Lookup;

[[nodiscard]] std::string_view token_register_result_string(TokenRegistry::RegisterResult result);
[[nodiscard]] std::string_view token_lookup_status_string(TokenLookup::Status status);

// ============================================================================
// Username Registry
// ============================================================================

class UsernameRegistry {
public:
    UsernameRegistry() = default;

    // Validated with is_valid_username() before insertion; never overwrites
    enum class RegisterResult {
        SUCCESS,
        DUPLICATE_USERNAME,
        INVALID_USERNAME,
    };
    RegisterResult register_user(UserEntry entry);

    [[nodiscard]] std::optional<UserEntry> lookup_user(const std::string& username) const;

    // Heartbeat: updates last_seen only. False when the user is unknown.
    bool touch_user(const std::string& username, system_time_t now);

    [[nodiscard]] std::size_t count() const;

private:
    std::unordered_map<std::string, UserEntry> users_;
    mutable std::mutex mutex_;
};

[[nodiscard]] std::string_view user_register_result_string(UsernameRegistry::RegisterResult result);

// ============================================================================
// Rendezvous Registry
// ============================================================================

// Owns the token and username maps. Each map locks independently.
class RendezvousRegistry {
public:
    RendezvousRegistry() = default;

    RendezvousRegistry(const RendezvousRegistry&) = delete;
    RendezvousRegistry& operator=(const RendezvousRegistry&) = delete;

    [[nodiscard]] TokenRegistry& tokens() { return tokens_; }
    [[nodiscard]] const TokenRegistry& tokens() const { return tokens_; }

    [[nodiscard]] UsernameRegistry& users() { return users_; }
    [[nodiscard]] const UsernameRegistry& users() const { return users_; }

private:
    TokenRegistry tokens_;
    UsernameRegistry users_;
};

}  // namespace qx
