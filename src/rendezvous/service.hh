#pragma once

#include "rendezvous/rate_limiter.hh"
#include "rendezvous/registry.hh"
#include <optional>
#include <string>
#include <vector>

namespace qx {

// ============================================================================
// Service Configuration
// ============================================================================

struct ServiceConfig {
    std::chrono::seconds max_token_ttl = MAX_TOKEN_TTL;
    std::chrono::seconds default_token_ttl = DEFAULT_TOKEN_TTL;

    // Per-client limits, one bucket per client and endpoint
    RateLimit register_token_limit = RateLimit::per_minute(20);
    RateLimit lookup_token_limit = RateLimit::per_minute(200);
    RateLimit register_user_limit = RateLimit::per_hour(5);
    RateLimit lookup_user_limit = RateLimit::per_minute(100);
};

// ============================================================================
// Status Codes
// ============================================================================

enum class StatusCode : std::uint16_t {
    OK = 200,
    CREATED = 201,
    BAD_REQUEST = 400,
    NOT_FOUND = 404,
    CONFLICT = 409,
    TOO_MANY_REQUESTS = 429,
};

[[nodiscard]] inline std::string_view status_code_reason(StatusCode code) {
    switch (code) {
        case StatusCode::OK: return "OK";
        case StatusCode::CREATED: return "Created";
        case StatusCode::BAD_REQUEST: return "Bad Request";
        case StatusCode::NOT_FOUND: return "Not Found";
        case StatusCode::CONFLICT: return "Conflict";
        case StatusCode::TOO_MANY_REQUESTS: return "Too Many Requests";
    }
    return "Unknown";
}

// ============================================================================
// Requests & Responses
// ============================================================================

struct TokenRegistrationRequest {
    std::string token;
    std::string ephemeral_public_key;
    std::string manifest_hash;
    std::vector<std::string> relay_hints;
    std::optional<std::string> sender_address;
    std::int64_t ttl_seconds = 0;  // 0 selects the default TTL
};

struct UserRegistrationRequest {
    std::string username;
    std::string public_key;
    std::vector<std::string> relay_hints;
    std::optional<std::string> direct_address;
};

struct TokenResponse {
    StatusCode status = StatusCode::OK;
    std::string error;
    std::optional<TokenEntry> entry;

    // Why a lookup answered NOT_FOUND: never registered, or lapsed
    std::optional<TokenLookup::Status> lookup_status;
};

struct UserResponse {
    StatusCode status = StatusCode::OK;
    std::string error;
    std::optional<UserEntry> entry;
};

struct HealthReport {
    std::size_t token_count = 0;
    std::size_t user_count = 0;
    std::chrono::seconds uptime{0};
};

// ============================================================================
// Bootstrap Service
// ============================================================================

// Endpoint contracts of the rendezvous service, independent of transport.
// client_id keys the per-client rate limits (e.g. the remote address).
class BootstrapService {
public:
    explicit BootstrapService(RendezvousRegistry& registry, ServiceConfig config = ServiceConfig{});

    [[nodiscard]] TokenResponse register_token(const std::string& client_id,
                                               const TokenRegistrationRequest& request);
    [[nodiscard]] TokenResponse register_token(const std::string& client_id,
                                               const TokenRegistrationRequest& request,
                                               system_time_t now);

    [[nodiscard]] TokenResponse lookup_token(const std::string& client_id, const std::string& token);
    [[nodiscard]] TokenResponse lookup_token(const std::string& client_id, const std::string& token,
                                             system_time_t now);

    [[nodiscard]] UserResponse register_user(const std::string& client_id,
                                             const UserRegistrationRequest& request);
    [[nodiscard]] UserResponse register_user(const std::string& client_id,
                                             const UserRegistrationRequest& request,
                                             system_time_t now);

    // A successful lookup refreshes last_seen
    [[nodiscard]] UserResponse lookup_user(const std::string& client_id, const std::string& username);
    [[nodiscard]] UserResponse lookup_user(const std::string& client_id, const std::string& username,
                                           system_time_t now);

    [[nodiscard]] HealthReport health() const;

    // Drops rate-limit buckets of clients idle long enough to be back at full
    // burst; returns buckets removed across all endpoints. Run on the sweep cadence.
    std::size_t prune_rate_limiters();
    std::size_t prune_rate_limiters(steady_time_t now);

    // Clients currently tracked across all endpoint limiters
    [[nodiscard]] std::size_t rate_limited_clients() const;

    [[nodiscard]] const ServiceConfig& config() const { return config_; }

    // Lowercase hex prefix of SHA-256(public_key)
    [[nodiscard]] static std::string fingerprint(std::string_view public_key);

private:
    RendezvousRegistry& registry_;
    ServiceConfig config_;
    steady_time_t started_at_;

    ClientRateLimiter register_token_limiter_;
    ClientRateLimiter lookup_token_limiter_;
    ClientRateLimiter register_user_limiter_;
    ClientRateLimiter lookup_user_limiter_;
};

}  // namespace qx
