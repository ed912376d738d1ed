#include "rendezvous/service.hh"
#include "core/logging.hh"
#include "crypto/hash.hh"
#include "rendezvous/username.hh"
#include <algorithm>

namespace qx {

namespace {

template<typename Response>
Response error_response(StatusCode status, std::string error) {
    Response r;
    r.status = status;
    r.error = std::move(error);
    return r;
}

}  // namespace

BootstrapService::BootstrapService(RendezvousRegistry& registry, ServiceConfig config)
    : registry_(registry)
    , config_(std::move(config))
    , started_at_(std::chrono::steady_clock::now())
    , register_token_limiter_(config_.register_token_limit)
    , lookup_token_limiter_(config_.lookup_token_limit)
    , register_user_limiter_(config_.register_user_limit)
    , lookup_user_limiter_(config_.lookup_user_limit) {}

std::string BootstrapService::fingerprint(std::string_view public_key) {
    return bytes_to_hex(sha256(public_key)).substr(0, FINGERPRINT_HEX_CHARS);
}

// ============================================================================
// Tokens
// ============================================================================

TokenResponse BootstrapService::register_token(const std::string& client_id,
                                               const TokenRegistrationRequest& request) {
    return register_token(client_id, request, std::chrono::system_clock::now());
}

TokenResponse BootstrapService::register_token(const std::string& client_id,
                                               const TokenRegistrationRequest& request,
                                               system_time_t now) {
    if (!register_token_limiter_.allow(client_id)) {
        return error_response<TokenResponse>(StatusCode::TOO_MANY_REQUESTS, "rate limit exceeded");
    }
    if (request.token.empty() || request.ephemeral_public_key.empty() ||
        request.manifest_hash.empty()) {
        return error_response<TokenResponse>(
            StatusCode::BAD_REQUEST, "token, ephemeral_public_key and manifest_hash are required");
    }
    if (request.ttl_seconds < 0) {
        return error_response<TokenResponse>(StatusCode::BAD_REQUEST, "ttl must not be negative");
    }

    std::chrono::seconds ttl = request.ttl_seconds == 0
        ? config_.default_token_ttl
        : std::min(std::chrono::seconds(request.ttl_seconds), config_.max_token_ttl);

    TokenEntry entry;
    entry.token = request.token;
    entry.ephemeral_public_key = request.ephemeral_public_key;
    entry.manifest_hash = request.manifest_hash;
    entry.relay_hints = request.relay_hints;
    entry.sender_address = request.sender_address;
    entry.created_at = now;
    entry.expires_at = now + ttl;
    entry.registration_id = random_id_hex();

    TokenEntry stored = entry;
    switch (registry_.tokens().register_token(std::move(entry))) {
        case TokenRegistry::RegisterResult::SUCCESS:
            break;
        case TokenRegistry::RegisterResult::DUPLICATE_TOKEN:
            return error_response<TokenResponse>(StatusCode::CONFLICT, "token already registered");
        case TokenRegistry::RegisterResult::INVALID_INPUT:
            return error_response<TokenResponse>(StatusCode::BAD_REQUEST, "invalid token");
    }

    QX_LOG_INFO(log::service) << "Token registered by " << client_id << ": id "
                              << stored.registration_id << ", ttl " << ttl.count() << "s";

    TokenResponse response;
    response.status = StatusCode::CREATED;
    response.entry = std::move(stored);
    return response;
}

TokenResponse BootstrapService::lookup_token(const std::string& client_id, const std::string& token) {
    return lookup_token(client_id, token, std::chrono::system_clock::now());
}

TokenResponse BootstrapService::lookup_token(const std::string& client_id, const std::string& token,
                                             system_time_t now) {
    if (!lookup_token_limiter_.allow(client_id)) {
        return error_response<TokenResponse>(StatusCode::TOO_MANY_REQUESTS, "rate limit exceeded");
    }
    if (token.empty()) {
        return error_response<TokenResponse>(StatusCode::BAD_REQUEST, "token is required");
    }

    auto lookup = registry_.tokens().lookup_token(token, now);
    if (!lookup.found()) {
        QX_LOG_DEBUG(log::service) << "Token lookup by " << client_id << ": "
                                   << token_lookup_status_string(lookup.status);
        auto response = error_response<TokenResponse>(
            StatusCode::NOT_FOUND,
            lookup.status == TokenLookup::Status::EXPIRED ? "token expired" : "token not found");
        response.lookup_status = lookup.status;
        return response;
    }

    TokenResponse response;
    response.status = StatusCode::OK;
    response.entry = std::move(lookup.entry);
    response.lookup_status = TokenLookup::Status::FOUND;
    return response;
}

// ============================================================================
// Users
// ============================================================================

UserResponse BootstrapService::register_user(const std::string& client_id,
                                             const UserRegistrationRequest& request) {
    return register_user(client_id, request, std::chrono::system_clock::now());
}

UserResponse BootstrapService::register_user(const std::string& client_id,
                                             const UserRegistrationRequest& request,
                                             system_time_t now) {
    if (!register_user_limiter_.allow(client_id)) {
        return error_response<UserResponse>(StatusCode::TOO_MANY_REQUESTS, "rate limit exceeded");
    }
    if (!is_valid_username(request.username)) {
        return error_response<UserResponse>(StatusCode::BAD_REQUEST, "invalid username");
    }
    if (request.public_key.empty()) {
        return error_response<UserResponse>(StatusCode::BAD_REQUEST, "public_key is required");
    }

    UserEntry entry;
    entry.username = request.username;
    entry.public_key = request.public_key;
    entry.fingerprint = fingerprint(request.public_key);
    entry.relay_hints = request.relay_hints;
    entry.direct_address = request.direct_address;
    entry.registered_at = now;
    entry.last_seen = now;

    UserEntry stored = entry;
    switch (registry_.users().register_user(std::move(entry))) {
        case UsernameRegistry::RegisterResult::SUCCESS:
            break;
        case UsernameRegistry::RegisterResult::DUPLICATE_USERNAME:
            return error_response<UserResponse>(StatusCode::CONFLICT, "username already taken");
        case UsernameRegistry::RegisterResult::INVALID_USERNAME:
            return error_response<UserResponse>(StatusCode::BAD_REQUEST, "invalid username");
    }

    UserResponse response;
    response.status = StatusCode::CREATED;
    response.entry = std::move(stored);
    return response;
}

UserResponse BootstrapService::lookup_user(const std::string& client_id, const std::string& username) {
    return lookup_user(client_id, username, std::chrono::system_clock::now());
}

UserResponse BootstrapService::lookup_user(const std::string& client_id, const std::string& username,
                                           system_time_t now) {
    if (!lookup_user_limiter_.allow(client_id)) {
        return error_response<UserResponse>(StatusCode::TOO_MANY_REQUESTS, "rate limit exceeded");
    }
    if (username.empty()) {
        return error_response<UserResponse>(StatusCode::BAD_REQUEST, "username is required");
    }

    // Heartbeat first so the returned entry carries the refreshed last_seen
    if (!registry_.users().touch_user(username, now)) {
        return error_response<UserResponse>(StatusCode::NOT_FOUND, "user not found");
    }
    auto entry = registry_.users().lookup_user(username);
    if (!entry) {
        return error_response<UserResponse>(StatusCode::NOT_FOUND, "user not found");
    }

    UserResponse response;
    response.status = StatusCode::OK;
    response.entry = std::move(entry);
    return response;
}

// ============================================================================
// Health
// ============================================================================

HealthReport BootstrapService::health() const {
    HealthReport report;
    report.token_count = registry_.tokens().count();
    report.user_count = registry_.users().count();
    report.uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_at_);
    return report;
}

// ============================================================================
// Rate-limit Maintenance
// ============================================================================

std::size_t BootstrapService::prune_rate_limiters() {
    return prune_rate_limiters(std::chrono::steady_clock::now());
}

std::size_t BootstrapService::prune_rate_limiters(steady_time_t now) {
    std::size_t removed = register_token_limiter_.prune(now) +
                          lookup_token_limiter_.prune(now) +
                          register_user_limiter_.prune(now) +
                          lookup_user_limiter_.prune(now);
    if (removed > 0) {
        QX_LOG_DEBUG(log::service) << "Pruned " << removed << " idle rate-limit buckets";
    }
    return removed;
}

std::size_t BootstrapService::rate_limited_clients() const {
    return register_token_limiter_.client_count() + lookup_token_limiter_.client_count() +
           register_user_limiter_.client_count() + lookup_user_limiter_.client_count();
}

}  // namespace qx
