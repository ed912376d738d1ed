#include "rendezvous/registry.hh"
#include "core/logging.hh"
#include "rendezvous/username.hh"

namespace qx {

// ============================================================================
// Result Strings
// ============================================================================

std::string_view token_register_result_string(TokenRegistry::RegisterResult result) {
    switch (result) {
        case TokenRegistry::RegisterResult::SUCCESS: return "success";
        case TokenRegistry::RegisterResult::DUPLICATE_TOKEN: return "duplicate_token";
        case TokenRegistry::RegisterResult::INVALID_INPUT: return "invalid_input";
    }
    return "unknown";
}

std::string_view token_lookup_status_string(TokenLookup::Status status) {
    switch (status) {
        case TokenLookup::Status::FOUND: return "found";
        case TokenLookup::Status::NOT_FOUND: return "not_found";
        case TokenLookup::Status::EXPIRED: return "expired";
    }
    return "unknown";
}

std::string_view user_register_result_string(UsernameRegistry::RegisterResult result) {
    switch (result) {
        case UsernameRegistry::RegisterResult::SUCCESS: return "success";
        case UsernameRegistry::RegisterResult::DUPLICATE_USERNAME: return "duplicate_username";
        case UsernameRegistry::RegisterResult::INVALID_USERNAME: return "invalid_username";
    }
    return "unknown";
}

// ============================================================================
// TokenRegistry Implementation
// ============================================================================

TokenRegistry::RegisterResult TokenRegistry::register_token(TokenEntry entry) {
    if (entry.token.empty()) {
        return RegisterResult::INVALID_INPUT;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto [it, inserted] = tokens_.try_emplace(entry.token, std::move(entry));
    if (!inserted) {
        QX_LOG_DEBUG(log::rendezvous) << "Rejecting duplicate token registration";
        return RegisterResult::DUPLICATE_TOKEN;
    }

    QX_LOG_DEBUG(log::rendezvous) << "Registered token " << it->second.registration_id
                                  << ", expires " << format_utc(it->second.expires_at)
                                  << ", total: " << tokens_.size();
    return RegisterResult::SUCCESS;
}

TokenLookup TokenRegistry::lookup_token(const std::string& token) const {
    return lookup_token(token, std::chrono::system_clock::now());
}

TokenLookup TokenRegistry::lookup_token(const std::string& token, system_time_t now) const {
    std::lock_guard<std::mutex> lock(mutex_);

    Lookup result;
    auto it = tokens_.find(token);
    if (it == tokens_.end()) {
        result.status = Lookup::Status::NOT_FOUND;
        return result;
    }
    if (it->second.is_expired(now)) {
        result.status = Lookup::Status::EXPIRED;
        return result;
    }

    result.status = Lookup::Status::FOUND;
    result.entry = it->second;
    return result;
}

std::size_t TokenRegistry::cleanup_expired() {
    return cleanup_expired(std::chrono::system_clock::now());
}

std::size_t TokenRegistry::cleanup_expired(system_time_t now) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::size_t removed = std::erase_if(tokens_, [now](const auto& kv) {
        return kv.second.expires_at < now;
    });

    if (removed > 0) {
        QX_LOG_DEBUG(log::rendezvous) << "Removed " << removed << " expired tokens, "
                                      << tokens_.size() << " remain";
    }
    return removed;
}

std::size_t TokenRegistry::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.size();
}

// ============================================================================
// UsernameRegistry Implementation
// ============================================================================

UsernameRegistry::RegisterResult UsernameRegistry::register_user(UserEntry entry) {
    if (!is_valid_username(entry.username)) {
        return RegisterResult::INVALID_USERNAME;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto [it, inserted] = users_.try_emplace(entry.username, std::move(entry));
    if (!inserted) {
        return RegisterResult::DUPLICATE_USERNAME;
    }

    QX_LOG_INFO(log::rendezvous) << "Registered user " << it->first
                                 << " (" << it->second.fingerprint << ")";
    return RegisterResult::SUCCESS;
}

std::optional<UserEntry> UsernameRegistry::lookup_user(const std::string& username) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = users_.find(username);
    if (it == users_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool UsernameRegistry::touch_user(const std::string& username, system_time_t now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = users_.find(username);
    if (it == users_.end()) {
        return false;
    }
    it->second.last_seen = now;
    return true;
}

std::size_t UsernameRegistry::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return users_.size();
}

}  // namespace qx
