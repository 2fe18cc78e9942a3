#include <meshgate/gateway/auth.hpp>
#include <meshgate/core/logger.hpp>
#include <meshgate/core/utils.hpp>

namespace meshgate {

AuthGuard::AuthGuard(bool require_auth, const std::vector<std::string>& tokens)
    : require_auth_(require_auth) {
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (!tokens[i].empty()) {
            tokens_.insert(tokens[i]);
        }
    }

    if (require_auth_ && tokens_.empty()) {
        LOG_WARN("Auth is required but no tokens are configured; every register will be rejected");
    }
}

bool AuthGuard::validate_token(const std::string& token) const {
    if (!require_auth_) return true;
    if (token.empty()) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.find(token) != tokens_.end();
}

std::string AuthGuard::generate_token() {
    return random_hex(32);
}

void AuthGuard::add_token(const std::string& token) {
    if (token.empty()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_.insert(token);
}

bool AuthGuard::revoke_token(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.erase(token) > 0;
}

size_t AuthGuard::token_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.size();
}

bool AuthGuard::is_auth_required() const {
    return require_auth_;
}

} // namespace meshgate
