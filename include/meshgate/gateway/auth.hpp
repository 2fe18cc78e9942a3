#ifndef MESHGATE_GATEWAY_AUTH_HPP
#define MESHGATE_GATEWAY_AUTH_HPP

#include <string>
#include <vector>
#include <set>
#include <mutex>

namespace meshgate {

// Shared-secret token check in front of registration.
// Tokens are capability secrets compared by plain string equality.
class AuthGuard {
public:
    AuthGuard(bool require_auth, const std::vector<std::string>& tokens);

    // True when auth is disabled, or the token is non-empty and known
    bool validate_token(const std::string& token) const;

    // 256-bit random token, hex encoded. Not added to the set.
    static std::string generate_token();

    void add_token(const std::string& token);

    // Returns false if the token was not in the set
    bool revoke_token(const std::string& token);

    size_t token_count() const;
    bool is_auth_required() const;

private:
    bool require_auth_;
    std::set<std::string> tokens_;
    mutable std::mutex mutex_;
};

} // namespace meshgate

#endif // MESHGATE_GATEWAY_AUTH_HPP
