#ifndef SERVER_AUTHORIZATION_HPP
#define SERVER_AUTHORIZATION_HPP
#include <string>

#include "security/tier.hpp"

namespace server {

// Maps caller identities to privilege tiers.
class Authorizer {
 public:
  virtual ~Authorizer() = default;
  virtual security::Tier TierOf(const std::string& caller_id) = 0;
};

// Five digit agent ids: the leading digit is the tier (0xxxx Head of Council,
// 1xxxx Council, 2xxxx Lead, 3xxxx Task). Anything else is Task.
class AgentIdAuthorizer : public Authorizer {
 public:
  security::Tier TierOf(const std::string& caller_id) override;
};

}  // namespace server

#endif
