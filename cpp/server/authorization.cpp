#include "server/authorization.hpp"

#include <cctype>

namespace server {

security::Tier AgentIdAuthorizer::TierOf(const std::string& caller_id) {
  if (caller_id.size() != 5) return security::Tier::TASK;
  for (char c : caller_id) {
    if (!isdigit(static_cast<unsigned char>(c))) return security::Tier::TASK;
  }
  switch (caller_id[0]) {
    case '0':
      return security::Tier::HEAD_OF_COUNCIL;
    case '1':
      return security::Tier::COUNCIL;
    case '2':
      return security::Tier::LEAD;
    default:
      return security::Tier::TASK;
  }
}

}  // namespace server
