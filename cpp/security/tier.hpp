#ifndef SECURITY_TIER_HPP
#define SECURITY_TIER_HPP

namespace security {

// Caller privilege, from the most to the least privileged.
enum class Tier {
  HEAD_OF_COUNCIL = 0,
  COUNCIL = 1,
  LEAD = 2,
  TASK = 3,
};

inline const char* TierName(Tier tier) {
  switch (tier) {
    case Tier::HEAD_OF_COUNCIL:
      return "head_of_council";
    case Tier::COUNCIL:
      return "council";
    case Tier::LEAD:
      return "lead";
    case Tier::TASK:
      return "task";
  }
  return "task";
}

// True if tier is at least as privileged as required.
inline bool AtLeast(Tier tier, Tier required) {
  return static_cast<int>(tier) <= static_cast<int>(required);
}

}  // namespace security

#endif
