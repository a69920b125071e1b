#include "pmarb/common.hpp"
#include <algorithm>
#include <cctype>

namespace pmarb {

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

CostConfig::CostConfig() {
  VenueFeeSchedule poly;
  poly.model = FeeModel::WINNER_FLAT;
  poly.rate = 0.02;
  fee_table[Venue::POLYMARKET] = poly;

  VenueFeeSchedule kalshi;
  kalshi.model = FeeModel::PRICE_BRACKETED;
  kalshi.low_rate = 0.005;
  kalshi.mid_rate = 0.015;
  kalshi.bracket_low = 0.20;
  kalshi.bracket_high = 0.80;
  fee_table[Venue::KALSHI] = kalshi;

  VenueFeeSchedule pnp;
  pnp.model = FeeModel::FLAT;
  pnp.rate = 0.01;
  fee_table[Venue::PNP] = pnp;
}

const char *venueName(Venue venue) {
  switch (venue) {
  case Venue::POLYMARKET:
    return "polymarket";
  case Venue::KALSHI:
    return "kalshi";
  case Venue::PNP:
    return "pnp";
  case Venue::UNKNOWN:
    break;
  }
  return "unknown";
}

Venue parseVenue(const std::string &name) {
  auto n = lower(name);
  if (n == "polymarket")
    return Venue::POLYMARKET;
  if (n == "kalshi")
    return Venue::KALSHI;
  if (n == "pnp")
    return Venue::PNP;
  return Venue::UNKNOWN;
}

const char *policyName(UnhedgedPolicy policy) {
  switch (policy) {
  case UnhedgedPolicy::ALERT:
    return "alert";
  case UnhedgedPolicy::UNWIND:
    return "unwind";
  case UnhedgedPolicy::UNWIND_AND_ALERT:
    return "unwind_and_alert";
  }
  return "alert";
}

std::optional<UnhedgedPolicy> parsePolicy(const std::string &name) {
  auto n = lower(name);
  if (n == "alert")
    return UnhedgedPolicy::ALERT;
  if (n == "unwind")
    return UnhedgedPolicy::UNWIND;
  if (n == "unwind_and_alert")
    return UnhedgedPolicy::UNWIND_AND_ALERT;
  return std::nullopt;
}

const char *relationName(RelationKind kind) {
  switch (kind) {
  case RelationKind::MUTUALLY_EXCLUSIVE:
    return "mutually_exclusive";
  case RelationKind::COMPLEMENTARY:
    return "complementary";
  case RelationKind::ENTAILMENT:
    return "entailment";
  case RelationKind::INDEPENDENT:
    return "independent";
  case RelationKind::CONTRADICTION:
    return "contradiction";
  }
  return "independent";
}

std::optional<RelationKind> parseRelation(const std::string &name) {
  auto n = lower(name);
  if (n == "mutually_exclusive" || n == "mutex")
    return RelationKind::MUTUALLY_EXCLUSIVE;
  if (n == "complementary")
    return RelationKind::COMPLEMENTARY;
  if (n == "entailment" || n == "implies")
    return RelationKind::ENTAILMENT;
  if (n == "independent")
    return RelationKind::INDEPENDENT;
  if (n == "contradiction")
    return RelationKind::CONTRADICTION;
  return std::nullopt;
}

const char *directionName(Direction direction) {
  switch (direction) {
  case Direction::A_IMPLIES_B:
    return "a_implies_b";
  case Direction::B_IMPLIES_A:
    return "b_implies_a";
  case Direction::SYMMETRIC:
    return "symmetric";
  case Direction::NONE:
    break;
  }
  return "none";
}

std::optional<Direction> parseDirection(const std::string &name) {
  auto n = lower(name);
  if (n == "a_implies_b")
    return Direction::A_IMPLIES_B;
  if (n == "b_implies_a")
    return Direction::B_IMPLIES_A;
  if (n == "symmetric")
    return Direction::SYMMETRIC;
  if (n == "none")
    return Direction::NONE;
  return std::nullopt;
}

} // namespace pmarb
