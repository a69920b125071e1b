#include "pmarb/opportunity.hpp"

namespace pmarb {

const std::string &opportunityId(const Opportunity &opp) {
  return std::visit([](const auto &o) -> const std::string & { return o.id; },
                    opp);
}

StrategyKind strategyOf(const Opportunity &opp) {
  return std::visit(
      overloaded{
          [](const RebalancingOpportunity &) {
            return StrategyKind::REBALANCING;
          },
          [](const CombinatorialOpportunity &) {
            return StrategyKind::COMBINATORIAL;
          },
      },
      opp);
}

std::vector<std::string> marketsOf(const Opportunity &opp) {
  return std::visit(
      overloaded{
          [](const RebalancingOpportunity &o) {
            return std::vector<std::string>{o.market_id};
          },
          [](const CombinatorialOpportunity &o) {
            return std::vector<std::string>{o.leg_a.market_id,
                                            o.leg_b.market_id};
          },
      },
      opp);
}

std::pair<OpportunityLeg, OpportunityLeg> legsOf(const Opportunity &opp) {
  return std::visit(
      overloaded{
          [](const RebalancingOpportunity &o) {
            Side side =
                o.side == RebalanceSide::BUY_BOTH ? Side::BUY : Side::SELL;
            OpportunityLeg yes;
            yes.venue = o.venue;
            yes.market_id = o.market_id;
            yes.outcome = "YES";
            yes.price = o.yes_price;
            yes.side = side;
            yes.book = o.yes_book;
            yes.quoted_at = o.quoted_at;

            OpportunityLeg no = yes;
            no.outcome = "NO";
            no.price = o.no_price;
            no.book = o.no_book;
            return std::make_pair(yes, no);
          },
          [](const CombinatorialOpportunity &o) {
            return std::make_pair(o.leg_a, o.leg_b);
          },
      },
      opp);
}

} // namespace pmarb
