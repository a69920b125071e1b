#pragma once
#include "pmarb/venue_adapter.hpp"
#include <map>
#include <mutex>
#include <vector>

namespace pmarb {

// Simulated venue for paper trading and tests. Every order fills
// immediately unless a per-market behaviour says otherwise.
class PaperVenueAdapter : public VenueAdapter {
public:
  enum class Behaviour { FILL, TIMEOUT, REJECT_SUBMIT, REJECT_FILL };

  explicit PaperVenueAdapter(Venue venue);

  std::optional<std::string> submit(const Order &order) override;
  FillStatus awaitFill(const std::string &order_id,
                       std::chrono::milliseconds timeout) override;
  bool cancel(const std::string &order_id) override;

  void setBehaviour(const std::string &market_id, Behaviour behaviour);
  // Applies to markets with no explicit behaviour
  void setDefaultBehaviour(Behaviour behaviour);

  std::vector<Order> submitted() const;
  std::vector<std::string> cancelled() const;
  int submitCount() const;

private:
  Venue venue_;
  Behaviour default_behaviour_ = Behaviour::FILL;
  std::map<std::string, Behaviour> behaviours_;
  std::map<std::string, Order> orders_; // by order id
  std::vector<std::string> order_sequence_;
  std::vector<std::string> cancelled_;
  long next_id_ = 1;
  mutable std::mutex mtx_;

  Behaviour behaviourFor(const std::string &market_id) const;
};

} // namespace pmarb
