#include "pmarb/paper_venue.hpp"
#include <spdlog/spdlog.h>
#include <thread>

namespace pmarb {

PaperVenueAdapter::PaperVenueAdapter(Venue venue) : venue_(venue) {}

PaperVenueAdapter::Behaviour
PaperVenueAdapter::behaviourFor(const std::string &market_id) const {
  auto it = behaviours_.find(market_id);
  return it == behaviours_.end() ? default_behaviour_ : it->second;
}

void PaperVenueAdapter::setBehaviour(const std::string &market_id,
                                     Behaviour behaviour) {
  std::lock_guard<std::mutex> lock(mtx_);
  behaviours_[market_id] = behaviour;
}

void PaperVenueAdapter::setDefaultBehaviour(Behaviour behaviour) {
  std::lock_guard<std::mutex> lock(mtx_);
  default_behaviour_ = behaviour;
}

// ── Submit order ─────────────────────────────────────────────────────
std::optional<std::string> PaperVenueAdapter::submit(const Order &order) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (behaviourFor(order.market_id) == Behaviour::REJECT_SUBMIT) {
    spdlog::warn("[Paper] {} rejected order on {}", venueName(venue_),
                 order.market_id);
    return std::nullopt;
  }

  std::string id = "PAPER_" + std::string(venueName(venue_)) + "_" +
                   std::to_string(next_id_++);
  Order stored = order;
  stored.order_id = id;
  stored.status = OrderStatus::SUBMITTED;
  orders_[id] = stored;
  order_sequence_.push_back(id);

  spdlog::info("[Paper] Order: {} {} {} @ {:.3f} x {:.2f} → {}",
               sideName(order.side), order.market_id.substr(0, 16),
               order.outcome, order.price, order.size, id);
  return id;
}

FillStatus PaperVenueAdapter::awaitFill(const std::string &order_id,
                                        std::chrono::milliseconds timeout) {
  Behaviour behaviour;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = orders_.find(order_id);
    if (it == orders_.end())
      return FillStatus::REJECTED;
    behaviour = behaviourFor(it->second.market_id);

    if (behaviour == Behaviour::FILL) {
      it->second.status = OrderStatus::FILLED;
      it->second.filled_size = it->second.size;
      return FillStatus::FILLED;
    }
    if (behaviour == Behaviour::REJECT_FILL) {
      it->second.status = OrderStatus::FAILED;
      return FillStatus::REJECTED;
    }
  }

  // Resting order that never trades
  std::this_thread::sleep_for(timeout);
  return FillStatus::TIMED_OUT;
}

bool PaperVenueAdapter::cancel(const std::string &order_id) {
  std::lock_guard<std::mutex> lock(mtx_);
  cancelled_.push_back(order_id);
  auto it = orders_.find(order_id);
  if (it == orders_.end() || it->second.status == OrderStatus::FILLED)
    return false;
  it->second.status = OrderStatus::CANCELLED;
  spdlog::info("[Paper] Cancelled {}", order_id);
  return true;
}

std::vector<Order> PaperVenueAdapter::submitted() const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<Order> out;
  for (const auto &id : order_sequence_)
    out.push_back(orders_.at(id));
  return out;
}

std::vector<std::string> PaperVenueAdapter::cancelled() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return cancelled_;
}

int PaperVenueAdapter::submitCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return static_cast<int>(order_sequence_.size());
}

} // namespace pmarb
