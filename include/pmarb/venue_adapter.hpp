#pragma once
#include "pmarb/common.hpp"
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace pmarb {

// ── Orders ───────────────────────────────────────────────────────────
enum class OrderStatus {
  PENDING,
  SUBMITTED,
  PARTIALLY_FILLED,
  FILLED,
  CANCELLED,
  FAILED
};

const char *orderStatusName(OrderStatus status);

struct Order {
  std::string market_id;
  std::string outcome = "YES";
  Venue venue = Venue::UNKNOWN;
  Side side = Side::BUY;
  double price = 0.0;
  double size = 0.0; // contracts
  std::string order_id; // filled after submission
  OrderStatus status = OrderStatus::PENDING;
  double filled_size = 0.0;
};

enum class FillStatus { FILLED, TIMED_OUT, REJECTED };

const char *fillStatusName(FillStatus status);

// Boundary to a single trading venue. Implementations may block inside
// awaitFill up to the given timeout.
class VenueAdapter {
public:
  virtual ~VenueAdapter() = default;

  // Returns the venue's order id, or nullopt if the venue rejected it
  virtual std::optional<std::string> submit(const Order &order) = 0;
  virtual FillStatus awaitFill(const std::string &order_id,
                               std::chrono::milliseconds timeout) = 0;
  virtual bool cancel(const std::string &order_id) = 0;
};

// Non-owning venue → adapter map
class VenueRouter {
public:
  void add(Venue venue, VenueAdapter &adapter) { adapters_[venue] = &adapter; }
  bool has(Venue venue) const { return adapters_.count(venue) > 0; }

  VenueAdapter &at(Venue venue) const {
    auto it = adapters_.find(venue);
    if (it == adapters_.end())
      throw std::runtime_error(std::string("no adapter for venue ") +
                               venueName(venue));
    return *it->second;
  }

private:
  std::unordered_map<Venue, VenueAdapter *, VenueHash> adapters_;
};

} // namespace pmarb
