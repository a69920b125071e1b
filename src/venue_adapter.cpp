#include "pmarb/venue_adapter.hpp"

namespace pmarb {

const char *orderStatusName(OrderStatus status) {
  switch (status) {
  case OrderStatus::PENDING:
    return "pending";
  case OrderStatus::SUBMITTED:
    return "submitted";
  case OrderStatus::PARTIALLY_FILLED:
    return "partially_filled";
  case OrderStatus::FILLED:
    return "filled";
  case OrderStatus::CANCELLED:
    return "cancelled";
  case OrderStatus::FAILED:
    return "failed";
  }
  return "pending";
}

const char *fillStatusName(FillStatus status) {
  switch (status) {
  case FillStatus::FILLED:
    return "filled";
  case FillStatus::TIMED_OUT:
    return "timed_out";
  case FillStatus::REJECTED:
    return "rejected";
  }
  return "rejected";
}

} // namespace pmarb
