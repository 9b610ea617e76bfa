#pragma once

#include <atomic>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace pmm {

// -----------------------------------------------------------------------------
// OrderIdGenerator - thread-safe exchange-style order id source
// -----------------------------------------------------------------------------
//
// @brief  Produces unique ids of the form "0x" + 16 lowercase hex digits
//         from an atomic counter.
//
// @details
// Used by the PaperExchange to play the exchange's role of assigning ids on
// acceptance (and to number the trades it records). Counting starts at 1;
// 0 is never issued. fetch_add with relaxed ordering is enough: the only
// requirement is uniqueness.
//
// Thread model: next_id() is safe to call concurrently from any thread.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  explicit OrderIdGenerator(std::uint64_t salt = 0) : salt_(salt) {}

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  std::uint64_t next_sequence() {
    return next_.fetch_add(1, std::memory_order_relaxed);
  }

  std::string next_id() {
    std::ostringstream out;
    out << "0x" << std::hex << std::setw(16) << std::setfill('0')
        << (salt_ ^ next_sequence());
    return out.str();
  }

 private:
  const std::uint64_t salt_;
  std::atomic<std::uint64_t> next_{1};
};

}  // namespace pmm
