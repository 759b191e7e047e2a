#pragma once

#include "custody/domain/product.hpp"

#include <atomic>
#include <cstdint>

namespace custody {

// -----------------------------------------------------------------------------
// ProductIdGenerator: monotonically increasing product id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out 1, 2, 3, ... and never repeats a value.
//
// @details
// Id 0 is reserved: it is never a valid product id. The counter is atomic so
// next_id() is safe from any thread, but the ProductStore calls it while
// holding its structural lock, which additionally makes "id order" equal to
// "insertion order".
//
// Owned as a value member by ProductStore. Non-copyable and non-movable:
// two copies would hand out duplicate ids.
// -----------------------------------------------------------------------------
class ProductIdGenerator {
 public:
  ProductIdGenerator() = default;

  ProductIdGenerator(const ProductIdGenerator&) = delete;
  ProductIdGenerator& operator=(const ProductIdGenerator&) = delete;
  ProductIdGenerator(ProductIdGenerator&&) = delete;
  ProductIdGenerator& operator=(ProductIdGenerator&&) = delete;

  domain::ProductId next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<domain::ProductId> next_id_{1};
};

}  // namespace custody
