#pragma once

#include "custody/concurrent/product_id_generator.hpp"
#include "custody/domain/product.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace custody {

// -----------------------------------------------------------------------------
// ProductStore: authoritative in-memory map of product id to Product
// -----------------------------------------------------------------------------
//
// @brief  Owns every product record. Records are created with sequential ids,
//         mutated in place, and never deleted.
//
// @details
// Locking is two-level:
//
//   1. map_mutex_ (std::shared_mutex) guards the map structure. create()
//      takes it exclusively; every lookup takes it shared and only long
//      enough to find the entry.
//
//   2. Each record has its own std::mutex. get(), put() and acquire() lock
//      only the record they address, so transitions on different ids never
//      contend with each other.
//
// Entries are heap-allocated and never erased, so an Entry* found under the
// shared lock stays valid after the lock is released (rehashing moves the
// unique_ptr, not the Entry).
//
// Read-modify-write:
//   acquire(id) returns a RecordHandle that holds the record lock for its
//   whole lifetime. The LifecycleEngine validates against current(), runs
//   any external side effect, and commit()s the new record while still
//   holding the lock. A handle destroyed without commit() leaves the record
//   exactly as it was: that is the all-or-nothing guarantee.
//
// Thread model: every method is safe from any thread. A thread must not
// call get()/put()/acquire() on an id whose RecordHandle it already holds.
// -----------------------------------------------------------------------------
class ProductStore {
 private:
  struct Entry {
    std::mutex mutex;
    domain::Product product;
  };

 public:
  // ---------------------------------------------------------------------------
  // RecordHandle: exclusive access to one record
  // ---------------------------------------------------------------------------
  class RecordHandle {
   public:
    RecordHandle(RecordHandle&&) = default;
    RecordHandle& operator=(RecordHandle&&) = default;
    RecordHandle(const RecordHandle&) = delete;
    RecordHandle& operator=(const RecordHandle&) = delete;

    // False when the id addressed no record. No lock is held in that case.
    bool exists() const { return entry_ != nullptr; }

    domain::ProductId id() const { return id_; }

    // The record as it is now. Precondition: exists().
    const domain::Product& current() const { return entry_->product; }

    // -------------------------------------------------------------------------
    // commit(updated)
    // -------------------------------------------------------------------------
    // Overwrites the record. The id is forced to the handle's id so a caller
    // cannot re-key a record. Returns false if the handle addresses nothing.
    // -------------------------------------------------------------------------
    bool commit(domain::Product updated);

   private:
    friend class ProductStore;

    RecordHandle(domain::ProductId id, Entry* entry);
    RecordHandle(domain::ProductId id, Entry* entry,
                 std::unique_lock<std::mutex> held);

    domain::ProductId id_{0};
    Entry* entry_{nullptr};
    std::unique_lock<std::mutex> lock_;
  };

  ProductStore() = default;

  ProductStore(const ProductStore&) = delete;
  ProductStore& operator=(const ProductStore&) = delete;
  ProductStore(ProductStore&&) = delete;
  ProductStore& operator=(ProductStore&&) = delete;

  // Assigns the next sequential id, stores the record under it, and returns
  // the id. The record's own id field is ignored and overwritten.
  domain::ProductId create(domain::Product record);

  // -------------------------------------------------------------------------
  // createAcquired(record)
  // -------------------------------------------------------------------------
  // Same as create(), but the new record is locked before it becomes visible
  // and the lock is handed back in the returned handle. No other thread can
  // touch the record until the handle is released, which lets the creator
  // log the creation before anyone can act on the new id.
  // -------------------------------------------------------------------------
  RecordHandle createAcquired(domain::Product record);

  // Snapshot of the record, or std::nullopt if the id was never created.
  std::optional<domain::Product> get(domain::ProductId id) const;

  // Overwrites an existing record. Never inserts: returns false for an id
  // that was never created.
  bool put(domain::ProductId id, domain::Product record);

  // Locks one record for a read-modify-write. See RecordHandle.
  RecordHandle acquire(domain::ProductId id);

  std::size_t size() const;

  // Copies of every record ordered by id.
  std::vector<domain::Product> snapshot() const;

 private:
  Entry* find(domain::ProductId id) const;

  mutable std::shared_mutex map_mutex_;
  std::unordered_map<domain::ProductId, std::unique_ptr<Entry>> records_;
  ProductIdGenerator id_gen_;
};

}  // namespace custody
