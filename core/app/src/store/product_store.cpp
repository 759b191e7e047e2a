#include "custody/store/product_store.hpp"

#include <algorithm>
#include <utility>

namespace custody {

// -----------------------------------------------------------------------------
// RecordHandle
// -----------------------------------------------------------------------------
ProductStore::RecordHandle::RecordHandle(domain::ProductId id, Entry* entry)
    : id_(id), entry_(entry) {
  if (entry_ != nullptr) {
    lock_ = std::unique_lock<std::mutex>(entry_->mutex);
  }
}

ProductStore::RecordHandle::RecordHandle(domain::ProductId id, Entry* entry,
                                         std::unique_lock<std::mutex> held)
    : id_(id), entry_(entry), lock_(std::move(held)) {}

bool ProductStore::RecordHandle::commit(domain::Product updated) {
  if (entry_ == nullptr) {
    return false;
  }
  updated.id = id_;
  entry_->product = std::move(updated);
  return true;
}

// -----------------------------------------------------------------------------
// create(): allocate id and insert under the exclusive structural lock
// -----------------------------------------------------------------------------
domain::ProductId ProductStore::create(domain::Product record) {
  return createAcquired(std::move(record)).id();
}

// -----------------------------------------------------------------------------
// createAcquired(): lock the entry first, then publish it in the map
// -----------------------------------------------------------------------------
ProductStore::RecordHandle ProductStore::createAcquired(
    domain::Product record) {
  auto entry = std::make_unique<Entry>();
  Entry* raw = entry.get();
  std::unique_lock<std::mutex> record_lock(raw->mutex);

  domain::ProductId id = 0;
  {
    std::unique_lock lock(map_mutex_);
    id = id_gen_.next_id();
    record.id = id;
    raw->product = std::move(record);
    records_.emplace(id, std::move(entry));
  }
  return RecordHandle(id, raw, std::move(record_lock));
}

// -----------------------------------------------------------------------------
// get(): copy under the record lock
// -----------------------------------------------------------------------------
std::optional<domain::Product> ProductStore::get(domain::ProductId id) const {
  Entry* entry = find(id);
  if (entry == nullptr) {
    return std::nullopt;
  }
  std::lock_guard lock(entry->mutex);
  return entry->product;
}

// -----------------------------------------------------------------------------
// put(): overwrite an existing record, never insert
// -----------------------------------------------------------------------------
bool ProductStore::put(domain::ProductId id, domain::Product record) {
  Entry* entry = find(id);
  if (entry == nullptr) {
    return false;
  }
  record.id = id;
  std::lock_guard lock(entry->mutex);
  entry->product = std::move(record);
  return true;
}

ProductStore::RecordHandle ProductStore::acquire(domain::ProductId id) {
  return RecordHandle(id, find(id));
}

std::size_t ProductStore::size() const {
  std::shared_lock lock(map_mutex_);
  return records_.size();
}

// -----------------------------------------------------------------------------
// snapshot(): per-record copies, ordered by id
// -----------------------------------------------------------------------------
std::vector<domain::Product> ProductStore::snapshot() const {
  std::vector<Entry*> entries;
  {
    std::shared_lock lock(map_mutex_);
    entries.reserve(records_.size());
    for (const auto& [id, entry] : records_) {
      entries.push_back(entry.get());
    }
  }

  std::vector<domain::Product> result;
  result.reserve(entries.size());
  for (Entry* entry : entries) {
    std::lock_guard lock(entry->mutex);
    result.push_back(entry->product);
  }

  std::sort(result.begin(), result.end(),
            [](const domain::Product& a, const domain::Product& b) {
              return a.id < b.id;
            });
  return result;
}

// -----------------------------------------------------------------------------
// find(): structural lookup only; the returned Entry* outlives the lock
// -----------------------------------------------------------------------------
ProductStore::Entry* ProductStore::find(domain::ProductId id) const {
  std::shared_lock lock(map_mutex_);
  auto it = records_.find(id);
  return it != records_.end() ? it->second.get() : nullptr;
}

}  // namespace custody
