#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <utility>

namespace vault {

// -----------------------------------------------------------------------------
// RecordStore<Record>
// -----------------------------------------------------------------------------
//
// @brief  Address-keyed arena of fixed-schema records. Stands in for the
//         account storage of the host ledger.
//
// @details
// Semantics mirror what the ledger offers to a program:
//   - create() succeeds only if nothing lives at the address yet
//     ("init" of a deterministic account).
//   - find() is a read; findMutable() is the read-modify-write handle the
//     owning component uses to change a record in place.
//   - put() is an unconditional upsert, used only to hydrate restored
//     state before the engine accepts commands.
// Records are never deleted.
//
// std::map keeps iteration ordered by address so listings and snapshots
// come out in a stable order.
//
// Thread model:
//   No internal locking. Each store is owned by exactly one component and
//   every access happens inside a LedgerEngine command, which the engine
//   already serializes.
// -----------------------------------------------------------------------------
template <typename Record>
class RecordStore {
 public:
  RecordStore() = default;

  RecordStore(const RecordStore&) = delete;
  RecordStore& operator=(const RecordStore&) = delete;

  // Returns false and leaves the store untouched if `address` is taken.
  bool create(const std::string& address, Record record) {
    return records_.emplace(address, std::move(record)).second;
  }

  bool contains(const std::string& address) const {
    return records_.find(address) != records_.end();
  }

  const Record* find(const std::string& address) const {
    auto it = records_.find(address);
    return (it != records_.end()) ? &it->second : nullptr;
  }

  Record* findMutable(const std::string& address) {
    auto it = records_.find(address);
    return (it != records_.end()) ? &it->second : nullptr;
  }

  void put(const std::string& address, Record record) {
    records_[address] = std::move(record);
  }

  std::size_t size() const { return records_.size(); }

  // Visits every record in address order. fn(const std::string&, const Record&).
  template <typename Fn>
  void forEach(Fn&& fn) const {
    for (const auto& [address, record] : records_) {
      fn(address, record);
    }
  }

 private:
  std::map<std::string, Record> records_;
};

}  // namespace vault
