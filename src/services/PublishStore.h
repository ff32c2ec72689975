#pragma once

#include <stdint.h>

#include <vector>

#include "services/MqttMessages.h"

enum class StoreResult : uint8_t {
  stored,
  coalesced,      // replaced the stored status snapshot
  evicted_status, // full: the stored status made room
  dropped
};

static const char* toString(StoreResult r) {
  switch (r) {
    case StoreResult::stored:         return "stored";
    case StoreResult::coalesced:      return "coalesced";
    case StoreResult::evicted_status: return "evicted_status";
    case StoreResult::dropped:        return "dropped";
    default:                          return "unknown";
  }
}

// Outbound messages kept while the broker is unreachable, oldest first.
// At most one status snapshot is held; a newer heartbeat overwrites it in
// place and incident traffic may evict it when the ring is full.
class PublishStore {
public:
  // Slot persistence. Tasks.cpp backs it with NVS.
  class Backend {
  public:
    virtual ~Backend() {}
    virtual bool loadMeta(uint32_t& head, uint32_t& tail, uint32_t& count) = 0;
    // False when the slot is missing or has a different layout.
    virtual bool loadSlot(uint32_t idx, PublishMsg& out) = 0;
    virtual void saveMeta(uint32_t head, uint32_t tail, uint32_t count) = 0;
    virtual void saveSlot(uint32_t idx, const PublishMsg& msg) = 0;
  };

  explicit PublishStore(uint32_t capacity);

  void attachBackend(Backend* backend) { backend_ = backend; }

  // Reloads the ring from the backend. Returns the number of restored
  // messages; an inconsistent image empties the store.
  uint32_t restore();

  StoreResult push(const PublishMsg& msg);
  bool peek(PublishMsg& out) const;
  void pop();
  void clear();

  uint32_t size() const { return count_; }
  uint32_t capacity() const { return (uint32_t)slots_.size(); }
  bool empty() const { return count_ == 0; }
  uint32_t drops() const { return drops_; }
  uint32_t coalesced() const { return coalesced_; }
  uint32_t evictions() const { return evictions_; }

private:
  uint32_t slot(uint32_t n) const { return (head_ + n) % capacity(); }
  bool findStatus(uint32_t& n) const;
  void removeAt(uint32_t n);
  void append(const PublishMsg& msg);
  void saveMeta();

  Backend* backend_ = nullptr;
  std::vector<PublishMsg> slots_;
  uint32_t head_ = 0;
  uint32_t tail_ = 0;
  uint32_t count_ = 0;

  uint32_t drops_ = 0;
  uint32_t coalesced_ = 0;
  uint32_t evictions_ = 0;
};
