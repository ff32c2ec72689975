#include "services/PublishStore.h"

#include "app/Log.h"

namespace {
constexpr const char* TAG = "MQTT";
}

PublishStore::PublishStore(uint32_t capacity)
  : slots_(capacity == 0 ? 1 : capacity) {}

void PublishStore::saveMeta() {
  if (backend_) backend_->saveMeta(head_, tail_, count_);
}

void PublishStore::clear() {
  head_ = 0;
  tail_ = 0;
  count_ = 0;
  saveMeta();
}

uint32_t PublishStore::restore() {
  if (!backend_) return 0;

  uint32_t head = 0;
  uint32_t tail = 0;
  uint32_t count = 0;
  if (!backend_->loadMeta(head, tail, count)) {
    clear();
    return 0;
  }
  const uint32_t cap = capacity();
  if (head >= cap || tail >= cap || count > cap || (head + count) % cap != tail) {
    LOG_WARN(TAG, "store: bad meta h=%lu t=%lu c=%lu, cleared",
             (unsigned long)head, (unsigned long)tail, (unsigned long)count);
    clear();
    return 0;
  }

  head_ = head;
  tail_ = tail;
  count_ = count;
  for (uint32_t n = 0; n < count_; ++n) {
    if (!backend_->loadSlot(slot(n), slots_[slot(n)])) {
      // Layout changed between firmware versions; drop everything.
      LOG_WARN(TAG, "store: slot %lu unreadable, cleared", (unsigned long)slot(n));
      clear();
      return 0;
    }
  }
  return count_;
}

bool PublishStore::findStatus(uint32_t& n) const {
  for (uint32_t i = 0; i < count_; ++i) {
    if (slots_[slot(i)].kind == PublishKind::status) {
      n = i;
      return true;
    }
  }
  return false;
}

void PublishStore::removeAt(uint32_t n) {
  for (uint32_t i = n; i + 1 < count_; ++i) {
    slots_[slot(i)] = slots_[slot(i + 1)];
    if (backend_) backend_->saveSlot(slot(i), slots_[slot(i)]);
  }
  tail_ = (tail_ + capacity() - 1) % capacity();
  --count_;
  saveMeta();
}

void PublishStore::append(const PublishMsg& msg) {
  slots_[tail_] = msg;
  if (backend_) backend_->saveSlot(tail_, msg);
  tail_ = (tail_ + 1) % capacity();
  ++count_;
  saveMeta();
}

StoreResult PublishStore::push(const PublishMsg& msg) {
  uint32_t n = 0;
  if (msg.kind == PublishKind::status) {
    if (findStatus(n)) {
      slots_[slot(n)] = msg;
      if (backend_) backend_->saveSlot(slot(n), msg);
      ++coalesced_;
      return StoreResult::coalesced;
    }
    if (count_ >= capacity()) {
      ++drops_;
      return StoreResult::dropped;
    }
    append(msg);
    return StoreResult::stored;
  }

  if (count_ < capacity()) {
    append(msg);
    return StoreResult::stored;
  }
  if (!findStatus(n)) {
    ++drops_;
    LOG_WARN(TAG, "store full (%lu), %s dropped", (unsigned long)count_, msg.id);
    return StoreResult::dropped;
  }
  removeAt(n);
  append(msg);
  ++evictions_;
  return StoreResult::evicted_status;
}

bool PublishStore::peek(PublishMsg& out) const {
  if (count_ == 0) return false;
  out = slots_[head_];
  return true;
}

void PublishStore::pop() {
  if (count_ == 0) return;
  head_ = (head_ + 1) % capacity();
  --count_;
  saveMeta();
}
