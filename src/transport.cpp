#include "transport.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "util.hpp"
#include <cstring>
#include <stdexcept>

LoopbackChannel::LoopbackChannel(const std::string& service_name, size_t slot_count) : service(service_name), slots(slot_count), on_loan(slot_count, false) {
  if (slot_count == 0) {
    throw std::invalid_argument("LoopbackChannel needs at least one slot");
  }
  free_slots.reserve(slot_count);
  for (size_t i = slot_count; i > 0; --i)
    free_slots.push_back(i - 1);
  Logger::log(Logger::DEBUG, "loopback channel " + service + " ready with " + std::to_string(slot_count) + " slots");
}

size_t LoopbackChannel::index_of(const Envelope* slot) const {
  if (slot < slots.data() || slot >= slots.data() + slots.size()) {
    throw std::invalid_argument("envelope slot does not belong to " + service);
  }
  return static_cast<size_t>(slot - slots.data());
}

Envelope* LoopbackChannel::loan() {
  std::lock_guard<std::mutex> lock(mutex);
  if (free_slots.empty()) {
    Logger::log(Logger::WARN, "no free slot on " + service);
    return nullptr;
  }
  size_t index = free_slots.back();
  free_slots.pop_back();
  on_loan[index] = true;
  return &slots[index];
}

// Caller holds the mutex.
size_t LoopbackChannel::take_back(Envelope* slot) {
  size_t index = index_of(slot);
  if (!on_loan[index]) {
    throw std::invalid_argument("envelope slot " + std::to_string(index) + " of " + service + " is not on loan");
  }
  on_loan[index] = false;
  return index;
}

void LoopbackChannel::publish(Envelope* slot) {
  std::lock_guard<std::mutex> lock(mutex);
  ready.push_back(take_back(slot));
}

void LoopbackChannel::release(Envelope* slot) {
  std::lock_guard<std::mutex> lock(mutex);
  free_slots.push_back(take_back(slot));
}

bool LoopbackChannel::poll_one(Envelope& out) {
  std::lock_guard<std::mutex> lock(mutex);
  if (ready.empty())
    return false;
  size_t index = ready.front();
  ready.pop_front();
  std::memcpy(&out, &slots[index], sizeof(Envelope));
  free_slots.push_back(index);
  return true;
}

size_t LoopbackChannel::pending() {
  std::lock_guard<std::mutex> lock(mutex);
  return ready.size();
}

bool publish_envelope(Publisher& publisher, const std::string& topic, const std::string& body, uint8_t priority, uint64_t timestamp) {
  Envelope* slot = publisher.loan();
  if (!slot)
    return false;
  try {
    encode_envelope_into(*slot, topic, body, priority, timestamp);
  } catch (const IpcError&) {
    publisher.release(slot);
    throw;
  }
  publisher.publish(slot);
  return true;
}

bool publish_envelope(Publisher& publisher, const std::string& topic, const std::string& body, uint8_t priority) {
  return publish_envelope(publisher, topic, body, priority, now_millis());
}
