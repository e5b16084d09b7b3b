#pragma once
// Transport boundary: what the envelope layer needs from a publish/subscribe
// transport, plus an in-process loopback implementation.
//
// A Publisher hands out writable slots sized for exactly one Envelope; the
// caller encodes in place and publishes, after which the slot belongs to the
// transport again. A Subscriber polls without blocking.
//
// Concurrency:
// - One handle is driven by one thread; give each producer/consumer its own
//   handle instead of sharing one
// - LoopbackChannel locks internally so one publishing thread and one
//   polling thread may use it at the same time
#include "envelope.hpp"
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

class Publisher {
public:
  virtual ~Publisher() = default;
  // Writable slot, or nullptr when every slot is in flight.
  virtual Envelope* loan() = 0;
  // Hand a loaned slot to the transport. The caller must not touch it after.
  virtual void publish(Envelope* slot) = 0;
  // Give a loaned slot back without sending it.
  virtual void release(Envelope* slot) = 0;
};

class Subscriber {
public:
  virtual ~Subscriber() = default;
  // Copy the next envelope into `out`; false when none is available.
  virtual bool poll_one(Envelope& out) = 0;
};

// Single-process channel backed by a fixed pool of envelope slots.
class LoopbackChannel : public Publisher, public Subscriber {
  std::string service;
  std::vector<Envelope> slots;
  std::vector<size_t> free_slots;
  // Per slot: true between loan() and publish()/release().
  std::vector<bool> on_loan;
  std::deque<size_t> ready;
  std::mutex mutex;

  size_t index_of(const Envelope* slot) const;
  size_t take_back(Envelope* slot);

public:
  explicit LoopbackChannel(const std::string& service_name = DEFAULT_SERVICE_NAME, size_t slot_count = 16);

  Envelope* loan() override;
  // Both throw std::invalid_argument for a slot that is not currently on
  // loan from this channel.
  void publish(Envelope* slot) override;
  void release(Envelope* slot) override;
  bool poll_one(Envelope& out) override;

  const std::string& service_name() const {
    return service;
  }
  size_t capacity() const {
    return slots.size();
  }
  // Number of published envelopes not yet polled.
  size_t pending();
};

// Loan a slot, encode into it and publish. Returns false if no slot was
// free. Encoding errors (IpcError) propagate and the slot is released.
bool publish_envelope(Publisher& publisher, const std::string& topic, const std::string& body, uint8_t priority, uint64_t timestamp);
bool publish_envelope(Publisher& publisher, const std::string& topic, const std::string& body, uint8_t priority);
