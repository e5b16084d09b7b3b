#pragma once
// Message priority scale carried in the envelope's single priority byte.
// Only 0..3 have names; any other byte is still valid on the wire.
#include <cstdint>
#include <string>

enum class Priority : uint8_t { LOW = 0, NORMAL = 1, HIGH = 2, CRITICAL = 3 };

// "Low", "Normal", "High", "Critical", or "Unknown(n)" for any other byte.
std::string priority_name(uint8_t priority);

inline std::string priority_name(Priority priority) {
  return priority_name(static_cast<uint8_t>(priority));
}

// Reverse lookup of the four canonical names. Returns false for anything else.
bool parse_priority(const std::string& name, uint8_t& out);

// Receivers treat High and above as action-required.
inline bool is_action_required(uint8_t priority) {
  return priority >= static_cast<uint8_t>(Priority::HIGH);
}
