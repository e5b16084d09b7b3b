#include "priority.hpp"

static const char* const kPriorityNames[] = {"Low", "Normal", "High", "Critical"};
static const uint8_t kPriorityCount = 4;

std::string priority_name(uint8_t priority) {
  if (priority < kPriorityCount)
    return kPriorityNames[priority];
  return "Unknown(" + std::to_string(priority) + ")";
}

bool parse_priority(const std::string& name, uint8_t& out) {
  for (uint8_t i = 0; i < kPriorityCount; ++i) {
    if (name == kPriorityNames[i]) {
      out = i;
      return true;
    }
  }
  return false;
}
