// Small utility helpers
//
// `is_valid_utf8` validates a byte range as well-formed UTF-8 (no overlong
// forms, no surrogates, nothing above U+10FFFF).
// `now_millis` reads the wall clock as milliseconds since the epoch.
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

static inline bool is_valid_utf8(const uint8_t* data, size_t len) {
  size_t i = 0;
  while (i < len) {
    uint8_t c = data[i];
    if (c < 0x80) {
      ++i;
      continue;
    }

    size_t extra;
    uint8_t lo = 0x80, hi = 0xBF; // allowed range of the first continuation byte
    if (c >= 0xC2 && c <= 0xDF) {
      extra = 1;
    } else if (c == 0xE0) {
      extra = 2;
      lo = 0xA0;
    } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
      extra = 2;
    } else if (c == 0xED) {
      extra = 2;
      hi = 0x9F;
    } else if (c == 0xF0) {
      extra = 3;
      lo = 0x90;
    } else if (c >= 0xF1 && c <= 0xF3) {
      extra = 3;
    } else if (c == 0xF4) {
      extra = 3;
      hi = 0x8F;
    } else {
      return false;
    }

    if (len - i <= extra)
      return false;
    if (data[i + 1] < lo || data[i + 1] > hi)
      return false;
    for (size_t k = 2; k <= extra; ++k) {
      if ((data[i + k] & 0xC0) != 0x80)
        return false;
    }
    i += extra + 1;
  }
  return true;
}

static inline bool is_valid_utf8(const std::string& s) {
  return is_valid_utf8(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

static inline uint64_t now_millis() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}
