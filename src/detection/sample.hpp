#ifndef SAMPLE_HPP
#define SAMPLE_HPP

#include <cstdint>
#include <string>
#include <utility>

// One observed count or magnitude for a signal at one moment.
struct Sample {
  uint64_t timestamp_ms = 0;
  double value = 0.0;
  // Origin of the observation; for social posts this carries the text excerpt
  // the count was derived from and feeds location resolution.
  std::string source_tag;

  Sample() = default;
  Sample(uint64_t ts, double v, std::string tag = "")
      : timestamp_ms(ts), value(v), source_tag(std::move(tag)) {}
};

// Half-open collection range [start_ms, end_ms).
struct TimeWindow {
  uint64_t start_ms = 0;
  uint64_t end_ms = 0;
};

#endif // SAMPLE_HPP
