#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

// "[######....]" for done/total in width slots; all '_' when total is unknown.
std::string format_progress_bar(uint64_t done, uint64_t total, std::size_t width);

class ProgressMeter {
public:
  ProgressMeter(std::string label,
                std::size_t width,
                bool enabled,
                std::ostream& out,
                std::chrono::milliseconds min_interval = std::chrono::milliseconds(100));

  void update(uint64_t transferred, uint64_t total);
  // Draws the last state and clears the line.
  void finish();

  bool enabled() const { return enabled_; }

private:
  void draw();

  std::string label_;
  std::size_t width_;
  bool enabled_;
  std::ostream& out_;
  std::chrono::milliseconds min_interval_;
  std::chrono::steady_clock::time_point last_draw_{};
  uint64_t transferred_ = 0;
  uint64_t total_ = 0;
  std::size_t line_width_ = 0;
  bool drawn_ = false;
};
