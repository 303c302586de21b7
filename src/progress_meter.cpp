#include "progress_meter.hpp"

#include <algorithm>
#include <sstream>

#include "utils.hpp"

std::string format_progress_bar(uint64_t done, uint64_t total, std::size_t width) {
  const std::size_t slots = std::max<std::size_t>(1, width);
  std::string bar;
  bar.reserve(slots + 2);
  bar.push_back('[');
  if(total == 0) {
    bar.append(slots, '_');
  } else {
    const double ratio = std::clamp(static_cast<double>(done) / static_cast<double>(total), 0.0, 1.0);
    auto filled = static_cast<std::size_t>(ratio * static_cast<double>(slots));
    if(done >= total) filled = slots;
    bar.append(filled, '#');
    bar.append(slots - filled, '.');
  }
  bar.push_back(']');
  return bar;
}

ProgressMeter::ProgressMeter(std::string label,
                             std::size_t width,
                             bool enabled,
                             std::ostream& out,
                             std::chrono::milliseconds min_interval)
  : label_(std::move(label)),
    width_(std::max<std::size_t>(1, width)),
    enabled_(enabled),
    out_(out),
    min_interval_(min_interval) {}

void ProgressMeter::update(uint64_t transferred, uint64_t total) {
  transferred_ = transferred;
  total_ = total;
  if(!enabled_) return;
  auto now = std::chrono::steady_clock::now();
  const bool complete = total_ > 0 && transferred_ >= total_;
  if(drawn_ && !complete && now - last_draw_ < min_interval_) return;
  last_draw_ = now;
  draw();
}

void ProgressMeter::draw() {
  std::ostringstream line;
  line << "\r" << label_ << " " << format_progress_bar(transferred_, total_, width_)
       << " " << format_size(transferred_);
  if(total_ > 0) line << "/" << format_size(total_);
  auto rendered = line.str();
  out_ << rendered;
  if(rendered.size() < line_width_) {
    out_ << std::string(line_width_ - rendered.size(), ' ');
  } else {
    line_width_ = rendered.size();
  }
  out_.flush();
  drawn_ = true;
}

void ProgressMeter::finish() {
  if(!enabled_ || !drawn_) return;
  draw();
  out_ << "\r" << std::string(line_width_, ' ') << "\r";
  out_.flush();
  drawn_ = false;
  line_width_ = 0;
}
