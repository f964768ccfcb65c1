#include "progress_reporter.hpp"

#include <algorithm>
#include <ostream>

std::string render_progress_bar(std::size_t completed, std::size_t total, std::size_t width) {
  std::size_t percent = 0;
  if(total > 0) {
    percent = std::min(completed, total) * 100 / total;
  }
  const std::size_t filled = percent * width / 100;

  std::string bar;
  bar.reserve(width + 8);
  bar.push_back('[');
  bar.append(filled, '#');
  bar.append(width - filled, ' ');
  bar.append("] ");
  bar.append(std::to_string(percent));
  bar.push_back('%');
  return bar;
}

ProgressReporter::ProgressReporter(std::ostream& out, std::size_t width, bool enabled)
  : out_(out), width_(width), enabled_(enabled) {}

ProgressReporter::~ProgressReporter() {
  finish();
}

void ProgressReporter::update(std::size_t completed, std::size_t total) {
  if(!enabled_) return;
  std::string line = "Progress: " + render_progress_bar(completed, total, width_);
  out_ << '\r' << line;
  if(line.size() < line_width_) {
    out_ << std::string(line_width_ - line.size(), ' ');
  }
  line_width_ = std::max(line_width_, line.size());
  out_.flush();
}

void ProgressReporter::finish() {
  if(line_width_ == 0) return;
  out_ << '\n';
  out_.flush();
  line_width_ = 0;
}
