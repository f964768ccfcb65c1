#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>

// "[#####     ] 50%". total == 0 renders as 0% with an empty bar.
std::string render_progress_bar(std::size_t completed, std::size_t total, std::size_t width);

class ProgressReporter {
public:
  ProgressReporter(std::ostream& out, std::size_t width, bool enabled = true);
  ~ProgressReporter();

  void update(std::size_t completed, std::size_t total);
  // Ends the progress line if anything was drawn.
  void finish();

private:
  std::ostream& out_;
  std::size_t width_;
  bool enabled_;
  std::size_t line_width_ = 0;
};
