#include "h5tree/walk/line_sink.hpp"

#include <string>

namespace h5tree::walk {

void LineSink::write_line(std::string_view line) {
  std::string text;
  text.reserve(line.size() + 1);
  text.append(line);
  text.push_back('\n');

  console_.write(text.data(), static_cast<std::streamsize>(text.size()));
  if (file_ != nullptr) {
    file_->write(text.data(), static_cast<std::streamsize>(text.size()));
  }
}

}  // namespace h5tree::walk
