#include "h5tree/session/explorer.hpp"

#include "h5tree/core/common.hpp"
#include "h5tree/core/error.hpp"
#include "h5tree/h5/reader.hpp"
#include "h5tree/walk/line_sink.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <fstream>

namespace h5tree::session {

std::string separator_line() {
  return std::string(core::kSeparatorWidth, '=');
}

std::error_code Explorer::explore(const std::string& path, const std::optional<std::string>& output_path) const {
  try {
    return explore_impl_(path, output_path);
  } catch (const std::exception& e) {
    spdlog::error("exploring {} failed: {}", path, e.what());
    console_ << "Unexpected error: " << e.what() << "\n";
    return core::make_error_code(core::errc::unexpected);
  }
}

std::error_code Explorer::explore_impl_(const std::string& path,
                                        const std::optional<std::string>& output_path) const {
  spdlog::debug("exploring {} (max_items={}, max_string_length={})",
               path,
               config_.max_display_items,
               config_.max_string_length);

  // 先打开 HDF5 文件：失败时不应留下输出文件。
  h5::File file;
  std::string err;
  if (auto ec = h5::File::open(path, file, err)) {
    if (ec == core::errc::file_not_found) {
      console_ << "Error: HDF5 file '" << path << "' not found.\n";
    } else {
      console_ << "Error: Cannot read HDF5 file '" << path << "': " << err << "\n";
    }
    spdlog::error("open {} failed: {}", path, err);
    return ec;
  }

  model::Group root;
  if (auto ec = h5::load_root(file, root, err)) {
    console_ << "Error: Cannot read HDF5 file '" << path << "': " << err << "\n";
    spdlog::error("load {} failed: {}", path, err);
    return ec;
  }

  if (output_path.has_value()) {
    {
      std::ofstream out(*output_path, std::ios::out | std::ios::trunc);
      if (!out.is_open()) {
        const std::string cause = std::strerror(errno);
        console_ << "Error: Cannot write output file '" << *output_path << "': " << cause << "\n";
        spdlog::error("open output {} failed: {}", *output_path, cause);
        return core::make_error_code(core::errc::output_open_failed);
      }

      walk::LineSink sink(console_, &out);
      sink.write_line(separator_line());
      walker_.walk(root, sink);

      // 写满磁盘等错误只会体现在流状态上。
      out.flush();
      if (!out) {
        const std::string cause = std::strerror(errno);
        console_ << "Error: Cannot write output file '" << *output_path << "': " << cause << "\n";
        spdlog::error("write output {} failed: {}", *output_path, cause);
        return core::make_error_code(core::errc::output_open_failed);
      }
    }
    console_ << "Results saved to: " << *output_path << "\n";
  } else {
    walk::LineSink sink(console_);
    sink.write_line("HDF5 File Structure: " + path);
    sink.write_line(separator_line());
    walker_.walk(root, sink);
    sink.write_line("\nStructure exploration completed.");
  }

  spdlog::debug("finished {}", path);
  return {};
}

}  // namespace h5tree::session
