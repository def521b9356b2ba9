/**
 * @file h5_explore.cpp
 * @brief HDF5 文件结构浏览工具：打印组/数据集/属性树，并对内容做有界预览
 *
 * 用法：
 *   ./h5tree_explore --help
 *
 * 常用：
 *   # 1) 仅在控制台查看
 *   ./h5tree_explore data.h5
 *
 *   # 2) 同时保存到文件（默认 h5_structure.txt）
 *   ./h5tree_explore data.h5 -s -o structure_report.txt -m 10
 */

#include "h5tree/core/common.hpp"
#include "h5tree/core/log.hpp"
#include "h5tree/format/render_config.hpp"
#include "h5tree/session/explorer.hpp"

#include <charconv>
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace {

using h5tree::core::LogLevel;

struct Options final {
    std::string input_path{};
    std::string output_path{h5tree::core::kDefaultOutputPath};
    std::size_t max_items{h5tree::core::kDefaultMaxDisplayItems};
    std::size_t max_string_length{h5tree::core::kDefaultMaxStringLength};
    bool save{false};

    LogLevel log_level{LogLevel::warn};
};

static void print_usage(const char *argv0) {
    std::cout << "用法:\n"
              << "  " << argv0 << " <h5_file> [options]\n\n"
              << "选项:\n"
              << "  -o, --output <path>             输出文件路径（默认 h5_structure.txt，仅 --save 时生效）\n"
              << "  -m, --max-items <n>             数据集/数组最多展示的元素数（默认 10）\n"
              << "  -l, --max-string-length <n>     字符串截断长度（默认 100）\n"
              << "  -s, --save                      同时保存到输出文件\n"
              << "  --log-level <lvl>               trace|debug|info|warn|error|critical|off（默认 warn）\n"
              << "  -h, --help                      显示帮助\n\n"
              << "示例:\n"
              << "  " << argv0 << " data.h5\n"
              << "  " << argv0 << " data.h5 -s -o structure_report.txt -m 10\n";
}

static bool parse_size(std::string_view s, std::size_t &out) {
    std::size_t v = 0;
    auto *begin = s.data();
    auto *end = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(begin, end, v, 10);
    if (s.empty() || ec != std::errc{} || ptr != end) {
        return false;
    }
    out = v;
    return true;
}

static bool parse_log_level(std::string_view s, LogLevel &out) {
    if (s == "trace") {
        out = LogLevel::trace;
        return true;
    }
    if (s == "debug") {
        out = LogLevel::debug;
        return true;
    }
    if (s == "info") {
        out = LogLevel::info;
        return true;
    }
    if (s == "warn") {
        out = LogLevel::warn;
        return true;
    }
    if (s == "error") {
        out = LogLevel::error;
        return true;
    }
    if (s == "critical") {
        out = LogLevel::critical;
        return true;
    }
    if (s == "off") {
        out = LogLevel::off;
        return true;
    }
    return false;
}

// 返回值：0 继续执行；1 已打印帮助；2 参数错误。
static int parse_args(int argc, char **argv, Options &opt) {
    bool has_input = false;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        auto next_value = [&](std::string_view &out) -> bool {
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string_view value;
        if (arg == "-h" || arg == "--help") {
            return 1;
        }
        if (arg == "-s" || arg == "--save") {
            opt.save = true;
            continue;
        }
        if (arg == "-o" || arg == "--output") {
            if (!next_value(value)) {
                return 2;
            }
            opt.output_path = std::string(value);
            continue;
        }
        if (arg == "-m" || arg == "--max-items") {
            if (!next_value(value)) {
                return 2;
            }
            if (!parse_size(value, opt.max_items)) {
                std::cerr << "invalid --max-items: " << value << "\n";
                return 2;
            }
            continue;
        }
        if (arg == "-l" || arg == "--max-string-length") {
            if (!next_value(value)) {
                return 2;
            }
            if (!parse_size(value, opt.max_string_length)) {
                std::cerr << "invalid --max-string-length: " << value << "\n";
                return 2;
            }
            continue;
        }
        if (arg == "--log-level") {
            if (!next_value(value)) {
                return 2;
            }
            if (!parse_log_level(value, opt.log_level)) {
                std::cerr << "invalid --log-level: " << value << "\n";
                return 2;
            }
            continue;
        }
        if (!arg.empty() && arg.front() == '-') {
            std::cerr << "unknown arg: " << arg << "\n";
            return 2;
        }
        if (has_input) {
            std::cerr << "unexpected extra input: " << arg << "\n";
            return 2;
        }
        opt.input_path = std::string(arg);
        has_input = true;
    }

    if (!has_input) {
        std::cerr << "missing input file\n";
        return 2;
    }
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    Options opt;
    const int rc = parse_args(argc, argv, opt);
    if (rc != 0) {
        print_usage(argv[0]);
        return rc == 1 ? 0 : 2;
    }

    h5tree::core::use_stderr_logger();
    h5tree::core::set_log_level(opt.log_level);

    std::cout << "current HDF5 directory: ./" << opt.input_path << "\n";

    h5tree::format::RenderConfig config;
    config.max_display_items = opt.max_items;
    config.max_string_length = opt.max_string_length;

    const h5tree::session::Explorer explorer(config);

    // 未指定 --save 时忽略 --output。
    std::optional<std::string> output_path;
    if (opt.save) {
        output_path = opt.output_path;
    }

    const auto ec = explorer.explore(opt.input_path, output_path);
    return ec ? 1 : 0;
}
