/**
 * @file test_cli_explore.cpp
 * @brief h5tree_explore 命令行工具的端到端测试：退出码与输出文件
 *
 * 可执行文件路径由第一个参数给出；未给出时在测试程序同目录下查找。
 */

#include "h5_fixture.hpp"
#include "test_main.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;
using h5tree::tests::ScopedFile;

static std::optional<int> wait_exit_code(pid_t pid, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        int status = 0;
        const pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return -1;
        }
        if (r < 0) {
            return std::nullopt;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            (void)::kill(pid, SIGKILL);
            (void)::waitpid(pid, &status, 0);
            return std::nullopt;
        }
        std::this_thread::sleep_for(10ms);
    }
}

// 在 cwd 下运行工具，stdout/stderr 丢弃；返回退出码（超时或失败为 -1）。
static int run_tool(const std::string &exe, const std::vector<std::string> &args, const std::string &cwd) {
    std::vector<std::string> storage;
    storage.push_back(exe);
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char *> argv;
    for (auto &s : storage) {
        argv.push_back(s.data());
    }
    argv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        TEST_FAIL(std::string("fork failed: ") + std::strerror(errno));
        return -1;
    }
    if (pid == 0) {
        // child: 切换工作目录并丢弃输出
        if (::chdir(cwd.c_str()) != 0) {
            std::_Exit(126);
        }
        const int null_fd = ::open("/dev/null", O_WRONLY);
        if (null_fd >= 0) {
            (void)::dup2(null_fd, STDOUT_FILENO);
            (void)::dup2(null_fd, STDERR_FILENO);
            (void)::close(null_fd);
        }
        ::execv(exe.c_str(), argv.data());
        std::_Exit(127);
    }

    const auto code = wait_exit_code(pid, 20s);
    return code.has_value() ? *code : -1;
}

struct Workspace final {
    std::filesystem::path dir;

    Workspace() : dir(std::filesystem::temp_directory_path() / "h5tree_cli_explore") {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        std::filesystem::create_directories(dir, ec);
    }
    ~Workspace() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    Workspace(const Workspace &) = delete;
    Workspace &operator=(const Workspace &) = delete;

    [[nodiscard]] std::string cwd() const { return dir.string(); }
    [[nodiscard]] bool has(const std::string &name) const { return std::filesystem::exists(dir / name); }
};

void test_usage_errors(const std::string &exe, const std::string &sample, const Workspace &ws) {
    TEST_EXPECT_EQ(run_tool(exe, {}, ws.cwd()), 2);
    TEST_EXPECT_EQ(run_tool(exe, {sample, "--bogus"}, ws.cwd()), 2);
    TEST_EXPECT_EQ(run_tool(exe, {sample, "-m", "-1"}, ws.cwd()), 2);
    TEST_EXPECT_EQ(run_tool(exe, {sample, "-m", "ten"}, ws.cwd()), 2);
    TEST_EXPECT_EQ(run_tool(exe, {sample, "-l", "-5"}, ws.cwd()), 2);
    TEST_EXPECT_EQ(run_tool(exe, {sample, "--max-string-length", "1.5"}, ws.cwd()), 2);
    TEST_EXPECT_EQ(run_tool(exe, {sample, "-m"}, ws.cwd()), 2);
    TEST_EXPECT_EQ(run_tool(exe, {sample, "--log-level", "loud"}, ws.cwd()), 2);
    TEST_EXPECT_EQ(run_tool(exe, {sample, sample}, ws.cwd()), 2);
}

void test_help_and_success(const std::string &exe, const std::string &sample, const Workspace &ws) {
    TEST_EXPECT_EQ(run_tool(exe, {"--help"}, ws.cwd()), 0);
    TEST_EXPECT_EQ(run_tool(exe, {sample}, ws.cwd()), 0);
    TEST_EXPECT_EQ(run_tool(exe, {sample, "-m", "0", "-l", "0", "--log-level", "off"}, ws.cwd()), 0);
}

void test_exploration_failures(const std::string &exe, const Workspace &ws) {
    TEST_EXPECT_EQ(run_tool(exe, {"/nonexistent/h5tree_missing.h5"}, ws.cwd()), 1);
    TEST_EXPECT(!ws.has("h5_structure.txt"));

    const ScopedFile garbage("h5tree_cli_garbage.h5");
    h5tree::tests::write_text_file(garbage.path(), "garbage");
    TEST_EXPECT_EQ(run_tool(exe, {garbage.path()}, ws.cwd()), 1);
}

void test_output_requires_save(const std::string &exe, const std::string &sample, const Workspace &ws) {
    // 未指定 --save 时 --output 被忽略。
    TEST_EXPECT_EQ(run_tool(exe, {sample, "-o", "report.txt"}, ws.cwd()), 0);
    TEST_EXPECT(!ws.has("report.txt"));

    TEST_EXPECT_EQ(run_tool(exe, {sample, "-s", "-o", "report.txt"}, ws.cwd()), 0);
    TEST_EXPECT(ws.has("report.txt"));

    TEST_EXPECT_EQ(run_tool(exe, {sample, "--save"}, ws.cwd()), 0);
    TEST_EXPECT(ws.has("h5_structure.txt"));

    if (std::filesystem::exists("/dev/full")) {
        TEST_EXPECT_EQ(run_tool(exe, {sample, "-s", "-o", "/dev/full"}, ws.cwd()), 1);
    }
}

} // namespace

int main(int argc, char **argv) {
    std::string exe;
    if (argc > 1) {
        exe = argv[1];
    } else {
        const auto base = std::filesystem::path(argc > 0 ? argv[0] : "").parent_path();
        exe = (base / "h5tree_explore").lexically_normal().string();
    }
    if (::access(exe.c_str(), X_OK) != 0) {
        std::fprintf(stderr, "[cli_explore] SKIP: h5tree_explore 未构建或不可执行\n");
        return 77;
    }
    exe = std::filesystem::absolute(exe).string();

    const Workspace ws;
    const ScopedFile sample("h5tree_cli_sample.h5");
    h5tree::tests::write_sample_file(sample.path());

    test_usage_errors(exe, sample.path(), ws);
    test_help_and_success(exe, sample.path(), ws);
    test_exploration_failures(exe, ws);
    test_output_requires_save(exe, sample.path(), ws);
    return ::h5tree::tests::run_and_report();
}
