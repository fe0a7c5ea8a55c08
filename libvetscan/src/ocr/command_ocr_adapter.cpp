#include "../../include/command_ocr_adapter.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <spawn.h>
#include <stdexcept>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char **environ;

namespace {

constexpr std::string_view kInput = "{input}";
constexpr std::string_view kOutput = "{output}";
constexpr auto kPollInterval = std::chrono::milliseconds(20);

void replace_all(std::string& s, const std::string_view from, const std::string& to) {
    for (auto pos = s.find(from); pos != std::string::npos; pos = s.find(from, pos + to.size())) {
        s.replace(pos, from.size(), to);
    }
}

/**
 * @brief Removes the chunk's temp directory on scope exit.
 */
struct TempDirGuard {
    std::filesystem::path dir;
    ~TempDirGuard() { vetscan::cleanup_temp_dir(dir, "command_ocr"); }
};

/**
 * @brief posix_spawn_file_actions_t with RAII destruction.
 */
struct SpawnFileActions {
    posix_spawn_file_actions_t actions{};
    SpawnFileActions() { posix_spawn_file_actions_init(&actions); }
    ~SpawnFileActions() { posix_spawn_file_actions_destroy(&actions); }
    SpawnFileActions(const SpawnFileActions&) = delete;
    SpawnFileActions& operator=(const SpawnFileActions&) = delete;
};

void kill_and_reap(const pid_t pid) {
    kill(pid, SIGKILL);
    int status = 0;
    while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
}

std::string last_line_of(const std::filesystem::path& path) {
    std::string text;
    try {
        const auto bytes = vetscan::read_file_bytes(path);
        text.assign(bytes.begin(), bytes.end());
    } catch (const std::exception&) {
        return {};
    }
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) text.pop_back();
    const auto nl = text.find_last_of('\n');
    return nl == std::string::npos ? text : text.substr(nl + 1);
}

} // namespace

namespace vetscan {

CommandOcrAdapter::CommandOcrAdapter(const std::string& command) : tokens_(tokenize(command)) {
    if (tokens_.empty()) {
        throw std::invalid_argument("OCR command is empty");
    }
    bool has_input = false;
    for (const auto& t : tokens_) {
        if (t.find(kInput) != std::string::npos) has_input = true;
        if (t.find(kOutput) != std::string::npos) writes_output_file_ = true;
    }
    if (!has_input) {
        throw std::invalid_argument("OCR command must contain {input}: " + command);
    }
    name_ = std::filesystem::path(tokens_.front()).filename().string();
}

std::vector<std::string> CommandOcrAdapter::tokenize(const std::string_view command) {
    std::vector<std::string> words;
    std::string current;
    bool quoted = false;
    bool in_word = false;
    for (const char c : command) {
        if (c == '"') {
            quoted = !quoted;
            in_word = true;
        } else if (!quoted && (c == ' ' || c == '\t' || c == '\n')) {
            if (in_word) words.push_back(std::move(current));
            current.clear();
            in_word = false;
        } else {
            current.push_back(c);
            in_word = true;
        }
    }
    if (in_word) words.push_back(std::move(current));
    return words;
}

std::vector<PageText> CommandOcrAdapter::split_pages(std::string_view text) {
    if (!text.empty() && text.back() == '\f') text.remove_suffix(1);

    std::vector<PageText> pages;
    std::size_t start = 0;
    while (true) {
        const auto ff = text.find('\f', start);
        const auto end = ff == std::string_view::npos ? text.size() : ff;
        pages.push_back({pages.size(), std::string(text.substr(start, end - start))});
        if (ff == std::string_view::npos) break;
        start = ff + 1;
    }
    return pages;
}

std::vector<PageText> CommandOcrAdapter::extract_text(const OcrRequest& request, std::stop_token stop) {
    if (stop.stop_requested()) {
        throw CancelledError();
    }

    std::filesystem::path dir;
    try {
        dir = make_temp_dir_for("p" + std::to_string(request.pages.start_page), "ocr");
    } catch (const std::exception& e) {
        throw OcrFatalError(e.what());
    }
    TempDirGuard tmp{dir};
    const auto input = tmp.dir / "chunk.pdf";
    const auto output = tmp.dir / "chunk.txt";
    const auto errors = tmp.dir / "stderr.txt";
    try {
        write_file_bytes(input, request.chunk_pdf);
    } catch (const std::exception& e) {
        throw OcrTransientError(std::string("cannot stage chunk for OCR: ") + e.what());
    }

    std::vector<std::string> args;
    args.reserve(tokens_.size());
    for (auto t : tokens_) {
        replace_all(t, kInput, input.string());
        replace_all(t, kOutput, output.string());
        args.push_back(std::move(t));
    }
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    SpawnFileActions fa;
    posix_spawn_file_actions_addopen(&fa.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    if (!writes_output_file_) {
        posix_spawn_file_actions_addopen(&fa.actions, STDOUT_FILENO, output.c_str(),
                                         O_WRONLY | O_CREAT | O_TRUNC, 0600);
    }
    posix_spawn_file_actions_addopen(&fa.actions, STDERR_FILENO, errors.c_str(),
                                     O_WRONLY | O_CREAT | O_TRUNC, 0600);

    Logger::log(LogLevel::Debug, "Running " + name_ + " on chunk " + request.pages.to_string(), "command_ocr");

    pid_t pid = 0;
    if (const int rc = posix_spawnp(&pid, argv[0], &fa.actions, nullptr, argv.data(), environ); rc != 0) {
        throw OcrFatalError("cannot start OCR command '" + args.front() + "': " + std::strerror(rc));
    }

    const auto deadline = std::chrono::steady_clock::now() + request.timeout;
    int status = 0;
    while (true) {
        const pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r == -1) {
            if (errno == EINTR) continue;
            throw OcrFatalError(std::string("waitpid failed: ") + std::strerror(errno));
        }
        if (stop.stop_requested()) {
            kill_and_reap(pid);
            throw CancelledError("OCR call cancelled");
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            kill_and_reap(pid);
            throw OcrTransientError("OCR call timed out after " + std::to_string(request.timeout.count()) + " ms");
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        const std::string detail = WIFEXITED(status)
            ? "exit status " + std::to_string(WEXITSTATUS(status))
            : "signal " + std::to_string(WTERMSIG(status));
        std::string message = name_ + " failed with " + detail;
        if (const auto line = last_line_of(errors); !line.empty()) message += ": " + line;
        throw OcrTransientError(message);
    }

    std::vector<std::uint8_t> bytes;
    try {
        bytes = read_file_bytes(output);
    } catch (const std::exception& e) {
        throw OcrTransientError(name_ + " produced no output: " + e.what());
    }

    auto pages = split_pages(std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
    Logger::log(LogLevel::Debug,
                name_ + " returned " + std::to_string(pages.size()) + " pages for chunk " + request.pages.to_string(),
                "command_ocr");
    return pages;
}

} // namespace vetscan
