#include "transcode/FlacCliTranscoder.hpp"
#include "types/Errors.hpp"
#include "logging/LogRegistry.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>

namespace fs = std::filesystem;

using namespace re::transcode;
using namespace re::logging;

namespace {

// Child exit status reserved for a failed execvp, like a shell.
constexpr int EXEC_FAILED = 127;

constexpr size_t MAX_STDERR_BYTES = 4096;

void discardTemp(const fs::path& tmp) {
    std::error_code ec;
    fs::remove(tmp, ec);
    if (ec) LogRegistry::transcode()->warn("[FlacCliTranscoder] Failed to remove {}: {}", tmp.string(), ec.message());
}

std::string trimmed(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
    return s;
}

}

FlacCliTranscoder::FlacCliTranscoder(std::string binary, std::vector<std::string> args)
    : binary_(std::move(binary)), args_(std::move(args)) {}

fs::path FlacCliTranscoder::tempPathFor(const fs::path& file) {
    return fs::path(file.string() + ".tmp");
}

TransformOutcome FlacCliTranscoder::transform(const fs::path& file) const {
    std::error_code ec;
    const auto before = fs::file_size(file, ec);
    if (ec) throw types::TransformError(file, "cannot stat input: " + ec.message());

    const auto tmp = tempPathFor(file);
    std::string err;
    int status = 0;

    try {
        status = runEncoder(file, tmp, err);
    } catch (const std::exception& e) {
        discardTemp(tmp);
        throw types::TransformError(file, e.what());
    }

    if (status == EXEC_FAILED) {
        discardTemp(tmp);
        throw types::TransformError(file, fmt::format("could not execute '{}'", binary_));
    }

    if (status != 0) {
        discardTemp(tmp);
        throw types::TransformError(file, fmt::format("{} exited with status {}{}{}", binary_, status,
                                                      err.empty() ? "" : ": ", trimmed(err)));
    }

    if (!fs::exists(tmp, ec)) throw types::TransformError(file, fmt::format("{} produced no output", binary_));

    const auto after = fs::file_size(tmp, ec);
    if (ec) {
        discardTemp(tmp);
        throw types::TransformError(file, "cannot stat output: " + ec.message());
    }

    fs::rename(tmp, file, ec);
    if (ec) {
        discardTemp(tmp);
        throw types::TransformError(file, "cannot replace original: " + ec.message());
    }

    LogRegistry::transcode()->debug("[FlacCliTranscoder] {} {} -> {} bytes", file.string(), before, after);
    return {file, before, after};
}

int FlacCliTranscoder::runEncoder(const fs::path& file, const fs::path& tmp, std::string& errOut) const {
    const std::string outputArg = "--output-name=" + tmp.string();

    std::vector<const char*> argv;
    argv.reserve(args_.size() + 5);
    argv.push_back(binary_.c_str());
    for (const auto& a : args_) argv.push_back(a.c_str());
    argv.push_back("--force");
    argv.push_back(outputArg.c_str());
    argv.push_back(file.c_str());
    argv.push_back(nullptr);

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) == -1) throw std::runtime_error(fmt::format("pipe: {}", std::strerror(errno)));

    const pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        throw std::runtime_error(fmt::format("fork: {}", std::strerror(errno)));
    }

    if (pid == 0) {
        // Child: own process group so a terminal Ctrl-C reaches only the driver.
        // stderr into the pipe, stdin/stdout on /dev/null.
        setpgid(0, 0);
        dup2(pipefd[1], STDERR_FILENO);
        if (const int devnull = open("/dev/null", O_RDWR); devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
        }
        execvp(binary_.c_str(), const_cast<char* const*>(argv.data()));
        _exit(EXEC_FAILED);
    }

    close(pipefd[1]);

    char buf[512];
    while (true) {
        const ssize_t n = read(pipefd[0], buf, sizeof(buf));
        if (n > 0) {
            if (errOut.size() < MAX_STDERR_BYTES) errOut.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    close(pipefd[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) throw std::runtime_error(fmt::format("waitpid: {}", std::strerror(errno)));
    }

    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) {
        LogRegistry::transcode()->warn("[FlacCliTranscoder] {} killed by signal {} on {}", binary_, WTERMSIG(status), file.string());
        return 128 + WTERMSIG(status);
    }
    return -1;
}
