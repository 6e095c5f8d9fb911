/**
 * PostProcessor.cpp
 */

#include "PostProcessor.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace botarr::core::postprocess {

namespace fs = std::filesystem;

namespace {

/**
 * Owns one end of a pipe
 */
class FdGuard {
public:
    explicit FdGuard(int fd = -1) : m_fd(fd) {}
    ~FdGuard() { reset(); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return m_fd; }

    void reset() {
        if (m_fd >= 0) {
            ::close(m_fd);
            m_fd = -1;
        }
    }

private:
    int m_fd;
};

void appendOutput(std::string& output, const char* data, size_t len) {
    size_t room = PostProcessor::kMaxScriptOutput - std::min(output.size(), PostProcessor::kMaxScriptOutput);
    output.append(data, std::min(len, room));
}

// Reads what is available without blocking; false once the pipe reached EOF
bool drainPipe(int fd, std::string& output) {
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            appendOutput(output, buffer, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

} // namespace

PostProcessOptions PostProcessOptions::fromJson(const nlohmann::json& config) {
    PostProcessOptions options;

    auto section = config.find("postprocess");
    if (section == config.end() || !section->is_object()) {
        return options;
    }

    try {
        options.moveCompleted = section->value("moveCompleted", false);
        options.moveCompletedDir = section->value("moveCompletedDir", std::string());
        options.scriptEnabled = section->value("scriptEnabled", false);
        options.script = section->value("script", std::string());
        int timeout = section->value("scriptTimeout", 300);
        if (timeout > 0) {
            options.scriptTimeout = std::chrono::seconds(timeout);
        }
    } catch (const nlohmann::json::exception& e) {
        Logger::instance().warn("Invalid postprocess settings: {}", e.what());
    }

    return options;
}

PostProcessOptions PostProcessOptions::fromConfig() {
    return fromJson(Config::instance().getAll());
}

nlohmann::json PostProcessResult::toJson() const {
    return {
        {"final_path", finalPath.string()},
        {"moved", moved},
        {"exit_code", exitCode ? nlohmann::json(*exitCode) : nlohmann::json(nullptr)},
        {"output", output},
        {"errors", errors}
    };
}

PostProcessor::PostProcessor(PostProcessOptions options)
    : m_options(std::move(options)) {
}

PostProcessResult PostProcessor::process(const fs::path& file) const {
    PostProcessResult result;
    result.finalPath = file;

    if (m_options.moveCompleted) {
        if (m_options.moveCompletedDir.empty()) {
            result.errors.push_back("Move enabled but no completed directory is configured");
        } else {
            std::string error;
            if (auto moved = moveFile(file, m_options.moveCompletedDir, error)) {
                result.finalPath = *moved;
                result.moved = true;
                Logger::instance().info("Moved {} to {}", file.string(), moved->string());
            } else {
                result.errors.push_back(error);
            }
        }
    }

    if (m_options.scriptEnabled) {
        if (m_options.script.empty()) {
            result.errors.push_back("Script enabled but no script is configured");
        } else {
            runScript(result.finalPath, result);
        }
    }

    for (const auto& error : result.errors) {
        Logger::instance().error("Post-processing {}: {}", file.filename().string(), error);
    }
    return result;
}

std::optional<fs::path> PostProcessor::moveFile(const fs::path& file,
                                                const fs::path& directory,
                                                std::string& error) {
    std::error_code ec;

    if (!fs::is_regular_file(file, ec)) {
        error = "File not found: " + file.string();
        return std::nullopt;
    }

    fs::create_directories(directory, ec);
    if (ec) {
        error = "Cannot create " + directory.string() + ": " + ec.message();
        return std::nullopt;
    }

    fs::path target = directory / file.filename();
    if (fs::equivalent(file, target, ec)) {
        return target;
    }

    ec.clear();
    fs::rename(file, target, ec);
    if (!ec) {
        return target;
    }

    // Cross-device move
    Logger::instance().debug("rename {} failed ({}), copying instead", file.string(), ec.message());
    ec.clear();
    fs::copy_file(file, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        error = "Cannot copy to " + target.string() + ": " + ec.message();
        return std::nullopt;
    }

    fs::remove(file, ec);
    if (ec) {
        Logger::instance().warn("Copied {} but could not remove the source: {}", file.string(), ec.message());
    }
    return target;
}

void PostProcessor::runScript(const fs::path& file, PostProcessResult& result) const {
    Logger::instance().info("Running post-processing script {} on {}", m_options.script, file.string());

    // Close-on-exec so scripts running concurrently never hold each other's pipe;
    // dup2() clears the flag on the child's stdout and stderr
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        result.errors.push_back(std::string("pipe failed: ") + std::strerror(errno));
        return;
    }
    FdGuard readEnd(fds[0]);
    FdGuard writeEnd(fds[1]);

    std::string scriptPath = m_options.script;
    std::string filePath = file.string();

    std::vector<char*> args;
    args.push_back(const_cast<char*>(scriptPath.c_str()));
    args.push_back(const_cast<char*>(filePath.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        result.errors.push_back(std::string("fork failed: ") + std::strerror(errno));
        return;
    }

    if (pid == 0) {
        // Child process
        ::dup2(writeEnd.get(), STDOUT_FILENO);
        ::dup2(writeEnd.get(), STDERR_FILENO);
        ::close(readEnd.get());
        ::close(writeEnd.get());

        execvp(args[0], args.data());
        _exit(127);
    }

    writeEnd.reset();
    ::fcntl(readEnd.get(), F_SETFL, ::fcntl(readEnd.get(), F_GETFL) | O_NONBLOCK);

    auto deadline = std::chrono::steady_clock::now() + m_options.scriptTimeout;
    bool pipeOpen = true;
    int status = 0;

    while (true) {
        if (pipeOpen) {
            pollfd pfd{readEnd.get(), POLLIN, 0};
            int ready = ::poll(&pfd, 1, 100);
            if (ready > 0) {
                pipeOpen = drainPipe(readEnd.get(), result.output);
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            break;
        }
        if (done < 0 && errno != EINTR) {
            result.errors.push_back(std::string("waitpid failed: ") + std::strerror(errno));
            return;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            ::kill(pid, SIGKILL);
            ::waitpid(pid, &status, 0);
            if (pipeOpen) {
                drainPipe(readEnd.get(), result.output);
            }
            result.errors.push_back("Script timed out after " +
                                    std::to_string(m_options.scriptTimeout.count()) + "s");
            return;
        }
    }

    if (pipeOpen) {
        drainPipe(readEnd.get(), result.output);
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
        if (*result.exitCode == 127) {
            result.errors.push_back("Script could not be executed: " + m_options.script);
        } else if (*result.exitCode != 0) {
            result.errors.push_back("Script exited with code " + std::to_string(*result.exitCode));
        } else {
            Logger::instance().info("Post-processing script finished for {}", file.filename().string());
        }
    } else if (WIFSIGNALED(status)) {
        result.errors.push_back("Script terminated by signal " + std::to_string(WTERMSIG(status)));
    }
}

} // namespace botarr::core::postprocess
