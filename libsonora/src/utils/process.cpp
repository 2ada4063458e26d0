#include "../../include/process.hpp"
#include "../../include/logger.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <stdexcept>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <utility>

extern char** environ;

namespace sonora {

namespace {

constexpr int kPollIntervalMs = 100;
constexpr size_t kReadChunk = 4096;

std::string join_args(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& arg : args) {
        if (!out.empty()) out += ' ';
        out += arg;
    }
    return out;
}

[[noreturn]] void throw_errno(const char* what) {
    throw std::system_error(errno, std::generic_category(), what);
}

class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(const int fd) : fd_(fd) {}
    ~FileDescriptor() { close(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    [[nodiscard]] int get() const noexcept { return fd_; }

    void close() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

struct Pipe {
    FileDescriptor read;
    FileDescriptor write;
};

Pipe make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw_errno("pipe2");
    }
    return {FileDescriptor(fds[0]), FileDescriptor(fds[1])};
}

// read end of one child stream, splitting its data into lines
class OutputStream {
public:
    OutputStream(FileDescriptor fd, const LineSink& sink) : fd_(std::move(fd)), sink_(sink) {
        const int flags = ::fcntl(fd_.get(), F_GETFL);
        if (flags < 0 || ::fcntl(fd_.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
            throw_errno("fcntl");
        }
    }

    [[nodiscard]] bool open() const noexcept { return open_; }
    [[nodiscard]] int fd() const noexcept { return fd_.get(); }

    // read everything available right now and forward complete lines
    void drain() {
        std::array<char, kReadChunk> buf{};
        while (open_) {
            const ssize_t n = ::read(fd_.get(), buf.data(), buf.size());
            if (n > 0) {
                if (sink_) pending_.append(buf.data(), static_cast<size_t>(n));
                continue;
            }
            if (n == 0) {
                open_ = false;
                fd_.close();
                break;
            }
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            throw_errno("read");
        }
        forward_lines();
    }

    // deliver a last line that had no newline
    void finish() {
        if (sink_ && !pending_.empty()) {
            sink_(pending_);
        }
        pending_.clear();
    }

private:
    void forward_lines() {
        if (!sink_) return;
        size_t start = 0;
        size_t nl;
        while ((nl = pending_.find('\n', start)) != std::string::npos) {
            std::string_view line(pending_.data() + start, nl - start);
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            sink_(line);
            start = nl + 1;
        }
        pending_.erase(0, start);
    }

    FileDescriptor fd_;
    const LineSink& sink_;
    std::string pending_;
    bool open_ = true;
};

// posix_spawn_file_actions_t with every call checked
class SpawnActions {
public:
    SpawnActions() {
        check(::posix_spawn_file_actions_init(&actions_), "posix_spawn_file_actions_init");
    }
    ~SpawnActions() { ::posix_spawn_file_actions_destroy(&actions_); }

    SpawnActions(const SpawnActions&) = delete;
    SpawnActions& operator=(const SpawnActions&) = delete;

    void open(const int fd, const char* path, const int flags) {
        check(::posix_spawn_file_actions_addopen(&actions_, fd, path, flags, 0),
              "posix_spawn_file_actions_addopen");
    }

    void dup2(const int fd, const int target) {
        check(::posix_spawn_file_actions_adddup2(&actions_, fd, target), "posix_spawn_file_actions_adddup2");
    }

    [[nodiscard]] const posix_spawn_file_actions_t* get() const noexcept { return &actions_; }

private:
    static void check(const int rc, const char* what) {
        if (rc != 0) {
            throw std::system_error(rc, std::generic_category(), what);
        }
    }

    posix_spawn_file_actions_t actions_{};
};

int decode_wait_status(const int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return -WTERMSIG(status);
    return -1;
}

} // namespace

int run_process(const std::vector<std::string>& args,
                const LineSink& stdout_sink,
                const LineSink& stderr_sink) {
    if (args.empty()) {
        throw std::invalid_argument("run_process: empty argument list");
    }

    const std::string command_line = join_args(args);
    Logger::log(LogLevel::Debug, "Running: " + command_line, "process");

    Pipe out = make_pipe();
    Pipe err = make_pipe();

    SpawnActions actions;
    actions.open(STDIN_FILENO, "/dev/null", O_RDONLY);
    actions.dup2(out.write.get(), STDOUT_FILENO);
    actions.dup2(err.write.get(), STDERR_FILENO);

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    // a program given with a directory part is run as is, never searched
    const bool has_dir = args.front().find('/') != std::string::npos;
    pid_t pid = 0;
    const int rc = has_dir
        ? ::posix_spawn(&pid, argv[0], actions.get(), nullptr, argv.data(), environ)
        : ::posix_spawnp(&pid, argv[0], actions.get(), nullptr, argv.data(), environ);
    if (rc != 0) {
        Logger::log(LogLevel::Error, "Cannot execute " + args[0] + ": " + std::generic_category().message(rc),
                    "process");
        throw std::system_error(rc, std::generic_category(), "Cannot execute " + args[0]);
    }

    out.write.close();
    err.write.close();

    int status = 0;
    bool reaped = false;
    try {
        OutputStream out_stream(std::move(out.read), stdout_sink);
        OutputStream err_stream(std::move(err.read), stderr_sink);

        while (true) {
            std::array<pollfd, 2> fds{};
            nfds_t count = 0;
            for (const auto* stream : {&out_stream, &err_stream}) {
                if (stream->open()) {
                    fds[count++] = pollfd{stream->fd(), POLLIN, 0};
                }
            }
            if (count > 0 && ::poll(fds.data(), count, kPollIntervalMs) < 0 && errno != EINTR) {
                throw_errno("poll");
            }

            out_stream.drain();
            err_stream.drain();

            // block only once both streams are closed
            const pid_t waited = ::waitpid(pid, &status, (out_stream.open() || err_stream.open()) ? WNOHANG : 0);
            if (waited == pid) {
                reaped = true;
                break;
            }
            if (waited < 0 && errno != EINTR) throw_errno("waitpid");
        }

        out_stream.drain();
        err_stream.drain();
        out_stream.finish();
        err_stream.finish();
    } catch (...) {
        if (!reaped) {
            ::kill(pid, SIGKILL);
            ::waitpid(pid, nullptr, 0);
        }
        throw;
    }

    const int exit_code = decode_wait_status(status);
    if (exit_code != 0) {
        Logger::log(LogLevel::Warning,
                    "Error executing (returns " + std::to_string(exit_code) + "): " + command_line,
                    "process");
    }
    return exit_code;
}

} // namespace sonora
