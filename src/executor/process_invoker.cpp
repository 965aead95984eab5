/**
 * @file process_invoker.cpp
 * @brief ProcessInvoker implementation: fork/exec, pipe plumbing, deadline.
 * @author Dimitris Kafetzis
 *
 * Lifecycle of one invocation:
 *   1. Four O_CLOEXEC pipes: stdin, stdout, stderr and an exec-status pipe.
 *   2. fork(); the child joins its own process group, wires the pipes onto
 *      fds 0-2 and execvp()s. If exec fails it writes errno to the status
 *      pipe; a successful exec closes that pipe, so EOF means "running".
 *   3. The parent feeds the input, drains stdout/stderr and polls for exit
 *      in slices of kPollSlice until the deadline.
 *   4. On deadline: SIGTERM to the group, grace period, SIGKILL, reap.
 *      The child is only reaped once no further signal will be sent.
 */

#include "executor/process_invoker.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace tier_gate {

namespace {

constexpr Millis kPollSlice{10};
constexpr size_t kReadChunk = 4096;

// ─────────────────────────────────────────────
// File descriptor / child ownership
// ─────────────────────────────────────────────

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) reset(other.release());
        return *this;
    }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

struct Pipe {
    UniqueFd read;
    UniqueFd write;
};

std::string errno_text(int err) {
    return std::string{std::strerror(err)};
}

Result<Pipe> make_pipe() {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return Error{"pipe2 failed: " + errno_text(errno)};
    }
    return Pipe{UniqueFd{fds[0]}, UniqueFd{fds[1]}};
}

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL);
    if (flags != -1) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

pid_t wait_retry(pid_t pid, int* status, int options) noexcept {
    pid_t rv;
    do {
        rv = ::waitpid(pid, status, options);
    } while (rv == -1 && errno == EINTR);
    return rv;
}

/**
 * @brief Owns a forked child until it has been reaped.
 *
 * Exit is detected with WNOWAIT, so the child stays a zombie until reap():
 * its pid and process group stay reserved and every signal sent before
 * that point reaches this child and its descendants, never a recycled pid.
 * If the invocation unwinds early the destructor kills the whole group and
 * reaps the child, so no path leaves a zombie behind.
 */
class ChildProcess {
public:
    explicit ChildProcess(pid_t pid) noexcept : pid_(pid) {}
    ~ChildProcess() {
        signal_group(SIGKILL);
        reap();
    }

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    [[nodiscard]] int status() const noexcept { return status_; }

    /// Non-blocking exit check. Leaves the child unreaped.
    bool exited() noexcept {
        if (exited_) return true;
        siginfo_t info{};
        int rv;
        do {
            rv = ::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT);
        } while (rv == -1 && errno == EINTR);
        if (rv == 0 && info.si_pid == pid_) exited_ = true;
        return exited_;
    }

    /// Blocking wait that collects the exit status and releases the pid.
    void reap() noexcept {
        if (reaped_) return;
        if (wait_retry(pid_, &status_, 0) == pid_) {
            exited_ = true;
            reaped_ = true;
        }
    }

    /// Signal the child's process group, or the child alone if it never got one.
    void signal_group(int sig) noexcept {
        if (reaped_) return;
        if (::kill(-pid_, sig) != 0 && errno == ESRCH) {
            ::kill(pid_, sig);
        }
    }

    /**
     * @brief SIGTERM, wait up to @p grace, then SIGKILL the group and reap.
     *
     * SIGKILL is sent even when the child left within the grace period so
     * that descendants ignoring SIGTERM do not outlive the invocation.
     */
    void terminate(Millis grace) noexcept {
        signal_group(SIGTERM);
        auto grace_deadline = SteadyClock::now() + grace;
        while (!exited() && SteadyClock::now() < grace_deadline) {
            std::this_thread::sleep_for(kPollSlice);
        }
        signal_group(SIGKILL);
        reap();
    }

private:
    pid_t pid_;
    int status_ = 0;
    bool exited_ = false;
    bool reaped_ = false;
};

// ─────────────────────────────────────────────
// Output capture
// ─────────────────────────────────────────────

class StreamCapture {
public:
    StreamCapture(UniqueFd fd, size_t limit) : fd_(std::move(fd)), limit_(limit) {
        set_nonblocking(fd_.get());
    }

    [[nodiscard]] bool open() const noexcept { return fd_.valid(); }
    [[nodiscard]] int fd() const noexcept { return fd_.get(); }

    /// Read everything currently available; closes the fd on EOF or error.
    void drain() {
        std::array<char, kReadChunk> buf{};
        while (fd_.valid()) {
            ssize_t n = ::read(fd_.get(), buf.data(), buf.size());
            if (n > 0) {
                append(buf.data(), static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
            fd_.reset();
        }
    }

    [[nodiscard]] std::string take() {
        if (truncated_) text_ += "\n[output truncated]";
        return std::move(text_);
    }

private:
    void append(const char* data, size_t size) {
        size_t room = limit_ > text_.size() ? limit_ - text_.size() : 0;
        if (size > room) truncated_ = true;
        text_.append(data, std::min(size, room));
    }

    UniqueFd fd_;
    size_t limit_;
    std::string text_;
    bool truncated_ = false;
};

std::string trim(std::string text) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    text.erase(text.begin(), std::find_if(text.begin(), text.end(), not_space));
    text.erase(std::find_if(text.rbegin(), text.rend(), not_space).base(), text.end());
    return text;
}

ExecutionResult make_result(const TaskDescriptor& task, Outcome outcome, Millis duration) {
    ExecutionResult result;
    result.task_id = task.id;
    result.tier = task.tier;
    result.family = task.family;
    result.outcome = outcome;
    result.duration = duration;
    return result;
}

void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

/// Inside double quotes a backslash only escapes these; elsewhere it is literal.
bool is_double_quote_escapable(char c) noexcept {
    return c == '$' || c == '`' || c == '"' || c == '\\' || c == '\n';
}

/// Make @p from available as @p to in the child. Async-signal-safe.
void redirect(int from, int to) noexcept {
    if (from == to) {
        ::fcntl(to, F_SETFD, 0);
    } else {
        ::dup2(from, to);
    }
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Command tokenization
// ─────────────────────────────────────────────

Result<std::vector<std::string>> split_command(std::string_view command) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;

    for (size_t i = 0; i < command.size(); ++i) {
        char c = command[i];

        if (c == '\'') {
            auto close = command.find('\'', i + 1);
            if (close == std::string_view::npos) {
                return Error{"Unterminated single quote in command: " + std::string{command}};
            }
            current.append(command.substr(i + 1, close - i - 1));
            in_word = true;
            i = close;
        } else if (c == '"') {
            size_t j = i + 1;
            for (; j < command.size() && command[j] != '"'; ++j) {
                if (command[j] == '\\' && j + 1 < command.size()
                    && is_double_quote_escapable(command[j + 1])) {
                    ++j;
                    if (command[j] == '\n') continue;
                }
                current.push_back(command[j]);
            }
            if (j >= command.size()) {
                return Error{"Unterminated double quote in command: " + std::string{command}};
            }
            in_word = true;
            i = j;
        } else if (c == '\\' && i + 1 < command.size()) {
            // Backslash-newline is a line continuation.
            if (command[++i] != '\n') {
                current.push_back(command[i]);
                in_word = true;
            }
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_word) {
                words.push_back(std::move(current));
                current.clear();
                in_word = false;
            }
        } else {
            current.push_back(c);
            in_word = true;
        }
    }
    if (in_word) words.push_back(std::move(current));
    return words;
}

// ─────────────────────────────────────────────
// ProcessInvoker
// ─────────────────────────────────────────────

ProcessInvoker::ProcessInvoker(const ExecutorConfig& config)
    : kill_grace_(config.kill_grace_ms)
    , max_output_bytes_(static_cast<size_t>(config.max_output_kb) * 1024) {
    // Writing to a validator that exited early must yield EPIPE, not kill us.
    ignore_sigpipe_once();
}

ExecutionResult ProcessInvoker::invoke(const TaskDescriptor& task, std::string_view input) noexcept {
    try {
        return run_child(task, input);
    } catch (const std::exception& ex) {
        auto result = make_result(task, Outcome::Fail, Millis{0});
        result.error = std::string{"Invoker error: "} + ex.what();
        return result;
    }
}

ExecutionResult ProcessInvoker::run_child(const TaskDescriptor& task, std::string_view input) {
    auto argv_words = split_command(task.invocation);
    if (!argv_words) {
        auto result = make_result(task, Outcome::Fail, Millis{0});
        result.error = argv_words.error().message;
        return result;
    }
    if (argv_words->empty()) {
        auto result = make_result(task, Outcome::Fail, Millis{0});
        result.error = "No command specified";
        return result;
    }

    const auto start = SteadyClock::now();
    auto elapsed = [&start] {
        return std::chrono::duration_cast<Millis>(SteadyClock::now() - start);
    };
    auto spawn_failure = [&](std::string reason) {
        auto result = make_result(task, Outcome::Fail, elapsed());
        result.error = "Failed to spawn '" + argv_words->front() + "': " + std::move(reason);
        return result;
    };

    // argv must be fully built before fork(): the child may only make
    // async-signal-safe calls.
    std::vector<char*> argv;
    argv.reserve(argv_words->size() + 1);
    for (auto& word : *argv_words) argv.push_back(word.data());
    argv.push_back(nullptr);

    auto stdin_pipe = make_pipe();
    auto stdout_pipe = make_pipe();
    auto stderr_pipe = make_pipe();
    auto status_pipe = make_pipe();
    for (const auto* p : {&stdin_pipe, &stdout_pipe, &stderr_pipe, &status_pipe}) {
        if (!*p) return spawn_failure(p->error().message);
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        return spawn_failure("fork failed: " + errno_text(errno));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::signal(SIGPIPE, SIG_DFL);
        redirect(stdin_pipe->read.get(), STDIN_FILENO);
        redirect(stdout_pipe->write.get(), STDOUT_FILENO);
        redirect(stderr_pipe->write.get(), STDERR_FILENO);
        ::execvp(argv[0], argv.data());
        int exec_errno = errno;
        [[maybe_unused]] auto n = ::write(status_pipe->write.get(), &exec_errno, sizeof(exec_errno));
        ::_exit(127);
    }

    ChildProcess child(pid);
    // Both sides call setpgid to close the race with the first kill(); the
    // call fails harmlessly once the child has exec'd.
    ::setpgid(pid, pid);

    stdin_pipe->read.reset();
    stdout_pipe->write.reset();
    stderr_pipe->write.reset();
    status_pipe->write.reset();

    int exec_errno = 0;
    ssize_t status_bytes;
    do {
        status_bytes = ::read(status_pipe->read.get(), &exec_errno, sizeof(exec_errno));
    } while (status_bytes == -1 && errno == EINTR);

    if (status_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
        child.reap();
        return spawn_failure(errno_text(exec_errno));
    }

    UniqueFd stdin_fd = std::move(stdin_pipe->write);
    set_nonblocking(stdin_fd.get());
    size_t input_offset = 0;
    if (input.empty()) stdin_fd.reset();

    StreamCapture out(std::move(stdout_pipe->read), max_output_bytes_);
    StreamCapture err(std::move(stderr_pipe->read), max_output_bytes_);

    // Bounded so the deadline cannot overflow the clock's representation.
    const auto budget = std::clamp(task.timeout, Millis{0}, kMaxTaskTimeout);
    const auto deadline = start + budget;
    bool timed_out = false;

    while (true) {
        if (child.exited()) {
            // Descendants may still hold the pipes; take what is buffered and stop.
            out.drain();
            err.drain();
            child.reap();
            break;
        }

        auto now = SteadyClock::now();
        if (now >= deadline) {
            timed_out = true;
            break;
        }
        auto slice = std::min(kPollSlice,
                              std::chrono::duration_cast<Millis>(deadline - now) + Millis{1});

        std::array<pollfd, 3> fds{};
        nfds_t count = 0;
        int stdin_slot = -1, out_slot = -1, err_slot = -1;
        if (stdin_fd.valid()) { stdin_slot = static_cast<int>(count); fds[count++] = {stdin_fd.get(), POLLOUT, 0}; }
        if (out.open())       { out_slot = static_cast<int>(count);   fds[count++] = {out.fd(), POLLIN, 0}; }
        if (err.open())       { err_slot = static_cast<int>(count);   fds[count++] = {err.fd(), POLLIN, 0}; }

        if (count == 0) {
            std::this_thread::sleep_for(slice);
            continue;
        }

        int ready = ::poll(fds.data(), count, static_cast<int>(slice.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            int poll_errno = errno;
            child.terminate(kill_grace_);
            auto result = make_result(task, Outcome::Fail, elapsed());
            result.error = "poll failed: " + errno_text(poll_errno);
            return result;
        }
        if (ready == 0) continue;

        if (stdin_slot >= 0 && fds[stdin_slot].revents != 0) {
            ssize_t n = ::write(stdin_fd.get(), input.data() + input_offset,
                                input.size() - input_offset);
            if (n > 0) {
                input_offset += static_cast<size_t>(n);
                if (input_offset >= input.size()) stdin_fd.reset();
            } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                // EPIPE: the validator stopped reading; its exit code still decides.
                stdin_fd.reset();
            }
        }
        if (out_slot >= 0 && fds[out_slot].revents != 0) out.drain();
        if (err_slot >= 0 && fds[err_slot].revents != 0) err.drain();
    }

    if (timed_out) {
        child.terminate(kill_grace_);
        out.drain();
        err.drain();
        auto result = make_result(task, Outcome::Timeout, elapsed());
        result.output = trim(out.take());
        result.error = "Validator timed out after " + std::to_string(budget.count()) + "ms";
        auto stderr_text = trim(err.take());
        if (!stderr_text.empty()) result.error += ": " + stderr_text;
        return result;
    }

    const int status = child.status();
    ExecutionResult result;
    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        result = make_result(task, outcome_from_exit_code(code), elapsed());
        result.exit_code = code;
        result.error = trim(err.take());
    } else {
        result = make_result(task, Outcome::Fail, elapsed());
        result.error = WIFSIGNALED(status)
            ? "Validator terminated by signal " + std::to_string(WTERMSIG(status))
            : "Validator ended with unexpected status " + std::to_string(status);
        auto stderr_text = trim(err.take());
        if (!stderr_text.empty()) result.error += ": " + stderr_text;
    }
    result.output = trim(out.take());
    return result;
}

}  // namespace tier_gate
