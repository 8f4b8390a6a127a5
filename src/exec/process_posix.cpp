/*
 * POSIX child process implementation - AI-AutoBuilder
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ai-autobuilder/exec/process.hpp>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

extern char** environ;

namespace autobuilder {

namespace {

class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : m_fd(fd) {}
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    Fd(Fd&& o) noexcept : m_fd(o.m_fd) { o.m_fd = -1; }
    ~Fd() { close(); }
    int get() const { return m_fd; }
    bool open() const { return m_fd >= 0; }
    void close() { if (m_fd >= 0) { ::close(m_fd); m_fd = -1; } }
private:
    int m_fd = -1;
};

struct Pipe { Fd r; Fd w; };

Pipe make_pipe() {
    int p[2];
    if (::pipe(p) != 0) throw std::system_error(errno, std::generic_category(), "pipe");
    for (int fd : p) ::fcntl(fd, F_SETFD, ::fcntl(fd, F_GETFD) | FD_CLOEXEC);
    return Pipe{Fd(p[0]), Fd(p[1])};
}

// Writing the prompt to a child that already exited must not kill us.
class IgnoreSigpipe {
public:
    IgnoreSigpipe() {
        struct sigaction sa{}; sa.sa_handler = SIG_IGN; sigemptyset(&sa.sa_mask);
        ::sigaction(SIGPIPE, &sa, &m_old);
    }
    ~IgnoreSigpipe() { ::sigaction(SIGPIPE, &m_old, nullptr); }
private:
    struct sigaction m_old{};
};

bool is_executable(const std::string& p) {
    struct stat st{};
    if (::stat(p.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return (st.st_mode & (S_IXUSR|S_IXGRP|S_IXOTH)) != 0;
}

std::vector<std::string> build_env(const std::vector<std::pair<std::string,std::string>>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string kv = *e;
        std::string key = kv.substr(0, kv.find('='));
        bool overridden = false;
        for (auto& o : overrides) if (o.first == key) { overridden = true; break; }
        if (!overridden) env.push_back(kv);
    }
    for (auto& o : overrides) env.push_back(o.first + "=" + o.second);
    return env;
}

std::vector<char*> to_cargv(std::vector<std::string>& v) {
    std::vector<char*> c; c.reserve(v.size()+1);
    for (auto& s : v) c.push_back(const_cast<char*>(s.c_str()));
    c.push_back(nullptr);
    return c;
}

// Drains what is readable on fd into sink; closes fd at EOF or on a hard error.
void drain(Fd& fd, std::string& sink) {
    char buf[16 * 1024];
    ssize_t r = ::read(fd.get(), buf, sizeof(buf));
    if (r > 0) { sink.append(buf, static_cast<size_t>(r)); return; }
    if (r < 0 && (errno == EINTR || errno == EAGAIN)) return;
    fd.close();
}

} // namespace

std::optional<std::string> resolve_executable(const std::string& cmd, const char* path_env) {
    if (cmd.empty()) return std::nullopt;
    if (cmd.find('/') != std::string::npos) {
        if (is_executable(cmd)) return cmd;
        return std::nullopt;
    }
    if (!path_env) return std::nullopt;
    std::string paths = path_env;
    size_t start = 0;
    while (start <= paths.size()) {
        size_t colon = paths.find(':', start);
        std::string dir = paths.substr(start, colon == std::string::npos ? std::string::npos : colon - start);
        if (!dir.empty()) {
            std::string full = dir + '/' + cmd;
            if (is_executable(full)) return full;
        }
        if (colon == std::string::npos) break;
        start = colon + 1;
    }
    return std::nullopt;
}

ProcessResult run_process(const ProcessSpec& spec) {
    ProcessResult res;
    if (spec.argv.empty()) { res.status = 127; res.err = "empty command"; return res; }
    auto exe = resolve_executable(spec.argv[0], std::getenv("PATH"));
    if (!exe) { res.status = 127; res.err = spec.argv[0] + ": command not found"; return res; }

    // everything the child needs is prepared before fork
    std::vector<std::string> args = spec.argv;
    std::vector<std::string> env = build_env(spec.env);
    std::vector<char*> cargv = to_cargv(args);
    std::vector<char*> cenv = to_cargv(env);

    IgnoreSigpipe sigpipe_guard;
    Pipe in = make_pipe(), out = make_pipe(), err = make_pipe();

    pid_t pid = ::fork();
    if (pid < 0) throw std::system_error(errno, std::generic_category(), "fork");
    if (pid == 0) {
        std::signal(SIGPIPE, SIG_DFL);
        ::setpgid(0, 0); // a timeout kills the whole group
        if (::dup2(in.r.get(), STDIN_FILENO) < 0) _exit(127);
        if (::dup2(out.w.get(), STDOUT_FILENO) < 0) _exit(127);
        if (::dup2(err.w.get(), STDERR_FILENO) < 0) _exit(127);
        ::execve(exe->c_str(), cargv.data(), cenv.data());
        _exit(127);
    }
    in.r.close(); out.w.close(); err.w.close();
    ::fcntl(in.w.get(), F_SETFL, ::fcntl(in.w.get(), F_GETFL) | O_NONBLOCK);

    size_t written = 0;
    if (spec.input.empty()) in.w.close();
    using clock = std::chrono::steady_clock;
    const bool bounded = spec.timeout_seconds > 0;
    const auto deadline = clock::now() + std::chrono::seconds(spec.timeout_seconds);

    while (out.r.open() || err.r.open()) {
        pollfd fds[3]; nfds_t n = 0;
        int idx_in = -1, idx_out = -1, idx_err = -1;
        if (in.w.open()) { idx_in = n; fds[n++] = pollfd{in.w.get(), POLLOUT, 0}; }
        if (out.r.open()) { idx_out = n; fds[n++] = pollfd{out.r.get(), POLLIN, 0}; }
        if (err.r.open()) { idx_err = n; fds[n++] = pollfd{err.r.get(), POLLIN, 0}; }
        int wait_ms = -1;
        if (bounded) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
            if (left <= 0) { res.timed_out = true; break; }
            wait_ms = static_cast<int>(left);
        }
        int rc = ::poll(fds, n, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            int saved = errno;
            ::kill(pid, SIGKILL);
            int st = 0; while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
            throw std::system_error(saved, std::generic_category(), "poll");
        }
        if (rc == 0) continue; // deadline re-checked at the top
        if (idx_in >= 0 && (fds[idx_in].revents & (POLLOUT|POLLERR|POLLHUP))) {
            ssize_t w = ::write(in.w.get(), spec.input.data() + written, spec.input.size() - written);
            if (w > 0) written += static_cast<size_t>(w);
            else if (w < 0 && errno != EAGAIN && errno != EINTR) in.w.close(); // child stopped reading
            if (written >= spec.input.size()) in.w.close();
        }
        if (idx_out >= 0 && (fds[idx_out].revents & (POLLIN|POLLHUP|POLLERR))) drain(out.r, res.out);
        if (idx_err >= 0 && (fds[idx_err].revents & (POLLIN|POLLHUP|POLLERR))) drain(err.r, res.err);
    }
    in.w.close();
    out.r.close(); err.r.close();

    // the child may close both streams and keep running; the deadline still applies
    int st = 0;
    bool reaped = false;
    while (bounded && !res.timed_out && !reaped) {
        pid_t w = ::waitpid(pid, &st, WNOHANG);
        if (w == pid) { reaped = true; break; }
        if (w < 0 && errno != EINTR) throw std::system_error(errno, std::generic_category(), "waitpid");
        if (clock::now() >= deadline) { res.timed_out = true; break; }
        ::usleep(10000);
    }
    if (res.timed_out) ::kill(-pid, SIGKILL);
    while (!reaped && ::waitpid(pid, &st, 0) < 0) {
        if (errno != EINTR) throw std::system_error(errno, std::generic_category(), "waitpid");
    }
    if (WIFEXITED(st)) res.status = WEXITSTATUS(st);
    else if (WIFSIGNALED(st)) res.status = 128 + WTERMSIG(st);
    return res;
}

} // namespace autobuilder
