// SPDX-License-Identifier: Apache-2.0
#include "worker/source/command.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace hdw::source {

namespace {
int wait_child(pid_t pid)
{
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            return -1;
    }
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

void kill_and_reap(pid_t pid)
{
    ::kill(pid, SIGKILL);
    wait_child(pid);
}
} // namespace

CommandResult run_command(const std::vector<std::string> &argv, std::chrono::milliseconds timeout)
{
    if (argv.empty())
        throw CommandError("empty command");

    std::vector<char *> args;
    args.reserve(argv.size() + 1);
    for (const auto &a : argv)
        args.push_back(const_cast<char *>(a.c_str()));
    args.push_back(nullptr);

    int out_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0)
        throw CommandError(std::string("pipe: ") + std::strerror(errno));

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        throw CommandError(std::string("fork: ") + std::strerror(err));
    }
    if (pid == 0) {
        // Child: stdout -> pipe, stderr -> /dev/null. Only async-signal-safe calls from here on.
        dup2(out_pipe[1], STDOUT_FILENO);
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0)
            dup2(devnull, STDERR_FILENO);
        execvp(args[0], args.data());
        _exit(127);
    }

    ::close(out_pipe[1]);
    int fd = out_pipe[0];
    CommandResult result;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[8192];
    for (;;) {
        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            ::close(fd);
            kill_and_reap(pid);
            throw CommandTimeout(argv[0] + " timed out after " + std::to_string(timeout.count()) + "ms");
        }
        pollfd pfd{fd, POLLIN, 0};
        int pr = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (pr < 0) {
            if (errno == EINTR)
                continue;
            int err = errno;
            ::close(fd);
            kill_and_reap(pid);
            throw CommandError(std::string("poll: ") + std::strerror(err));
        }
        if (pr == 0)
            continue; // deadline check at loop head
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            result.output.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0)
            break; // EOF
        if (errno == EINTR || errno == EAGAIN)
            continue;
        int err = errno;
        ::close(fd);
        kill_and_reap(pid);
        throw CommandError(std::string("read: ") + std::strerror(err));
    }
    ::close(fd);
    result.exit_code = wait_child(pid);
    return result;
}

std::vector<std::string> split_lines(const std::string &text)
{
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        size_t end = nl == std::string::npos ? text.size() : nl;
        size_t len = end - start;
        if (len > 0 && text[start + len - 1] == '\r')
            --len;
        lines.emplace_back(text, start, len);
        if (nl == std::string::npos)
            break;
        start = nl + 1;
    }
    return lines;
}

} // namespace hdw::source
