//
//  process.cpp
//  TagLens
//
//  Created by the TagLens contributors on 10/19/26.
//  Copyright © 2026 TagLens contributors. All rights reserved.
//

#include "process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <system_error>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "logging.hpp"

namespace taglens {

namespace {

constexpr int kExecFailedExit = 127;
constexpr size_t kReadChunk = 64 * 1024;

std::vector<char *> make_argv(const std::vector<std::string> &argv) {
    std::vector<char *> out;
    out.reserve(argv.size() + 1);
    for (const auto &a : argv) {
        out.push_back(const_cast<char *>(a.c_str()));
    }
    out.push_back(nullptr);
    return out;
}

void redirect_to_devnull(int fd) {
    int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
        ::dup2(devnull, fd);
        ::close(devnull);
    }
}

bool write_all(int fd, const std::string &data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

void close_pipe(int fds[2]) {
    if (fds[0] >= 0) {
        ::close(fds[0]);
    }
    if (fds[1] >= 0) {
        ::close(fds[1]);
    }
}

}  // namespace

ProcessResult run_process(const std::vector<std::string> &argv, const std::string &input,
                          bool capture_output) {
    ProcessResult res;
    if (argv.empty()) {
        return res;
    }
    int out_pipe[2] = {-1, -1};
    int in_pipe[2] = {-1, -1};
    if (capture_output && ::pipe(out_pipe) != 0) {
        TL_LOG("error", "pipe failed errno=" << errno << " ("
                                             << std::generic_category().message(errno) << ")");
        return res;
    }
    if (::pipe(in_pipe) != 0) {
        TL_LOG("error", "pipe failed errno=" << errno << " ("
                                             << std::generic_category().message(errno) << ")");
        close_pipe(out_pipe);
        return res;
    }

    auto args = make_argv(argv);
    pid_t pid = ::fork();
    if (pid < 0) {
        TL_LOG("error", "fork failed for " << argv[0] << " errno=" << errno);
        close_pipe(out_pipe);
        close_pipe(in_pipe);
        return res;
    }
    if (pid == 0) {
        /* child */
        ::dup2(in_pipe[0], STDIN_FILENO);
        if (capture_output) {
            ::dup2(out_pipe[1], STDOUT_FILENO);
        } else {
            redirect_to_devnull(STDOUT_FILENO);
        }
        redirect_to_devnull(STDERR_FILENO);
        close_pipe(in_pipe);
        close_pipe(out_pipe);
        ::execvp(args[0], args.data());
        ::_exit(kExecFailedExit);
    }

    /* parent */
    ::close(in_pipe[0]);
    if (capture_output) {
        ::close(out_pipe[1]);
    }
    // A child that exits without reading stdin must not kill us with SIGPIPE.
    auto old_handler = std::signal(SIGPIPE, SIG_IGN);
    if (!input.empty() && !write_all(in_pipe[1], input)) {
        TL_LOG("warn", "short write to stdin of " << argv[0]);
    }
    ::close(in_pipe[1]);
    std::signal(SIGPIPE, old_handler);

    if (capture_output) {
        std::vector<uint8_t> buf(kReadChunk);
        while (true) {
            ssize_t n = ::read(out_pipe[0], buf.data(), buf.size());
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                break;
            }
            res.output.insert(res.output.end(), buf.begin(), buf.begin() + n);
        }
        ::close(out_pipe[0]);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            TL_LOG("error", "waitpid failed for " << argv[0] << " errno=" << errno);
            return res;
        }
    }
    if (WIFEXITED(status)) {
        res.exit_code = WEXITSTATUS(status);
    }
    res.started = res.exit_code != kExecFailedExit;
    TL_LOG("process", argv[0] << " exit=" << res.exit_code << " stdout=" << res.output.size()
                              << " bytes");
    return res;
}

bool launch_detached(const std::vector<std::string> &argv) {
    if (argv.empty()) {
        return false;
    }
    auto args = make_argv(argv);
    pid_t pid = ::fork();
    if (pid < 0) {
        TL_LOG("error", "fork failed for " << argv[0] << " errno=" << errno);
        return false;
    }
    if (pid == 0) {
        /* child: double fork so the opener is reparented and never becomes a zombie */
        ::setsid();
        pid_t grandchild = ::fork();
        if (grandchild != 0) {
            ::_exit(grandchild < 0 ? kExecFailedExit : 0);
        }
        redirect_to_devnull(STDIN_FILENO);
        redirect_to_devnull(STDOUT_FILENO);
        redirect_to_devnull(STDERR_FILENO);
        ::execvp(args[0], args.data());
        ::_exit(kExecFailedExit);
    }
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

}  // namespace taglens
