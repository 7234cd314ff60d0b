//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PosixProcess.cpp
// Purpose: fork/exec child process with piped stdio, kill-and-reap semantics
//==========================================================================================================

#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <mutex>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "logging/Logger.h"
#include "lsp/Process.h"
#include "lsp/errors/Errors.h"

namespace lsp {

namespace {
void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

class PosixChildProcess : public IChildProcess {
public:
    PosixChildProcess(pid_t pid, int in, int out, int err)
        : pid(pid), stdinFd(in), stdoutFd(out), stderrFd(err) {}

    ~PosixChildProcess() override {
        Kill();
        closeFd(stdinFd);
        closeFd(stdoutFd);
        closeFd(stderrFd);
    }

    int Pid() const override { return static_cast<int>(pid); }

    int TakeStdin() override { int fd = stdinFd; stdinFd = -1; return fd; }
    int TakeStdout() override { int fd = stdoutFd; stdoutFd = -1; return fd; }
    int TakeStderr() override { int fd = stderrFd; stderrFd = -1; return fd; }

    void Kill() override {
        std::lock_guard<std::mutex> lk(mutex);
        if (reaped) {
            return;
        }
        if (::kill(pid, SIGKILL) != 0 && errno != ESRCH) {
            LOG_WARN("kill({}) failed: {}", static_cast<int>(pid), std::strerror(errno));
        }
        int status = 0;
        pid_t r = 0;
        do {
            r = ::waitpid(pid, &status, 0);
        } while (r < 0 && errno == EINTR);
        reaped = true;
        LOG_DEBUG("Language server process {} reaped", static_cast<int>(pid));
    }

    bool IsRunning() override {
        std::lock_guard<std::mutex> lk(mutex);
        if (reaped) {
            return false;
        }
        int status = 0;
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            reaped = true;
            return false;
        }
        return r == 0;
    }

private:
    pid_t pid;
    int stdinFd;
    int stdoutFd;
    int stderrFd;
    std::mutex mutex;
    bool reaped{false};
};
} // namespace

void IgnoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, [](){ ::signal(SIGPIPE, SIG_IGN); });
}

int WriteAll(int fd, const char* data, std::size_t size) {
    std::size_t total = 0;
    while (total < size) {
        ssize_t w = ::write(fd, data + total, size - total);
        if (w > 0) {
            total += static_cast<std::size_t>(w);
        } else if (w < 0 && errno == EINTR) {
            continue;
        } else {
            return (w < 0) ? errno : EIO;
        }
    }
    return 0;
}

std::unique_ptr<IChildProcess> PosixProcessLauncher::Spawn(const std::string& command,
                                                           const std::vector<std::string>& args) {
    FUNC_SCOPE();
    using errors::ErrorCategory;
    IgnoreSigpipe();

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int statusPipe[2] = {-1, -1};
    auto closeAll = [&]() {
        for (int* p : {inPipe, outPipe, errPipe, statusPipe}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
    };
    if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 ||
        ::pipe2(errPipe, O_CLOEXEC) != 0 || ::pipe2(statusPipe, O_CLOEXEC) != 0) {
        const int err = errno;
        closeAll();
        throw errors::makeException(ErrorCategory::SpawnFailed,
            std::format("Failed to start language server '{}': pipe: {}", command, std::strerror(err)));
    }

    // argv is built before fork; the child only calls async-signal-safe functions
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(command.c_str()));
    for (const auto& a : args) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        closeAll();
        throw errors::makeException(ErrorCategory::SpawnFailed,
            std::format("Failed to start language server '{}': fork: {}", command, std::strerror(err)));
    }
    if (pid == 0) {
        ::dup2(inPipe[0], STDIN_FILENO);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);
        ::execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = ::write(statusPipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(statusPipe[1]);

    // EOF on the status pipe means exec succeeded (close-on-exec); otherwise the child sent errno
    int childErr = 0;
    ssize_t r = 0;
    do {
        r = ::read(statusPipe[0], &childErr, sizeof(childErr));
    } while (r < 0 && errno == EINTR);
    closeFd(statusPipe[0]);

    if (r > 0) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        closeAll();
        throw errors::makeException(ErrorCategory::SpawnFailed,
            std::format("Failed to start language server '{}': {}", command, std::strerror(childErr)));
    }

    LOG_INFO("Spawned language server '{}' (pid={})", command, static_cast<int>(pid));
    return std::make_unique<PosixChildProcess>(pid, inPipe[1], outPipe[0], errPipe[0]);
}

} // namespace lsp
