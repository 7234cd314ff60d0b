//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Process.h
// Purpose: Child process abstraction with piped stdio, and the POSIX fork/exec launcher
//==========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace lsp {

//==========================================================================================================
// IChildProcess
// Purpose: A spawned language server. The three pipe descriptors are handed over to the session with the
//          Take* calls (ownership moves, the process no longer closes them).
// Notes:
//   Kill() is idempotent: it terminates the child and reaps it. The destructor kills as well.
//==========================================================================================================
class IChildProcess {
public:
    virtual ~IChildProcess() = default;

    virtual int Pid() const = 0;

    // Write end of the child's stdin; -1 once taken.
    virtual int TakeStdin() = 0;
    // Read end of the child's stdout; -1 once taken.
    virtual int TakeStdout() = 0;
    // Read end of the child's stderr; -1 once taken.
    virtual int TakeStderr() = 0;

    virtual void Kill() = 0;
    virtual bool IsRunning() = 0;
};

//==========================================================================================================
// IProcessLauncher
// Purpose: Spawns a process with piped stdin/stdout/stderr.
// Throws:
//   errors::LspException(SpawnFailed) when the executable cannot be started.
//==========================================================================================================
class IProcessLauncher {
public:
    virtual ~IProcessLauncher() = default;
    virtual std::unique_ptr<IChildProcess> Spawn(const std::string& command,
                                                 const std::vector<std::string>& args) = 0;
};

// fork/execvp launcher. The command is looked up on PATH. Exec failures are reported synchronously.
class PosixProcessLauncher : public IProcessLauncher {
public:
    std::unique_ptr<IChildProcess> Spawn(const std::string& command,
                                         const std::vector<std::string>& args) override;
};

// Ignores SIGPIPE for the whole process (idempotent) so writes to a dead child fail with EPIPE.
void IgnoreSigpipe();

// Writes all of data to fd, retrying on EINTR. Returns 0 on success or the failing errno.
int WriteAll(int fd, const char* data, std::size_t size);

} // namespace lsp
