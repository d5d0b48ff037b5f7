// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file process.hpp
/// @brief Launching, talking to and reaping the agent bridge child (POSIX)

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace chatconsole
{

struct ProcessHandle;
struct PipeHandle;

// =============================================================================
// Error Types
// =============================================================================

/// The bridge could not be launched, or one of its pipes failed
class ProcessError : public std::runtime_error
{
  public:
    explicit ProcessError(const std::string& message) : std::runtime_error(message) {}
};

// =============================================================================
// Pipes
// =============================================================================

/// Our end of the bridge's stdout or stderr
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    /// @return Bytes read, 0 once the bridge has closed its end
    /// @throws ProcessError on read failure
    size_t read(char* buffer, size_t size);

    /// One log line from the bridge, without its line ending
    /// @return std::nullopt once the stream ends with nothing left to read
    std::optional<std::string> read_line(size_t max_size = 4096);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

/// Our end of the bridge's stdin; closing it is how the bridge is asked to exit
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    /// Write every byte, retrying short writes
    /// @throws ProcessError on failure, including a bridge that already exited
    size_t write(const char* data, size_t size);

    size_t write(const std::string& data);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

// =============================================================================
// LaunchOptions
// =============================================================================

/// How the bridge is started. stdin and stdout are always piped.
struct LaunchOptions
{
    /// Directory the bridge runs in (empty = ours)
    std::string working_directory;

    /// Variables set on top of our own environment
    std::map<std::string, std::string> environment;

    /// Pipe stderr back so the bridge's log can be forwarded
    bool capture_stderr = false;
};

// =============================================================================
// Process
// =============================================================================

/// The bridge child process
///
/// A Process is spawned once. The orderly shutdown is to close stdin and give
/// the bridge a grace period:
/// @code
/// Process bridge;
/// bridge.spawn("agent-bridge", {"--log-level", "info"});
/// bridge.stdin_pipe().write(frame);
/// bridge.stdin_pipe().close();
/// int exit_code = bridge.wait_or_kill(std::chrono::seconds(5));
/// @endcode
/// Destroying a Process whose child is still alive kills and reaps it.
class Process
{
  public:
    Process();
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    /// @param executable Looked up in PATH when it has no slash
    /// @throws ProcessError if a pipe cannot be created, exec fails, or already spawned
    void spawn(
        const std::string& executable,
        const std::vector<std::string>& args,
        const LaunchOptions& options = {}
    );

    /// @throws ProcessError once closed
    WritePipe& stdin_pipe();

    ReadPipe& stdout_pipe();

    /// @throws ProcessError unless LaunchOptions::capture_stderr was set
    ReadPipe& stderr_pipe();

    /// Wait for the bridge to exit, sending SIGKILL once `grace` runs out
    /// @return Exit code, or 128 + signal number when killed by a signal
    int wait_or_kill(std::chrono::milliseconds grace);

  private:
    std::optional<int> try_reap();
    int reap();
    void kill();

    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
    std::unique_ptr<ReadPipe> stderr_;
};

// =============================================================================
// Utility Functions
// =============================================================================

/// Resolve a program name against PATH
/// @return Full path, or std::nullopt if not found
std::optional<std::string> find_executable(const std::string& name);

/// A bridge command ending in .js or .mjs is run through node
bool is_node_script(const std::string& path);

std::optional<std::string> find_node();

} // namespace chatconsole
