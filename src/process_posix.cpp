// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

// The agent bridge child on POSIX systems

#include <chatconsole/logging.hpp>
#include <chatconsole/process.hpp>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace chatconsole
{

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

namespace
{

std::string errno_message(int err = errno)
{
    return std::strerror(err);
}

/// Both ends of a pipe, closed on destruction unless released
struct FdPair
{
    int fds[2] = {-1, -1};

    ~FdPair()
    {
        close_both();
    }

    void open(const char* what)
    {
        if (::pipe(fds) != 0)
            throw ProcessError(std::string("Failed to create ") + what + " pipe: " + errno_message());
    }

    bool is_open() const
    {
        return fds[0] >= 0;
    }

    int read_end() const
    {
        return fds[0];
    }

    int write_end() const
    {
        return fds[1];
    }

    void close_read()
    {
        if (fds[0] >= 0)
            ::close(fds[0]);
        fds[0] = -1;
    }

    void close_write()
    {
        if (fds[1] >= 0)
            ::close(fds[1]);
        fds[1] = -1;
    }

    int release_read()
    {
        int fd = fds[0];
        fds[0] = -1;
        return fd;
    }

    int release_write()
    {
        int fd = fds[1];
        fds[1] = -1;
        return fd;
    }

    void close_both()
    {
        close_read();
        close_write();
    }
};

/// In the child: report errno through the error pipe and exit
[[noreturn]] void child_fail(int error_fd)
{
    int err = errno;
    (void)::write(error_fd, &err, sizeof(err));
    _exit(127);
}

int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

// =============================================================================
// ReadPipe
// =============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    while (true)
    {
        ssize_t bytes_read = ::read(handle_->fd, buffer, size);
        if (bytes_read >= 0)
            return static_cast<size_t>(bytes_read);
        if (errno != EINTR)
            throw ProcessError("Read failed: " + errno_message());
    }
}

std::optional<std::string> ReadPipe::read_line(size_t max_size)
{
    std::string line;
    bool got_any = false;

    char ch;
    while (line.size() < max_size)
    {
        if (read(&ch, 1) == 0)
            break;
        got_any = true;
        if (ch == '\n')
            break;
        line.push_back(ch);
    }

    if (!got_any)
        return std::nullopt;
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return line;
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// WritePipe
// =============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

size_t WritePipe::write(const char* data, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    size_t total_written = 0;
    while (total_written < size)
    {
        ssize_t bytes_written = ::write(handle_->fd, data + total_written, size - total_written);
        if (bytes_written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw ProcessError("Broken pipe (process closed stdin)");
            throw ProcessError("Write failed: " + errno_message());
        }
        total_written += static_cast<size_t>(bytes_written);
    }

    return total_written;
}

size_t WritePipe::write(const std::string& data)
{
    return write(data.data(), data.size());
}

void WritePipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// Process
// =============================================================================

Process::Process()
    : handle_(std::make_unique<ProcessHandle>()), stdin_(std::make_unique<WritePipe>()),
      stdout_(std::make_unique<ReadPipe>()), stderr_(std::make_unique<ReadPipe>())
{
}

Process::~Process()
{
    if (!handle_)
        return;

    stdin_->close();
    stdout_->close();
    stderr_->close();

    if (handle_->running)
    {
        kill();
        try
        {
            reap();
        }
        catch (const ProcessError& e)
        {
            CHATCONSOLE_LOG_DEBUG(std::string("Bridge child not reaped: ") + e.what());
        }
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(
    const std::string& executable,
    const std::vector<std::string>& args,
    const LaunchOptions& options
)
{
    if (handle_->pid != 0)
        throw ProcessError("Bridge process already spawned");

    FdPair in, out, err, exec_error;
    in.open("stdin");
    out.open("stdout");
    if (options.capture_stderr)
        err.open("stderr");
    exec_error.open("error");

    // exec closes the error pipe's write end; only a failure writes to it
    fcntl(exec_error.write_end(), F_SETFD, FD_CLOEXEC);

    // Everything the child needs is prepared here; after fork it may only
    // call async-signal-safe functions
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
        throw ProcessError("Failed to fork bridge process: " + errno_message());

    if (pid == 0)
    {
        ::close(exec_error.read_end());
        int error_fd = exec_error.write_end();

        if (dup2(in.read_end(), STDIN_FILENO) < 0 || dup2(out.write_end(), STDOUT_FILENO) < 0)
            child_fail(error_fd);
        if (err.is_open() && dup2(err.write_end(), STDERR_FILENO) < 0)
            child_fail(error_fd);
        for (int fd : {in.fds[0], in.fds[1], out.fds[0], out.fds[1], err.fds[0], err.fds[1]})
            if (fd > STDERR_FILENO)
                ::close(fd);

        if (!options.working_directory.empty() && chdir(options.working_directory.c_str()) != 0)
            child_fail(error_fd);
        for (const auto& [key, value] : options.environment)
            setenv(key.c_str(), value.c_str(), 1);

        execvp(executable.c_str(), argv.data());
        child_fail(error_fd);
    }

    exec_error.close_write();
    int child_errno = 0;
    ssize_t error_bytes;
    do
    {
        error_bytes = ::read(exec_error.read_end(), &child_errno, sizeof(child_errno));
    } while (error_bytes < 0 && errno == EINTR);

    if (error_bytes > 0)
    {
        waitpid(pid, nullptr, 0);
        throw ProcessError("Failed to execute '" + executable + "': " + errno_message(child_errno));
    }

    in.close_read();
    stdin_->handle_->fd = in.release_write();
    out.close_write();
    stdout_->handle_->fd = out.release_read();
    if (err.is_open())
    {
        err.close_write();
        stderr_->handle_->fd = err.release_read();
    }

    handle_->pid = pid;
    handle_->running = true;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_->is_open())
        throw ProcessError("Bridge stdin is closed");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_->is_open())
        throw ProcessError("Bridge stderr is not captured");
    return *stderr_;
}

int Process::wait_or_kill(std::chrono::milliseconds grace)
{
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (true)
    {
        if (auto code = try_reap())
            return *code;
        if (std::chrono::steady_clock::now() >= deadline)
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    CHATCONSOLE_LOG_WARN("Bridge did not exit in time; killing it");
    kill();
    return reap();
}

std::optional<int> Process::try_reap()
{
    if (!handle_->running)
        return handle_->exit_code;

    int status = 0;
    pid_t result = waitpid(handle_->pid, &status, WNOHANG);
    if (result == 0)
        return std::nullopt;
    if (result != handle_->pid)
        throw ProcessError("waitpid failed: " + errno_message());

    handle_->exit_code = decode_status(status);
    handle_->running = false;
    return handle_->exit_code;
}

int Process::reap()
{
    if (!handle_->running)
        return handle_->exit_code;

    int status = 0;
    pid_t result;
    do
    {
        result = waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result != handle_->pid)
        throw ProcessError("waitpid failed: " + errno_message());

    handle_->exit_code = decode_status(status);
    handle_->running = false;
    return handle_->exit_code;
}

void Process::kill()
{
    if (handle_->running)
        ::kill(handle_->pid, SIGKILL);
}

// =============================================================================
// Utility functions
// =============================================================================

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    auto is_executable = [](const fs::path& p)
    {
        std::error_code ec;
        return fs::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
    };

    // Anything with a separator is a path, absolute or relative to the cwd
    if (name.find('/') != std::string::npos)
    {
        if (is_executable(name))
            return fs::absolute(name).string();
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env)
    {
        if (is_executable(name))
            return fs::absolute(name).string();
        return std::nullopt;
    }

    std::string path_str(path_env);
    size_t start = 0;
    while (start <= path_str.size())
    {
        size_t end = path_str.find(':', start);
        if (end == std::string::npos)
            end = path_str.size();

        std::string dir = path_str.substr(start, end - start);
        if (!dir.empty())
        {
            fs::path candidate = fs::path(dir) / name;
            if (is_executable(candidate))
                return candidate.string();
        }
        start = end + 1;
    }

    return std::nullopt;
}

bool is_node_script(const std::string& path)
{
    auto ends_with = [&path](const std::string& suffix)
    {
        return path.size() >= suffix.size() &&
               path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    return ends_with(".js") || ends_with(".mjs");
}

std::optional<std::string> find_node()
{
    return find_executable("node");
}

} // namespace chatconsole
