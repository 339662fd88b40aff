#include "core/process_runner.hpp"
#include "core/errors.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace
{
    // Exit code used by the child when execvp itself fails
    constexpr int EXEC_FAILED_EXIT_CODE = 127;
    constexpr const char EXEC_FAILED_MARKER[] = "media_tools: exec failed\n";

    std::string systemErrorMessage(const std::string &what)
    {
        return what + ": " + std::error_code(errno, std::generic_category()).message();
    }

    class FileDescriptor
    {
    public:
        explicit FileDescriptor(int fd = -1) : fd_(fd) {}
        ~FileDescriptor() { reset(); }

        FileDescriptor(const FileDescriptor &) = delete;
        FileDescriptor &operator=(const FileDescriptor &) = delete;

        int get() const { return fd_; }

        void reset(int fd = -1)
        {
            if (fd_ >= 0)
                ::close(fd_);
            fd_ = fd;
        }

    private:
        int fd_;
    };

    std::string formatDuration(std::chrono::milliseconds duration)
    {
        if (duration.count() % 1000 == 0)
            return std::to_string(duration.count() / 1000) + "s";
        return std::to_string(duration.count()) + "ms";
    }

    // Keeps the last `limit` bytes of a stream
    void appendTail(std::string &tail, const char *data, size_t size, size_t limit)
    {
        tail.append(data, size);
        if (tail.size() > limit)
        {
            tail.erase(0, tail.size() - limit);
        }
    }

    void drainPipe(int fd, std::string &tail, size_t limit)
    {
        char buffer[4096];
        for (;;)
        {
            ssize_t n = ::read(fd, buffer, sizeof(buffer));
            if (n > 0)
            {
                appendTail(tail, buffer, static_cast<size_t>(n), limit);
                continue;
            }
            if (n < 0 && errno == EINTR)
                continue;
            break;
        }
    }

    /**
     * Owns a running child. If the runner unwinds for any reason the group is
     * killed and reaped so no process outlives its job.
     */
    class ChildGuard
    {
    public:
        explicit ChildGuard(pid_t pid) : pid_(pid) {}

        ~ChildGuard()
        {
            if (!reaped_)
            {
                ::kill(-pid_, SIGKILL);
                int status = 0;
                while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR)
                {
                }
            }
        }

        ChildGuard(const ChildGuard &) = delete;
        ChildGuard &operator=(const ChildGuard &) = delete;

        // Returns true once the child has exited; status is filled in then
        bool poll(int &status)
        {
            if (reaped_)
                return true;
            pid_t res = ::waitpid(pid_, &status, WNOHANG);
            if (res == pid_)
            {
                reaped_ = true;
                return true;
            }
            if (res == -1 && errno != EINTR)
            {
                throw ResourceError(systemErrorMessage("waitpid failed"));
            }
            return false;
        }

        // SIGTERM the group, escalate to SIGKILL after the grace period
        void terminate(std::chrono::milliseconds grace, int &status)
        {
            ::kill(-pid_, SIGTERM);
            auto deadline = std::chrono::steady_clock::now() + grace;
            while (std::chrono::steady_clock::now() < deadline)
            {
                if (poll(status))
                    return;
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
            Logger::warn("Child process " + std::to_string(pid_) + " ignored SIGTERM, sending SIGKILL");
            ::kill(-pid_, SIGKILL);
            while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR)
            {
            }
            reaped_ = true;
        }

    private:
        pid_t pid_;
        bool reaped_ = false;
    };
}

ProcessResult ProcessRunner::run(const std::vector<std::string> &argv, const Options &options,
                                 const CancellationToken &token)
{
    if (argv.empty())
    {
        throw TransformFailed("No program given");
    }

    // Everything the child touches is prepared before fork
    std::vector<char *> exec_args;
    exec_args.reserve(argv.size() + 1);
    for (const auto &arg : argv)
    {
        exec_args.push_back(const_cast<char *>(arg.c_str()));
    }
    exec_args.push_back(nullptr);
    const std::string working_directory = options.working_directory.string();

    int pipefd[2];
    if (::pipe(pipefd) == -1)
    {
        throw ResourceError(systemErrorMessage("pipe failed"));
    }
    FileDescriptor read_end(pipefd[0]);
    FileDescriptor write_end(pipefd[1]);

    // dup2 clears FD_CLOEXEC on the child's stderr, so both ends can carry it
    if (::fcntl(read_end.get(), F_SETFD, FD_CLOEXEC) == -1 ||
        ::fcntl(write_end.get(), F_SETFD, FD_CLOEXEC) == -1 ||
        ::fcntl(read_end.get(), F_SETFL, O_NONBLOCK) == -1)
    {
        throw ResourceError(systemErrorMessage("fcntl failed"));
    }

    Logger::debug("Spawning " + argv.front() + " with " + std::to_string(argv.size() - 1) + " argument(s)");
    auto started = std::chrono::steady_clock::now();

    const pid_t pid = ::fork();
    if (pid == -1)
    {
        throw ResourceError(systemErrorMessage("fork failed"));
    }

    if (pid == 0) // CHILD
    {
        ::setpgid(0, 0);

        const int null_fd = ::open("/dev/null", O_RDWR);
        if (null_fd != -1)
        {
            ::dup2(null_fd, STDIN_FILENO);
            ::dup2(null_fd, STDOUT_FILENO);
            ::close(null_fd);
        }
        if (::dup2(write_end.get(), STDERR_FILENO) == -1)
            ::_exit(EXEC_FAILED_EXIT_CODE);

        if (!working_directory.empty() && ::chdir(working_directory.c_str()) == -1)
            ::_exit(EXEC_FAILED_EXIT_CODE);

        ::execvp(exec_args[0], exec_args.data());
        ssize_t ignored = ::write(STDERR_FILENO, EXEC_FAILED_MARKER, sizeof(EXEC_FAILED_MARKER) - 1);
        (void)ignored;
        ::_exit(EXEC_FAILED_EXIT_CODE);
    }

    // PARENT
    ChildGuard child(pid);
    ::setpgid(pid, pid); // Closes the race with the child's own setpgid
    write_end.reset();

    ProcessResult result;
    int status = 0;
    bool timed_out = false;
    bool cancelled = false;
    auto deadline = started + options.timeout;

    for (;;)
    {
        struct pollfd pfd{read_end.get(), POLLIN, 0};
        int ready = ::poll(&pfd, 1, 100);
        if (ready > 0)
        {
            drainPipe(read_end.get(), result.stderr_tail, options.max_stderr_bytes);
        }

        if (child.poll(status))
            break;

        if (std::chrono::steady_clock::now() >= deadline)
        {
            timed_out = true;
            child.terminate(options.kill_grace, status);
            break;
        }
        if (token.isCancelled())
        {
            cancelled = true;
            child.terminate(options.kill_grace, status);
            break;
        }
    }

    drainPipe(read_end.get(), result.stderr_tail, options.max_stderr_bytes);
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    if (timed_out)
    {
        throw TransformTimeout("Transformation exceeded the " + formatDuration(options.timeout) + " time limit");
    }
    if (cancelled)
    {
        std::string reason = token.reason();
        throw TransformFailed("Transformation cancelled" + (reason.empty() ? std::string() : ": " + reason));
    }

    if (WIFEXITED(status))
    {
        result.exit_code = WEXITSTATUS(status);
    }
    else if (WIFSIGNALED(status))
    {
        result.signaled = true;
        result.exit_code = 128 + WTERMSIG(status);
    }

    if (result.exit_code == EXEC_FAILED_EXIT_CODE &&
        result.stderr_tail.find(EXEC_FAILED_MARKER) != std::string::npos)
    {
        throw TransformFailed("Cannot execute " + std::filesystem::path(argv.front()).filename().string());
    }

    Logger::debug(argv.front() + " exited with code " + std::to_string(result.exit_code) + " after " +
                  std::to_string(result.elapsed.count()) + "ms");
    return result;
}
