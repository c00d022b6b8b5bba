// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tandem/remote/process.hpp>
#include <cerrno>
#include <cstring>
#include <array>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tandem::remote {

namespace {

// RAII file descriptor
struct FileDescriptor {
    int fd = -1;

    FileDescriptor() = default;
    explicit FileDescriptor(int f) : fd(f) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&& other) noexcept : fd(other.fd) { other.fd = -1; }
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset();
            fd = other.fd;
            other.fd = -1;
        }
        return *this;
    }

    void reset() noexcept {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
};

std::error_code last_error() noexcept {
    return {errno, std::generic_category()};
}

std::expected<std::pair<FileDescriptor, FileDescriptor>, std::error_code> make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return std::unexpected(last_error());
    }
    return std::make_pair(FileDescriptor(fds[0]), FileDescriptor(fds[1]));
}

// Drain both pipes until EOF without letting either one fill up
void drain(FileDescriptor& out, std::string& out_text,
           FileDescriptor& err, std::string& err_text) {
    std::array<char, 4096> buf{};

    while (out.fd >= 0 || err.fd >= 0) {
        pollfd fds[2];
        nfds_t count = 0;
        FileDescriptor* owners[2] = {nullptr, nullptr};
        std::string* sinks[2] = {nullptr, nullptr};

        if (out.fd >= 0) {
            fds[count] = {out.fd, POLLIN, 0};
            owners[count] = &out;
            sinks[count] = &out_text;
            ++count;
        }
        if (err.fd >= 0) {
            fds[count] = {err.fd, POLLIN, 0};
            owners[count] = &err;
            sinks[count] = &err_text;
            ++count;
        }

        int ready = ::poll(fds, count, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            out.reset();
            err.reset();
            return;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;

            ssize_t n = ::read(fds[i].fd, buf.data(), buf.size());
            if (n > 0) {
                sinks[i]->append(buf.data(), static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                owners[i]->reset();
            }
        }
    }
}

} // namespace

std::expected<ProcessResult, std::error_code>
run_process(const std::vector<std::string>& argv,
            const std::optional<std::filesystem::path>& stdout_file) {
    if (argv.empty()) {
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }

    // Build everything the child needs before forking
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    auto err_pipe = make_pipe();
    if (!err_pipe) return std::unexpected(err_pipe.error());

    FileDescriptor out_read;
    FileDescriptor out_write;
    if (stdout_file) {
        int fd = ::open(stdout_file->c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd < 0) return std::unexpected(last_error());
        out_write = FileDescriptor(fd);
    } else {
        auto out_pipe = make_pipe();
        if (!out_pipe) return std::unexpected(out_pipe.error());
        out_read = std::move(out_pipe->first);
        out_write = std::move(out_pipe->second);
    }

    FileDescriptor err_read = std::move(err_pipe->first);
    FileDescriptor err_write = std::move(err_pipe->second);

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(last_error());
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::dup2(out_write.fd, STDOUT_FILENO);
        ::dup2(err_write.fd, STDERR_FILENO);
        ::execvp(args[0], args.data());

        const char* msg = "exec failed: ";
        (void)!::write(STDERR_FILENO, msg, std::strlen(msg));
        const char* reason = std::strerror(errno);
        (void)!::write(STDERR_FILENO, reason, std::strlen(reason));
        ::_exit(127);
    }

    out_write.reset();
    err_write.reset();

    ProcessResult result;
    drain(out_read, result.output, err_read, result.error);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return std::unexpected(last_error());
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

} // namespace tandem::remote
