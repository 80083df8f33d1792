#include "shell.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace DockWatch {

    namespace {

        // NULL-terminated argv for execvp. Built before fork: the child of a
        // threaded process must not allocate.
        std::vector<char*> exec_args(const std::vector<std::string>& argv) {
            std::vector<char*> args;
            args.reserve(argv.size() + 1);
            for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
            args.push_back(nullptr);
            return args;
        }

        // fork + exec with stdout/stderr on a fresh pipe. Returns the read end.
        // Both pipe ends are close-on-exec so concurrent spawns never inherit them.
        pid_t spawn_piped(const std::vector<std::string>& argv, int& read_fd) {
            read_fd = -1;
            if (argv.empty()) return -1;

            auto args = exec_args(argv);
            int fds[2];
            if (pipe2(fds, O_CLOEXEC) != 0) return -1;
            // Keep the child off the terminal the UI is reading from
            int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);

            pid_t pid = fork();
            if (pid < 0) {
                close(fds[0]);
                close(fds[1]);
                if (devnull >= 0) close(devnull);
                return -1;
            }

            if (pid == 0) {
                if (devnull >= 0) dup2(devnull, STDIN_FILENO);
                dup2(fds[1], STDOUT_FILENO);
                dup2(fds[1], STDERR_FILENO);
                execvp(args[0], args.data());
                _exit(127);
            }

            close(fds[1]);
            if (devnull >= 0) close(devnull);
            read_fd = fds[0];
            return pid;
        }

        int decode_status(int status) {
            if (WIFEXITED(status)) return WEXITSTATUS(status);
            if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
            return -1;
        }

    }

    std::string CommandResult::trimmed() const {
        size_t end = output.find_last_not_of(" \t\r\n");
        if (end == std::string::npos) return "";
        size_t begin = output.find_first_not_of(" \t\r\n");
        return output.substr(begin, end - begin + 1);
    }

    CommandResult run_command(const std::vector<std::string>& argv, int timeout_seconds) {
        std::vector<std::string> full;
        if (timeout_seconds > 0) {
            full.push_back("timeout");
            full.push_back(std::to_string(timeout_seconds) + "s");
        }
        full.insert(full.end(), argv.begin(), argv.end());

        CommandResult result;
        int fd = -1;
        pid_t pid = spawn_piped(full, fd);
        if (pid < 0) {
            result.output = "failed to start " + (argv.empty() ? std::string("process") : argv.front());
            return result;
        }

        std::array<char, 4096> buffer;
        while (true) {
            ssize_t n = read(fd, buffer.data(), buffer.size());
            if (n > 0) {
                result.output.append(buffer.data(), (size_t)n);
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            break;
        }
        close(fd);

        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        result.exit_code = decode_status(status);
        return result;
    }

    int run_interactive(const std::vector<std::string>& argv) {
        if (argv.empty()) return -1;

        auto args = exec_args(argv);
        pid_t pid = fork();
        if (pid < 0) return -1;
        if (pid == 0) {
            execvp(args[0], args.data());
            _exit(127);
        }

        int status = 0;
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) return -1;
        }
        int code = decode_status(status);
        return code == 127 ? -1 : code;
    }

    // --- ChildProcess ---

    ChildProcess::~ChildProcess() {
        terminate();
    }

    bool ChildProcess::spawn(const std::vector<std::string>& argv) {
        pid_ = spawn_piped(argv, fd_);
        return pid_ > 0;
    }

    ChildProcess::ReadStatus ChildProcess::read_line(std::string& line, int timeout_ms) {
        auto take_line = [&]() -> bool {
            size_t nl = buffer_.find('\n');
            if (nl == std::string::npos) return false;
            line = buffer_.substr(0, nl);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            buffer_.erase(0, nl + 1);
            return true;
        };

        if (take_line()) return ReadStatus::Line;
        if (fd_ < 0) {
            if (!buffer_.empty()) {
                line.swap(buffer_);
                buffer_.clear();
                return ReadStatus::Line;
            }
            return ReadStatus::Eof;
        }

        pollfd pfd{fd_, POLLIN, 0};
        int rc = poll(&pfd, 1, timeout_ms);
        if (rc == 0) return ReadStatus::Timeout;
        if (rc < 0) return errno == EINTR ? ReadStatus::Timeout : ReadStatus::Eof;

        std::array<char, 4096> chunk;
        ssize_t n = read(fd_, chunk.data(), chunk.size());
        if (n > 0) {
            buffer_.append(chunk.data(), (size_t)n);
            return take_line() ? ReadStatus::Line : ReadStatus::Timeout;
        }
        if (n < 0 && errno == EINTR) return ReadStatus::Timeout;

        close(fd_);
        fd_ = -1;
        return read_line(line, 0);
    }

    void ChildProcess::terminate() {
        if (pid_ > 0) {
            kill(pid_, SIGTERM);
            int status = 0;
            bool reaped = false;
            for (int i = 0; i < 50 && !reaped; ++i) {
                reaped = waitpid(pid_, &status, WNOHANG) == pid_;
                if (!reaped) std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            if (!reaped) {
                kill(pid_, SIGKILL);
                waitpid(pid_, &status, 0);
            }
            exit_code_ = decode_status(status);
            pid_ = -1;
        }
        if (fd_ >= 0) {
            close(fd_);
            fd_ = -1;
        }
    }

    int ChildProcess::wait() {
        if (pid_ > 0) {
            int status = 0;
            while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
            exit_code_ = decode_status(status);
            pid_ = -1;
        }
        if (fd_ >= 0) {
            close(fd_);
            fd_ = -1;
        }
        return exit_code_;
    }

}
