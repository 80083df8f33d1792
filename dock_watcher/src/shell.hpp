#ifndef DOCKWATCH_SHELL_HPP
#define DOCKWATCH_SHELL_HPP

#include <string>
#include <sys/types.h>
#include <vector>

namespace DockWatch {

    struct CommandResult {
        int exit_code = -1;
        std::string output; // stdout and stderr merged

        bool ok() const { return exit_code == 0; }
        bool timed_out() const { return exit_code == 124; }
        std::string trimmed() const;
    };

    // Runs argv[0] from PATH with stdin on /dev/null. A positive timeout wraps
    // the call in coreutils `timeout`.
    CommandResult run_command(const std::vector<std::string>& argv, int timeout_seconds = 0);

    // Runs argv on the caller's terminal and waits for it. Returns the exit
    // code, or -1 when the process could not be started.
    int run_interactive(const std::vector<std::string>& argv);

    // Long-lived child with its merged output on a pipe (log/stats streams).
    class ChildProcess {
    public:
        enum class ReadStatus { Line, Timeout, Eof };

        ChildProcess() = default;
        ~ChildProcess();

        ChildProcess(const ChildProcess&) = delete;
        ChildProcess& operator=(const ChildProcess&) = delete;

        bool spawn(const std::vector<std::string>& argv);
        ReadStatus read_line(std::string& line, int timeout_ms);
        void terminate();
        int wait(); // exit code, reaps the child

        bool running() const { return pid_ > 0; }

    private:
        pid_t pid_ = -1;
        int fd_ = -1;
        std::string buffer_;
        int exit_code_ = -1;
    };

}

#endif
