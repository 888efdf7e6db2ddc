#include "octpkg/builder.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace octpkg {

ExecResult run_process(const ProcessSpec& spec) {
    ExecResult result;

    if (spec.argv.empty()) {
        result.error = "empty command line";
        return result;
    }

    // Build C-style arrays before forking
    std::vector<char*> argv;
    for (const auto& s : spec.argv) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    std::string command_line;
    for (const auto& s : spec.argv) {
        if (!command_line.empty()) command_line += ' ';
        command_line += s;
    }
    spdlog::debug("running {}{}", command_line, spec.cwd.empty() ? "" : " in " + spec.cwd);

    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        // Child process
        if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) {
            _exit(127);
        }

        for (const auto& [key, value] : spec.env) {
            setenv(key.c_str(), value.c_str(), 1);
        }

        if (!spec.show_output) {
            const char* sink = spec.log_file.empty() ? "/dev/null" : spec.log_file.c_str();
            int fd = open(sink, O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (fd >= 0) {
                dup2(fd, STDOUT_FILENO);
                dup2(fd, STDERR_FILENO);
                close(fd);
            }
        }

        execvp(argv[0], argv.data());

        // If execvp returns, it failed
        _exit(127);
    }

    // Parent process
    int status;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            result.error = "waitpid failed: " + std::string(strerror(errno));
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }

    return result;
}

} // namespace octpkg
