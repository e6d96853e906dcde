#include "process.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

ProcessResult run_process(const std::vector<std::string>& args, const std::filesystem::path& cwd) {
    if (args.empty()) {
        throw VpkgException(ErrorKind::Io, get_string("error.empty_command"));
    }

    int pipe_fds[2];
    if (pipe2(pipe_fds, O_CLOEXEC) != 0) {
        throw VpkgException(ErrorKind::Io, string_format("error.spawn_failed", args[0], strerror(errno)));
    }

    std::vector<char*> c_args;
    for (const auto& arg : args) c_args.push_back(const_cast<char*>(arg.c_str()));
    c_args.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        close(pipe_fds[0]);
        close(pipe_fds[1]);
        throw VpkgException(ErrorKind::Io, string_format("error.spawn_failed", args[0], strerror(err)));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        dup2(pipe_fds[1], STDOUT_FILENO);
        dup2(pipe_fds[1], STDERR_FILENO);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        if (chdir(cwd.c_str()) != 0) {
            const char msg[] = "vpkg: cannot change to working directory\n";
            (void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
            _exit(127);
        }
        execvp(c_args[0], c_args.data());
        const char msg[] = "vpkg: exec failed\n";
        (void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
        _exit(127);
    }

    close(pipe_fds[1]);

    ProcessResult result;
    char buffer[4096];
    while (true) {
        ssize_t n = read(pipe_fds[0], buffer, sizeof(buffer));
        if (n > 0) {
            result.output.append(buffer, static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            break;
        }
    }
    close(pipe_fds[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw VpkgException(ErrorKind::Io, string_format("error.wait_failed", args[0], strerror(errno)));
        }
    }
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}
