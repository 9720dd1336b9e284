#include <yarn2nix/process.hpp>
#include <yarn2nix/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace yarn2nix {

static void drain(int fd, std::string& out) {
    char buf[4096];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
}

// The child leads its own process group, so this also reaches anything it
// spawned (nix-prefetch-git runs git).
static Yarn2nixError kill_child(pid_t pid, int out_fd, int err_fd,
                                Yarn2nixError err) {
    kill(-pid, SIGKILL);
    waitpid(pid, nullptr, 0);
    close(out_fd);
    close(err_fd);
    return err;
}

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds,
                                  const CancelFlag* cancel) {
    if (args.empty()) {
        return Yarn2nixError{Yarn2nixError::InvalidArg, "run_command: empty args"};
    }

    // Build argv for execvp
    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int stdout_pipe[2];
    int stderr_pipe[2];

    if (pipe(stdout_pipe) != 0) {
        return Yarn2nixError{Yarn2nixError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    if (pipe(stderr_pipe) != 0) {
        int saved = errno;
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        return Yarn2nixError{Yarn2nixError::IO,
            std::string("pipe() failed: ") + strerror(saved)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        return Yarn2nixError{Yarn2nixError::IO,
            std::string("fork() failed: ") + strerror(saved)};
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        if (!working_dir.empty()) {
            if (chdir(working_dir.c_str()) != 0) {
                _exit(127);
            }
        }

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);  // execvp failed
    }

    // Parent process. Set the group here too so a kill issued before the
    // child runs setpgid still finds it.
    setpgid(pid, pid);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    auto start = std::chrono::steady_clock::now();

    while (true) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                >= timeout_seconds) {
            return kill_child(pid, stdout_pipe[0], stderr_pipe[0],
                Yarn2nixError{Yarn2nixError::IO,
                    args[0] + " timed out after " + std::to_string(timeout_seconds) + "s"});
        }

        if (is_cancelled(cancel)) {
            log::debug("cancelling %s (pid %d)", args[0].c_str(), static_cast<int>(pid));
            return kill_child(pid, stdout_pipe[0], stderr_pipe[0],
                Yarn2nixError{Yarn2nixError::Cancelled, args[0] + " cancelled"});
        }

        drain(stdout_pipe[0], out_buf);
        drain(stderr_pipe[0], err_buf);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain(stdout_pipe[0], out_buf);
            drain(stderr_pipe[0], err_buf);

            close(stdout_pipe[0]);
            close(stderr_pipe[0]);

            int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return Result<CommandResult>::ok(
                CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
        } else if (w < 0) {
            int saved = errno;
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            return Yarn2nixError{Yarn2nixError::IO,
                std::string("waitpid failed: ") + strerror(saved)};
        }

        // Brief sleep to avoid busy-wait
        usleep(1000);  // 1ms
    }
}

} // namespace yarn2nix
