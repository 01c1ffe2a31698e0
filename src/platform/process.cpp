#include "process.hpp"
#include <core/constants.hpp>
#include <util/string_utils.hpp>

#include <unistd.h>
#include <sys/wait.h>
#include <sys/stat.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstdlib>
#include <system_error>

namespace platform {

static void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

static int wait_exit_code(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// ── run_shell ────────────────────────────────────────────────

ShellOutput run_shell(const std::string& command_line,
                      const std::string& cwd,
                      std::size_t max_buffer,
                      const ChunkCallback& on_stdout,
                      const ChunkCallback& on_stderr) {
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};

    // Children forked by other pool threads must not inherit these ends.
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe");
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        throw std::system_error(saved, std::generic_category(), "pipe");
    }

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        throw std::system_error(saved, std::generic_category(), "fork");
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            const char msg[] = "sh: cannot change to working directory\n";
            ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
            (void)ignored;
            _exit(127);
        }

        execl(SHELL_PATH, "sh", "-c", command_line.c_str(), static_cast<char*>(nullptr));
        _exit(127);  // exec failed
    }

    // Parent
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    ShellOutput result;
    result.pid = pid;

    struct pollfd fds[2];
    fds[0] = {out_pipe[0], POLLIN, 0};
    fds[1] = {err_pipe[0], POLLIN, 0};
    std::string* sinks[2] = {&result.stdout_data, &result.stderr_data};
    const ChunkCallback* callbacks[2] = {&on_stdout, &on_stderr};
    const char* names[2] = {"stdout", "stderr"};

    char buf[EXEC_READ_BUF_SIZE];
    while ((fds[0].fd >= 0 || fds[1].fd >= 0) && !result.overflow) {
        int rc = poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }

        for (int i = 0; i < 2 && !result.overflow; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;

            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                close_fd(fds[i].fd);
                continue;
            }

            sinks[i]->append(buf, static_cast<size_t>(n));
            if (*callbacks[i]) (*callbacks[i])(buf, static_cast<size_t>(n));

            if (sinks[i]->size() > max_buffer) {
                result.overflow = true;
                result.overflow_stream = names[i];
                kill(pid, SIGTERM);
            }
        }
    }

    close_fd(fds[0].fd);
    close_fd(fds[1].fd);
    result.exit_code = wait_exit_code(pid);
    return result;
}

// ── find_executable ──────────────────────────────────────────

static bool is_executable_file(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

bool find_executable(const std::string& name) {
    if (name.empty()) return false;
    if (name.find('/') != std::string::npos) return is_executable_file(name);

    const char* path_env = std::getenv("PATH");
    if (!path_env) return false;

    for (const auto& dir : StringUtils::split(path_env, ':')) {
        std::string candidate = (dir.empty() ? std::string(".") : dir) + "/" + name;
        if (is_executable_file(candidate)) return true;
    }
    return false;
}

} // namespace platform
