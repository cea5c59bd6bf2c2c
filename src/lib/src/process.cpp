#include <xprimary/process.hpp>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

static std::runtime_error system_error(const std::string &what)
{
    return std::runtime_error(what + ": " + std::string(strerror(errno)));
}

[[noreturn]] static void exec_child(const std::vector<std::string> &argv,
                                    process::output_mode mode,
                                    int pipe_fds[2])
{
    switch (mode)
    {
    case process::output_mode::CAPTURE:
        dup2(pipe_fds[1], STDOUT_FILENO);
        close(pipe_fds[0]);
        close(pipe_fds[1]);
        break;
    case process::output_mode::DISCARD:
    {
        int null_fd = open("/dev/null", O_WRONLY);
        if (null_fd >= 0)
        {
            dup2(null_fd, STDOUT_FILENO);
            dup2(null_fd, STDERR_FILENO);
            close(null_fd);
        }
        break;
    }
    case process::output_mode::INHERIT:
        break;
    }

    std::vector<char *> args;
    args.reserve(argv.size() + 1);
    for (const std::string &arg : argv)
        args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);

    execvp(args[0], args.data());
    _exit(127);
}

static std::string read_all(int fd)
{
    std::string out;
    char buf[4096];
    for (;;)
    {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0)
        {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        break;
    }
    return out;
}

process::result process::run(const std::vector<std::string> &argv,
                             output_mode mode)
{
    if (argv.empty())
        throw std::invalid_argument("Empty command line.");

    int pipe_fds[2] = {-1, -1};
    if (mode == output_mode::CAPTURE && pipe(pipe_fds) < 0)
        throw system_error("pipe");

    pid_t pid = fork();
    if (pid < 0)
    {
        if (mode == output_mode::CAPTURE)
        {
            close(pipe_fds[0]);
            close(pipe_fds[1]);
        }
        throw system_error("fork");
    }
    if (pid == 0)
        exec_child(argv, mode, pipe_fds);

    result result;
    if (mode == output_mode::CAPTURE)
    {
        close(pipe_fds[1]);
        result.out = read_all(pipe_fds[0]);
        close(pipe_fds[0]);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
            throw system_error("waitpid");
    }
    if (WIFEXITED(status))
        result.exit_status = WEXITSTATUS(status);

    return result;
}
