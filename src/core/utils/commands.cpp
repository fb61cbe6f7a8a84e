#include "soberlauncher/util.hpp"
#include "soberlauncher/debug.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <sys/poll.h>
#include <sys/wait.h>
#include <unistd.h>

/*
  Utility: drain two fds using poll until EOF on both,
  then reap the child and report how it ended.
*/
static int drain_pipes_and_reap(pid_t child,
                                int fd_out,
                                int fd_err,
                                std::string &out, std::string &err)
{
    // non-blocking reads
    fcntl(fd_out, F_SETFL, O_NONBLOCK);
    fcntl(fd_err, F_SETFL, O_NONBLOCK);

    struct pollfd fds[2];
    fds[0].fd = fd_out;
    fds[0].events = POLLIN;
    fds[1].fd = fd_err;
    fds[1].events = POLLIN;

    int active = 2;
    std::array<char, 4096> buf;

    while (active > 0) {
        int rv = poll(fds, 2, 3000);
        if (rv < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rv == 0)
            continue; // nothing yet, the child is still writing or sleeping

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0) continue;
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;

            ssize_t n = read(fds[i].fd, buf.data(), buf.size());
            if (n > 0) {
                (i == 0 ? out : err).append(buf.data(), n);
            } else if (n == 0 || (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)) {
                // EOF or unrecoverable read error
                close(fds[i].fd);
                fds[i].fd = -1;
                --active;
            }
        }
    }

    for (auto &p : fds)
        if (p.fd >= 0) close(p.fd);

    int status = 0;
    while (waitpid(child, &status, 0) < 0) {
        if (errno != EINTR)
            return -1;
    }

    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
}

bool
sl_util::command_exists(const std::string& command)
{
    // Check if command is in PATH
    return !sl_util::which(command).empty();
}

void
sl_util::set_cloexec(int fd)
{
    if (fd < 0) return;
    int flags = fcntl(fd, F_GETFD);
    if (flags == -1) return;
    (void) fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

// Execvp-based implementation using vector<string> -> argv
command_streams
sl_util::exec_commandv(const std::vector<std::string> &args)
{
    command_streams result;
    if (args.empty()) return result;

    int out_pipe[2] = {-1,-1};
    int err_pipe[2] = {-1,-1};

    if (pipe(out_pipe) < 0 || pipe(err_pipe) < 0) {
        std::cerr << "pipe() failed: " << strerror(errno) << std::endl;
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]})
            if (fd >= 0) close(fd);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "fork() failed: " << strerror(errno) << std::endl;
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // child: wire stdout/stderr, stdin from /dev/null
        close(out_pipe[0]);
        close(err_pipe[0]);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[1]);
        close(err_pipe[1]);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (const auto &s : args) argv.push_back(const_cast<char*>(s.c_str()));
        argv.push_back(nullptr);

        execvp(argv[0], argv.data());
        _exit(127);
    }

    // parent: close the write ends we don't need
    close(out_pipe[1]);
    close(err_pipe[1]);

    result.exit_status = drain_pipes_and_reap(pid, out_pipe[0], err_pipe[0],
                                              result.stdout_str, result.stderr_str);
    DEBUG_LOG("[exec] ", args[0], " exited with ", result.exit_status);

    return result;
}
