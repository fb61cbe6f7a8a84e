#include "soberlauncher/processsupervisor.hpp"
#include "soberlauncher/profilecatalog.hpp"
#include "soberlauncher/debug.hpp"
#include "soberlauncher/util.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

extern char **environ;

namespace {

// Everything execvpe() needs, prepared before fork() so the child only has
// to make async-signal-safe calls.
struct exec_plan
{
    std::vector<std::string> argv_storage;
    std::vector<std::string> env_storage;
    std::vector<char*> argv;
    std::vector<char*> envp;
};

exec_plan
make_exec_plan(const sl_mgmt::invocation &inv)
{
    exec_plan plan;
    plan.argv_storage = inv.argv;

    for (char **e = environ; e && *e; ++e) {
        if (!inv.home.empty() && std::strncmp(*e, "HOME=", 5) == 0)
            continue;
        plan.env_storage.emplace_back(*e);
    }
    if (!inv.home.empty())
        plan.env_storage.push_back("HOME=" + inv.home);

    for (auto &s : plan.argv_storage) plan.argv.push_back(const_cast<char*>(s.c_str()));
    plan.argv.push_back(nullptr);
    for (auto &s : plan.env_storage) plan.envp.push_back(const_cast<char*>(s.c_str()));
    plan.envp.push_back(nullptr);

    return plan;
}

[[noreturn]] void
report_child_failure(int status_fd)
{
    int err = errno;
    ssize_t ignored = write(status_fd, &err, sizeof(err));
    (void) ignored;
    _exit(127);
}

/*
  fork + execvpe with a close-on-exec status pipe: if exec (or anything
  before it) fails, the child writes errno into the pipe; a clean exec
  closes the pipe and the parent reads EOF. That's how a missing binary
  becomes an error here instead of an exit status nobody looks at.

  detach: double fork, the grandchild runs the program in its own session
  and the intermediate child is reaped right away. Returns 0 in that case.
  Otherwise the child leads its own process group and its pid is returned.
*/
pid_t
spawn(const sl_mgmt::invocation &inv, bool detach, std::string &error)
{
    if (inv.argv.empty()) {
        error = "Nothing to run";
        return -1;
    }

    exec_plan plan = make_exec_plan(inv);

    int status_pipe[2] = {-1, -1};
    if (pipe(status_pipe) < 0) {
        error = std::string("pipe() failed: ") + strerror(errno);
        return -1;
    }
    sl_util::set_cloexec(status_pipe[0]);
    sl_util::set_cloexec(status_pipe[1]);

    pid_t pid = fork();
    if (pid < 0) {
        error = std::string("fork() failed: ") + strerror(errno);
        close(status_pipe[0]);
        close(status_pipe[1]);
        return -1;
    }

    if (pid == 0) {
        close(status_pipe[0]);

        if (detach) {
            pid_t gpid = fork();
            if (gpid < 0)
                report_child_failure(status_pipe[1]);
            if (gpid > 0)
                _exit(0); // intermediate child, reaped below
            setsid();
        } else {
            setpgid(0, 0);
        }

        // Don't hand our own signal setup to the application
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);
        signal(SIGPIPE, SIG_DFL);

        execvpe(plan.argv[0], plan.argv.data(), plan.envp.data());
        report_child_failure(status_pipe[1]);
    }

    close(status_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (detach) {
        while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
    }

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        error = "Failed to start " + inv.argv[0] + ": " + strerror(child_errno);
        if (!detach) {
            while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
        }
        return -1;
    }

    return detach ? 0 : pid;
}

// true once the process is gone (reaped now, or not our child anymore)
bool
reap_if_exited(pid_t pid)
{
    int status = 0;
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == pid)
        return true;
    if (r < 0 && errno == ECHILD)
        return true;
    return false;
}

// SIGTERM to the process group, short grace period, then SIGKILL; always reaps
void
kill_process(pid_t pid, int sig = SIGTERM, int wait_retries = 10, int wait_usleep = 50000)
{
    if (::kill(-pid, sig) != 0)
        ::kill(pid, sig);

    for (int i = 0; i < wait_retries; ++i) {
        if (reap_if_exited(pid))
            return;
        usleep(wait_usleep);
    }

    DEBUG_LOG("[supervisor] pid ", pid, " ignored signal ", sig, ", sending SIGKILL");
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
    while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
}

} // namespace

sl_mgmt::launch_target
sl_mgmt::launch_target::sober()
{
    const std::string identity = "org.vinegarhq.Sober";
    return launch_target{
        {"flatpak", "run", identity},
        identity,
        {"flatpak", "kill", identity}
    };
}

std::vector<std::string>
sl_mgmt::find_terminal_prefix()
{
    if (sl_util::command_exists("konsole"))
        return {"konsole", "-e"};
    if (sl_util::command_exists("x-terminal-emulator"))
        return {"x-terminal-emulator", "-e"};
    if (sl_util::command_exists("gnome-terminal"))
        return {"gnome-terminal", "--"};
    return {};
}

sl_mgmt::process_supervisor::process_supervisor(std::string profiles_root, launch_target target)
    : profiles_root_(std::move(profiles_root))
    , target_(std::move(target))
{
}

sl_mgmt::invocation
sl_mgmt::process_supervisor::build_invocation(const std::string &profile, const launch_options &options) const
{
    invocation inv;
    std::string home = profiles::home_for(profiles_root_, profile);

    if (options.with_console) {
        // The terminal itself keeps the real HOME; only the application
        // inside it gets the override, via env(1).
        inv.argv = find_terminal_prefix();
        if (!home.empty()) {
            inv.argv.push_back("env");
            inv.argv.push_back("HOME=" + home);
        }
    } else {
        inv.home = home;
    }

    inv.argv.insert(inv.argv.end(), target_.command.begin(), target_.command.end());
    if (!options.argument.empty())
        inv.argv.push_back(options.argument);

    return inv;
}

std::string
sl_mgmt::process_supervisor::shell_command_line(const std::string &profile, const std::string &argument) const
{
    std::string line;
    std::string home = profiles::home_for(profiles_root_, profile);
    if (!home.empty())
        line = "env HOME=" + sl_util::quote_if_needed(home) + " ";

    for (size_t i = 0; i < target_.command.size(); ++i) {
        if (i > 0) line += " ";
        line += target_.command[i];
    }

    if (!argument.empty())
        line += " " + sl_util::quote_if_needed(argument);

    return line;
}

sl_mgmt::launch_result
sl_mgmt::process_supervisor::launch(const std::string &profile, const launch_options &options)
{
    launch_result result;

    // Fresh look at this profile's process; the last poll may be stale
    auto it = live_.find(profile);
    if (it != live_.end()) {
        if (!reap_if_exited(it->second)) {
            DEBUG_LOG("[supervisor] ", profile, " already running as ", it->second);
            result.status = launch_status::already_running;
            result.pid = it->second;
            return result;
        }
        live_.erase(it);
    }

    if (options.with_console && find_terminal_prefix().empty()) {
        result.error = "No compatible terminal emulator found.";
        return result;
    }

    invocation inv = build_invocation(profile, options);
    DEBUG_LOG("[supervisor] launching ", profile, ": ", inv.argv, (inv.home.empty() ? "" : " HOME=" + inv.home));

    pid_t pid = spawn(inv, false, result.error);
    if (pid <= 0) {
        std::cerr << "Failed to launch " << profile << ": " << result.error << std::endl;
        return result;
    }

    live_[profile] = pid;
    result.status = launch_status::launched;
    result.pid = pid;
    return result;
}

profile_set
sl_mgmt::process_supervisor::poll()
{
    profile_set exited;

    for (auto it = live_.begin(); it != live_.end(); ) {
        if (reap_if_exited(it->second)) {
            DEBUG_LOG("[supervisor] ", it->first, " (pid ", it->second, ") exited");
            exited.insert(it->first);
            it = live_.erase(it);
        } else {
            ++it;
        }
    }

    return exited;
}

void
sl_mgmt::process_supervisor::terminate_all()
{
    // Everything with our identity, including instances we didn't start
    if (!target_.kill_command.empty()) {
        if (sl_util::command_exists(target_.kill_command[0])) {
            command_streams res = sl_util::exec_commandv(target_.kill_command);
            if (res.exit_status != 0) {
                DEBUG_LOG("[supervisor] kill-all exited with ", res.exit_status, ": ", res.stderr_str);
            }
        } else {
            std::cerr << "Warning: " << target_.kill_command[0]
                      << " not found, only stopping tracked instances" << std::endl;
        }
    }

    for (const auto &entry : live_) {
        DEBUG_LOG("[supervisor] terminating ", entry.first, " (pid ", entry.second, ")");
        kill_process(entry.second);
    }
    live_.clear();
}

bool
sl_mgmt::process_supervisor::forget(const std::string &profile)
{
    auto it = live_.find(profile);
    if (it == live_.end())
        return false;

    if (!reap_if_exited(it->second))
        kill_process(it->second);

    live_.erase(it);
    return true;
}

bool
sl_mgmt::process_supervisor::is_live(const std::string &profile) const
{
    return live_.find(profile) != live_.end();
}

profile_set
sl_mgmt::process_supervisor::live_profiles() const
{
    profile_set live;
    for (const auto &entry : live_)
        live.insert(entry.first);
    return live;
}

bool
sl_mgmt::process_supervisor::any_live() const
{
    return !live_.empty();
}

sl_mgmt::launch_result
sl_mgmt::process_supervisor::spawn_detached(const std::string &argument) const
{
    invocation inv;
    inv.argv = target_.command;
    if (!argument.empty())
        inv.argv.push_back(argument);

    DEBUG_LOG("[supervisor] detached launch: ", inv.argv);

    launch_result result;
    if (spawn(inv, true, result.error) < 0) {
        std::cerr << "Failed to launch: " << result.error << std::endl;
        return result;
    }

    result.status = launch_status::launched;
    return result;
}

sl_mgmt::launch_result
sl_mgmt::process_supervisor::launch_detached(const std::string &profile, const launch_options &options) const
{
    launch_result result;

    if (options.with_console && find_terminal_prefix().empty()) {
        result.error = "No compatible terminal emulator found.";
        return result;
    }

    invocation inv = build_invocation(profile, options);
    DEBUG_LOG("[supervisor] detached launch of ", profile, ": ", inv.argv);

    if (spawn(inv, true, result.error) < 0) {
        std::cerr << "Failed to launch " << profile << ": " << result.error << std::endl;
        return result;
    }

    result.status = launch_status::launched;
    return result;
}
