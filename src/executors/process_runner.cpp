#include "process_runner.hpp"
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <spawn.h>
#include <stdexcept>
#include <sys/types.h>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>

extern char **environ;

namespace {

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ != -1; }
    void reset(int fd = -1) {
        if (fd_ != -1) close(fd_);
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

void make_pipe(Pipe& p) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) == -1) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
    p.read_end.reset(fds[0]);
    p.write_end.reset(fds[1]);
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// posix_spawn attribute and file action objects, destroyed on scope exit
struct SpawnSetup {
    posix_spawnattr_t attr;
    posix_spawn_file_actions_t actions;
    SpawnSetup() {
        posix_spawnattr_init(&attr);
        posix_spawn_file_actions_init(&actions);
    }
    ~SpawnSetup() {
        posix_spawn_file_actions_destroy(&actions);
        posix_spawnattr_destroy(&attr);
    }
    SpawnSetup(const SpawnSetup&) = delete;
    SpawnSetup& operator=(const SpawnSetup&) = delete;
};

} // namespace

ProcessResult run_process(const ProcessSpec& spec) {
    if (spec.argv.empty()) throw std::invalid_argument("run_process: empty argv");

    ProcessResult result;
    Pipe out, err;
    make_pipe(out);
    make_pipe(err);

    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto& a : spec.argv) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    SpawnSetup setup;
    // own process group so a timeout can kill the whole pipeline
    short flags = POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK;
    posix_spawnattr_setflags(&setup.attr, flags);
    posix_spawnattr_setpgroup(&setup.attr, 0);
    sigset_t defaults, empty;
    sigemptyset(&defaults);
    sigaddset(&defaults, SIGPIPE);
    sigaddset(&defaults, SIGINT);
    sigaddset(&defaults, SIGTERM);
    posix_spawnattr_setsigdefault(&setup.attr, &defaults);
    sigemptyset(&empty);
    posix_spawnattr_setsigmask(&setup.attr, &empty);

    posix_spawn_file_actions_addopen(&setup.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&setup.actions, out.write_end.get(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&setup.actions, err.write_end.get(), STDERR_FILENO);
    if (!spec.dir.empty()) posix_spawn_file_actions_addchdir_np(&setup.actions, spec.dir.c_str());

    const auto t0 = std::chrono::steady_clock::now();
    pid_t pid;
    int rc = posix_spawnp(&pid, argv[0], &setup.actions, &setup.attr, argv.data(), environ);
    if (rc != 0) {
        throw std::system_error(rc, std::generic_category(), "posix_spawnp " + spec.argv[0]);
    }

    // parent never writes
    out.write_end.reset();
    err.write_end.reset();
    fcntl(out.read_end.get(), F_SETFL, fcntl(out.read_end.get(), F_GETFL, 0) | O_NONBLOCK);
    fcntl(err.read_end.get(), F_SETFL, fcntl(err.read_end.get(), F_GETFL, 0) | O_NONBLOCK);

    bool exited = false;
    int status = 0;
    char buf[4096];

    auto drain = [&](UniqueFd& fd, std::string& sink, std::ostream& echo_to) {
        while (true) {
            ssize_t r = read(fd.get(), buf, sizeof(buf));
            if (r > 0) {
                sink.append(buf, static_cast<size_t>(r));
                if (spec.echo) echo_to.write(buf, r).flush();
            } else if (r == 0) { // EOF
                fd.reset();
                return;
            } else if (errno == EINTR) {
                continue;
            } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return;
            } else {
                fd.reset();
                return;
            }
        }
    };

    while (true) {
        if (exited && !out.read_end.valid() && !err.read_end.valid()) break;

        struct pollfd fds[2];
        UniqueFd* owners[2];
        int nfds = 0;
        for (UniqueFd* fd : {&out.read_end, &err.read_end}) {
            if (!fd->valid()) continue;
            fds[nfds].fd = fd->get();
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            owners[nfds] = fd;
            nfds++;
        }

        if (nfds > 0) {
            int ready = poll(fds, nfds, static_cast<int>(spec.poll_interval.count()));
            if (ready < 0 && errno != EINTR) {
                kill(-pid, SIGKILL);
                throw std::system_error(errno, std::generic_category(), "poll");
            }
            for (int i = 0; i < nfds && ready > 0; i++) {
                if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
                if (owners[i] == &out.read_end) drain(out.read_end, result.stdout_data, std::cout);
                else drain(err.read_end, result.stderr_data, std::cerr);
            }
        } else if (!exited) {
            std::this_thread::sleep_for(spec.poll_interval);
        }

        if (!exited) {
            pid_t w = waitpid(pid, &status, WNOHANG);
            if (w == pid) exited = true;
            else if (w == -1 && errno != EINTR) {
                kill(-pid, SIGKILL);
                throw std::system_error(errno, std::generic_category(), "waitpid");
            }
        }

        if (spec.timeout.count() > 0 && std::chrono::steady_clock::now() - t0 >= spec.timeout) {
            if (exited && !out.read_end.valid() && !err.read_end.valid()) break;
            result.timed_out = true;
            if (spec.echo) std::cout << "Timeout!" << std::endl;
            kill(-pid, SIGKILL);
            if (!exited) kill(pid, SIGKILL);
            break;
        }
    }

    if (result.timed_out) {
        out.read_end.reset();
        err.read_end.reset();
        if (!exited) {
            while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
        }
        if (spec.on_timeout) spec.on_timeout();
        result.exit_code = kTimeoutExitCode;
    } else {
        result.exit_code = decode_status(status);
    }

    result.ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
    return result;
}
