#include "process.hpp"

#include <cstdlib>
#include <functional>
#include <stdexcept>
#include <sys/wait.h>

#include "base_host.hpp"

namespace {

std::vector<char *> make_argv(const std::vector<std::string> &args) {
    std::vector<char *> argv;
    argv.reserve(args.size() + 1);
    for (const auto &a : args) {
        argv.push_back(const_cast<char *>(a.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

int wait_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            PLOGE("waitpid %d", pid);
            return -1;
        }
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Fork, run `child_setup` then execvp in the child, and return the child's pid.
pid_t spawn(const std::vector<std::string> &args, const std::function<void()> &child_setup) {
    if (args.empty()) {
        throw std::invalid_argument("empty command line");
    }
    LOGD("exec: %s\n", join_args(args).c_str());
    auto argv = make_argv(args);

    std::fflush(stdout);
    std::fflush(stderr);
    pid_t pid = ::fork();
    if (pid < 0) {
        PLOGE("fork");
        throw std::runtime_error("fork() failed");
    }
    if (pid == 0) {
        child_setup();
        ::execvp(argv[0], argv.data());
        PLOGE("exec %s", argv[0]);
        ::_exit(127);
    }
    return pid;
}

}  // namespace

int exec_command(const std::vector<std::string> &args) {
    pid_t pid = spawn(args, [] {});
    return wait_child(pid);
}

int capture_command(const std::vector<std::string> &args, std::string &out) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) < 0) {
        PLOGE("pipe");
        throw std::runtime_error("pipe() failed");
    }
    owned_fd read_end(fds[0]);
    owned_fd write_end(fds[1]);

    pid_t pid = spawn(args, [&write_end] {
        ::dup2(write_end, STDOUT_FILENO);
    });
    ::close(write_end.release());

    out.clear();
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(read_end, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            PLOGE("read pipe");
            break;
        }
        if (n == 0) break;
        out.append(buf, static_cast<std::size_t>(n));
    }
    return wait_child(pid);
}

bool find_executable(const std::string &name) {
    if (name.empty()) return false;
    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0 && is_regular_file(name.c_str());
    }
    const char *path = std::getenv("PATH");
    std::string dirs = path ? path : "/usr/local/bin:/usr/bin:/bin";
    std::size_t pos = 0;
    while (pos <= dirs.size()) {
        std::size_t colon = dirs.find(':', pos);
        if (colon == std::string::npos) colon = dirs.size();
        std::string dir = dirs.substr(pos, colon - pos);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (::access(candidate.c_str(), X_OK) == 0 && is_regular_file(candidate.c_str())) {
            return true;
        }
        pos = colon + 1;
    }
    return false;
}

std::string join_args(const std::vector<std::string> &args) {
    std::string out;
    for (const auto &a : args) {
        if (!out.empty()) out.push_back(' ');
        if (a.find_first_of(" \t'\"") != std::string::npos) {
            out += '\'' + a + '\'';
        } else {
            out += a;
        }
    }
    return out;
}
