#include "engine/process_runner.hpp"
#include "io/sequence_stream.hpp"
#include "util/file_util.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace kubuild {

std::string EngineResult::describe() const {
    if (!message.empty()) return tool + ": " + message;
    if (term_signal != 0)
        return tool + " killed by signal " + std::to_string(term_signal);
    if (exit_code != 0)
        return tool + " exited with status " + std::to_string(exit_code);
    return tool + " succeeded";
}

std::string format_command(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

static bool is_executable_file(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
           ::access(path.c_str(), X_OK) == 0;
}

// Children run in the database directory, so a relative hit must be made
// absolute against the driver's own cwd before exec.
static std::string absolute_exe(const std::string& path) {
    std::error_code ec;
    std::filesystem::path abs = std::filesystem::absolute(path, ec);
    if (ec) return path;
    return abs.lexically_normal().string();
}

std::string find_executable(const std::string& name,
                            const std::vector<std::string>& search_dirs) {
    if (name.empty()) return "";
    if (name.find('/') != std::string::npos)
        return is_executable_file(name) ? absolute_exe(name) : "";

    for (const auto& dir : search_dirs) {
        if (dir.empty()) continue;
        std::string p = dir + "/" + name;
        if (is_executable_file(p)) return absolute_exe(p);
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return "";
    std::string paths(path_env);
    size_t start = 0;
    while (start <= paths.size()) {
        size_t end = paths.find(':', start);
        if (end == std::string::npos) end = paths.size();
        std::string dir = paths.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string p = dir + "/" + name;
        if (is_executable_file(p)) return absolute_exe(p);
        start = end + 1;
    }
    return "";
}

// Ignore SIGPIPE while feeding a child so an early exit surfaces as EPIPE.
class ScopedIgnoreSigpipe {
public:
    ScopedIgnoreSigpipe() {
        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = SIG_IGN;
        sigemptyset(&sa.sa_mask);
        installed_ = ::sigaction(SIGPIPE, &sa, &old_) == 0;
    }
    ~ScopedIgnoreSigpipe() {
        if (installed_) ::sigaction(SIGPIPE, &old_, nullptr);
    }
    ScopedIgnoreSigpipe(const ScopedIgnoreSigpipe&) = delete;
    ScopedIgnoreSigpipe& operator=(const ScopedIgnoreSigpipe&) = delete;

private:
    struct sigaction old_;
    bool installed_ = false;
};

EngineResult ProcessRunner::run(const ProcessSpec& spec) const {
    if (spec.argv.empty())
        return EngineResult::failure("(none)", "empty command line");

    const std::string tool = basename_of(spec.argv[0]);
    std::string exe = find_executable(spec.argv[0], {});
    if (exe.empty())
        return EngineResult::failure(tool, "executable not found: " + spec.argv[0]);

    int pipe_fds[2] = {-1, -1};
    if (spec.stream) {
        if (::pipe(pipe_fds) != 0)
            return EngineResult::failure(tool, std::string("pipe: ") + std::strerror(errno));
        // Only the read end is inherited by the child.
        ::fcntl(pipe_fds[1], F_SETFD, FD_CLOEXEC);
    }

    int out_fd = -1;
    if (!spec.stdout_path.empty()) {
        out_fd = ::open(spec.stdout_path.c_str(),
                        O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (out_fd < 0) {
            std::string msg = "cannot open '" + spec.stdout_path + "': " + std::strerror(errno);
            if (spec.stream) {
                ::close(pipe_fds[0]);
                ::close(pipe_fds[1]);
            }
            return EngineResult::failure(tool, msg);
        }
    }

    // Build the child's argv before fork; the child only calls
    // async-signal-safe functions.
    std::vector<std::string> args = spec.argv;
    args[0] = exe;
    for (auto& a : args) {
        if (a == kStreamArg) {
            if (!spec.stream) {
                if (out_fd >= 0) ::close(out_fd);
                return EngineResult::failure(tool, "stream argument without a stream");
            }
            a = "/dev/fd/" + std::to_string(pipe_fds[0]);
        }
    }
    std::vector<char*> c_args;
    c_args.reserve(args.size() + 1);
    for (auto& a : args) c_args.push_back(&a[0]);
    c_args.push_back(nullptr);

    logger_.debug("EXECUTING %s", format_command(args).c_str());

    ScopedIgnoreSigpipe sigpipe_guard;

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        if (spec.stream) {
            ::close(pipe_fds[0]);
            ::close(pipe_fds[1]);
        }
        if (out_fd >= 0) ::close(out_fd);
        return EngineResult::failure(tool, std::string("fork: ") + std::strerror(err));
    }

    if (pid == 0) {
        ::signal(SIGPIPE, SIG_DFL);
        if (!spec.working_dir.empty() && ::chdir(spec.working_dir.c_str()) != 0) {
            const char msg[] = "kubuild: cannot enter working directory\n";
            (void)!::write(STDERR_FILENO, msg, sizeof(msg) - 1);
            ::_exit(127);
        }
        if (out_fd >= 0 && ::dup2(out_fd, STDOUT_FILENO) < 0) ::_exit(127);
        ::execv(c_args[0], c_args.data());
        const char msg[] = "kubuild: exec failed\n";
        (void)!::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        ::_exit(127);
    }

    if (out_fd >= 0) ::close(out_fd);

    std::string feed_error;
    if (spec.stream) {
        ::close(pipe_fds[0]);
        spec.stream->reset();
        if (!spec.stream->write_all(pipe_fds[1])) feed_error = spec.stream->error();
        ::close(pipe_fds[1]);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            return EngineResult::failure(tool, std::string("waitpid: ") + std::strerror(errno));
    }

    EngineResult result;
    result.tool = tool;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = -1;
        result.term_signal = WTERMSIG(status);
    }
    if (result.ok() && !feed_error.empty()) {
        // The child succeeded on partial input.
        result.exit_code = -1;
        result.message = feed_error;
    }
    return result;
}

} // namespace kubuild
