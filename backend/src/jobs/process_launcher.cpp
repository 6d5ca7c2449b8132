#include "jobs/process_launcher.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace candlecast::jobs {

namespace {

bool read_full(int fd, void* out, size_t size) {
    auto* dst = static_cast<char*>(out);
    size_t done = 0;
    while (done < size) {
        const ssize_t n = ::read(fd, dst + done, size - done);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        done += static_cast<size_t>(n);
    }
    return true;
}

void write_full(int fd, const void* data, size_t size) {
    const auto* src = static_cast<const char*>(data);
    size_t done = 0;
    while (done < size) {
        const ssize_t n = ::write(fd, src + done, size - done);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return;
        done += static_cast<size_t>(n);
    }
}

} // namespace

std::vector<std::string> build_argv(const JobDescriptor& job, const std::string& bin_dir) {
    const std::filesystem::path dir(bin_dir.empty() ? "." : bin_dir);
    if (job.kind == JobKind::Producer) {
        return {(dir / "candlecast_producer").string(), "--symbol", job.symbol};
    }
    return {(dir / "candlecast_consumer").string(), "--crypto", job.entity.symbol, "--model", job.entity.model,
            "--version", job.entity.version};
}

core::Expected<pid_t> spawn_detached(const std::vector<std::string>& argv) {
    if (argv.empty()) return core::make_error(core::ErrorCode::Invalid, "empty argv");

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) args.push_back(const_cast<char*>(arg.c_str()));
    args.push_back(nullptr);

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return core::make_error(core::ErrorCode::Io, std::string("pipe2 failed: ") + std::strerror(errno));
    }

    const pid_t child = ::fork();
    if (child < 0) {
        const int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return core::make_error(core::ErrorCode::Io, std::string("fork failed: ") + std::strerror(err));
    }
    if (child == 0) {
        ::close(fds[0]);
        ::setsid();
        const pid_t grandchild = ::fork();
        if (grandchild < 0) {
            const pid_t none = -1;
            write_full(fds[1], &none, sizeof(none));
            ::_exit(1);
        }
        if (grandchild > 0) {
            write_full(fds[1], &grandchild, sizeof(grandchild));
            ::_exit(0);
        }
        const int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) ::close(devnull);
        }
        ::execv(args[0], args.data());
        const int err = errno;
        write_full(fds[1], &err, sizeof(err));
        ::_exit(127);
    }

    ::close(fds[1]);
    int status = 0;
    while (::waitpid(child, &status, 0) < 0 && errno == EINTR) {
    }

    pid_t pid = -1;
    const bool got_pid = read_full(fds[0], &pid, sizeof(pid));
    int exec_errno = 0;
    const bool exec_failed = got_pid && pid > 0 && read_full(fds[0], &exec_errno, sizeof(exec_errno));
    ::close(fds[0]);

    if (!got_pid || pid <= 0) {
        return core::make_error(core::ErrorCode::Io, "could not fork launcher for " + argv[0]);
    }
    if (exec_failed) {
        return core::make_error(core::ErrorCode::NotFound,
                                "execv " + argv[0] + " failed: " + std::strerror(exec_errno));
    }
    return pid;
}

Launcher make_process_launcher(std::string bin_dir) {
    return [bin_dir = std::move(bin_dir)](const JobDescriptor& job) { return spawn_detached(build_argv(job, bin_dir)); };
}

} // namespace candlecast::jobs
