#include "Exec.hpp"
#include "Logger.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <format>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <hyprutils/os/FileDescriptor.hpp>

using namespace Hyprutils::OS;

//
static std::vector<const char*> makeArgv(const std::vector<std::string>& argv) {
    std::vector<const char*> out;
    out.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        out.emplace_back(a.c_str());
    }
    out.emplace_back(nullptr);
    return out;
}

static std::expected<int, std::string> waitFor(pid_t pid, const std::string& name) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR)
            continue;
        return std::unexpected(std::format("waitpid for {} failed: {}", name, strerror(errno)));
    }

    if (WIFEXITED(status))
        return WEXITSTATUS(status);

    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);

    return -1;
}

std::expected<Exec::SResult, std::string> Exec::run(const std::vector<std::string>& argv, const std::string& input) {
    if (argv.empty() || argv[0].empty())
        return std::unexpected("Empty command");

    std::array<int, 2> in = {-1, -1}, out = {-1, -1}, err = {-1, -1};

    if (pipe2(in.data(), O_CLOEXEC) < 0 || pipe2(out.data(), O_CLOEXEC) < 0 || pipe2(err.data(), O_CLOEXEC) < 0) {
        for (int fd : {in[0], in[1], out[0], out[1], err[0], err[1]}) {
            if (fd >= 0)
                close(fd);
        }
        return std::unexpected(std::format("failed to create pipes for {}", argv[0]));
    }

    CFileDescriptor inWrite{in[1]}, outRead{out[0]}, errRead{err[0]};
    CFileDescriptor inRead{in[0]}, outWrite{out[1]}, errWrite{err[1]};

    const auto      ARGV = makeArgv(argv);

    const auto      pid = fork();

    if (pid < 0)
        return std::unexpected(std::format("failed to fork for {}", argv[0]));

    if (pid == 0) {
        dup2(inRead.get(), STDIN_FILENO);
        dup2(outWrite.get(), STDOUT_FILENO);
        dup2(errWrite.get(), STDERR_FILENO);
        signal(SIGPIPE, SIG_DFL);
        execvp(ARGV[0], cc<char* const*>(ARGV.data()));
        _exit(127);
    }

    inRead.reset();
    outWrite.reset();
    errWrite.reset();

    // the child may exit without draining stdin
    size_t written = 0;
    while (written < input.size()) {
        const auto RET = write(inWrite.get(), input.data() + written, input.size() - written);
        if (RET < 0) {
            if (errno == EINTR)
                continue;
            g_logger->log(LOG_WARN, "exec: {} did not take its whole input", argv[0]);
            break;
        }
        written += sc<size_t>(RET);
    }
    inWrite.reset();

    SResult result;
    pollfd  fds[2] = {
        pollfd{.fd = outRead.get(), .events = POLLIN},
        pollfd{.fd = errRead.get(), .events = POLLIN},
    };
    std::string* sinks[2] = {&result.out, &result.err};

    char         buf[4096];
    int          open = 2;
    while (open > 0) {
        if (poll(fds, 2, -1) < 0) {
            if (errno == EINTR)
                continue;
            break;
        }

        for (size_t i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
                continue;

            const auto LEN = read(fds[i].fd, buf, sizeof(buf));
            if (LEN > 0) {
                sinks[i]->append(buf, sc<size_t>(LEN));
                continue;
            }

            if (LEN < 0 && errno == EINTR)
                continue;

            fds[i].fd = -1;
            open--;
        }
    }

    const auto CODE = waitFor(pid, argv[0]);
    if (!CODE)
        return std::unexpected(CODE.error());

    if (*CODE == 127 && result.err.empty())
        return std::unexpected(std::format("failed to execute {}", argv[0]));

    result.exitCode = *CODE;
    return result;
}

std::expected<int, std::string> Exec::runInteractive(const std::string& program, const std::vector<std::string>& args) {
    std::vector<std::string> argv = {program};
    argv.insert(argv.end(), args.begin(), args.end());

    const auto ARGV = makeArgv(argv);

    const auto pid = fork();

    if (pid < 0)
        return std::unexpected(std::format("failed to fork for {}", program));

    if (pid == 0) {
        signal(SIGINT, SIG_DFL);
        signal(SIGPIPE, SIG_DFL);
        execvp(ARGV[0], cc<char* const*>(ARGV.data()));
        _exit(127);
    }

    const auto CODE = waitFor(pid, program);
    if (CODE && *CODE == 127)
        return std::unexpected(std::format("failed to execute {}", program));

    return CODE;
}
