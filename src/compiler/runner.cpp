// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <compiler/runner.h>

#include <threadinterrupt.h>
#include <util.h>

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace scverify {

namespace {

//! Poll slice between interrupt and deadline checks
const int POLL_INTERVAL_MS = 100;

/** Owns a file descriptor */
class UniqueFd
{
public:
    explicit UniqueFd(int fd = -1) : fd_(fd) {}
    ~UniqueFd() { reset(); }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }
    void reset(int fd = -1)
    {
        if (fd_ >= 0) close(fd_);
        fd_ = fd;
    }

private:
    int fd_;
};

bool MakePipe(UniqueFd& readEnd, UniqueFd& writeEnd)
{
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    readEnd.reset(fds[0]);
    writeEnd.reset(fds[1]);
    return true;
}

void SetNonBlocking(int fd)
{
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

void KillAndReap(pid_t pid)
{
    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);
    int status;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

/** Read what is available; false once the descriptor reached end of file */
bool Drain(UniqueFd& fd, std::string& out)
{
    char buf[65536];
    while (true) {
        ssize_t n = read(fd.get(), buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            return true;
        }
        fd.reset();
        return false;
    }
}

} // anonymous namespace

LocalCompilerRunner::LocalCompilerRunner(std::chrono::seconds timeout)
    : timeout_(timeout)
{
}

std::string LocalCompilerRunner::Run(const Compiler& compiler, const CompilerInput& input, const CThreadInterrupt* interrupt)
{
    LogPrint(BCLog::COMPILER, "Running %s %s\n", LanguageToString(input.GetLanguage()), compiler.version.ToString());
    int64_t nStart = GetTimeMillis();
    std::string output = Execute(compiler.path, input.ToJSON(), interrupt);
    LogPrint(BCLog::COMPILER, "Compiler %s finished in %d ms, %u bytes of output\n",
             compiler.version.ToString(), GetTimeMillis() - nStart, output.size());
    return output;
}

std::string LocalCompilerRunner::Execute(const fs::path& binary, const std::string& stdinData, const CThreadInterrupt* interrupt)
{
    UniqueFd inRead, inWrite, outRead, outWrite, errRead, errWrite;
    if (!MakePipe(inRead, inWrite) || !MakePipe(outRead, outWrite) || !MakePipe(errRead, errWrite)) {
        throw CompilerRunError(CompilerRunError::FAILED, strprintf("cannot create pipes: %s", strerror(errno)));
    }

    const std::string path = binary.string();
    pid_t pid = fork();
    if (pid < 0) {
        throw CompilerRunError(CompilerRunError::FAILED, strprintf("cannot start compiler: %s", strerror(errno)));
    }
    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);
        dup2(inRead.get(), STDIN_FILENO);
        dup2(outWrite.get(), STDOUT_FILENO);
        dup2(errWrite.get(), STDERR_FILENO);
        execl(path.c_str(), path.c_str(), "--standard-json", (char*)nullptr);
        _exit(127);
    }
    setpgid(pid, pid);

    inRead.reset();
    outWrite.reset();
    errWrite.reset();
    SetNonBlocking(inWrite.get());
    SetNonBlocking(outRead.get());
    SetNonBlocking(errRead.get());

    const int64_t nDeadline = timeout_.count() > 0 ? GetTimeMillis() + timeout_.count() * 1000 : 0;
    std::string out, err;
    size_t written = 0;
    if (stdinData.empty()) {
        inWrite.reset();
    }

    auto checkCancelled = [&]() {
        if (interrupt && *interrupt) {
            KillAndReap(pid);
            throw CompilerRunError(CompilerRunError::CANCELLED, "compilation interrupted");
        }
        if (nDeadline && GetTimeMillis() > nDeadline) {
            KillAndReap(pid);
            throw CompilerRunError(CompilerRunError::CANCELLED, strprintf("compilation timed out after %d seconds", timeout_.count()));
        }
    };

    while (outRead.get() >= 0 || errRead.get() >= 0) {
        checkCancelled();

        struct pollfd fds[3];
        nfds_t nfds = 0;
        fds[nfds++] = {outRead.get(), POLLIN, 0};
        fds[nfds++] = {errRead.get(), POLLIN, 0};
        fds[nfds++] = {inWrite.get(), POLLOUT, 0};
        int r = poll(fds, nfds, POLL_INTERVAL_MS);
        if (r < 0 && errno != EINTR) {
            KillAndReap(pid);
            throw CompilerRunError(CompilerRunError::FAILED, strprintf("poll failed: %s", strerror(errno)));
        }
        if (r <= 0) continue;

        if (fds[2].fd >= 0 && (fds[2].revents & (POLLOUT | POLLERR | POLLHUP))) {
            ssize_t n = write(inWrite.get(), stdinData.data() + written, stdinData.size() - written);
            if (n > 0) {
                written += n;
            }
            // EPIPE: the compiler does not read its input, let it fail on its own
            if (written == stdinData.size() || (n < 0 && errno != EAGAIN && errno != EINTR)) {
                inWrite.reset();
            }
        }
        if (fds[0].fd >= 0 && fds[0].revents) {
            Drain(outRead, out);
        }
        if (fds[1].fd >= 0 && fds[1].revents) {
            Drain(errRead, err);
        }
    }
    inWrite.reset();

    // The compiler may close its output and keep running
    int status = 0;
    while (true) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r < 0 && errno != EINTR) {
            throw CompilerRunError(CompilerRunError::FAILED, strprintf("waitpid failed: %s", strerror(errno)));
        }
        checkCancelled();
        poll(nullptr, 0, POLL_INTERVAL_MS);
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        // standard JSON compilers report their diagnostics on stdout
        std::string diagnostics = !err.empty() ? err : out;
        if (diagnostics.empty()) {
            diagnostics = WIFEXITED(status) ? strprintf("compiler exited with code %d", WEXITSTATUS(status))
                                            : strprintf("compiler terminated by signal %d", WTERMSIG(status));
        }
        throw CompilerRunError(CompilerRunError::FAILED, diagnostics);
    }
    return out;
}

} // namespace scverify
