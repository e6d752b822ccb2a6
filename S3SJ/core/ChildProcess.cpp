#include "ChildProcess.h"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {
std::vector<char*> toCArray(std::vector<std::string>& values) {
    std::vector<char*> out;
    out.reserve(values.size() + 1);
    for (auto& v : values)
        out.push_back(&v[0]);
    out.push_back(nullptr);
    return out;
}

// Only async-signal-safe calls from here on.
[[noreturn]] void execChild(const LaunchOptions& options, char* const* argv, char* const* envp,
    int stdinFd, int outputFd) {
    if (options.newProcessGroup)
        setpgid(0, 0);

    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    signal(SIGUSR1, SIG_DFL);
    signal(SIGPIPE, SIG_DFL);

    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);

    if (stdinFd >= 0)
        dup2(stdinFd, STDIN_FILENO);
    if (outputFd >= 0) {
        dup2(outputFd, STDOUT_FILENO);
        dup2(outputFd, STDERR_FILENO);
    }

    execve(argv[0], argv, envp);

    const char msg[] = "Unable to launch child process: execve failed\n";
    ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)ignored;
    _exit(127);
}
}

ChildProcess::~ChildProcess() {
    closeFd(inputFd);
    closeFd(outputFd);

    // Blocks until a still-running child exits; nothing is left as a zombie
    if (childPid > 0 && !reaped)
        wait();
}

void ChildProcess::closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void ChildProcess::fail(const std::string& what, int err) {
    errorText = what + " (error " + std::to_string(err) + ": " + std::strerror(err) + ")";
}

bool ChildProcess::start(const LaunchOptions& options) {
    if (childPid > 0 || options.argv.empty()) {
        errorText = "nothing to launch";
        return false;
    }

    // Everything the child touches is prepared before fork
    std::vector<std::string> argvCopy = options.argv;
    std::vector<std::string> envCopy = options.env;
    std::vector<char*> argv = toCArray(argvCopy);
    std::vector<char*> envp = toCArray(envCopy);
    char* const* envArray = options.env.empty() ? environ : envp.data();

    int inPipe[2] = { -1, -1 };
    int outPipe[2] = { -1, -1 };
    int devNull = -1;

    if (options.pipeInput) {
        if (pipe2(inPipe, O_CLOEXEC) != 0) {
            fail("pipe", errno);
            return false;
        }
    }
    else {
        devNull = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devNull < 0) {
            fail("open /dev/null", errno);
            return false;
        }
    }

    if (options.captureOutput && pipe2(outPipe, O_CLOEXEC) != 0) {
        fail("pipe", errno);
        closeFd(inPipe[0]);
        closeFd(inPipe[1]);
        closeFd(devNull);
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        fail("fork", errno);
        closeFd(inPipe[0]);
        closeFd(inPipe[1]);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(devNull);
        return false;
    }

    if (pid == 0) {
        execChild(options, argv.data(), envArray,
            options.pipeInput ? inPipe[0] : devNull,
            options.captureOutput ? outPipe[1] : -1);
    }

    childPid = pid;
    reaped = false;

    if (options.newProcessGroup)
        setpgid(pid, pid); // both sides set it, whichever runs first wins

    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(devNull);
    inputFd = inPipe[1];
    outputFd = outPipe[0];
    return true;
}

bool ChildProcess::writeInput(const std::string& data) {
    if (inputFd < 0)
        return data.empty();

    const char* p = data.data();
    std::size_t left = data.size();
    bool ok = true;

    while (left > 0) {
        ssize_t n = ::write(inputFd, p, left);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            fail("write to child", errno);
            ok = false;
            break;
        }
        p += n;
        left -= static_cast<std::size_t>(n);
    }

    closeFd(inputFd);
    return ok;
}

std::string ChildProcess::readOutput() {
    std::string out;
    if (outputFd < 0)
        return out;

    char buf[4096];
    for (;;) {
        ssize_t n = ::read(outputFd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR)
                continue;
            fail("read from child", errno);
            break;
        }
        if (n == 0)
            break;
        out.append(buf, static_cast<std::size_t>(n));
    }

    closeFd(outputFd);
    return out;
}

bool ChildProcess::tryWait(int& status) {
    if (reaped) {
        status = exitStatus;
        return true;
    }
    if (childPid <= 0)
        return false;

    int waitStatus = 0;
    pid_t r = waitpid(childPid, &waitStatus, WNOHANG);
    if (r == 0)
        return false;

    if (r < 0) {
        if (errno == EINTR)
            return false;
        fail("waitpid", errno);
        exitStatus = 1;
    }
    else {
        exitStatus = normalizeStatus(waitStatus);
    }

    reaped = true;
    status = exitStatus;
    return true;
}

int ChildProcess::wait() {
    if (reaped || childPid <= 0)
        return exitStatus;

    int waitStatus = 0;
    pid_t r;
    do {
        r = waitpid(childPid, &waitStatus, 0);
    } while (r < 0 && errno == EINTR);

    if (r < 0) {
        fail("waitpid", errno);
        exitStatus = 1;
    }
    else {
        exitStatus = normalizeStatus(waitStatus);
    }

    reaped = true;
    return exitStatus;
}

int ChildProcess::normalizeStatus(int waitStatus) {
    if (WIFEXITED(waitStatus))
        return WEXITSTATUS(waitStatus);
    if (WIFSIGNALED(waitStatus))
        return 128 + WTERMSIG(waitStatus);
    return 1;
}

CommandResult runCommand(LaunchOptions options, const std::string& input) {
    CommandResult result;
    options.captureOutput = true;

    ChildProcess child;
    if (!child.start(options)) {
        result.output = child.lastError();
        return result;
    }
    result.started = true;

    // Input is small (a batch script), it fits in the pipe buffer
    std::string inputError;
    if (options.pipeInput && !child.writeInput(input))
        inputError = child.lastError();

    result.output = child.readOutput();
    result.status = child.wait();

    if (!inputError.empty()) {
        result.output += inputError + "\n";
        if (result.status == 0)
            result.status = 1;
    }
    return result;
}
