#include "lsp/BackendProcess.h"
#include "core/Errors.h"
#include "utils/Logger.h"
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace fs = std::filesystem;

namespace {
bool isExecutableFile(const fs::path& candidate) {
    std::error_code ec;
    return fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0;
}

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Inherited environment with the forwarded variables written explicitly.
std::vector<std::string> buildEnvironment(const std::vector<std::string>& forwardEnv) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry = *e;
        std::string name = entry.substr(0, entry.find('='));
        bool forwarded = false;
        for (const auto& f : forwardEnv) {
            if (f == name) forwarded = true;
        }
        if (!forwarded) env.push_back(std::move(entry));
    }
    for (const auto& name : forwardEnv) {
        if (const char* value = std::getenv(name.c_str())) {
            env.push_back(name + "=" + value);
        }
    }
    return env;
}
}  // namespace

BackendProcess::~BackendProcess() {
    terminate();
    closeStreams();
}

std::string BackendProcess::findExecutable(const std::string& command) {
    if (command.empty()) return "";
    if (command.find('/') != std::string::npos) {
        return isExecutableFile(command) ? fs::absolute(command).string() : "";
    }

    if (const char* pathEnv = std::getenv("PATH")) {
        std::string paths = pathEnv;
        size_t start = 0;
        while (start <= paths.size()) {
            size_t end = paths.find(':', start);
            std::string dir = (end == std::string::npos) ? paths.substr(start) : paths.substr(start, end - start);
            if (!dir.empty()) {
                fs::path candidate = fs::path(dir) / command;
                if (isExecutableFile(candidate)) return candidate.string();
            }
            if (end == std::string::npos) break;
            start = end + 1;
        }
    }

    if (const char* home = std::getenv("HOME")) {
        fs::path cargoBin = fs::path(home) / ".cargo" / "bin" / command;
        if (isExecutableFile(cargoBin)) return cargoBin.string();
    }
    return "";
}

void BackendProcess::spawn(const Options& options) {
    if (pid > 0) return;

    std::string executable = findExecutable(options.command);
    if (executable.empty()) {
        throw BackendStartError("Failed to find " + options.command +
                                " in PATH or ~/.cargo/bin. Please ensure it is installed.");
    }

    // Writing to a backend that already exited must surface as EPIPE, not kill us.
    std::signal(SIGPIPE, SIG_IGN);

    std::vector<std::string> args;
    args.push_back(executable);
    args.insert(args.end(), options.args.begin(), options.args.end());
    std::vector<std::string> env = buildEnvironment(options.forwardEnv);

    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    std::vector<char*> envp;
    for (auto& e : env) envp.push_back(const_cast<char*>(e.c_str()));
    envp.push_back(nullptr);
    std::string workingDir = options.workingDir.string();

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execStatus[2] = {-1, -1};
    auto closeAll = [&]() {
        for (int* p : {inPipe, outPipe, errPipe, execStatus}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
    };
    if (pipe2(inPipe, O_CLOEXEC) != 0 || pipe2(outPipe, O_CLOEXEC) != 0 ||
        pipe2(errPipe, O_CLOEXEC) != 0 || pipe2(execStatus, O_CLOEXEC) != 0) {
        int err = errno;
        closeAll();
        throw BackendStartError(std::string("Failed to create backend pipes: ") + std::strerror(err));
    }

    pid_t child = fork();
    if (child < 0) {
        int err = errno;
        closeAll();
        throw BackendStartError(std::string("Failed to start backend: ") + std::strerror(err));
    }

    if (child == 0) {
        // Only async-signal-safe calls from here on.
        setpgid(0, 0);
        dup2(inPipe[0], STDIN_FILENO);
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        int err = 0;
        if (!workingDir.empty() && chdir(workingDir.c_str()) != 0) {
            err = errno;
        } else {
            execve(argv[0], argv.data(), envp.data());
            err = errno;
        }
        ssize_t ignored = write(execStatus[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(execStatus[1]);

    // The status pipe closes on a successful exec; otherwise it carries errno.
    int childErr = 0;
    ssize_t n;
    do {
        n = read(execStatus[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    closeFd(execStatus[0]);

    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        int status = 0;
        waitpid(child, &status, 0);
        closeAll();
        throw BackendStartError("Failed to start " + executable + ": " + std::strerror(childErr));
    }

    pid = child;
    stdinWrite = inPipe[1];
    stdoutRead = outPipe[0];
    stderrRead = errPipe[0];
    if (stdinWrite < 0 || stdoutRead < 0 || stderrRead < 0) {
        terminate();
        closeStreams();
        throw BackendStartError("Failed to get backend standard streams");
    }
    Logger::getInstance().info("Started " + executable + " (pid " + std::to_string(pid) + ") in " + workingDir);
}

void BackendProcess::terminate() {
    if (pid <= 0) return;
    // Negative pid: the whole process group.
    if (kill(-pid, SIGKILL) != 0) {
        kill(pid, SIGKILL);
    }
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    Logger::getInstance().debug("Backend process " + std::to_string(pid) + " exited");
    pid = -1;
}

void BackendProcess::closeStreams() {
    closeFd(stdinWrite);
    closeFd(stdoutRead);
    closeFd(stderrRead);
}
