#pragma once
#include <string>
#include <vector>
#include <filesystem>
#include <sys/types.h>

/**
 * @brief Owner of the backend child process and its three pipes.
 *
 * The child runs in its own process group so terminate() also reaps helpers
 * it spawned that might still hold the output pipes open.
 */
class BackendProcess {
public:
    struct Options {
        std::string command;
        std::vector<std::string> args;
        std::filesystem::path workingDir;
        std::vector<std::string> forwardEnv;
    };

    BackendProcess() = default;
    ~BackendProcess();

    BackendProcess(const BackendProcess&) = delete;
    BackendProcess& operator=(const BackendProcess&) = delete;

    /** @throws BackendStartError if the command cannot be found or started */
    void spawn(const Options& options);

    /** Kill the process group and wait for the child. Safe to call twice. */
    void terminate();

    /** Close the parent's pipe ends. Call after readers have finished. */
    void closeStreams();

    bool running() const { return pid > 0; }
    pid_t processId() const { return pid; }
    int stdinFd() const { return stdinWrite; }
    int stdoutFd() const { return stdoutRead; }
    int stderrFd() const { return stderrRead; }

    /**
     * @brief Resolve a command name to an executable path.
     *
     * Names containing '/' are taken as paths. Bare names are searched on PATH,
     * then in $HOME/.cargo/bin.
     * @return empty string when nothing executable was found
     */
    static std::string findExecutable(const std::string& command);

private:
    pid_t pid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    int stderrRead = -1;
};
