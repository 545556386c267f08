#include "utility.h"

#include <cerrno>
#include <cstdlib>
#include <stdexcept>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

namespace platform
{

namespace fs = std::filesystem;

std::optional<std::filesystem::path> get_home_dir()
{
    const char *home = std::getenv("HOME");

    if (!home) {
        return std::nullopt;
    }
    const fs::path home_path(home);
    if (!fs::exists(home_path)) {
        return std::nullopt;
    }
    return home_path;
}

void run_command(const std::vector<std::string> &args)
{
    if (args.empty()) {
        throw std::runtime_error("No command specified");
    }

    // Build argv before forking; the child only calls async-signal-safe
    // functions
    std::vector<char *> argv;
    for (const auto &arg : args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const pid_t pid = fork();
    if (pid == 0) {
        // Detach from parent completely
        setsid();

        // Double fork to avoid zombies
        const pid_t pid2 = fork();
        if (pid2 == 0) {
            execvp(argv[0], argv.data());
        }
        _exit(pid2 > 0 ? 0 : 1);
    } else if (pid > 0) {
        // Reap first child immediately (it exits right away)
        int status;
        waitpid(pid, &status, 0);

        if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            throw std::runtime_error("Failed to launch command: " + args[0]);
        }
    } else {
        throw std::runtime_error("Failed to fork process: " +
                                 std::string(strerror(errno)));
    }
}

} // namespace platform
