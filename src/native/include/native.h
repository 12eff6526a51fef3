#pragma once

#if !defined(__unix__) && !defined(__APPLE__)
#   error "Error, unsupported platform"
#endif

#include <string>
#include <utility>
#include <vector>

namespace tkd::native
{
    /**
     * Configures terminal settings for the current platform.
     * This is primarily used to ensure UTF-8 compatible console output.
     *
     * @return true if terminal configuration succeeded or was not required.
     * @return false if terminal configuration failed.
     */
    bool configureTerminal();

    /**
     * Spawns a new process and waits for it to finish.
     * The command is looked up in PATH, the arguments are passed as is (no shell).
     *
     * @param command The executable to run
     * @param args The arguments to pass to the command
     * @return exit code of the process and its combined stdout / stderr output.
     *         The exit code is -1 if the process could not be spawned.
     */
    std::pair<int, std::string> runProcess(const std::string & command, std::vector<std::string> args = {});
}
