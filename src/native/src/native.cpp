#include "native.h"

#include <cerrno>
#include <clocale>
#include <cstdlib>
#include <cstring>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace tkd::native
{
    bool configureTerminal()
    {
        return std::setlocale(LC_ALL, "") != nullptr;
    }

    std::pair<int, std::string> runProcess(const std::string & command, std::vector<std::string> args)
    {
        int pipe_fds[2];
        if(pipe(pipe_fds) != 0)
        {
            spdlog::error("Failed to create pipe for {}: {}", command, std::strerror(errno));
            return {-1, std::string{}};
        }

        std::vector<char*> argv;
        argv.reserve(args.size() + 2);
        argv.push_back(const_cast<char*>(command.c_str()));
        for(std::string & arg : args)
        {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        const pid_t pid = fork();
        if(pid < 0)
        {
            spdlog::error("Failed to fork for {}: {}", command, std::strerror(errno));
            close(pipe_fds[0]);
            close(pipe_fds[1]);
            return {-1, std::string{}};
        }

        if(pid == 0)
        {
            dup2(pipe_fds[1], STDOUT_FILENO);
            dup2(pipe_fds[1], STDERR_FILENO);
            close(pipe_fds[0]);
            close(pipe_fds[1]);

            execvp(command.c_str(), argv.data());
            _exit(127);
        }

        close(pipe_fds[1]);

        std::string output;
        char buffer[4096];
        while(true)
        {
            const ssize_t count = read(pipe_fds[0], buffer, sizeof(buffer));
            if(count > 0)
            {
                output.append(buffer, static_cast<std::size_t>(count));
                continue;
            }
            if(count < 0 && errno == EINTR)
            {
                continue;
            }
            break;
        }
        close(pipe_fds[0]);

        int status = 0;
        while(waitpid(pid, &status, 0) < 0)
        {
            if(errno != EINTR)
            {
                spdlog::error("Failed to wait for {}: {}", command, std::strerror(errno));
                return {-1, std::move(output)};
            }
        }

        if(WIFEXITED(status))
        {
            return {WEXITSTATUS(status), std::move(output)};
        }

        return {-1, std::move(output)};
    }
}
