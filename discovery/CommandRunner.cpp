#include "CommandRunner.hpp"
#include "../common/Log.hpp"

#ifdef _WIN32
#include <windows.h>
#include <thread>
#else
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace netscout::discovery
{
    using Clock = std::chrono::steady_clock;

#ifndef _WIN32
    namespace
    {
        bool MakePipe(int fds[2])
        {
            if (pipe(fds) != 0)
                return false;
            fcntl(fds[0], F_SETFD, FD_CLOEXEC);
            fcntl(fds[1], F_SETFD, FD_CLOEXEC);
            return true;
        }

        void ClosePipe(int fds[2])
        {
            if (fds[0] >= 0)
                close(fds[0]);
            if (fds[1] >= 0)
                close(fds[1]);
            fds[0] = fds[1] = -1;
        }

        // Returns false on EOF or error.
        bool DrainInto(int fd, std::string &sink)
        {
            char buffer[4096];
            ssize_t n = read(fd, buffer, sizeof(buffer));
            if (n > 0)
            {
                sink.append(buffer, static_cast<size_t>(n));
                return true;
            }
            if (n < 0 && (errno == EINTR || errno == EAGAIN))
                return true;
            return false;
        }
    }

    CommandResult RunCommand(const std::vector<std::string> &argv,
                             std::chrono::milliseconds timeout)
    {
        CommandResult result;
        if (argv.empty())
            return result;

        auto start = Clock::now();
        auto deadline = start + timeout;

        int outPipe[2] = {-1, -1};
        int errPipe[2] = {-1, -1};
        int execPipe[2] = {-1, -1};
        if (!MakePipe(outPipe) || !MakePipe(errPipe) || !MakePipe(execPipe))
        {
            common::LogWarn("Command") << "pipe() failed: " << std::strerror(errno);
            ClosePipe(outPipe);
            ClosePipe(errPipe);
            ClosePipe(execPipe);
            return result;
        }

        // Built before fork: the child may only make async-signal-safe calls.
        std::vector<char *> args;
        args.reserve(argv.size() + 1);
        for (const auto &arg : argv)
            args.push_back(const_cast<char *>(arg.c_str()));
        args.push_back(nullptr);

        pid_t pid = fork();
        if (pid < 0)
        {
            common::LogWarn("Command") << "fork() failed: " << std::strerror(errno);
            ClosePipe(outPipe);
            ClosePipe(errPipe);
            ClosePipe(execPipe);
            return result;
        }

        if (pid == 0)
        {
            int devNull = open("/dev/null", O_RDONLY);
            if (devNull >= 0)
                dup2(devNull, STDIN_FILENO);
            dup2(outPipe[1], STDOUT_FILENO);
            dup2(errPipe[1], STDERR_FILENO);

            execvp(args[0], args.data());

            int code = errno;
            ssize_t ignored = write(execPipe[1], &code, sizeof(code));
            (void)ignored;
            _exit(127);
        }

        close(outPipe[1]);
        close(errPipe[1]);
        close(execPipe[1]);

        int execErrno = 0;
        ssize_t n;
        do
        {
            n = read(execPipe[0], &execErrno, sizeof(execErrno));
        } while (n < 0 && errno == EINTR);
        close(execPipe[0]);

        if (n > 0)
        {
            int status = 0;
            waitpid(pid, &status, 0);
            close(outPipe[0]);
            close(errPipe[0]);
            common::LogDebug("Command") << argv[0] << ": " << std::strerror(execErrno);
            result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
            return result;
        }

        result.started = true;

        pollfd fds[2];
        fds[0].fd = outPipe[0];
        fds[0].events = POLLIN;
        fds[1].fd = errPipe[0];
        fds[1].events = POLLIN;

        while (fds[0].fd >= 0 || fds[1].fd >= 0)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            if (remaining.count() <= 0)
            {
                result.timed_out = true;
                break;
            }

            fds[0].revents = 0;
            fds[1].revents = 0;
            int r = poll(fds, 2, static_cast<int>(remaining.count()));
            if (r < 0)
            {
                if (errno == EINTR)
                    continue;
                break;
            }
            if (r == 0)
                continue;

            for (int i = 0; i < 2; ++i)
            {
                if (fds[i].fd < 0 || fds[i].revents == 0)
                    continue;
                std::string &sink = i == 0 ? result.output : result.error_output;
                if (!DrainInto(fds[i].fd, sink))
                {
                    close(fds[i].fd);
                    fds[i].fd = -1;
                }
            }
        }

        for (auto &pfd : fds)
        {
            if (pfd.fd >= 0)
                close(pfd.fd);
        }

        if (result.timed_out)
            kill(pid, SIGKILL);

        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
        {
        }

        if (!result.timed_out && WIFEXITED(status))
            result.exit_code = WEXITSTATUS(status);

        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
        return result;
    }

#else

    namespace
    {
        std::string QuoteArgument(const std::string &arg)
        {
            if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos)
                return arg;

            std::string quoted = "\"";
            for (char c : arg)
            {
                if (c == '"')
                    quoted += '\\';
                quoted += c;
            }
            quoted += '"';
            return quoted;
        }

        void ReadAll(HANDLE handle, std::string &sink)
        {
            char buffer[4096];
            DWORD n = 0;
            while (ReadFile(handle, buffer, sizeof(buffer), &n, nullptr) && n > 0)
                sink.append(buffer, n);
        }
    }

    CommandResult RunCommand(const std::vector<std::string> &argv,
                             std::chrono::milliseconds timeout)
    {
        CommandResult result;
        if (argv.empty())
            return result;

        auto start = Clock::now();

        SECURITY_ATTRIBUTES sa{};
        sa.nLength = sizeof(sa);
        sa.bInheritHandle = TRUE;

        HANDLE outRead = nullptr, outWrite = nullptr;
        HANDLE errRead = nullptr, errWrite = nullptr;
        if (!CreatePipe(&outRead, &outWrite, &sa, 0) || !CreatePipe(&errRead, &errWrite, &sa, 0))
        {
            common::LogWarn("Command") << "CreatePipe failed: " << GetLastError();
            for (HANDLE h : {outRead, outWrite, errRead, errWrite})
            {
                if (h)
                    CloseHandle(h);
            }
            return result;
        }
        SetHandleInformation(outRead, HANDLE_FLAG_INHERIT, 0);
        SetHandleInformation(errRead, HANDLE_FLAG_INHERIT, 0);

        std::string cmdLine;
        for (const auto &arg : argv)
        {
            if (!cmdLine.empty())
                cmdLine += ' ';
            cmdLine += QuoteArgument(arg);
        }

        STARTUPINFOA si{};
        si.cb = sizeof(si);
        si.dwFlags = STARTF_USESTDHANDLES;
        si.hStdInput = nullptr;
        si.hStdOutput = outWrite;
        si.hStdError = errWrite;

        PROCESS_INFORMATION pi{};
        BOOL created = CreateProcessA(nullptr, const_cast<char *>(cmdLine.c_str()), nullptr, nullptr, TRUE,
                                      CREATE_NO_WINDOW, nullptr, nullptr, &si, &pi);
        CloseHandle(outWrite);
        CloseHandle(errWrite);

        if (!created)
        {
            common::LogDebug("Command") << argv[0] << ": CreateProcessA failed: " << GetLastError();
            CloseHandle(outRead);
            CloseHandle(errRead);
            return result;
        }

        result.started = true;

        std::thread outReader(ReadAll, outRead, std::ref(result.output));
        std::thread errReader(ReadAll, errRead, std::ref(result.error_output));

        DWORD wait = WaitForSingleObject(pi.hProcess, static_cast<DWORD>(timeout.count()));
        if (wait == WAIT_TIMEOUT)
        {
            result.timed_out = true;
            TerminateProcess(pi.hProcess, 1);
            WaitForSingleObject(pi.hProcess, INFINITE);
        }
        else
        {
            DWORD code = 0;
            if (GetExitCodeProcess(pi.hProcess, &code))
                result.exit_code = static_cast<int>(code);
        }

        outReader.join();
        errReader.join();

        CloseHandle(outRead);
        CloseHandle(errRead);
        CloseHandle(pi.hProcess);
        CloseHandle(pi.hThread);

        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
        return result;
    }

#endif
}
