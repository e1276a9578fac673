#include "permitted/process.hpp"

#include "permitted/log.hpp"

#include <thread>

#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#else
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace permitted {
namespace process {

#if defined(_WIN32)

namespace {

// Quote one argument for CreateProcess
std::string quote_argument(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) {
        return arg;
    }
    std::string quoted = "\"";
    size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            ++backslashes;
            continue;
        }
        if (c == '"') {
            quoted.append(backslashes * 2 + 1, '\\');
        } else {
            quoted.append(backslashes, '\\');
        }
        backslashes = 0;
        quoted.push_back(c);
    }
    quoted.append(backslashes * 2, '\\');
    quoted.push_back('"');
    return quoted;
}

void drain_pipe(HANDLE pipe, std::string& output) {
    DWORD available = 0;
    while (PeekNamedPipe(pipe, nullptr, 0, nullptr, &available, nullptr) && available > 0) {
        char buffer[4096];
        DWORD read = 0;
        DWORD to_read = available < sizeof(buffer) ? available : sizeof(buffer);
        if (!ReadFile(pipe, buffer, to_read, &read, nullptr) || read == 0) {
            return;
        }
        output.append(buffer, read);
    }
}

}  // namespace

std::optional<std::string> run_and_capture(const std::vector<std::string>& argv,
                                           std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        return std::nullopt;
    }

    SECURITY_ATTRIBUTES sa;
    ZeroMemory(&sa, sizeof(sa));
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE read_end = nullptr;
    HANDLE write_end = nullptr;
    if (!CreatePipe(&read_end, &write_end, &sa, 0)) {
        return std::nullopt;
    }
    SetHandleInformation(read_end, HANDLE_FLAG_INHERIT, 0);

    std::string command_line;
    for (const auto& arg : argv) {
        if (!command_line.empty()) {
            command_line.push_back(' ');
        }
        command_line += quote_argument(arg);
    }
    std::vector<char> cmd_buffer(command_line.begin(), command_line.end());
    cmd_buffer.push_back('\0');

    STARTUPINFOA si;
    ZeroMemory(&si, sizeof(si));
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdOutput = write_end;
    si.hStdError = nullptr;
    si.hStdInput = nullptr;
    PROCESS_INFORMATION pi;
    ZeroMemory(&pi, sizeof(pi));

    BOOL created = CreateProcessA(nullptr, cmd_buffer.data(), nullptr, nullptr, TRUE,
                                  CREATE_NO_WINDOW, nullptr, nullptr, &si, &pi);
    CloseHandle(write_end);
    if (!created) {
        PERMITTED_LOG(log::get("process"), debug)
            << "CreateProcess failed for " << argv[0] << ": " << GetLastError();
        CloseHandle(read_end);
        return std::nullopt;
    }

    std::string output;
    auto start = std::chrono::steady_clock::now();
    bool timed_out = false;

    while (true) {
        drain_pipe(read_end, output);
        DWORD wait_result = WaitForSingleObject(pi.hProcess, 20);
        if (wait_result == WAIT_OBJECT_0) {
            break;
        }
        if (wait_result != WAIT_TIMEOUT) {
            timed_out = true;
            TerminateProcess(pi.hProcess, 1u);
            WaitForSingleObject(pi.hProcess, INFINITE);
            break;
        }
        if (std::chrono::steady_clock::now() - start >= timeout) {
            timed_out = true;
            TerminateProcess(pi.hProcess, 1u);
            WaitForSingleObject(pi.hProcess, INFINITE);
            break;
        }
    }
    drain_pipe(read_end, output);

    DWORD exit_code = 1;
    if (!timed_out && !GetExitCodeProcess(pi.hProcess, &exit_code)) {
        exit_code = 1;
    }

    CloseHandle(read_end);
    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);

    if (timed_out) {
        PERMITTED_LOG(log::get("process"), debug) << argv[0] << " timed out";
        return std::nullopt;
    }
    if (exit_code != 0) {
        PERMITTED_LOG(log::get("process"), debug)
            << argv[0] << " exited with code " << exit_code;
        return std::nullopt;
    }
    return output;
}

#else

std::optional<std::string> run_and_capture(const std::vector<std::string>& argv,
                                           std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        return std::nullopt;
    }

    int fds[2];
    if (pipe(fds) != 0) {
        PERMITTED_LOG(log::get("process"), debug) << "pipe failed: " << std::strerror(errno);
        return std::nullopt;
    }

    // Prepare C args before forking
    std::vector<char*> cargv;
    for (const auto& s : argv) {
        cargv.push_back(const_cast<char*>(s.c_str()));
    }
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        PERMITTED_LOG(log::get("process"), debug) << "fork failed: " << std::strerror(errno);
        close(fds[0]);
        close(fds[1]);
        return std::nullopt;
    }

    if (pid == 0) {
        // child
        dup2(fds[1], STDOUT_FILENO);
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        close(fds[0]);
        close(fds[1]);
        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    // parent: read until EOF, killing the child once the timeout elapses
    close(fds[1]);
    std::string output;
    auto start = std::chrono::steady_clock::now();
    bool timed_out = false;

    while (true) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (elapsed >= timeout) {
            timed_out = true;
            break;
        }
        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(timeout - elapsed).count();

        pollfd pfd{};
        pfd.fd = fds[0];
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, static_cast<int>(remaining < 50 ? remaining : 50));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ready == 0) {
            continue;
        }

        char buffer[4096];
        ssize_t n = read(fds[0], buffer, sizeof(buffer));
        if (n > 0) {
            output.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        break;  // EOF or read error
    }
    close(fds[0]);

    int status = 0;
    while (!timed_out) {
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            break;
        }
        if (w == -1) {
            if (errno == EINTR) {
                continue;
            }
            PERMITTED_LOG(log::get("process"), debug)
                << "waitpid failed: " << std::strerror(errno);
            return std::nullopt;
        }
        if (std::chrono::steady_clock::now() - start >= timeout) {
            timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (timed_out) {
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        PERMITTED_LOG(log::get("process"), debug) << argv[0] << " timed out";
        return std::nullopt;
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        PERMITTED_LOG(log::get("process"), debug)
            << argv[0] << " exited abnormally (status " << status << ")";
        return std::nullopt;
    }
    return output;
}

#endif

}  // namespace process
}  // namespace permitted
