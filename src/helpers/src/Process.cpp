/**
 * @file Process.cpp
 * @brief Bounded-wait command execution (POSIX and Windows).
 */

#include "src/helpers/inc/Process.hpp"

#if defined(_WIN32)
#include <windows.h>
#else
#include <fcntl.h>    // open, fcntl, FD_CLOEXEC
#include <poll.h>     // poll
#include <signal.h>   // kill, SIGKILL
#include <sys/wait.h> // waitpid, WIFEXITED
#include <unistd.h>   // fork, execvp, pipe, dup2, _exit
#endif

#include <array>
#include <cerrno>
#include <cstdlib> // setenv

#include <fmt/core.h>

namespace cpufetch {
namespace helpers {
namespace process {

namespace {

using Clock = std::chrono::steady_clock;

/// Milliseconds left until deadline, clamped at zero.
inline long long remainingMs(Clock::time_point deadline) noexcept {
  const auto LEFT =
      std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
  return LEFT > 0 ? LEFT : 0;
}

/// Append a chunk, respecting the output cap.
inline void appendCapped(std::string& out, const char* data, std::size_t len) {
  if (out.size() >= MAX_COMMAND_OUTPUT) {
    return;
  }
  const std::size_t ROOM = MAX_COMMAND_OUTPUT - out.size();
  out.append(data, len < ROOM ? len : ROOM);
}

#if !defined(_WIN32)

/// Reap child, polling until the deadline; kills it if the deadline passes.
/// @return true if the child exited before the deadline.
bool reapChild(pid_t pid, Clock::time_point deadline, int& waitStatus) noexcept {
  for (;;) {
    const pid_t RC = ::waitpid(pid, &waitStatus, WNOHANG);
    if (RC == pid) {
      return true;
    }
    if (RC < 0 && errno != EINTR) {
      waitStatus = 0;
      return true;
    }
    if (remainingMs(deadline) == 0) {
      ::kill(pid, SIGKILL);
      while (::waitpid(pid, &waitStatus, 0) < 0 && errno == EINTR) {
      }
      return false;
    }
    ::usleep(1000);
  }
}

CommandResult runPosix(const std::vector<std::string>& argv,
                       std::chrono::milliseconds timeout) noexcept {
  CommandResult result{};
  result.timeout = timeout;

  int fds[2] = {-1, -1};
  if (::pipe(fds) != 0) {
    return result;
  }
  ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const std::string& ARG : argv) {
    cargv.push_back(const_cast<char*>(ARG.c_str()));
  }
  cargv.push_back(nullptr);

  const pid_t PID = ::fork();
  if (PID < 0) {
    ::close(fds[0]);
    ::close(fds[1]);
    return result;
  }

  if (PID == 0) {
    // Child: stdout -> pipe, stderr -> /dev/null
    ::dup2(fds[1], STDOUT_FILENO);
    const int NULL_FD = ::open("/dev/null", O_WRONLY);
    if (NULL_FD >= 0) {
      ::dup2(NULL_FD, STDERR_FILENO);
      ::close(NULL_FD);
    }
    ::setenv("LC_ALL", "C", 1);
    ::execvp(cargv[0], cargv.data());
    ::_exit(EXEC_FAILED_EXIT_CODE);
  }

  ::close(fds[1]);
  const Clock::time_point DEADLINE = Clock::now() + timeout;

  std::array<char, 4096> chunk{};
  bool timedOut = false;
  for (;;) {
    const long long LEFT = remainingMs(DEADLINE);
    if (LEFT == 0) {
      timedOut = true;
      break;
    }

    struct pollfd pfd{};
    pfd.fd = fds[0];
    pfd.events = POLLIN;
    const int RC = ::poll(&pfd, 1, static_cast<int>(LEFT));
    if (RC < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (RC == 0) {
      continue;
    }

    const ssize_t N = ::read(fds[0], chunk.data(), chunk.size());
    if (N < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      break;
    }
    if (N == 0) {
      break; // EOF: child closed stdout
    }
    appendCapped(result.output, chunk.data(), static_cast<std::size_t>(N));
  }
  ::close(fds[0]);

  int waitStatus = 0;
  if (timedOut) {
    ::kill(PID, SIGKILL);
    while (::waitpid(PID, &waitStatus, 0) < 0 && errno == EINTR) {
    }
    result.status = CommandStatus::TIMED_OUT;
    return result;
  }

  if (!reapChild(PID, DEADLINE, waitStatus)) {
    result.status = CommandStatus::TIMED_OUT;
    return result;
  }

  if (WIFEXITED(waitStatus)) {
    result.exitCode = WEXITSTATUS(waitStatus);
    if (result.exitCode == 0) {
      result.status = CommandStatus::OK;
    } else if (result.exitCode == EXEC_FAILED_EXIT_CODE) {
      result.status = CommandStatus::NOT_FOUND;
    } else {
      result.status = CommandStatus::NON_ZERO_EXIT;
    }
  } else {
    result.status = CommandStatus::KILLED;
  }
  return result;
}

#else // _WIN32

/// Quote one argument for the Windows command line.
std::string quoteArg(const std::string& arg) {
  if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) {
    return arg;
  }
  std::string out = "\"";
  for (char c : arg) {
    if (c == '"') {
      out += '\\';
    }
    out += c;
  }
  out += '"';
  return out;
}

CommandResult runWindows(const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout) noexcept {
  CommandResult result{};
  result.timeout = timeout;

  SECURITY_ATTRIBUTES sa{};
  sa.nLength = sizeof(sa);
  sa.bInheritHandle = TRUE;

  HANDLE readEnd = nullptr;
  HANDLE writeEnd = nullptr;
  if (!::CreatePipe(&readEnd, &writeEnd, &sa, 0)) {
    return result;
  }
  ::SetHandleInformation(readEnd, HANDLE_FLAG_INHERIT, 0);

  std::string cmdline;
  for (std::size_t i = 0; i < argv.size(); ++i) {
    if (i > 0) {
      cmdline += ' ';
    }
    cmdline += quoteArg(argv[i]);
  }

  STARTUPINFOA si{};
  si.cb = sizeof(si);
  si.dwFlags = STARTF_USESTDHANDLES;
  si.hStdOutput = writeEnd;
  si.hStdError = nullptr;
  si.hStdInput = nullptr;

  PROCESS_INFORMATION pi{};
  if (!::CreateProcessA(nullptr, cmdline.data(), nullptr, nullptr, TRUE, CREATE_NO_WINDOW,
                        nullptr, nullptr, &si, &pi)) {
    const DWORD ERR = ::GetLastError();
    ::CloseHandle(readEnd);
    ::CloseHandle(writeEnd);
    result.status = (ERR == ERROR_FILE_NOT_FOUND || ERR == ERROR_PATH_NOT_FOUND)
                        ? CommandStatus::NOT_FOUND
                        : CommandStatus::SPAWN_FAILED;
    return result;
  }
  ::CloseHandle(writeEnd);

  const Clock::time_point DEADLINE = Clock::now() + timeout;
  std::array<char, 4096> chunk{};
  bool exited = false;
  for (;;) {
    DWORD avail = 0;
    while (::PeekNamedPipe(readEnd, nullptr, 0, nullptr, &avail, nullptr) && avail > 0) {
      DWORD got = 0;
      const DWORD WANT = avail < chunk.size() ? avail : static_cast<DWORD>(chunk.size());
      if (!::ReadFile(readEnd, chunk.data(), WANT, &got, nullptr) || got == 0) {
        break;
      }
      appendCapped(result.output, chunk.data(), got);
    }
    if (exited) {
      break;
    }
    if (remainingMs(DEADLINE) == 0) {
      ::TerminateProcess(pi.hProcess, 1);
      ::WaitForSingleObject(pi.hProcess, INFINITE);
      ::CloseHandle(pi.hProcess);
      ::CloseHandle(pi.hThread);
      ::CloseHandle(readEnd);
      result.status = CommandStatus::TIMED_OUT;
      return result;
    }
    // One more drain pass after the process exits
    exited = ::WaitForSingleObject(pi.hProcess, 10) == WAIT_OBJECT_0;
  }

  DWORD code = 1;
  ::GetExitCodeProcess(pi.hProcess, &code);
  ::CloseHandle(pi.hProcess);
  ::CloseHandle(pi.hThread);
  ::CloseHandle(readEnd);

  result.exitCode = static_cast<int>(code);
  result.status = code == 0 ? CommandStatus::OK : CommandStatus::NON_ZERO_EXIT;
  return result;
}

#endif // _WIN32

} // namespace

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(CommandStatus status) noexcept {
  switch (status) {
  case CommandStatus::OK:
    return "OK";
  case CommandStatus::INVALID_ARGUMENT:
    return "INVALID_ARGUMENT";
  case CommandStatus::NOT_FOUND:
    return "NOT_FOUND";
  case CommandStatus::SPAWN_FAILED:
    return "SPAWN_FAILED";
  case CommandStatus::NON_ZERO_EXIT:
    return "NON_ZERO_EXIT";
  case CommandStatus::KILLED:
    return "KILLED";
  case CommandStatus::TIMED_OUT:
    return "TIMED_OUT";
  }
  return "UNKNOWN";
}

/* ----------------------------- CommandResult ----------------------------- */

std::string CommandResult::describe(const std::string& command) const {
  switch (status) {
  case CommandStatus::OK:
    return fmt::format("{}: ok", command);
  case CommandStatus::INVALID_ARGUMENT:
    return fmt::format("{}: invalid command line", command);
  case CommandStatus::NOT_FOUND:
    return fmt::format("{}: command not found", command);
  case CommandStatus::SPAWN_FAILED:
    return fmt::format("{}: failed to start process", command);
  case CommandStatus::NON_ZERO_EXIT:
    return fmt::format("{}: exited with status {}", command, exitCode);
  case CommandStatus::KILLED:
    return fmt::format("{}: terminated by signal", command);
  case CommandStatus::TIMED_OUT:
    return fmt::format("{}: timed out after {} ms", command, timeout.count());
  }
  return fmt::format("{}: unknown failure", command);
}

/* ----------------------------- API ----------------------------- */

CommandResult runCommand(const std::vector<std::string>& argv,
                         std::chrono::milliseconds timeout) noexcept {
  if (argv.empty() || argv[0].empty()) {
    CommandResult result{};
    result.status = CommandStatus::INVALID_ARGUMENT;
    result.timeout = timeout;
    return result;
  }

#if defined(_WIN32)
  return runWindows(argv, timeout);
#else
  return runPosix(argv, timeout);
#endif
}

} // namespace process
} // namespace helpers
} // namespace cpufetch
