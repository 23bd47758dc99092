#include <link_supervisor/posix_process_launcher.hpp>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

namespace link_supervisor
{
namespace
{

ProcessStatus decodeWaitStatus(const int status)
{
  ProcessStatus out;
  if (WIFEXITED(status)) {
    out.exited = true;
    out.exitCode = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    out.signaled = true;
    out.signal = WTERMSIG(status);
  }
  return out;
}

void closeFd(const int fd)
{
  while (::close(fd) != 0 && errno == EINTR) {
  }
}

}  // namespace

PosixProcessLauncher::PosixProcessLauncher(const std::chrono::milliseconds pollInterval)
: pollInterval_(pollInterval)
{
}

SpawnResult PosixProcessLauncher::spawn(const std::vector<std::string> & argv)
{
  SpawnResult result;
  if (argv.empty() || argv.front().empty()) {
    result.detail = "empty command";
    return result;
  }

  int errorPipe[2];
  if (::pipe2(errorPipe, O_CLOEXEC) != 0) {
    result.detail = std::string("pipe2 failed: ") + std::strerror(errno);
    return result;
  }

  // Built before fork: the child may only call async-signal-safe functions.
  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto & arg : argv) {
    args.push_back(const_cast<char *>(arg.c_str()));
  }
  args.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    result.detail = std::string("fork failed: ") + std::strerror(errno);
    closeFd(errorPipe[0]);
    closeFd(errorPipe[1]);
    return result;
  }

  if (pid == 0) {
    ::close(errorPipe[0]);
    int err = 0;
    if (::setpgid(0, 0) == 0) {
      ::execvp(args[0], args.data());
    }
    err = errno;
    ssize_t written;
    do {
      written = ::write(errorPipe[1], &err, sizeof(err));
    } while (written < 0 && errno == EINTR);
    ::_exit(127);
  }

  closeFd(errorPipe[1]);
  int childErrno = 0;
  ssize_t bytes;
  do {
    bytes = ::read(errorPipe[0], &childErrno, sizeof(childErrno));
  } while (bytes < 0 && errno == EINTR);
  closeFd(errorPipe[0]);

  if (bytes == static_cast<ssize_t>(sizeof(childErrno))) {
    // Exec never happened; reap the stub child.
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    result.detail = "exec " + argv.front() + " failed: " + std::strerror(childErrno);
    return result;
  }

  result.success = true;
  result.pid = static_cast<int>(pid);
  return result;
}

ProcessStatus PosixProcessLauncher::poll(const int pid)
{
  ProcessStatus out;
  int status = 0;
  pid_t reaped;
  do {
    reaped = ::waitpid(static_cast<pid_t>(pid), &status, WNOHANG);
  } while (reaped < 0 && errno == EINTR);

  if (reaped == 0) {
    out.running = true;
    return out;
  }
  if (reaped < 0) {
    // ECHILD: already reaped or not ours; report it as gone.
    return out;
  }
  return decodeWaitStatus(status);
}

ProcessStatus PosixProcessLauncher::terminate(
  const int pid,
  const std::chrono::duration<double> grace)
{
  ProcessStatus status = poll(pid);
  if (!status.running) {
    return status;
  }

  if (!signalGroup(pid, SIGTERM)) {
    return poll(pid);
  }
  const auto deadline = std::chrono::steady_clock::now() +
    std::chrono::duration_cast<std::chrono::steady_clock::duration>(grace);
  while (std::chrono::steady_clock::now() < deadline) {
    status = poll(pid);
    if (!status.running) {
      return status;
    }
    std::this_thread::sleep_for(pollInterval_);
  }

  status = poll(pid);
  if (!status.running) {
    return status;
  }
  if (!signalGroup(pid, SIGKILL)) {
    return poll(pid);
  }

  int raw = 0;
  pid_t reaped;
  do {
    reaped = ::waitpid(static_cast<pid_t>(pid), &raw, 0);
  } while (reaped < 0 && errno == EINTR);
  if (reaped < 0) {
    return ProcessStatus{};
  }
  return decodeWaitStatus(raw);
}

bool PosixProcessLauncher::signalGroup(const int pid, const int sig) const
{
  // Fall back to the single pid if the group is already gone.
  return ::kill(-static_cast<pid_t>(pid), sig) == 0 || ::kill(static_cast<pid_t>(pid), sig) == 0;
}

}  // namespace link_supervisor
