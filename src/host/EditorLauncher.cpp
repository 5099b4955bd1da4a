#include "EditorLauncher.hpp"

#include "StreamUtils.hpp"

namespace eb {
namespace {
int waitForChild(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw std::runtime_error(string("Cannot wait for editor: ") +
                               strerror(errno));
    }
  }
  return status;
}

#if __APPLE__
// No pipe2 on macOS: pipe creation and fork are serialized instead, so no
// sibling editor inherits a descriptor before it is marked close-on-exec
mutex pipeForkMutex;
#endif

// Both ends are close-on-exec so that an editor started by another worker
// never holds them open
void createPipe(int fds[2]) {
#if __APPLE__
  if (::pipe(fds) == -1) {
    throw std::runtime_error(string("Cannot create pipe: ") + strerror(errno));
  }
  FATAL_FAIL(::fcntl(fds[0], F_SETFD, FD_CLOEXEC));
  FATAL_FAIL(::fcntl(fds[1], F_SETFD, FD_CLOEXEC));
#else
  if (::pipe2(fds, O_CLOEXEC) == -1) {
    throw std::runtime_error(string("Cannot create pipe: ") + strerror(errno));
  }
#endif
}
}  // namespace

vector<string> EditorLauncher::shellArguments() {
#if __APPLE__
  // Login shell, so that the PATH from the user's profile applies
  return {"-i", "-l", "-c"};
#else
  return {"-c"};
#endif
}

EditorResult EditorLauncher::runEditor(const string& shell,
                                       const string& command) {
  vector<string> args;
  args.push_back(shell);
  for (const auto& it : shellArguments()) {
    args.push_back(it);
  }
  args.push_back(command);
  vector<char*> argv;
  for (auto& it : args) {
    argv.push_back(&it[0]);
  }
  argv.push_back(NULL);

  int stderrPipe[2];
  int execErrorPipe[2];
#if __APPLE__
  unique_lock<std::mutex> forkGuard(pipeForkMutex);
#endif
  createPipe(stderrPipe);
  try {
    // Closed by a successful exec, so the parent reads EOF
    createPipe(execErrorPipe);
  } catch (const std::runtime_error&) {
    ::close(stderrPipe[0]);
    ::close(stderrPipe[1]);
    throw;
  }

  pid_t pid = ::fork();
#if __APPLE__
  forkGuard.unlock();
#endif
  if (pid < 0) {
    auto localErrno = errno;
    ::close(stderrPipe[0]);
    ::close(stderrPipe[1]);
    ::close(execErrorPipe[0]);
    ::close(execErrorPipe[1]);
    throw std::runtime_error(string("Cannot fork: ") + strerror(localErrno));
  }
  if (pid == 0) {
    // child process
    int devNull = ::open("/dev/null", O_RDWR);
    if (devNull >= 0) {
      ::dup2(devNull, STDIN_FILENO);
      // stdout carries native messaging frames and must stay untouched
      ::dup2(devNull, STDOUT_FILENO);
      ::close(devNull);
    }
    // dup2 clears close-on-exec on the new descriptor
    ::dup2(stderrPipe[1], STDERR_FILENO);
    ::close(stderrPipe[0]);
    ::close(stderrPipe[1]);
    ::close(execErrorPipe[0]);
    ::execvp(argv[0], argv.data());

    int localErrno = errno;
    ssize_t rc = ::write(execErrorPipe[1], &localErrno, sizeof(localErrno));
    (void)rc;
    ::_exit(127);
  }

  // parent process
  ::close(stderrPipe[1]);
  ::close(execErrorPipe[1]);
  int childErrno = 0;
  ssize_t rc;
  do {
    rc = ::read(execErrorPipe[0], &childErrno, sizeof(childErrno));
  } while (rc < 0 && errno == EINTR);
  ::close(execErrorPipe[0]);
  if (rc == sizeof(childErrno)) {
    ::close(stderrPipe[0]);
    waitForChild(pid);
    throw std::runtime_error("Cannot start " + shell + ": " +
                             strerror(childErrno));
  }
  LOG(INFO) << "Started editor (pid " << pid << "): " << command;

  EditorResult result;
  try {
    result.errorOutput = StreamUtils::readToEnd(stderrPipe[0]);
  } catch (const std::runtime_error&) {
    ::close(stderrPipe[0]);
    waitForChild(pid);
    throw;
  }
  ::close(stderrPipe[0]);

  int status = waitForChild(pid);
  if (WIFEXITED(status)) {
    result.exitStatus = WEXITSTATUS(status);
  } else {
    result.exitStatus = -1;
    if (WIFSIGNALED(status)) {
      result.errorOutput +=
          "\nEditor terminated by signal " + to_string(WTERMSIG(status));
    }
  }
  LOG(INFO) << "Editor (pid " << pid << ") exited with status "
            << result.exitStatus;
  return result;
}
}  // namespace eb
