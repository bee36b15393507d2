#include "subprocess.hpp"

#include <cerrno>
#include <cstring>
#include <algorithm>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

std::string errno_message(const char* what) {
  std::ostringstream oss;
  oss << what << ": " << std::strerror(errno);
  return oss.str();
}

int wait_child(pid_t pid) {
  int status = 0;
  while(::waitpid(pid, &status, 0) < 0) {
    if(errno != EINTR) return -1;
  }
  if(WIFEXITED(status)) return WEXITSTATUS(status);
  if(WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

} // namespace

ProcessResult run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
  ProcessResult result;
  if(argv.empty()) {
    result.spawn_error = "empty command line";
    return result;
  }

  // execvp wants mutable strings; give it its own copies.
  std::vector<std::string> arg_storage(argv.begin(), argv.end());
  std::vector<char*> c_argv;
  c_argv.reserve(arg_storage.size() + 1);
  for(auto& arg : arg_storage) c_argv.push_back(arg.data());
  c_argv.push_back(nullptr);

  int fds[2];
  if(::pipe2(fds, O_CLOEXEC) != 0) {
    result.spawn_error = errno_message("pipe failed");
    return result;
  }

  const pid_t pid = ::fork();
  if(pid < 0) {
    result.spawn_error = errno_message("fork failed");
    ::close(fds[0]);
    ::close(fds[1]);
    return result;
  }
  if(pid == 0) {
    ::dup2(fds[1], STDOUT_FILENO);
    ::dup2(fds[1], STDERR_FILENO);
    int devnull = ::open("/dev/null", O_RDONLY);
    if(devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    ::execvp(c_argv[0], c_argv.data());
    const char msg[] = "exec failed: ";
    (void)!::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    const char* reason = std::strerror(errno);
    (void)!::write(STDERR_FILENO, reason, std::strlen(reason));
    ::_exit(127);
  }

  ::close(fds[1]);
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  char buffer[4096];
  while(true) {
    const auto now = std::chrono::steady_clock::now();
    if(now >= deadline) {
      result.timed_out = true;
      ::kill(pid, SIGKILL);
      break;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    pollfd pfd{fds[0], POLLIN, 0};
    const int ready = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining.count(), 1000)));
    if(ready < 0) {
      if(errno == EINTR) continue;
      result.spawn_error = errno_message("poll failed");
      ::kill(pid, SIGKILL);
      break;
    }
    if(ready == 0) continue;
    const ssize_t n = ::read(fds[0], buffer, sizeof(buffer));
    if(n > 0) {
      result.output.append(buffer, static_cast<std::size_t>(n));
      continue;
    }
    if(n < 0 && errno == EINTR) continue;
    break; // EOF
  }
  ::close(fds[0]);
  result.exit_code = wait_child(pid);
  return result;
}
