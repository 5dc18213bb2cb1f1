#include "collectors/PingProbe.hpp"

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

extern char** environ;

namespace snapwatch::collectors {

PingProbe::PingProbe(std::string host, std::chrono::milliseconds timeout)
    : host_(std::move(host)), timeout_(timeout) {}

bool PingProbe::probe() {
  using namespace std::chrono;
  if (host_.empty()) return false;
  // ping -W takes whole seconds
  auto wait_s = std::max<long long>(1, duration_cast<seconds>(timeout_ + 999ms).count());
  std::string wait_arg = std::to_string(wait_s);
  std::vector<char*> argv = {
    const_cast<char*>("ping"), const_cast<char*>("-c"), const_cast<char*>("1"),
    const_cast<char*>("-W"), wait_arg.data(), host_.data(), nullptr
  };

  posix_spawn_file_actions_t fa;
  if (posix_spawn_file_actions_init(&fa) != 0) return false;
  posix_spawn_file_actions_addopen(&fa, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
  posix_spawn_file_actions_addopen(&fa, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
  posix_spawn_file_actions_addopen(&fa, STDERR_FILENO, "/dev/null", O_WRONLY, 0);
  pid_t pid = -1;
  int rc = posix_spawnp(&pid, "ping", &fa, nullptr, argv.data(), environ);
  posix_spawn_file_actions_destroy(&fa);
  if (rc != 0) return false;

  // Hard deadline: ping's own -W plus a one second grace, then SIGKILL
  auto deadline = steady_clock::now() + seconds(wait_s) + 1s;
  int status = 0;
  for (;;) {
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) break;
    if (r < 0 && errno != EINTR) return false;
    if (steady_clock::now() >= deadline) {
      ::kill(pid, SIGKILL);
      while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
      return false;
    }
    std::this_thread::sleep_for(20ms);
  }
  return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

} // namespace snapwatch::collectors
