#pragma once

#include <csignal>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

#include "broadcaster.hpp"

namespace hvctl {

/**
 * @brief A hypervisor child process whose stdout and stderr feed a console
 * @details The child runs in its own process group; `kill` signals the whole
 * group.
 */
class process_t : public object_t {
public:
  process_t(pid_t pid, int out_fd, int err_fd,
            std::shared_ptr<broadcaster_t> console);

  ~process_t();

  /**
   * @throw exception_t<runtime_error> if the program cannot be executed
   */
  static std::shared_ptr<process_t>
  spawn(const std::vector<std::string> &argv,
        std::shared_ptr<broadcaster_t> console,
        const std::filesystem::path &cwd = {});

  /**
   * @brief Blocks until the process exits
   * @return Its exit code, or 128 + signal number if it was killed
   */
  int wait();

  bool is_alive();

  void kill(int signum = SIGKILL);

  pid_t pid() const { return pid_; }

private:
  void reap_locked(int options);

  const pid_t pid_;

  mutex_t m_;

  bool exited_ = false;

  int status_ = 0;

  std::thread out_pump_;

  std::thread err_pump_;
};

/**
 * @return true if `program` is an executable found on `PATH`
 */
bool find_in_path(const std::string &program);

} // namespace hvctl
