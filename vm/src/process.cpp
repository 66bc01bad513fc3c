#include "process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "exception.hpp"
#include "logging.hpp"
#include "string_util.hpp"

namespace hvctl {

static void pump(int fd, std::shared_ptr<broadcaster_t> console) {
  char buf[4096];
  while (true) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0)
      break;
    // Keep draining after the console closed so the child never blocks
    if (!console->closed()) {
      try {
        console->write(std::string_view(buf, n));
      } catch (const exception_t<end_of_stream> &) {
      }
    }
  }
  ::close(fd);
}

process_t::process_t(pid_t pid, int out_fd, int err_fd,
                     std::shared_ptr<broadcaster_t> console)
    : pid_(pid), out_pump_(pump, out_fd, console),
      err_pump_(pump, err_fd, console) {}

process_t::~process_t() {
  {
    wlock_t lk(m_);
    if (!exited_) {
      ::kill(-pid_, SIGKILL);
      reap_locked(0);
    }
  }
  join_or_detach(out_pump_);
  join_or_detach(err_pump_);
}

std::shared_ptr<process_t>
process_t::spawn(const std::vector<std::string> &argv,
                 std::shared_ptr<broadcaster_t> console,
                 const std::filesystem::path &cwd) {
  if (argv.empty())
    throw exception<value_error>("empty command line");

  std::vector<char *> cargv;
  for (const auto &arg : argv)
    cargv.push_back(const_cast<char *>(arg.c_str()));
  cargv.push_back(nullptr);
  std::string cwd_str = cwd.string();

  int out[2], err[2], status[2];
  if (::pipe2(out, O_CLOEXEC) < 0)
    throw exception<runtime_error>(
        std::format("pipe failed: {}", std::strerror(errno)));
  if (::pipe2(err, O_CLOEXEC) < 0) {
    ::close(out[0]);
    ::close(out[1]);
    throw exception<runtime_error>(
        std::format("pipe failed: {}", std::strerror(errno)));
  }
  if (::pipe2(status, O_CLOEXEC) < 0) {
    for (int fd : {out[0], out[1], err[0], err[1]})
      ::close(fd);
    throw exception<runtime_error>(
        std::format("pipe failed: {}", std::strerror(errno)));
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    for (int fd : {out[0], out[1], err[0], err[1], status[0], status[1]})
      ::close(fd);
    throw exception<runtime_error>(
        std::format("fork failed: {}", std::strerror(errno)));
  }

  if (pid == 0) {
    ::setpgid(0, 0);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0)
      ::dup2(devnull, STDIN_FILENO);
    ::dup2(out[1], STDOUT_FILENO);
    ::dup2(err[1], STDERR_FILENO);
    if (!cwd_str.empty() && ::chdir(cwd_str.c_str()) < 0) {
      int e = errno;
      (void)!::write(status[1], &e, sizeof(e));
      ::_exit(127);
    }
    ::execvp(cargv[0], cargv.data());
    int e = errno;
    (void)!::write(status[1], &e, sizeof(e));
    ::_exit(127);
  }

  ::close(out[1]);
  ::close(err[1]);
  ::close(status[1]);

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(status[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  ::close(status[0]);

  if (n > 0) {
    ::waitpid(pid, nullptr, 0);
    ::close(out[0]);
    ::close(err[0]);
    throw exception<runtime_error>(std::format(
        "failed to execute '{}': {}", argv[0], std::strerror(child_errno)));
  }

  debug("spawned {} (pid {})", utils::join(" ", argv), pid);
  return create<process_t>(pid, out[0], err[0], std::move(console));
}

int process_t::wait() {
  {
    rlock_t lk(m_);
    if (exited_)
      return status_;
  }

  // Wait without reaping so that the pid stays valid for `kill`
  siginfo_t info{};
  while (::waitid(P_PID, pid_, &info, WEXITED | WNOWAIT) < 0 && errno == EINTR)
    ;

  wlock_t lk(m_);
  if (!exited_)
    reap_locked(0);
  return status_;
}

bool process_t::is_alive() {
  wlock_t lk(m_);
  if (exited_)
    return false;
  siginfo_t info{};
  if (::waitid(P_PID, pid_, &info, WEXITED | WNOHANG | WNOWAIT) < 0)
    return false;
  return info.si_pid == 0;
}

void process_t::kill(int signum) {
  wlock_t lk(m_);
  if (exited_)
    return;
  if (::kill(-pid_, signum) < 0 && errno != ESRCH)
    throw exception<runtime_error>(std::format(
        "failed to signal process {}: {}", pid_, std::strerror(errno)));
}

void process_t::reap_locked(int options) {
  int status = 0;
  pid_t rv;
  do {
    rv = ::waitpid(pid_, &status, options);
  } while (rv < 0 && errno == EINTR);
  if (rv != pid_)
    return;

  exited_ = true;
  if (WIFEXITED(status))
    status_ = WEXITSTATUS(status);
  else if (WIFSIGNALED(status))
    status_ = 128 + WTERMSIG(status);
}

bool find_in_path(const std::string &program) {
  const char *path = std::getenv("PATH");
  if (!path)
    return false;
  for (const auto &dir : utils::split_text(path, ":")) {
    if (dir.empty())
      continue;
    auto candidate = std::filesystem::path(dir) / program;
    if (::access(candidate.c_str(), X_OK) == 0)
      return true;
  }
  return false;
}

} // namespace hvctl
