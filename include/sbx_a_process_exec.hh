#pragma once

#include "sbx_a_types.hh"
#include "sbx_a_log.hh"
#include "sbx_a_invocation.hh"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <unistd.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <spawn.h>
#include <signal.h>
#include <poll.h>
#include <string>
#include <vector>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <thread>

extern char **environ;

/* --------------------------------------------- */

struct exe_c // config
{
  std::string cmd; // searched in PATH unless it contains '/'
  std::vector<std::string> args;
  std::string dir; // empty = inherit
  uint64_t timeout_ms = 0; // 0 or above sbx_budget_max_ms = unbounded
  uint64_t grace_ms = 2000; // SIGTERM -> SIGKILL
  exe_c(std::string _cmd, std::vector<std::string> _args, std::string _dir = "", uint64_t _timeout_ms = 0)
    : cmd(std::move(_cmd)), args(std::move(_args)), dir(std::move(_dir)), timeout_ms(_timeout_ms) {}
};

struct exe_r // result
{
  pid_t pid = -1;
  uint8_t status = 0; // 0 = created; 1 = running; 3 = completed; 4 = timed out; 5 = pipe failed; 6 = spawn failed; 7 = wait failed
  bool timed_out = false;
  bool exit_normal = false; // false = killed by a signal
  int exit_code = -1;
  int exit_sign = 0;
  int spawn_errno = 0;
  std::chrono::steady_clock::time_point started;
  std::chrono::steady_clock::time_point finished;
  std::string stdout_text;
  std::string stderr_text;
  inline std::string combined_() const { return stdout_text + stderr_text; }
  inline uint64_t elapsed_ms_() const
  {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(finished - started).count());
  }
  inline bool succeeded_() const noexcept { return status == 3 && exit_normal && exit_code == 0; }
  inline const char* state_() const noexcept
  {
    if (timed_out) return "timed_out";
    if (status != 3) return "failed";
    return exit_normal ? "exited" : "signaled";
  }
};

struct fd_p // pipe, both ends closed on scope exit
{
  int rd = -1;
  int wr = -1;
  fd_p() = default;
  fd_p(const fd_p&) = delete;
  fd_p& operator=(const fd_p&) = delete;
  ~fd_p()
  {
    close_rd_();
    close_wr_();
  }
  inline bool open_()
  {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) == -1) return false;
    rd = fds[0];
    wr = fds[1];
    return true;
  }
  inline void close_rd_() { if (rd >= 0) close(rd); rd = -1; }
  inline void close_wr_() { if (wr >= 0) close(wr); wr = -1; }
};

/* --------------------------------------------- */

class exe_t // bounded executor
{
public:
  // the child leads its own process group; a supervision unit drains its pipes while the caller holds the budget
  inline short execute_(const exe_c& _config, exe_r& _result)
  {
    fd_p out;
    fd_p err;
    if (!out.open_() || !err.open_())
    {
      perror("exe_t.execute_(): ---pipe2---");
      _result.status = 5;
      return -1;
    }
    _result.started = std::chrono::steady_clock::now();
    int rc = spawn_(_config, out.wr, err.wr, _result.pid);
    out.close_wr_(); // EOF reaches the reader once every holder of the write ends is gone
    err.close_wr_();
    if (rc != 0)
    {
      fprintf(stderr, "exe_t.execute_(): ---posix_spawnp %s: %s---\n", _config.cmd.c_str(), strerror(rc));
      _result.spawn_errno = rc;
      _result.finished = std::chrono::steady_clock::now();
      _result.status = 6;
      return -2;
    }
    _result.status = 1;
    std::mutex mtx;
    std::condition_variable cv;
    bool done = false;
    bool reaped = false;
    {
      std::jthread unit([&](std::stop_token _stop)
      {
        bool r = drain_(_stop, out.rd, err.rd, _result);
        {
          std::scoped_lock lock(mtx);
          reaped = r;
          done = true;
        }
        cv.notify_all();
      });
      std::unique_lock lock(mtx);
      auto finished = [&] { return done; };
      if (!bounded_(_config.timeout_ms)) cv.wait(lock, finished);
      else if (!cv.wait_for(lock, std::chrono::milliseconds(_config.timeout_ms), finished))
      {
        _result.timed_out = true;
        kill(-_result.pid, SIGTERM);
        if (!cv.wait_for(lock, std::chrono::milliseconds(_config.grace_ms), finished)) kill(-_result.pid, SIGKILL);
        unit.request_stop(); // a grandchild may still hold the pipes
      }
    } // joined: the child has been waited for
    if (!reaped)
    {
      _result.status = 7;
      return -3;
    }
    _result.status = _result.timed_out ? 4 : 3;
    return 0;
  }
  inline exe_r execute_(const exe_c& _config)
  {
    exe_r r;
    execute_(_config, r);
    return r;
  }
  inline sbx_r run_(const sbx_i& _invocation, uint64_t _timeout_s)
  {
    return run_ms_(_invocation, _timeout_s > sbx_budget_max_ms / 1000 ? 0 : _timeout_s * 1000);
  }
  // 0 and anything past sbx_budget_max_ms mean no deadline: the steady clock cannot hold such a wait
  static inline bool bounded_(uint64_t _timeout_ms) noexcept { return _timeout_ms > 0 && _timeout_ms <= sbx_budget_max_ms; }
  inline sbx_r run_ms_(const sbx_i& _invocation, uint64_t _timeout_ms, uint64_t _grace_ms = 2000)
  {
    exe_c config(_invocation.runtime, _invocation.args, "", _timeout_ms);
    config.grace_ms = _grace_ms;
    log_t::get_().debug_("Starting sandbox process"
      , {{"runtime", _invocation.runtime}, {"args", _invocation.args}, {"timeout_ms", _timeout_ms}});
    exe_r result = execute_(config);
    if (result.status == 6)
    {
      throw log_t::get_().fail_(sbx_e_execution("Failed to start " + _invocation.runtime + ": " + std::strerror(result.spawn_errno)
        , {{"runtime", _invocation.runtime}, {"errno", result.spawn_errno}}));
    }
    if (result.status == 5 || result.status == 7)
    {
      throw log_t::get_().fail_(sbx_e_execution("Failed to supervise " + _invocation.runtime, {{"runtime", _invocation.runtime}, {"pid", result.pid}}));
    }
    log_t::get_().debug_("Sandbox process finished"
      , {{"pid", result.pid}, {"state", result.state_()}, {"exit_code", result.exit_code}
      , {"signal", result.exit_sign}, {"elapsed_ms", result.elapsed_ms_()}});
    if (result.timed_out)
    {
      throw log_t::get_().fail_(sbx_e_timeout("Execution exceeded " + std::to_string(_timeout_ms) + " ms"
        , {{"timeout_ms", _timeout_ms}, {"pid", result.pid}, {"runtime", _invocation.runtime}}));
    }
    if (!result.succeeded_())
    {
      std::string why = result.exit_normal
        ? "exited with status " + std::to_string(result.exit_code)
        : "was killed by signal " + std::to_string(result.exit_sign);
      throw log_t::get_().fail_(sbx_e_execution(_invocation.runtime + " " + why
        , {{"runtime", _invocation.runtime}, {"exit_code", result.exit_code}, {"signal", result.exit_sign}
        , {"output", result.combined_()}}));
    }
    sbx_r r;
    r.output = result.combined_();
    r.exit_code = result.exit_code;
    r.elapsed_ms = result.elapsed_ms_();
    return r;
  }
private:
  // 0 or the posix_spawnp error
  static inline int spawn_(const exe_c& _config, int _out, int _err, pid_t& _pid)
  {
    std::vector<char*> argv;
    argv.reserve(_config.args.size() + 2);
    argv.push_back(const_cast<char*>(_config.cmd.c_str()));
    for (const auto& a : _config.args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    sigset_t reset; // dispositions the child must not inherit from us
    sigemptyset(&reset);
    for (int sig : {SIGPIPE, SIGINT, SIGTERM, SIGHUP}) sigaddset(&reset, sig);
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    posix_spawnattr_setsigdefault(&attr, &reset);
    posix_spawnattr_setpgroup(&attr, 0);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF);
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, _out, STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, _err, STDERR_FILENO);
    if (!_config.dir.empty()) posix_spawn_file_actions_addchdir_np(&actions, _config.dir.c_str());
    int rc = posix_spawnp(&_pid, _config.cmd.c_str(), &actions, &attr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);
    return rc;
  }
  // read both pipes until EOF (or stop), then reap; false = waitpid failed
  static inline bool drain_(const std::stop_token& _stop, int _out, int _err, exe_r& _result)
  {
    struct src_t { int fd; std::string* text; };
    std::vector<src_t> open = {{_out, &_result.stdout_text}, {_err, &_result.stderr_text}};
    for (const auto& s : open) fcntl(s.fd, F_SETFL, fcntl(s.fd, F_GETFL, 0) | O_NONBLOCK);
    char chunk[4096];
    while (!open.empty() && !_stop.stop_requested())
    {
      struct pollfd fds[2];
      for (size_t i = 0; i < open.size(); i++) fds[i] = {open[i].fd, POLLIN, 0};
      int ready = poll(fds, open.size(), 100); // bounded so a stop request is seen
      if (ready < 0 && errno == EINTR) continue;
      if (ready < 0)
      {
        perror("exe_t.drain_(): ---poll---");
        break;
      }
      for (size_t i = open.size(); i-- > 0;)
      {
        if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
        ssize_t n;
        while ((n = read(open[i].fd, chunk, sizeof(chunk))) > 0) open[i].text->append(chunk, static_cast<size_t>(n));
        if (n == 0) open.erase(open.begin() + i); // EOF
        else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
        {
          perror("exe_t.drain_(): ---read---");
          open.erase(open.begin() + i);
        }
      }
    }
    int status = 0;
    pid_t w;
    while ((w = waitpid(_result.pid, &status, 0)) == -1 && errno == EINTR) {}
    _result.finished = std::chrono::steady_clock::now();
    if (w == -1)
    {
      perror("exe_t.drain_(): ---waitpid---");
      return false;
    }
    _result.exit_normal = WIFEXITED(status);
    if (WIFEXITED(status)) _result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) _result.exit_sign = WTERMSIG(status);
    return true;
  }
};
