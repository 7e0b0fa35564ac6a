#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <sstream>

#include <processrunner.hxx>

extern char **environ;

using namespace pgdumpctl;

/* ****************************************************************************
 * ProcessCommand
 * ****************************************************************************/

void ProcessCommand::configure(std::shared_ptr<RuntimeConfiguration> rtc) {

  if (rtc == nullptr)
    return;

  this->timeout = rtc->getInt("process.timeout");
  this->killGrace = rtc->getInt("process.kill_grace");
  this->stderrTailBytes = (size_t) rtc->getInt("process.stderr_tail_kb") * 1024;

}

std::string ProcessCommand::commandLine() const {

  std::ostringstream cmd;

  cmd << this->executable;

  for (auto const &arg : this->args) {
    cmd << " " << arg;
  }

  return cmd.str();

}

/* ****************************************************************************
 * OutputTail
 * ****************************************************************************/

OutputTail::OutputTail(size_t capacity) : buffer(capacity) {}

OutputTail::~OutputTail() {}

void OutputTail::append(const char *data, size_t len) {

  if (this->buffer.capacity() == 0)
    return;

  for (size_t i = 0; i < len; i++) {

    if (this->buffer.full())
      this->truncated = true;

    this->buffer.push_back(data[i]);

  }

}

std::string OutputTail::str() const {

  return std::string(this->buffer.begin(), this->buffer.end());

}

bool OutputTail::wasTruncated() const {

  return this->truncated;

}

/* ****************************************************************************
 * ProcessRunner
 * ****************************************************************************/

ProcessRunner::ProcessRunner() {}

ProcessRunner::~ProcessRunner() {}

/* ****************************************************************************
 * LocalProcessRunner
 * ****************************************************************************/

/*
 * Reads everything currently available from the non-blocking
 * descriptor. Returns false once the write end was closed.
 */
static bool drain_fd(int fd, std::string &linebuf,
                     OutputTail *tail, process_progress_sink progress) {

  char buf[4096];

  while (true) {

    ssize_t n = ::read(fd, buf, sizeof(buf));

    if (n > 0) {

      if (tail != nullptr) {
        tail->append(buf, (size_t) n);
        continue;
      }

      if (progress == nullptr)
        continue;

      linebuf.append(buf, (size_t) n);

      size_t pos;
      while ((pos = linebuf.find('\n')) != std::string::npos) {
        progress(linebuf.substr(0, pos));
        linebuf.erase(0, pos + 1);
      }

      continue;

    }

    if (n == 0)
      return false;

    if (errno == EINTR)
      continue;

    if (errno == EAGAIN || errno == EWOULDBLOCK)
      return true;

    BOOST_LOG_TRIVIAL(warning) << "error reading child output: " << strerror(errno);
    return false;

  }

}

static void close_fd(int &fd) {

  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }

}

LocalProcessRunner::LocalProcessRunner() : ProcessRunner() {}

LocalProcessRunner::~LocalProcessRunner() {}

void LocalProcessRunner::reportMissing(std::string executable) {

  std::lock_guard<std::mutex> guard(this->reported_mutex);

  if (this->reported_missing.insert(executable).second) {
    BOOST_LOG_TRIVIAL(error) << "executable \"" << executable
                             << "\" not found, check PATH or the binary settings";
  }

}

OperationResult LocalProcessRunner::run(ProcessCommand &command,
                                        JobSignalHandler *cancel) {

  OperationResult result;
  std::chrono::steady_clock::time_point start = CPGDumpCtlBase::current_hires_time_point();
  boost::filesystem::path exe;
  std::vector<std::string> argv_store;
  std::vector<std::string> envp_store;
  std::vector<char *> argv;
  std::vector<char *> envp;
  int pipe_out[2] = { -1, -1 };
  int pipe_err[2] = { -1, -1 };
  pid_t pid;

  result.started = std::time(NULL);

  /*
   * A missing executable is detected here, before anything
   * is forked.
   */
  exe = CPGDumpCtlBase::resolve_file_path(command.executable);

  if (exe.empty()) {

    reportMissing(command.executable);

    result = OperationResult::failure(OPERR_PROCESS_FAILED,
                                      "executable not found: " + command.executable);
    result.started = std::time(NULL);
    return result;

  }

  /*
   * Build argument and environment arrays before fork(), the
   * child must not allocate anything.
   */
  argv_store.push_back(exe.string());
  argv_store.insert(argv_store.end(), command.args.begin(), command.args.end());

  for (char **env = environ; env != NULL && *env != NULL; env++) {

    std::string entry(*env);
    std::string name = entry.substr(0, entry.find('='));

    if (command.environment.find(name) != command.environment.end())
      continue;

    envp_store.push_back(entry);

  }

  for (auto const &var : command.environment) {
    envp_store.push_back(var.first + "=" + var.second);
  }

  for (auto &arg : argv_store)
    argv.push_back(const_cast<char *>(arg.c_str()));
  argv.push_back(NULL);

  for (auto &env : envp_store)
    envp.push_back(const_cast<char *>(env.c_str()));
  envp.push_back(NULL);

  if (::pipe2(pipe_out, O_CLOEXEC) < 0) {
    std::ostringstream oss;
    oss << "failed to initialize output pipe: " << strerror(errno);
    throw CProcessFailure(oss.str());
  }

  if (::pipe2(pipe_err, O_CLOEXEC) < 0) {
    std::ostringstream oss;
    oss << "failed to initialize error pipe: " << strerror(errno);
    close_fd(pipe_out[0]);
    close_fd(pipe_out[1]);
    throw CProcessFailure(oss.str());
  }

  BOOST_LOG_TRIVIAL(debug) << "executing " << command.commandLine();

  if ((pid = fork()) == (pid_t) 0) {

    /*
     * Child. Own process group, so a terminal interrupt reaches
     * the supervising parent only, which then decides about
     * cancellation.
     */
    sigset_t empty;
    int devnull;

    ::setpgid(0, 0);

    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, NULL);
    signal(SIGPIPE, SIG_DFL);
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);

    if ((devnull = ::open("/dev/null", O_RDONLY)) >= 0) {
      dup2(devnull, STDIN_FILENO);
    }

    if (dup2(pipe_out[1], STDOUT_FILENO) != STDOUT_FILENO)
      _exit(127);

    if (dup2(pipe_err[1], STDERR_FILENO) != STDERR_FILENO)
      _exit(127);

    ::execve(argv[0], argv.data(), envp.data());

    /* only reached if execve() failed */
    {
      const char *msg = "could not execute ";
      ssize_t rc;

      rc = ::write(STDERR_FILENO, msg, strlen(msg));
      rc = ::write(STDERR_FILENO, argv[0], strlen(argv[0]));
      rc = ::write(STDERR_FILENO, "\n", 1);
      (void) rc;
    }

    _exit(127);

  } else if (pid < (pid_t) 0) {

    std::ostringstream oss;

    oss << "fork() failed: " << strerror(errno);

    close_fd(pipe_out[0]);
    close_fd(pipe_out[1]);
    close_fd(pipe_err[0]);
    close_fd(pipe_err[1]);

    throw CProcessFailure(oss.str());

  }

  /*
   * Parent. Close the write ends, otherwise we'd never see
   * EOF on the pipes.
   */
  close_fd(pipe_out[1]);
  close_fd(pipe_err[1]);

  fcntl(pipe_out[0], F_SETFL, fcntl(pipe_out[0], F_GETFL) | O_NONBLOCK);
  fcntl(pipe_err[0], F_SETFL, fcntl(pipe_err[0], F_GETFL) | O_NONBLOCK);

  OutputTail tail(command.stderrTailBytes);
  std::string linebuf;
  std::string errbuf;
  bool exited = false;
  bool stop_requested = false;
  bool killed = false;
  bool timed_out = false;
  int status = 0;
  std::chrono::steady_clock::time_point term_sent;

  try {

    while (!exited) {

      struct pollfd fds[2];
      nfds_t nfds = 0;

      if (pipe_out[0] >= 0) {
        fds[nfds].fd = pipe_out[0];
        fds[nfds].events = POLLIN;
        fds[nfds].revents = 0;
        nfds++;
      }

      if (pipe_err[0] >= 0) {
        fds[nfds].fd = pipe_err[0];
        fds[nfds].events = POLLIN;
        fds[nfds].revents = 0;
        nfds++;
      }

      if (nfds > 0) {

        if (::poll(fds, nfds, poll_interval_ms) < 0 && errno != EINTR) {
          std::ostringstream oss;
          oss << "poll() on child output failed: " << strerror(errno);
          throw CProcessFailure(oss.str());
        }

        for (nfds_t i = 0; i < nfds; i++) {

          if (fds[i].revents == 0)
            continue;

          if (fds[i].fd == pipe_out[0]) {
            if (!drain_fd(pipe_out[0], linebuf, nullptr, command.progress))
              close_fd(pipe_out[0]);
          } else {
            if (!drain_fd(pipe_err[0], errbuf, &tail, nullptr))
              close_fd(pipe_err[0]);
          }

        }

      } else {

        /* both pipes closed, but the child is still there */
        usleep(poll_interval_ms * 1000);

      }

      pid_t rc = ::waitpid(pid, &status, WNOHANG);

      if (rc == pid) {
        exited = true;
        break;
      }

      if (rc < 0 && errno != EINTR) {
        std::ostringstream oss;
        oss << "waitpid() for child " << pid << " failed: " << strerror(errno);
        throw CProcessFailure(oss.str());
      }

      std::chrono::steady_clock::time_point now = CPGDumpCtlBase::current_hires_time_point();

      if (!stop_requested) {

        if (cancellation_requested(cancel)) {

          BOOST_LOG_TRIVIAL(info) << "cancelling " << command.executable
                                  << " (pid " << pid << ")";
          stop_requested = true;

        } else if (command.timeout > 0
                   && CPGDumpCtlBase::calculate_duration_ms(start, now).count()
                      >= (long long) command.timeout * 1000) {

          BOOST_LOG_TRIVIAL(warning) << command.executable << " (pid " << pid
                                     << ") exceeded timeout of "
                                     << command.timeout << " seconds";
          stop_requested = true;
          timed_out = true;

        }

        if (stop_requested) {
          ::kill(pid, SIGTERM);
          term_sent = now;
        }

      } else if (!killed
                 && CPGDumpCtlBase::calculate_duration_ms(term_sent, now).count()
                    >= (long long) command.killGrace * 1000) {

        BOOST_LOG_TRIVIAL(warning) << command.executable << " (pid " << pid
                                   << ") ignored SIGTERM, sending SIGKILL";
        ::kill(pid, SIGKILL);
        killed = true;

      }

    }

    /*
     * Pick up whatever the child wrote before it exited. Don't
     * wait for EOF here, a grandchild could still hold the pipes.
     */
    if (pipe_out[0] >= 0)
      drain_fd(pipe_out[0], linebuf, nullptr, command.progress);

    if (pipe_err[0] >= 0)
      drain_fd(pipe_err[0], errbuf, &tail, nullptr);

    if (command.progress != nullptr && !linebuf.empty())
      command.progress(linebuf);

  } catch (...) {

    /* don't leave an unsupervised child behind */
    if (!exited) {
      ::kill(pid, SIGKILL);
      while (::waitpid(pid, &status, 0) < 0 && errno == EINTR);
    }

    close_fd(pipe_out[0]);
    close_fd(pipe_err[0]);

    throw;

  }

  close_fd(pipe_out[0]);
  close_fd(pipe_err[0]);

  result.durationMs = CPGDumpCtlBase::duration_get_ms(
    CPGDumpCtlBase::calculate_duration_ms(start, CPGDumpCtlBase::current_hires_time_point()));
  result.stderrTail = tail.str();

  if (WIFEXITED(status)) {
    result.exitCode = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exitCode = 128 + WTERMSIG(status);
  }

  if (stop_requested) {

    result.status = OPERATION_CANCELLED;
    result.error = OPERR_CANCELLED;

    if (timed_out) {
      std::ostringstream oss;
      oss << command.executable << " timed out after " << command.timeout << " seconds";
      result.message = oss.str();
    } else {
      result.message = command.executable + " cancelled";
    }

  } else if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {

    result.status = OPERATION_SUCCEEDED;
    result.error = OPERR_NONE;

  } else {

    std::ostringstream oss;

    result.status = OPERATION_FAILED;
    result.error = OPERR_PROCESS_FAILED;

    if (WIFSIGNALED(status)) {
      oss << command.executable << " terminated by signal " << WTERMSIG(status);
    } else {
      oss << command.executable << " exited with code " << result.exitCode;
    }

    result.message = oss.str();

  }

  BOOST_LOG_TRIVIAL(debug) << command.executable << " (pid " << pid << ") finished: "
                           << OperationResult::statusName(result.status)
                           << ", exit code " << result.exitCode
                           << ", " << result.durationMs << " ms";

  return result;

}
