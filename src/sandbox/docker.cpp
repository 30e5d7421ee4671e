#include "shellwarden/sandbox/docker.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace shellwarden::sandbox {

namespace {

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

// Returns false once the write end is closed.
bool read_into_buffer(const int fd, std::string &buffer) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    if (bytes < 0 && errno == EINTR) {
      continue;
    }
    if (bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      return true;
    }
    return false;
  }
}

} // namespace

std::string join_docker_args(const std::vector<std::string> &args) {
  std::string out = "docker";
  for (const auto &arg : args) {
    out.push_back(' ');
    out += arg;
  }
  return out;
}

common::Result<DockerProcessResult>
DockerCliRunner::run(const std::vector<std::string> &args, const DockerCommandOptions &options) {
  if (args.empty()) {
    return common::Result<DockerProcessResult>::failure("docker command is empty");
  }

  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
    close_fd(stdout_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[0]);
    close_fd(stderr_pipe[1]);
    return common::Result<DockerProcessResult>::failure("failed to create pipes for docker");
  }

  std::vector<char *> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char *>(binary_.c_str()));
  for (const auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    close_fd(stdout_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[0]);
    close_fd(stderr_pipe[1]);
    return common::Result<DockerProcessResult>::failure("failed to fork docker process");
  }

  if (pid == 0) {
    (void)dup2(stdout_pipe[1], STDOUT_FILENO);
    (void)dup2(stderr_pipe[1], STDERR_FILENO);
    close(stdout_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[0]);
    close(stderr_pipe[1]);
    const int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      (void)dup2(devnull, STDIN_FILENO);
      close(devnull);
    }

    execvp(argv[0], argv.data());
    _exit(127);
  }

  close_fd(stdout_pipe[1]);
  close_fd(stderr_pipe[1]);
  set_non_blocking(stdout_pipe[0]);
  set_non_blocking(stderr_pipe[0]);

  DockerProcessResult result;
  int status = 0;
  bool exited = false;
  bool stdout_open = true;
  bool stderr_open = true;
  const auto started = std::chrono::steady_clock::now();

  while (!exited) {
    if (stdout_open) {
      stdout_open = read_into_buffer(stdout_pipe[0], result.stdout_text);
    }
    if (stderr_open) {
      stderr_open = read_into_buffer(stderr_pipe[0], result.stderr_text);
    }

    if (waitpid(pid, &status, WNOHANG) == pid) {
      exited = true;
      // Grandchildren may keep the pipes open; drain what is buffered and stop.
      (void)read_into_buffer(stdout_pipe[0], result.stdout_text);
      (void)read_into_buffer(stderr_pipe[0], result.stderr_text);
      break;
    }

    if (options.timeout.has_value() &&
        std::chrono::steady_clock::now() - started > *options.timeout) {
      result.timed_out = true;
      (void)kill(pid, SIGKILL);
      (void)waitpid(pid, &status, 0);
      exited = true;
      break;
    }

    struct pollfd poll_fds[2] = {
        {.fd = stdout_open ? stdout_pipe[0] : -1, .events = POLLIN, .revents = 0},
        {.fd = stderr_open ? stderr_pipe[0] : -1, .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 50);
  }

  close_fd(stdout_pipe[0]);
  close_fd(stderr_pipe[0]);

  result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  if (result.timed_out) {
    result.exit_code = -1;
    if (!options.allow_failure) {
      return common::Result<DockerProcessResult>::failure("docker command timed out: " +
                                                           join_docker_args(args));
    }
  }

  if (result.exit_code != 0 && !options.allow_failure) {
    const std::string message = result.stderr_text.empty()
                                    ? "docker command failed: " + join_docker_args(args)
                                    : result.stderr_text;
    return common::Result<DockerProcessResult>::failure(message);
  }

  return common::Result<DockerProcessResult>::success(std::move(result));
}

} // namespace shellwarden::sandbox
