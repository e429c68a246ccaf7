#include "ollacode/tools/builtin.hpp"

#include "ollacode/common/fs.hpp"
#include "ollacode/common/utf8.hpp"
#include "ollacode/tools/tool_kind.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace ollacode::tools::builtin {

namespace {

constexpr std::size_t kMaxCapturedBytes = 1024 * 1024;
constexpr std::size_t kMaxStdoutChars = 1500;
constexpr std::size_t kMaxStderrChars = 800;

constexpr std::array<std::string_view, 5> kDangerousPatterns = {"rm -rf /", "mkfs", "dd if=",
                                                                ":(){ ", "fork bomb"};

struct ProcessOutput {
  std::string out;
  std::string err;
  int exit_code = 0;
  bool timed_out = false;
};

void append_capped(std::string &target, const char *data, const std::size_t size) {
  const std::size_t remaining =
      kMaxCapturedBytes > target.size() ? kMaxCapturedBytes - target.size() : 0;
  target.append(data, std::min(remaining, size));
}

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

/// Run `command` through /bin/sh in its own process group with stdin closed.
/// On timeout the whole group is killed.
common::Result<ProcessOutput> run_process(const std::string &command,
                                          const std::filesystem::path &cwd,
                                          const std::chrono::seconds timeout) {
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (pipe(out_pipe) != 0) {
    return common::Result<ProcessOutput>::failure(std::strerror(errno));
  }
  if (pipe(err_pipe) != 0) {
    const int saved = errno;
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    return common::Result<ProcessOutput>::failure(std::strerror(saved));
  }

  const pid_t pid = fork();
  if (pid < 0) {
    const int saved = errno;
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
    return common::Result<ProcessOutput>::failure(std::strerror(saved));
  }

  if (pid == 0) {
    setpgid(0, 0);
    const int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
      dup2(null_fd, STDIN_FILENO);
      close(null_fd);
    }
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);
    if (chdir(cwd.c_str()) != 0) {
      _exit(126);
    }
    execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char *>(nullptr));
    _exit(127);
  }

  setpgid(pid, pid);
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);

  ProcessOutput output;
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::array<char, 4096> buffer{};

  while (out_pipe[0] >= 0 || err_pipe[0] >= 0) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      output.timed_out = true;
      break;
    }
    const auto wait_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();

    std::array<pollfd, 2> fds{{
        {.fd = out_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = err_pipe[0], .events = POLLIN, .revents = 0},
    }};
    const int ready =
        poll(fds.data(), fds.size(), static_cast<int>(std::min<long long>(wait_ms, 100)));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }

    for (std::size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }
      int &fd = i == 0 ? out_pipe[0] : err_pipe[0];
      std::string &target = i == 0 ? output.out : output.err;
      const ssize_t bytes = read(fd, buffer.data(), buffer.size());
      if (bytes > 0) {
        append_capped(target, buffer.data(), static_cast<std::size_t>(bytes));
      } else if (bytes == 0 || errno != EINTR) {
        close_fd(fd);
      }
    }
  }

  close_fd(out_pipe[0]);
  close_fd(err_pipe[0]);

  // The child may outlive its pipes (output redirected to a file), so the
  // deadline still applies while waiting for it to exit.
  int status = 0;
  bool reaped = false;
  while (!output.timed_out) {
    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      reaped = true;
      break;
    }
    if (waited < 0 && errno != EINTR) {
      break;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      output.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }

  if (output.timed_out) {
    kill(-pid, SIGKILL);
  }
  if (!reaped) {
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
  }
  if (WIFEXITED(status)) {
    output.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    output.exit_code = -WTERMSIG(status);
  }
  return common::Result<ProcessOutput>::success(std::move(output));
}

std::string strip(const std::string &text) {
  return common::trim(common::utf8_sanitize(text));
}

std::string cap_chars(const std::string &text, const std::size_t limit, const char *notice) {
  if (common::utf8_length(text) <= limit) {
    return text;
  }
  return common::utf8_prefix(text, limit) + notice;
}

} // namespace

ToolResult run_command(const ToolContext &ctx, const ToolParams &params) {
  const std::string command = param_or(params, "command");
  if (command.empty()) {
    return ToolResult::failure("No command provided.");
  }

  const std::string lowered = common::to_lower(command);
  for (const auto pattern : kDangerousPatterns) {
    if (lowered.find(pattern) != std::string::npos) {
      return ToolResult::failure("Dangerous command detected: " + command);
    }
  }

  const std::string description = "⚙️ Run command: `" + command + "`";
  if (!consult(ctx.gate, std::string(tool_kind_name(ToolKind::RunCommand)), description)) {
    return ToolResult::skip("User rejected command execution.");
  }

  auto result = run_process(command, ctx.workspace.root(), ctx.command_timeout);
  if (!result.ok()) {
    return ToolResult::failure("Command failed: " + result.error());
  }
  const auto &output = result.value();
  if (output.timed_out) {
    return ToolResult::failure("Command timed out (" + std::to_string(ctx.command_timeout.count()) +
                               "s): " + command);
  }

  std::string text = "⚙️ `" + command + "` (exit code: " + std::to_string(output.exit_code) + ")";
  const std::string out = strip(output.out);
  if (!out.empty()) {
    text += "\n```\n" + cap_chars(out, kMaxStdoutChars, "\n... (output truncated)") + "\n```";
  }
  const std::string err = strip(output.err);
  if (!err.empty()) {
    text += "\n**stderr:**\n```\n" + cap_chars(err, kMaxStderrChars, "\n... (stderr truncated)") +
            "\n```";
  }
  return ToolResult::success(std::move(text));
}

} // namespace ollacode::tools::builtin
