#include "command_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <system_error>

#include "internal/util/strings.hpp"

namespace kuberoll::exec {

namespace {

class Pipe {
 public:
  Pipe() {
    if (::pipe2(fds_, O_CLOEXEC) != 0) {
      throw std::system_error(errno, std::generic_category(), "pipe2");
    }
  }

  ~Pipe() {
    CloseRead();
    CloseWrite();
  }

  Pipe(const Pipe&)            = delete;
  Pipe& operator=(const Pipe&) = delete;

  int Read() const {
    return fds_[0];
  }

  int Write() const {
    return fds_[1];
  }

  void CloseRead() {
    if (fds_[0] >= 0) ::close(fds_[0]);
    fds_[0] = -1;
  }

  void CloseWrite() {
    if (fds_[1] >= 0) ::close(fds_[1]);
    fds_[1] = -1;
  }

 private:
  int fds_[2]{-1, -1};
};

std::string ErrnoText(const char* what) {
  return std::string(what) + ": " + std::strerror(errno) + "\n";
}

void SetNonBlocking(int fd) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

[[noreturn]] void ExecChild(const Command& command, Pipe& in, Pipe& out, Pipe& err) {
  ::dup2(in.Read(), STDIN_FILENO);
  ::dup2(out.Write(), STDOUT_FILENO);
  ::dup2(err.Write(), STDERR_FILENO);

  std::vector<char*> argv;
  argv.reserve(command.argv.size() + 1);
  for (const auto& arg : command.argv) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  ::execvp(argv[0], argv.data());

  const auto message = ErrnoText(argv[0]);
  (void)::write(STDERR_FILENO, message.data(), message.size());
  ::_exit(127);
}

constexpr std::string_view kEmptyListingNotice = "No resources found";

} // namespace

bool CommandResult::Failed() const {
  if (exit_code != 0) return true;

  for (const auto& line : util::SplitLines(stderr_text)) {
    if (line.empty() || util::StartsWith(line, kEmptyListingNotice)) continue;
    return true;
  }
  return false;
}

std::string Command::ToString() const {
  std::ostringstream out;
  for (std::size_t i = 0; i < argv.size(); ++i) {
    if (i > 0) out << ' ';
    out << argv[i];
  }
  return out.str();
}

ProcessCommandRunner::ProcessCommandRunner() {
  ::signal(SIGPIPE, SIG_IGN);
}

CommandResult ProcessCommandRunner::Run(const Command& command) {
  if (command.argv.empty()) {
    throw std::invalid_argument("empty command");
  }

  CommandResult result;

  Pipe in;
  Pipe out;
  Pipe err;

  const pid_t pid = ::fork();
  if (pid < 0) {
    result.exit_code   = 127;
    result.stderr_text = ErrnoText("fork");
    return result;
  }
  if (pid == 0) {
    ExecChild(command, in, out, err);
  }

  in.CloseRead();
  out.CloseWrite();
  err.CloseWrite();

  if (command.stdin_data.empty()) {
    in.CloseWrite();
  } else {
    SetNonBlocking(in.Write());
  }

  std::size_t            written = 0;
  std::array<char, 4096> buffer{};
  bool                   out_open = true;
  bool                   err_open = true;

  while (out_open || err_open) {
    std::array<pollfd, 3> fds{};
    nfds_t                count = 0;
    if (out_open) fds[count++] = {out.Read(), POLLIN, 0};
    if (err_open) fds[count++] = {err.Read(), POLLIN, 0};
    if (in.Write() >= 0) fds[count++] = {in.Write(), POLLOUT, 0};

    if (::poll(fds.data(), count, -1) < 0) {
      if (errno == EINTR) continue;
      result.stderr_text += ErrnoText("poll");
      break;
    }

    for (nfds_t i = 0; i < count; ++i) {
      if (fds[i].revents == 0) continue;

      if (fds[i].fd == in.Write()) {
        if (fds[i].revents & (POLLERR | POLLHUP)) {
          in.CloseWrite();
          continue;
        }
        const auto n = ::write(in.Write(), command.stdin_data.data() + written, command.stdin_data.size() - written);
        if (n > 0) written += static_cast<std::size_t>(n);
        if ((n < 0 && errno != EAGAIN && errno != EINTR) || written == command.stdin_data.size()) {
          in.CloseWrite();
        }
        continue;
      }

      const bool   is_out = fds[i].fd == out.Read();
      std::string& sink   = is_out ? result.stdout_text : result.stderr_text;
      const auto   n      = ::read(fds[i].fd, buffer.data(), buffer.size());
      if (n > 0) {
        sink.append(buffer.data(), static_cast<std::size_t>(n));
      } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        if (is_out) {
          out_open = false;
          out.CloseRead();
        } else {
          err_open = false;
          err.CloseRead();
        }
      }
    }
  }
  in.CloseWrite();

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      result.exit_code = 127;
      result.stderr_text += ErrnoText("waitpid");
      return result;
    }
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

} // namespace kuberoll::exec
