// Repository: Retrovue-vqexec
// Component: Subprocess Runner
// Purpose: Fork/exec a child, wait for it, and map its status to an exit code.
// Copyright (c) 2026 RetroVue

#include "vqexec/util/Process.hpp"

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include "vqexec/core/Errors.hpp"

namespace vqexec::util {

int RunProcess(const std::vector<std::string>& argv,
               const SpawnObserverFn& on_spawn) {
  if (argv.empty()) {
    throw core::IoError("RunProcess: empty argument vector");
  }

  // Build the exec vector before fork: the child may only call
  // async-signal-safe functions.
  std::vector<char*> exec_argv;
  exec_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    exec_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  exec_argv.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    throw core::IoError(std::string("fork failed: ") + std::strerror(errno));
  }

  if (pid == 0) {
    // Streaming producer threads block SIGPIPE; the tool must not inherit that.
    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);
    signal(SIGPIPE, SIG_DFL);
    execvp(exec_argv[0], exec_argv.data());
    _exit(127);
  }

  if (on_spawn) {
    on_spawn(pid);
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw core::IoError(std::string("waitpid failed: ") + std::strerror(errno));
    }
  }

  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return 1;
}

std::optional<std::string> FindExecutable(const std::string& name) {
  if (name.empty()) return std::nullopt;

  if (name.find('/') != std::string::npos) {
    if (access(name.c_str(), X_OK) == 0) return name;
    return std::nullopt;
  }

  const char* path_env = std::getenv("PATH");
  if (path_env == nullptr) return std::nullopt;

  std::istringstream dirs(path_env);
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    if (dir.empty()) dir = ".";
    const std::string candidate = dir + "/" + name;
    if (access(candidate.c_str(), X_OK) == 0) return candidate;
  }
  return std::nullopt;
}

std::string JoinCommandLine(const std::vector<std::string>& argv) {
  std::ostringstream oss;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i > 0) oss << ' ';
    oss << argv[i];
  }
  return oss.str();
}

}  // namespace vqexec::util
