// Repository: Retrovue-vqexec
// Component: Subprocess Runner
// Purpose: fork/exec/wait for external tools (transcoder). No shell involved.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_UTIL_PROCESS_HPP_
#define VQEXEC_UTIL_PROCESS_HPP_

#include <sys/types.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace vqexec::util {

// Invoked in the parent right after fork() with the child's pid, before the
// wait. Lets a supervisor record the pid for termination.
using SpawnObserverFn = std::function<void(pid_t pid)>;

// Runs argv[0] (PATH-resolved) with the given arguments and blocks until it
// exits. Returns the exit code, or 128 + signal number if it was killed.
// An exec failure in the child is reported as exit code 127.
// Throws core::IoError if fork/wait itself fails.
int RunProcess(const std::vector<std::string>& argv,
               const SpawnObserverFn& on_spawn = nullptr);

// Resolves `name` to an executable path. Names containing '/' are checked
// directly; bare names are searched on PATH.
std::optional<std::string> FindExecutable(const std::string& name);

// Renders argv as a single shell-like line for logging only.
std::string JoinCommandLine(const std::vector<std::string>& argv);

}  // namespace vqexec::util

#endif  // VQEXEC_UTIL_PROCESS_HPP_
