#include "app/CommandRunner.hpp"
#include "util/Diag.hpp"
#include "util/Text.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

#ifndef _WIN32
#include <sys/wait.h>
#endif

namespace netsnap::app {

#ifdef _WIN32
static FILE* open_pipe(const std::string& cmd) { return ::_popen(cmd.c_str(), "rb"); }
static int close_pipe(FILE* fp) { return ::_pclose(fp); }
#else
static FILE* open_pipe(const std::string& cmd) { return ::popen(cmd.c_str(), "r"); }
static int close_pipe(FILE* fp) { return ::pclose(fp); }
#endif

static std::string nonzero_exit_message(const std::string& command, int code, const std::string& output) {
  std::string msg = "Command '" + command + "' returned non-zero exit status " + std::to_string(code) + ".";
  auto detail = netsnap::util::first_line(output);
  if (!detail.empty()) msg += " " + detail;
  return msg;
}

CommandResult ShellCommandRunner::run(const std::string& command) {
  CommandResult res;
  // Group the whole line so stderr of every command in it is merged.
#ifdef _WIN32
  const std::string wrapped = "(" + command + ") 2>&1";
#else
  const std::string wrapped = "{ " + command + "\n} 2>&1";
#endif
  errno = 0;
  FILE* fp = open_pipe(wrapped);
  if (!fp) {
    res.error = errno ? std::strerror(errno) : std::string("failed to execute command: ") + command;
    netsnap::util::diag("CommandRunner", "spawn failed for '" + command + "': " + res.error);
    return res;
  }

  std::string raw;
  char buf[4096];
  size_t n = 0;
  while ((n = std::fread(buf, 1, sizeof(buf), fp)) > 0) raw.append(buf, n);
  const bool read_failed = std::ferror(fp) != 0;
  const int status = close_pipe(fp);
  res.output = netsnap::util::sanitize_utf8(raw);

  if (status == -1) {
    res.error = std::strerror(errno);
  } else {
#ifdef _WIN32
    res.exit_code = status;
    if (status != 0) res.error = nonzero_exit_message(command, status, res.output);
#else
    if (WIFEXITED(status)) {
      res.exit_code = WEXITSTATUS(status);
      if (res.exit_code != 0) res.error = nonzero_exit_message(command, res.exit_code, res.output);
    } else if (WIFSIGNALED(status)) {
      res.error = "Command '" + command + "' died with signal " + std::to_string(WTERMSIG(status)) + ".";
    } else {
      res.error = "Command '" + command + "' ended with status " + std::to_string(status) + ".";
    }
#endif
  }
  if (res.error.empty() && read_failed) res.error = "read error on output of '" + command + "'";
  res.ok = res.error.empty();

  netsnap::util::diag("CommandRunner", "'" + command + "' exit=" + std::to_string(res.exit_code) +
                      " bytes=" + std::to_string(raw.size()));
  return res;
}

} // namespace netsnap::app
