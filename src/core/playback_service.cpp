#include "playback_service.h"

#include <errno.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <sstream>

#include "clock.h"
#include "log.h"

namespace {

constexpr int kStopPollAttempts = 50;
constexpr unsigned long kStopPollMs = 10;

bool isExecutable(const std::string &path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
         ::access(path.c_str(), X_OK) == 0;
}

bool resolveOnPath(const std::string &binary) {
  if (binary.empty()) {
    return false;
  }
  if (binary.find('/') != std::string::npos) {
    return isExecutable(binary);
  }

  const char *pathEnv = getenv("PATH");
  if (!pathEnv) {
    return false;
  }
  std::stringstream dirs(pathEnv);
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    if (dir.empty()) {
      dir = ".";
    }
    if (isExecutable(dir + "/" + binary)) {
      return true;
    }
  }
  return false;
}

}  // namespace

std::vector<std::string> splitCommandLine(const std::string &command) {
  std::vector<std::string> parts;
  std::stringstream in(command);
  std::string part;
  while (in >> part) {
    parts.push_back(part);
  }
  return parts;
}

ProcessPlaybackService::ProcessPlaybackService(const std::string &command)
    : argv_(splitCommandLine(command)) {}

ProcessPlaybackService::~ProcessPlaybackService() {
  stop();
}

bool ProcessPlaybackService::load(const std::string &path, std::string *error) {
  if (access(path.c_str(), R_OK) != 0) {
    if (error) {
      *error = path + ": " + strerror(errno);
    }
    return false;
  }
  track_ = path;
  return true;
}

bool ProcessPlaybackService::play(std::string *error) {
  stop();
  if (track_.empty()) {
    if (error) {
      *error = "no track loaded";
    }
    return false;
  }
  if (argv_.empty()) {
    if (error) {
      *error = "player command is empty";
    }
    return false;
  }

  std::vector<char *> args;
  args.reserve(argv_.size() + 2);
  for (size_t i = 0; i < argv_.size(); ++i) {
    args.push_back(const_cast<char *>(argv_[i].c_str()));
  }
  args.push_back(const_cast<char *>(track_.c_str()));
  args.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    if (error) {
      *error = std::string("fork failed: ") + strerror(errno);
    }
    return false;
  }
  if (pid == 0) {
    setpgid(0, 0);
    execvp(args[0], args.data());
    _exit(127);
  }

  child_ = pid;
  paused_ = false;
  failed_ = false;
  logPrintf("[audio] playing %s (pid=%d)\n", track_.c_str(), static_cast<int>(pid));
  return true;
}

void ProcessPlaybackService::pause() {
  if (child_ > 0 && !paused_ && kill(child_, SIGSTOP) == 0) {
    paused_ = true;
  }
}

void ProcessPlaybackService::unpause() {
  if (child_ > 0 && paused_ && kill(child_, SIGCONT) == 0) {
    paused_ = false;
  }
}

void ProcessPlaybackService::stop() {
  if (child_ <= 0) {
    return;
  }

  stopping_ = true;
  if (paused_) {
    kill(child_, SIGCONT);
    paused_ = false;
  }
  kill(child_, SIGTERM);
  for (int i = 0; i < kStopPollAttempts; ++i) {
    if (reap(false)) {
      stopping_ = false;
      return;
    }
    delayMs(kStopPollMs);
  }

  logErrorf("[audio] player pid=%d ignored SIGTERM, killing\n", static_cast<int>(child_));
  kill(child_, SIGKILL);
  reap(true);
  stopping_ = false;
}

bool ProcessPlaybackService::isBusy() {
  if (child_ <= 0) {
    return false;
  }
  if (reap(false)) {
    return false;
  }
  return !paused_;
}

// True once the child is gone.
bool ProcessPlaybackService::reap(bool block) {
  if (child_ <= 0) {
    return true;
  }
  int status = 0;
  const pid_t rc = waitpid(child_, &status, block ? 0 : WNOHANG);
  if (rc == 0) {
    return false;
  }
  if (rc < 0 && errno != ECHILD) {
    return false;
  }
  if (rc > 0 && !stopping_) {
    if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
      logErrorf("[audio] player \"%s\" could not be started\n", argv_[0].c_str());
      failed_ = true;
    } else if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
      logErrorf("[audio] player exited with status %d on %s\n", WEXITSTATUS(status),
                track_.c_str());
      failed_ = true;
    } else if (WIFSIGNALED(status)) {
      logErrorf("[audio] player killed by signal %d on %s\n", WTERMSIG(status), track_.c_str());
      failed_ = true;
    }
  }
  child_ = -1;
  paused_ = false;
  return true;
}

bool NullPlaybackService::load(const std::string &path, std::string *error) {
  (void)path;
  if (error) {
    *error = "audio disabled";
  }
  return false;
}

bool NullPlaybackService::play(std::string *error) {
  if (error) {
    *error = "audio disabled";
  }
  return false;
}

std::unique_ptr<PlaybackService> makePlaybackService(const std::string &command) {
  const std::vector<std::string> parts = splitCommandLine(command);
  if (!parts.empty() && resolveOnPath(parts[0])) {
    logPrintf("[audio] player=%s\n", command.c_str());
    return std::unique_ptr<PlaybackService>(new ProcessPlaybackService(command));
  }

  logErrorf("[audio] player \"%s\" not found, audio disabled\n", command.c_str());
  return std::unique_ptr<PlaybackService>(new NullPlaybackService());
}
