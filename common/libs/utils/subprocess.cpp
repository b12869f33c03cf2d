/*
 * Copyright (C) 2018 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "common/libs/utils/subprocess.h"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/prctl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <map>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/strings.h>
#include <android-base/unique_fd.h>

extern char** environ;

namespace looplab {
namespace {

void DoRedirects(
    const std::map<Subprocess::StdIOChannel, android::base::unique_fd>&
        redirects) {
  for (const auto& entry : redirects) {
    auto std_channel = static_cast<int>(entry.first);
    TEMP_FAILURE_RETRY(dup2(entry.second.get(), std_channel));
  }
}

std::vector<const char*> ToCharPointers(const std::vector<std::string>& vect) {
  std::vector<const char*> ret = {};
  for (const auto& str : vect) {
    ret.push_back(str.c_str());
  }
  ret.push_back(NULL);
  return ret;
}

std::vector<std::string> CurrentEnvironment() {
  std::vector<std::string> env;
  for (char** var = environ; var && *var; var++) {
    env.emplace_back(*var);
  }
  return env;
}

}  // namespace

Subprocess::Subprocess(Subprocess&& subprocess)
    : pid_(subprocess.pid_), started_(subprocess.started_) {
  // Make sure the moved object no longer controls this subprocess
  subprocess.pid_ = -1;
  subprocess.started_ = false;
}

Subprocess& Subprocess::operator=(Subprocess&& other) {
  pid_ = other.pid_;
  started_ = other.started_;

  other.pid_ = -1;
  other.started_ = false;
  return *this;
}

int Subprocess::Wait() {
  if (pid_ < 0) {
    LOG(ERROR)
        << "Attempt to wait on invalid pid(has it been waited on already?): "
        << pid_;
    return -1;
  }
  int wstatus = 0;
  auto pid = pid_;  // Wait will set pid_ to -1 after waiting
  auto wait_ret = Wait(&wstatus, 0);
  if (wait_ret < 0) {
    PLOG(ERROR) << "Error on call to waitpid";
    return wait_ret;
  }
  int retval = 0;
  if (WIFEXITED(wstatus)) {
    retval = WEXITSTATUS(wstatus);
    if (retval) {
      LOG(DEBUG) << "Subprocess " << pid
                 << " exited with error code: " << retval;
    }
  } else if (WIFSIGNALED(wstatus)) {
    LOG(ERROR) << "Subprocess " << pid
               << " was interrupted by a signal: " << WTERMSIG(wstatus);
    retval = -1;
  }
  return retval;
}

pid_t Subprocess::Wait(int* wstatus, int options) {
  if (pid_ < 0) {
    LOG(ERROR)
        << "Attempt to wait on invalid pid(has it been waited on already?): "
        << pid_;
    return -1;
  }
  auto retval = TEMP_FAILURE_RETRY(waitpid(pid_, wstatus, options));
  // We don't want to wait twice for the same process
  pid_ = -1;
  return retval;
}

SubprocessOptions& SubprocessOptions::Verbose(bool verbose) & {
  verbose_ = verbose;
  return *this;
}
SubprocessOptions SubprocessOptions::Verbose(bool verbose) && {
  verbose_ = verbose;
  return *this;
}

SubprocessOptions& SubprocessOptions::ExitWithParent(bool v) & {
  exit_with_parent_ = v;
  return *this;
}
SubprocessOptions SubprocessOptions::ExitWithParent(bool v) && {
  exit_with_parent_ = v;
  return *this;
}

SubprocessOptions& SubprocessOptions::InGroup(bool in_group) & {
  in_group_ = in_group;
  return *this;
}
SubprocessOptions SubprocessOptions::InGroup(bool in_group) && {
  in_group_ = in_group;
  return *this;
}

Command::Command(std::string executable)
    : command_({std::move(executable)}), env_(CurrentEnvironment()) {}

Command& Command::RedirectStdIO(Subprocess::StdIOChannel channel,
                                android::base::unique_fd fd) & {
  CHECK(fd.get() >= 0) << "Redirect of channel " << static_cast<int>(channel)
                       << " to a closed file descriptor";
  CHECK(!redirects_.count(channel))
      << "Attempted multiple redirections of fd: " << static_cast<int>(channel);
  redirects_[channel] = std::move(fd);
  return *this;
}
Command Command::RedirectStdIO(Subprocess::StdIOChannel channel,
                               android::base::unique_fd fd) && {
  RedirectStdIO(channel, std::move(fd));
  return std::move(*this);
}

Command& Command::RedirectStdIO(Subprocess::StdIOChannel subprocess_channel,
                                Subprocess::StdIOChannel parent_channel) & {
  android::base::unique_fd dup_fd(
      fcntl(static_cast<int>(parent_channel), F_DUPFD_CLOEXEC, 3));
  PCHECK(dup_fd.get() >= 0) << "Could not duplicate parent channel "
                            << static_cast<int>(parent_channel);
  return RedirectStdIO(subprocess_channel, std::move(dup_fd));
}
Command Command::RedirectStdIO(Subprocess::StdIOChannel subprocess_channel,
                               Subprocess::StdIOChannel parent_channel) && {
  RedirectStdIO(subprocess_channel, parent_channel);
  return std::move(*this);
}

Command& Command::SetWorkingDirectory(const std::string& path) & {
  working_directory_ = path;
  return *this;
}
Command Command::SetWorkingDirectory(const std::string& path) && {
  return std::move(SetWorkingDirectory(path));
}

Subprocess Command::Start(SubprocessOptions options) const {
  auto cmd = ToCharPointers(command_);
  auto envp = ToCharPointers(env_);

  pid_t pid = fork();
  if (!pid) {
    if (options.ExitWithParent()) {
      prctl(PR_SET_PDEATHSIG, SIGHUP);  // Die when parent dies
    }

    DoRedirects(redirects_);
    if (options.InGroup()) {
      // This call should never fail (see SETPGID(2))
      if (setpgid(0, 0) != 0) {
        PLOG(ERROR) << "setpgid failed";
      }
    }
    if (working_directory_ && chdir(working_directory_->c_str()) != 0) {
      PLOG(ERROR) << "chdir(\"" << *working_directory_ << "\") failed";
      _exit(127);
    }
    if (strchr(cmd[0], '/') != nullptr) {
      execve(cmd[0], const_cast<char* const*>(cmd.data()),
             const_cast<char* const*>(envp.data()));
    } else {
      execvpe(cmd[0], const_cast<char* const*>(cmd.data()),
              const_cast<char* const*>(envp.data()));
    }
    // No need for an if: if exec worked it wouldn't have returned
    PLOG(ERROR) << "exec of " << cmd[0] << " failed";
    _exit(127);
  }
  if (pid == -1) {
    PLOG(ERROR) << "fork failed";
  }
  if (options.Verbose()) {
    LOG(DEBUG) << "Started (pid: " << pid
               << "): " << android::base::Join(command_, " ");
  } else {
    LOG(VERBOSE) << "Started (pid: " << pid
                 << "): " << android::base::Join(command_, " ");
  }
  return Subprocess(pid);
}

// A class that waits for threads to exit in its destructor.
class ThreadJoiner {
  std::vector<std::thread*> threads_;

 public:
  ThreadJoiner(const std::vector<std::thread*> threads) : threads_(threads) {}
  ~ThreadJoiner() {
    for (auto& thread : threads_) {
      if (thread->joinable()) {
        thread->join();
      }
    }
  }
};

int RunWithManagedStdio(Command&& cmd_tmp, const std::string* stdin,
                        std::string* stdout, std::string* stderr,
                        SubprocessOptions options) {
  /*
   * The order of these declarations is necessary for safety. If the function
   * returns at any point, the Command will be destroyed first, closing its
   * ends of the pipes. This will cause the thread internals to fail their
   * reads or writes. The ThreadJoiner then waits for the threads to complete,
   * as running the destructor of an active std::thread crashes the program.
   *
   * C++ scoping rules dictate that objects are descoped in reverse order to
   * construction, so this behavior is predictable.
   */
  std::thread stdin_thread, stdout_thread, stderr_thread;
  std::atomic<bool> io_error{false};
  ThreadJoiner thread_joiner({&stdin_thread, &stdout_thread, &stderr_thread});
  Command cmd = std::move(cmd_tmp);
  if (stdin != nullptr) {
    android::base::unique_fd pipe_read, pipe_write;
    if (!android::base::Pipe(&pipe_read, &pipe_write)) {
      PLOG(ERROR) << "Could not create a pipe to write the stdin of \""
                  << cmd.GetShortName() << "\"";
      return -1;
    }
    cmd.RedirectStdIO(Subprocess::StdIOChannel::kStdIn, std::move(pipe_read));
    stdin_thread = std::thread(
        [fd = std::move(pipe_write), stdin, &io_error]() mutable {
          if (!android::base::WriteStringToFd(*stdin, fd)) {
            io_error = true;
            PLOG(ERROR) << "Error in writing stdin to process";
          }
          fd.reset();
        });
  }
  if (stdout != nullptr) {
    android::base::unique_fd pipe_read, pipe_write;
    if (!android::base::Pipe(&pipe_read, &pipe_write)) {
      PLOG(ERROR) << "Could not create a pipe to read the stdout of \""
                  << cmd.GetShortName() << "\"";
      return -1;
    }
    cmd.RedirectStdIO(Subprocess::StdIOChannel::kStdOut,
                      std::move(pipe_write));
    stdout_thread = std::thread(
        [fd = std::move(pipe_read), stdout, &io_error]() {
          if (!android::base::ReadFdToString(fd, stdout)) {
            io_error = true;
            PLOG(ERROR) << "Error in reading stdout from process";
          }
        });
  }
  if (stderr != nullptr) {
    android::base::unique_fd pipe_read, pipe_write;
    if (!android::base::Pipe(&pipe_read, &pipe_write)) {
      PLOG(ERROR) << "Could not create a pipe to read the stderr of \""
                  << cmd.GetShortName() << "\"";
      return -1;
    }
    cmd.RedirectStdIO(Subprocess::StdIOChannel::kStdErr,
                      std::move(pipe_write));
    stderr_thread = std::thread(
        [fd = std::move(pipe_read), stderr, &io_error]() {
          if (!android::base::ReadFdToString(fd, stderr)) {
            io_error = true;
            PLOG(ERROR) << "Error in reading stderr from process";
          }
        });
  }

  auto subprocess = cmd.Start(options);
  if (!subprocess.Started()) {
    return -1;
  }
  auto cmd_short_name = cmd.GetShortName();
  {
    // Force the destructor to run by moving it into a smaller scope.
    // This is necessary to close the write end of the pipe.
    Command force_delete = std::move(cmd);
  }
  int wstatus = 0;
  if (subprocess.Wait(&wstatus, 0) < 0) {
    PLOG(ERROR) << "waitpid on " << cmd_short_name << " failed";
    return -1;
  }
  if (WIFSIGNALED(wstatus)) {
    LOG(ERROR) << "Command was interrupted by a signal: " << WTERMSIG(wstatus);
    return -1;
  }
  {
    auto join_threads = std::move(thread_joiner);
  }
  if (io_error) {
    LOG(ERROR) << "IO error communicating with " << cmd_short_name;
    return -1;
  }
  return WEXITSTATUS(wstatus);
}

}  // namespace looplab
