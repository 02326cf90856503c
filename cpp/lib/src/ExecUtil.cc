/** \file   ExecUtil.cc
 *  \brief  Implementation of the ExecUtil namespace.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "ExecUtil.h"
#include <mutex>
#include <stdexcept>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include "FileUtil.h"
#include "StringUtil.h"
#include "TimeLimit.h"
#include "TimeUtil.h"
#include "util.h"


namespace {


const int EXECVE_FAILURE(248);


bool IsExecutableFile(const std::string &path) {
    struct stat statbuf;
    return ::stat(path.c_str(), &statbuf) == 0 and S_ISREG(statbuf.st_mode) and (statbuf.st_mode & S_IXUSR);
}


// Only ever called in the child after fork(2), hence the _exit(2) calls.
void RedirectOrDie(const std::string &path, const int target_fd, const int open_flags) {
    if (path.empty())
        return;

    const int new_fd(::open(path.c_str(), open_flags, 0644));
    if (new_fd == -1 or ::dup2(new_fd, target_fd) == -1)
        ::_exit(EXECVE_FAILURE);
    ::close(new_fd);
}


} // unnamed namespace


namespace ExecUtil {


int Exec(const std::string &command, const std::vector<std::string> &args, const std::string &new_stdin, const std::string &new_stdout,
         const std::string &new_stderr, const unsigned timeout_in_seconds, const int tardy_child_signal,
         const std::unordered_map<std::string, std::string> &envs)
{
    errno = 0;
    if (::access(command.c_str(), X_OK) != 0)
        throw std::runtime_error("in ExecUtil::Exec: can't execute \"" + command + "\"!");

    // Build the argument list for execv(2) before forking:
    std::vector<char *> argv;
    argv.reserve(args.size() + 2);
    argv.emplace_back(const_cast<char *>(command.c_str()));
    for (const auto &arg : args)
        argv.emplace_back(const_cast<char *>(arg.c_str()));
    argv.emplace_back(nullptr);

    const pid_t pid(::fork());
    if (pid == -1)
        throw std::runtime_error("in ExecUtil::Exec: fork(2) failed: " + std::string(std::strerror(errno)) + "!");

    if (pid == 0) { // The child process.
        // Make us the leader of a new process group so that a timeout can kill all of our offspring:
        if (::setsid() == static_cast<pid_t>(-1))
            ::_exit(EXECVE_FAILURE);

        RedirectOrDie(new_stdin, STDIN_FILENO, O_RDONLY);
        RedirectOrDie(new_stdout, STDOUT_FILENO, O_WRONLY | O_CREAT | O_TRUNC);
        RedirectOrDie(new_stderr, STDERR_FILENO, O_WRONLY | O_CREAT | O_TRUNC);

        for (const auto &env : envs)
            ::setenv(env.first.c_str(), env.second.c_str(), 1);

        ::execv(command.c_str(), argv.data());
        ::_exit(EXECVE_FAILURE); // We typically never get here.
    }

    // The parent of the fork:
    const TimeLimit time_limit(timeout_in_seconds * 1000u);
    int child_exit_status;
    for (;;) {
        const pid_t wait_retval(::waitpid(pid, &child_exit_status, timeout_in_seconds == 0 ? 0 : WNOHANG));
        if (wait_retval == pid)
            break;
        if (wait_retval == -1 and errno != EINTR)
            throw std::runtime_error("in ExecUtil::Exec: waitpid(2) failed: " + std::string(std::strerror(errno)) + "!");

        if (timeout_in_seconds > 0 and time_limit.limitExceeded()) {
            // Snuff out all of our offspring:
            ::kill(-pid, tardy_child_signal);
            while (::waitpid(pid, &child_exit_status, 0) == -1 and errno == EINTR)
                /* Intentionally empty! */;
            errno = ETIME;
            return -1;
        }
        TimeUtil::Millisleep(20);
    }
    errno = 0;

    if (WIFEXITED(child_exit_status)) {
        if (WEXITSTATUS(child_exit_status) == EXECVE_FAILURE)
            throw std::runtime_error("in ExecUtil::Exec: failed to start \"" + command + "\" in the child process!");
        return WEXITSTATUS(child_exit_status);
    }
    if (WIFSIGNALED(child_exit_status))
        throw std::runtime_error("in ExecUtil::Exec: \"" + command + "\" killed by signal " + std::to_string(WTERMSIG(child_exit_status))
                                 + "!");

    throw std::runtime_error("in ExecUtil::Exec: unexpected exit status for \"" + command + "\"!");
}


std::string Which(const std::string &executable_candidate) {
    static std::mutex which_cache_mutex;
    static std::unordered_map<std::string, std::string> which_cache;

    std::lock_guard<std::mutex> which_cache_locker(which_cache_mutex);
    const auto which_cache_entry(which_cache.find(executable_candidate));
    if (which_cache_entry != which_cache.cend())
        return which_cache_entry->second;

    std::string executable;
    if (executable_candidate.find('/') != std::string::npos) {
        if (IsExecutableFile(executable_candidate))
            executable = executable_candidate;
    } else {
        const char * const PATH(::getenv("PATH"));
        std::vector<std::string> path_components;
        StringUtil::Split(PATH == nullptr ? "" : PATH, ':', &path_components, /* suppress_empty_components = */ true);
        for (const auto &path_component : path_components) {
            const std::string full_path(FileUtil::JoinPaths(path_component, executable_candidate));
            if (IsExecutableFile(full_path)) {
                executable = full_path;
                break;
            }
        }
    }

    if (not executable.empty())
        which_cache[executable_candidate] = executable;
    return executable;
}


bool ExecSubcommandAndCaptureStdoutAndStderr(const std::string &command, const std::vector<std::string> &args,
                                             std::string * const stdout_output, std::string * const stderr_output,
                                             const unsigned timeout_in_seconds,
                                             const std::unordered_map<std::string, std::string> &envs)
{
    const FileUtil::AutoTempFile stdout_temp;
    const FileUtil::AutoTempFile stderr_temp;

    const int retcode(Exec(command, args, /* new_stdin = */ "", stdout_temp.getFilePath(), stderr_temp.getFilePath(),
                           timeout_in_seconds, SIGKILL, envs));

    if (not FileUtil::ReadString(stdout_temp.getFilePath(), stdout_output))
        LOG_ERROR("failed to read temporary file w/ stdout contents!");
    if (not FileUtil::ReadString(stderr_temp.getFilePath(), stderr_output))
        LOG_ERROR("failed to read temporary file w/ stderr contents!");

    return retcode == 0;
}


} // namespace ExecUtil
