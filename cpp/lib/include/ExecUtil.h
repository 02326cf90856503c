/** \file   ExecUtil.h
 *  \brief  The Exec() function and related utility functions for running subprocesses.
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
#pragma once


#include <string>
#include <unordered_map>
#include <vector>
#include <signal.h>


namespace ExecUtil {


/** \brief  Run a subcommand to completion.
 *  \param  command             The path to the command that should be executed.
 *  \param  args                The arguments for the command, not including the command itself.
 *  \param  new_stdin           An optional replacement file path for stdin.
 *  \param  new_stdout          An optional replacement file path for stdout.
 *  \param  new_stderr          An optional replacement file path for stderr.
 *  \param  timeout_in_seconds  If not zero, the subprocess will be killed if the timeout expires before
 *                              the process terminates.
 *  \param  envs                Additional environment variables to be set in the child process.
 *  \note   In case of a timeout, we set errno to ETIME and return -1.
 *  \throws std::runtime_error if "command" is not executable or the child could not be started.
 *  \return The exit code of the subcommand.
 */
int Exec(const std::string &command, const std::vector<std::string> &args = {}, const std::string &new_stdin = "",
         const std::string &new_stdout = "", const std::string &new_stderr = "", const unsigned timeout_in_seconds = 0,
         const int tardy_child_signal = SIGKILL, const std::unordered_map<std::string, std::string> &envs = {});


/** \brief Tries to find a path, with the help of the environment variable PATH, to "executable_candidate".
 *  \return The path where the executable can be found or the empty string if no such path was found or if
 *          "executable_candidate" is not executable.
 */
std::string Which(const std::string &executable_candidate);


/** \brief  Runs "command" and collects what it wrote to stdout and stderr.
 *  \return True if the subcommand exited with a zero exit code, else false.
 */
bool ExecSubcommandAndCaptureStdoutAndStderr(const std::string &command, const std::vector<std::string> &args,
                                             std::string * const stdout_output, std::string * const stderr_output,
                                             const unsigned timeout_in_seconds = 0,
                                             const std::unordered_map<std::string, std::string> &envs = {});


} // namespace ExecUtil
