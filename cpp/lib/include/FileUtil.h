/** \file   FileUtil.h
 *  \brief  File related utility classes and functions.
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
#include <vector>
#include <ctime>
#include <sys/types.h>


namespace FileUtil {


/** \class AutoTempFile
 *  \brief Creates a temp file and removes it when going out of scope.
 */
class AutoTempFile {
    std::string path_;

public:
    explicit AutoTempFile(const std::string &path_prefix = "/tmp/ATF", const std::string &path_suffix = "");
    AutoTempFile(const AutoTempFile &rhs) = delete;
    ~AutoTempFile();

    const std::string &getFilePath() const { return path_; }
};


/** \class AutoTempDirectory
 *  \brief Creates a temp directory and recursively removes it when going out of scope.
 */
class AutoTempDirectory {
    std::string path_;
    bool removed_;

public:
    explicit AutoTempDirectory(const std::string &path_prefix = "/tmp/ATD");
    AutoTempDirectory(const AutoTempDirectory &rhs) = delete;
    ~AutoTempDirectory() { remove(); }

    const std::string &getDirectoryPath() const { return path_; }

    /** \brief Removes the directory and everything in it.  Subsequent calls and the destructor are no-ops.
     *  \return False if the directory could not be removed completely.
     */
    bool remove();
};


bool Exists(const std::string &path);
bool IsDirectory(const std::string &path);


/** \return The size of the regular file "path" or -1 if it does not exist or can't be stat(2)ed. */
off_t GetFileSize(const std::string &path);


/** \return The modification time of "path" or 0 if it can't be stat(2)ed. */
time_t GetLastModificationTime(const std::string &path);


bool WriteString(const std::string &path, const std::string &data);
bool ReadString(const std::string &path, std::string * const data);


/** \brief Reads at most "max_count" bytes from the start of "path". */
bool ReadPrefix(const std::string &path, const size_t max_count, std::string * const prefix);


bool DeleteFile(const std::string &path);


/** \brief Renames "old_path" to "new_path", replacing "new_path" if it exists.  Falls back to copy-and-delete when
 *         the two paths are on different file systems.
 */
bool RenameFile(const std::string &old_path, const std::string &new_path);


/** \brief Creates "path" and, if "recursive" is true, all missing parent directories.  An existing directory is
 *         not an error.
 */
bool MakeDirectory(const std::string &path, const bool recursive = false, const mode_t mode = 0755);


/** \brief Removes "dir_name" and all of its contents. */
bool RemoveDirectory(const std::string &dir_name);


/** \brief Collects the names of the entries of "directory_to_scan" whose names match "filename_regex".
 *  \return The number of matching names.
 */
size_t GetFileNameList(const std::string &filename_regex, std::vector<std::string> * const matched_filenames,
                       const std::string &directory_to_scan = ".");


std::string GetBasename(const std::string &path);
std::string GetDirname(const std::string &path);


/** \brief Joins a directory and a file name, avoiding duplicate slashes. */
std::string JoinPaths(const std::string &directory, const std::string &filename);


} // namespace FileUtil
