/** \file   FileUtil.cc
 *  \brief  Implementation of file related utility classes and functions.
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
#include "FileUtil.h"
#include <fstream>
#include <iterator>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>
#include "RegexMatcher.h"
#include "util.h"


namespace FileUtil {


AutoTempFile::AutoTempFile(const std::string &path_prefix, const std::string &path_suffix) {
    std::string path_template(path_prefix + "XXXXXX" + path_suffix);
    const int fd(::mkstemps(&path_template[0], static_cast<int>(path_suffix.length())));
    if (fd == -1)
        LOG_ERROR("mkstemps(3) for path prefix \"" + path_prefix + "\" failed!");

    ::close(fd);
    path_ = path_template;
}


AutoTempFile::~AutoTempFile() {
    if (not path_.empty())
        ::unlink(path_.c_str());
}


AutoTempDirectory::AutoTempDirectory(const std::string &path_prefix): removed_(false) {
    std::string path_template(path_prefix + "XXXXXX");
    const char * const path(::mkdtemp(&path_template[0]));
    if (path == nullptr)
        LOG_ERROR("mkdtemp(3) for path prefix \"" + path_prefix + "\" failed!");
    char resolved_path[PATH_MAX];
    if (unlikely(::realpath(path, resolved_path) == nullptr))
        LOG_ERROR("realpath(3) for path \"" + std::string(path) + "\" failed!");
    path_ = resolved_path;
}


bool AutoTempDirectory::remove() {
    if (removed_)
        return true;
    removed_ = true;

    if (not IsDirectory(path_))
        return true;
    if (RemoveDirectory(path_))
        return true;

    LOG_WARNING("can't completely remove \"" + path_ + "\"!");
    return false;
}


bool Exists(const std::string &path) {
    return ::access(path.c_str(), F_OK) == 0;
}


bool IsDirectory(const std::string &path) {
    struct stat stat_buf;
    return ::stat(path.c_str(), &stat_buf) == 0 and S_ISDIR(stat_buf.st_mode);
}


off_t GetFileSize(const std::string &path) {
    struct stat stat_buf;
    if (::stat(path.c_str(), &stat_buf) != 0 or not S_ISREG(stat_buf.st_mode)) {
        errno = 0;
        return -1;
    }

    return stat_buf.st_size;
}


time_t GetLastModificationTime(const std::string &path) {
    struct stat stat_buf;
    if (::stat(path.c_str(), &stat_buf) != 0) {
        errno = 0;
        return 0;
    }

    return stat_buf.st_mtime;
}


bool WriteString(const std::string &path, const std::string &data) {
    std::ofstream output(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (output.fail())
        return false;

    output.write(data.data(), static_cast<std::streamsize>(data.size()));
    return not output.bad();
}


bool ReadString(const std::string &path, std::string * const data) {
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (input.fail())
        return false;

    data->assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
    return not input.bad();
}


bool ReadPrefix(const std::string &path, const size_t max_count, std::string * const prefix) {
    prefix->clear();

    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (input.fail())
        return false;

    prefix->resize(max_count);
    input.read(&(*prefix)[0], static_cast<std::streamsize>(max_count));
    prefix->resize(static_cast<size_t>(input.gcount()));
    return not input.bad();
}


bool DeleteFile(const std::string &path) {
    if (::unlink(path.c_str()) == 0)
        return true;

    errno = 0;
    return false;
}


bool RenameFile(const std::string &old_path, const std::string &new_path) {
    if (::rename(old_path.c_str(), new_path.c_str()) == 0)
        return true;
    if (errno != EXDEV) {
        errno = 0;
        return false;
    }
    errno = 0;

    std::string contents;
    if (not ReadString(old_path, &contents) or not WriteString(new_path, contents)) {
        if (Exists(new_path) and not DeleteFile(new_path))
            LOG_WARNING("failed to remove partial copy \"" + new_path + "\"!");
        return false;
    }

    return DeleteFile(old_path);
}


bool MakeDirectory(const std::string &path, const bool recursive, const mode_t mode) {
    if (IsDirectory(path))
        return true;

    if (recursive) {
        const std::string parent(GetDirname(path));
        if (not parent.empty() and parent != path and not MakeDirectory(parent, /* recursive = */ true, mode))
            return false;
    }

    if (::mkdir(path.c_str(), mode) == 0 or (errno == EEXIST and IsDirectory(path))) {
        errno = 0;
        return true;
    }

    errno = 0;
    return false;
}


bool RemoveDirectory(const std::string &dir_name) {
    DIR * const dir_handle(::opendir(dir_name.c_str()));
    if (unlikely(dir_handle == nullptr)) {
        errno = 0;
        return false;
    }

    bool success(true);
    struct dirent *entry;
    while ((entry = ::readdir(dir_handle)) != nullptr) {
        if (std::strcmp(entry->d_name, ".") == 0 or std::strcmp(entry->d_name, "..") == 0)
            continue;

        const std::string path(JoinPaths(dir_name, entry->d_name));
        struct stat stat_buf;
        if (::lstat(path.c_str(), &stat_buf) != 0) {
            success = false;
            continue;
        }

        if (S_ISDIR(stat_buf.st_mode)) {
            if (not RemoveDirectory(path))
                success = false;
        } else if (::unlink(path.c_str()) != 0)
            success = false;
    }
    ::closedir(dir_handle);

    if (::rmdir(dir_name.c_str()) != 0)
        success = false;

    errno = 0;
    return success;
}


size_t GetFileNameList(const std::string &filename_regex, std::vector<std::string> * const matched_filenames,
                       const std::string &directory_to_scan)
{
    matched_filenames->clear();

    const ThreadSafeRegexMatcher matcher(filename_regex);
    DIR * const dir_handle(::opendir(directory_to_scan.c_str()));
    if (unlikely(dir_handle == nullptr)) {
        errno = 0;
        return 0;
    }

    struct dirent *entry;
    while ((entry = ::readdir(dir_handle)) != nullptr) {
        if (std::strcmp(entry->d_name, ".") == 0 or std::strcmp(entry->d_name, "..") == 0)
            continue;
        if (matcher.match(entry->d_name))
            matched_filenames->emplace_back(entry->d_name);
    }
    ::closedir(dir_handle);

    return matched_filenames->size();
}


std::string GetBasename(const std::string &path) {
    const auto last_slash_pos(path.rfind('/'));
    return (last_slash_pos == std::string::npos) ? path : path.substr(last_slash_pos + 1);
}


std::string GetDirname(const std::string &path) {
    const auto last_slash_pos(path.rfind('/'));
    if (last_slash_pos == std::string::npos)
        return "";
    return (last_slash_pos == 0) ? "/" : path.substr(0, last_slash_pos);
}


std::string JoinPaths(const std::string &directory, const std::string &filename) {
    if (directory.empty())
        return filename;
    return (directory.back() == '/') ? directory + filename : directory + "/" + filename;
}


} // namespace FileUtil
