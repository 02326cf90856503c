/** \file   DocFetch.h
 *  \brief  Installation-wide locations used by the docfetch programs.
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


namespace DocFetch {


// \return A slash-terminated absolute path.
inline std::string GetDocFetchPath() {
    return "/usr/local/var/lib/docfetch/";
}


inline std::string GetConfigPath() {
    return GetDocFetchPath() + "docfetch.conf";
}


// \return A path relative to the current working directory.
inline std::string GetDefaultDownloadDirectory() {
    return "downloads";
}


// \return A slash-terminated absolute path.
inline std::string GetTmpPath() {
    return "/tmp/";
}


} // namespace DocFetch
