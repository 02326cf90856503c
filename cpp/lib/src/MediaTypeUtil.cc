/** \file   MediaTypeUtil.cc
 *  \brief  Implementation of Media Type utility functions.
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
#include "MediaTypeUtil.h"
#include <stdexcept>
#include <cstring>
#include <magic.h>
#include "StringUtil.h"
#include "util.h"


namespace {


// Opens libmagic and loads the default "magic" definitions file.
magic_t OpenMagicCookie(const int flags) {
    const magic_t cookie(::magic_open(flags));
    if (unlikely(cookie == nullptr))
        throw std::runtime_error("in MediaTypeUtil::OpenMagicCookie: could not open libmagic!");

    if (unlikely(::magic_load(cookie, nullptr /* use default magic file */) != 0)) {
        const std::string error_message(::magic_error(cookie));
        ::magic_close(cookie);
        throw std::runtime_error("in MediaTypeUtil::OpenMagicCookie: could not load libmagic (" + error_message + ").");
    }

    return cookie;
}


std::string CleanUpMagicResult(const char *magic_mime_type, const bool auto_simplify) {
    // Attempt to remove possible leading junk (no idea why libmagic behaves in this manner every now and then):
    if (std::strncmp(magic_mime_type, "\\012- ", 6) == 0)
        magic_mime_type += 6;

    std::string media_type(magic_mime_type);
    if (auto_simplify)
        MediaTypeUtil::SimplifyMediaType(&media_type);
    return media_type;
}


} // unnamed namespace


namespace MediaTypeUtil {


std::string GetMediaType(const std::string &document, const bool auto_simplify) {
    if (document.empty())
        return "";

    const magic_t cookie(OpenMagicCookie(MAGIC_MIME));
    const char * const magic_mime_type(::magic_buffer(cookie, document.c_str(), document.length()));
    if (unlikely(magic_mime_type == nullptr)) {
        const std::string error_message(::magic_error(cookie));
        ::magic_close(cookie);
        throw std::runtime_error("in MediaTypeUtil::GetMediaType: error in libmagic (" + error_message + ").");
    }

    const std::string media_type(CleanUpMagicResult(magic_mime_type, auto_simplify));
    ::magic_close(cookie);
    return media_type;
}


std::string GetFileMediaType(const std::string &filename, const bool auto_simplify) {
    const magic_t cookie(OpenMagicCookie(MAGIC_MIME | MAGIC_SYMLINK));
    const char * const magic_mime_type(::magic_file(cookie, filename.c_str()));
    if (unlikely(magic_mime_type == nullptr)) {
        const std::string error_message(::magic_error(cookie));
        ::magic_close(cookie);
        throw std::runtime_error("in MediaTypeUtil::GetFileMediaType: error in libmagic (" + error_message + ").");
    }

    const std::string media_type(CleanUpMagicResult(magic_mime_type, auto_simplify));
    ::magic_close(cookie);
    return media_type;
}


bool SimplifyMediaType(std::string * const media_type) {
    const std::string original_media_type(*media_type);

    const auto semicolon_pos(media_type->find(';'));
    if (semicolon_pos != std::string::npos)
        media_type->resize(semicolon_pos);
    StringUtil::TrimWhite(media_type);
    StringUtil::ASCIIToLower(media_type);

    return *media_type != original_media_type;
}


bool IsPdfMediaType(const std::string &media_type) {
    return StringUtil::Contains(StringUtil::ASCIIToLower(media_type), "pdf");
}


} // namespace MediaTypeUtil
