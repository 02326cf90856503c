/** \file   MediaTypeUtil.h
 *  \brief  Utilities for determining the media types of downloaded documents.
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


namespace MediaTypeUtil {


/** \brief  Attempts to determine the media type of "document" with the help of libmagic.
 *  \param  auto_simplify  If true, parameters like "; charset=binary" are removed.
 *  \throws std::runtime_error if libmagic can't be initialised.
 */
std::string GetMediaType(const std::string &document, const bool auto_simplify = true);


/** \brief  Like GetMediaType() but for the contents of the file "filename". */
std::string GetFileMediaType(const std::string &filename, const bool auto_simplify = true);


/** \brief  Removes everything starting at the first semicolon, trims the result and converts it to lowercase.
 *  \return True if "media_type" was modified, else false.
 */
bool SimplifyMediaType(std::string * const media_type);


/** \return True if "media_type" (as sent by a server or returned by libmagic) denotes a PDF document. */
bool IsPdfMediaType(const std::string &media_type);


} // namespace MediaTypeUtil
