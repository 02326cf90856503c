/** \file   UrlUtil.h
 *  \brief  Various URL related utility functions.
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


namespace UrlUtil {


/* Return the "%XX" sequence (with two hex digits) corresponding to "ch". */
std::string UrlEncodeChar(const char ch);


/** Replace all characters that have a special meaning in a URL with %XX where "XX" is a two character hex encoding. */
std::string UrlEncode(const std::string &s);


/** Decode all "%XX" hex encodings. */
std::string UrlDecode(const std::string &s);


/** \return The scheme, e.g. "https", in lowercase or the empty string if "url" has no scheme. */
std::string GetScheme(const std::string &url);


/** \return The host part of "url" in lowercase, w/o user info and port, or the empty string if there is none. */
std::string GetHost(const std::string &url);


/** \brief Turns "reference" into an absolute URL.  References that already have a scheme are returned unchanged.
 *  \note  Protocol relative references ("//host/path") get the "https" scheme.  References starting with a slash
 *         are resolved against the scheme and host of "base_url", path relative ones against its directory.
 */
std::string MakeAbsoluteUrl(const std::string &base_url, const std::string &reference);


/** \return True if the host of "url" is "domain" or a subdomain of "domain". */
bool IsInDomain(const std::string &url, const std::string &domain);


/** \brief Appends "name=value", URL-encoding "value", as a query parameter. */
std::string AddQueryParameter(const std::string &url, const std::string &name, const std::string &value);


} // namespace UrlUtil
