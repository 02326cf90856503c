/** \file   UrlUtil.cc
 *  \brief  Implementation of URL related utility functions.
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
#include "UrlUtil.h"
#include <vector>
#include <cctype>
#include "StringUtil.h"


namespace {


inline char HexDigit(const unsigned nybble) {
    return "0123456789ABCDEF"[nybble & 0xFu];
}


// \return The value of the hex digit "ch" or -1 if "ch" is not a hex digit.
int HexValue(const char ch) {
    if (ch >= '0' and ch <= '9')
        return ch - '0';
    if (ch >= 'A' and ch <= 'F')
        return ch - 'A' + 10;
    if (ch >= 'a' and ch <= 'f')
        return ch - 'a' + 10;
    return -1;
}


// Splits "url" into "scheme://authority" and the rest.  Returns false if "url" has no scheme and authority.
bool SplitOrigin(const std::string &url, std::string * const origin, std::string * const rest) {
    const auto scheme_end(url.find("://"));
    if (scheme_end == std::string::npos or scheme_end == 0)
        return false;

    const auto authority_end(url.find_first_of("/?#", scheme_end + 3));
    if (authority_end == std::string::npos) {
        *origin = url;
        rest->clear();
    } else {
        *origin = url.substr(0, authority_end);
        *rest = url.substr(authority_end);
    }

    return true;
}


// Resolves "." and ".." segments in an absolute path.  ".." never climbs above the root.
std::string RemoveDotSegments(const std::string &path) {
    std::vector<std::string> segments;
    StringUtil::Split(path, '/', &segments, /* suppress_empty_components = */ false);

    std::vector<std::string> resolved_segments;
    for (const auto &segment : segments) {
        if (segment == ".")
            continue;
        if (segment == "..") {
            if (not resolved_segments.empty())
                resolved_segments.pop_back();
            continue;
        }
        if (not segment.empty())
            resolved_segments.emplace_back(segment);
    }

    std::string resolved_path("/" + StringUtil::Join(resolved_segments, "/"));
    const bool ends_in_directory(path.back() == '/' or segments.back() == "." or segments.back() == "..");
    if (not resolved_segments.empty() and ends_in_directory)
        resolved_path += '/';
    return resolved_path;
}


// \return True if "url" starts with something like "https://" or "file://".
bool HasScheme(const std::string &url) {
    const auto scheme_end(url.find("://"));
    if (scheme_end == std::string::npos or scheme_end == 0)
        return false;

    for (size_t i(0); i < scheme_end; ++i) {
        const char ch(url[i]);
        if (not (std::isalnum(static_cast<unsigned char>(ch)) or ch == '+' or ch == '-' or ch == '.'))
            return false;
    }

    return true;
}


} // unnamed namespace


namespace UrlUtil {


std::string UrlEncodeChar(const char ch) {
    std::string encoded_char("%");
    encoded_char += HexDigit(static_cast<unsigned char>(ch) >> 4u);
    encoded_char += HexDigit(static_cast<unsigned char>(ch) & 0xFu);

    return encoded_char;
}


std::string UrlEncode(const std::string &s) {
    std::string result;
    result.reserve(2 * s.length());
    for (const char ch : s) {
        if (std::isalnum(static_cast<unsigned char>(ch)) or ch == '-' or ch == '_' or ch == '.' or ch == '~')
            result += ch;
        else
            result += UrlEncodeChar(ch);
    }

    return result;
}


std::string UrlDecode(const std::string &s) {
    std::string result;
    result.reserve(s.length());
    for (size_t i(0); i < s.length(); ++i) {
        if (s[i] == '%' and i + 2 < s.length() and HexValue(s[i + 1]) != -1 and HexValue(s[i + 2]) != -1) {
            result += static_cast<char>((HexValue(s[i + 1]) << 4) | HexValue(s[i + 2]));
            i += 2;
        } else if (s[i] == '+')
            result += ' ';
        else
            result += s[i];
    }

    return result;
}


std::string GetScheme(const std::string &url) {
    const auto scheme_end(url.find("://"));
    if (scheme_end == std::string::npos)
        return "";
    return StringUtil::ASCIIToLower(url.substr(0, scheme_end));
}


std::string GetHost(const std::string &url) {
    std::string origin, rest;
    if (not SplitOrigin(url, &origin, &rest))
        return "";

    std::string authority(origin.substr(origin.find("://") + 3));
    const auto at_pos(authority.rfind('@'));
    if (at_pos != std::string::npos)
        authority = authority.substr(at_pos + 1);
    const auto colon_pos(authority.find(':'));
    if (colon_pos != std::string::npos)
        authority.resize(colon_pos);

    return StringUtil::ASCIIToLower(authority);
}


std::string MakeAbsoluteUrl(const std::string &base_url, const std::string &reference) {
    if (HasScheme(reference))
        return reference;
    if (StringUtil::StartsWith(reference, "//"))
        return "https:" + reference;

    std::string origin, rest;
    if (not SplitOrigin(base_url, &origin, &rest))
        return reference;

    const std::string base_without_fragment(origin + rest.substr(0, rest.find('#')));
    if (reference.empty())
        return base_without_fragment;
    if (reference[0] == '#')
        return base_without_fragment + reference;

    std::string base_path(rest.substr(0, rest.find_first_of("?#")));
    if (base_path.empty())
        base_path = "/";
    if (reference[0] == '?')
        return origin + base_path + reference;

    const auto query_start(reference.find_first_of("?#"));
    const std::string reference_path(reference.substr(0, query_start));
    const std::string reference_query(query_start == std::string::npos ? "" : reference.substr(query_start));
    if (reference_path[0] == '/')
        return origin + RemoveDotSegments(reference_path) + reference_query;

    const std::string base_directory(base_path.substr(0, base_path.rfind('/') + 1));
    return origin + RemoveDotSegments(base_directory + reference_path) + reference_query;
}


bool IsInDomain(const std::string &url, const std::string &domain) {
    const std::string host(GetHost(url));
    const std::string lowercase_domain(StringUtil::ASCIIToLower(domain));
    if (host.empty() or lowercase_domain.empty())
        return false;
    return host == lowercase_domain or StringUtil::EndsWith(host, "." + lowercase_domain);
}


std::string AddQueryParameter(const std::string &url, const std::string &name, const std::string &value) {
    const char separator((url.find('?') == std::string::npos) ? '?' : '&');
    return url + separator + name + "=" + UrlEncode(value);
}


} // namespace UrlUtil
