/** \file    StringUtil.cc
 *  \brief   Implementation of string utility functions.
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
#include "StringUtil.h"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <strings.h>


namespace StringUtil {


std::string &ASCIIToLower(std::string * const s) {
    for (auto &ch : *s) {
        if (ch >= 'A' and ch <= 'Z')
            ch = static_cast<char>(ch - 'A' + 'a');
    }

    return *s;
}


bool IsUnsignedNumber(const std::string &s) {
    if (s.empty())
        return false;

    for (const char ch : s) {
        if (not IsDigit(ch))
            return false;
    }

    return true;
}


std::string &Trim(const std::string &trim_set, std::string * const s) {
    const auto first(s->find_first_not_of(trim_set));
    if (first == std::string::npos) {
        s->clear();
        return *s;
    }

    const auto last(s->find_last_not_of(trim_set));
    *s = s->substr(first, last - first + 1);
    return *s;
}


std::string &CollapseAndTrimWhitespace(std::string * const s) {
    std::string collapsed;
    collapsed.reserve(s->size());

    bool last_char_was_whitespace(true);
    for (const char ch : *s) {
        if (IsWhitespace(ch)) {
            if (not last_char_was_whitespace)
                collapsed += ' ';
            last_char_was_whitespace = true;
        } else {
            collapsed += ch;
            last_char_was_whitespace = false;
        }
    }

    if (not collapsed.empty() and collapsed.back() == ' ')
        collapsed.resize(collapsed.size() - 1);

    s->swap(collapsed);
    return *s;
}


bool StartsWith(const std::string &s, const std::string &prefix, const bool ignore_case) {
    if (prefix.length() > s.length())
        return false;

    return ignore_case ? ::strncasecmp(s.c_str(), prefix.c_str(), prefix.length()) == 0
                       : s.compare(0, prefix.length(), prefix) == 0;
}


bool EndsWith(const std::string &s, const std::string &suffix, const bool ignore_case) {
    if (suffix.length() > s.length())
        return false;

    const size_t offset(s.length() - suffix.length());
    return ignore_case ? ::strcasecmp(s.c_str() + offset, suffix.c_str()) == 0 : s.compare(offset, suffix.length(), suffix) == 0;
}


unsigned Split(const std::string &s, const char separator, std::vector<std::string> * const components,
               const bool suppress_empty_components)
{
    return Split(s, std::string(1, separator), components, suppress_empty_components);
}


unsigned Split(const std::string &s, const std::string &separator, std::vector<std::string> * const components,
               const bool suppress_empty_components)
{
    components->clear();
    if (s.empty())
        return 0;

    std::string::size_type start(0);
    for (;;) {
        const auto separator_pos(s.find(separator, start));
        const std::string component(s.substr(start, separator_pos == std::string::npos ? std::string::npos : separator_pos - start));
        if (not component.empty() or not suppress_empty_components)
            components->emplace_back(component);
        if (separator_pos == std::string::npos)
            break;
        start = separator_pos + separator.length();
    }

    return components->size();
}


std::string Join(const std::vector<std::string> &components, const std::string &separator) {
    std::string joined;
    for (auto component(components.cbegin()); component != components.cend(); ++component) {
        if (component != components.cbegin())
            joined += separator;
        joined += *component;
    }

    return joined;
}


unsigned ReplaceString(const std::string &old_text, const std::string &new_text, std::string * const s) {
    if (old_text.empty())
        return 0;

    unsigned replacement_count(0);
    std::string::size_type pos(0);
    while ((pos = s->find(old_text, pos)) != std::string::npos) {
        s->replace(pos, old_text.length(), new_text);
        pos += new_text.length();
        ++replacement_count;
    }

    return replacement_count;
}


std::string &Map(std::string * const s, const std::string &chars_to_replace, const char replacement) {
    for (auto &ch : *s) {
        if (chars_to_replace.find(ch) != std::string::npos)
            ch = replacement;
    }

    return *s;
}


bool ToUnsigned(const std::string &s, unsigned * const n) {
    if (not IsUnsignedNumber(s))
        return false;

    errno = 0;
    char *end_ptr;
    const unsigned long value(std::strtoul(s.c_str(), &end_ptr, 10));
    if (errno != 0 or *end_ptr != '\0' or value > UINT_MAX) {
        errno = 0;
        return false;
    }

    *n = static_cast<unsigned>(value);
    return true;
}


bool ToDouble(const std::string &s, double * const n) {
    if (s.empty())
        return false;

    errno = 0;
    char *end_ptr;
    *n = std::strtod(s.c_str(), &end_ptr);
    if (errno != 0 or *end_ptr != '\0') {
        errno = 0;
        return false;
    }

    return true;
}


bool ToBool(const std::string &value, bool * const b) {
    const std::string lowercase_value(ASCIIToLower(TrimWhite(value)));
    if (lowercase_value == "true" or lowercase_value == "yes" or lowercase_value == "on" or lowercase_value == "1") {
        *b = true;
        return true;
    }
    if (lowercase_value == "false" or lowercase_value == "no" or lowercase_value == "off" or lowercase_value == "0") {
        *b = false;
        return true;
    }

    return false;
}


} // namespace StringUtil
