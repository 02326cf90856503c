/** \file    StringUtil.h
 *  \brief   Declarations of string utility functions.
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
#include <cstring>


namespace StringUtil {


constexpr char WHITE_SPACE[] = " \t\n\v\f\r";


/** \brief  Converts ASCII upper case letters in "s" to lower case.  Non-ASCII bytes are left alone. */
std::string &ASCIIToLower(std::string * const s);
inline std::string ASCIIToLower(std::string s) {
    return ASCIIToLower(&s);
}


inline bool IsWhitespace(const char ch) {
    return std::strchr(WHITE_SPACE, ch) != nullptr and ch != '\0';
}


inline bool IsDigit(const char ch) {
    return ch >= '0' and ch <= '9';
}


/** \return True if "s" is non-empty and consists of ASCII digits only. */
bool IsUnsignedNumber(const std::string &s);


std::string &Trim(const std::string &trim_set, std::string * const s);
inline std::string Trim(const std::string &trim_set, const std::string &s) {
    std::string temp_s(s);
    return Trim(trim_set, &temp_s);
}


inline std::string &TrimWhite(std::string * const s) {
    return Trim(WHITE_SPACE, s);
}


inline std::string TrimWhite(const std::string &s) {
    return Trim(WHITE_SPACE, s);
}


/** \brief Replaces runs of ASCII whitespace with a single space and removes leading and trailing whitespace. */
std::string &CollapseAndTrimWhitespace(std::string * const s);
inline std::string CollapseAndTrimWhitespace(std::string s) {
    return CollapseAndTrimWhitespace(&s);
}


bool StartsWith(const std::string &s, const std::string &prefix, const bool ignore_case = false);
bool EndsWith(const std::string &s, const std::string &suffix, const bool ignore_case = false);


inline bool Contains(const std::string &haystack, const std::string &needle) {
    return haystack.find(needle) != std::string::npos;
}


/** \brief  Splits "s" on "separator".
 *  \param  suppress_empty_components  If true, empty strings between consecutive separators are dropped.
 *  \return The number of extracted components.
 */
unsigned Split(const std::string &s, const char separator, std::vector<std::string> * const components,
               const bool suppress_empty_components = true);
unsigned Split(const std::string &s, const std::string &separator, std::vector<std::string> * const components,
               const bool suppress_empty_components = true);


std::string Join(const std::vector<std::string> &components, const std::string &separator);


/** \brief Replaces all occurrences of "old_text" with "new_text".
 *  \return The number of replacements.
 */
unsigned ReplaceString(const std::string &old_text, const std::string &new_text, std::string * const s);


/** \brief Replaces every character of "s" that is in "chars_to_replace" with "replacement". */
std::string &Map(std::string * const s, const std::string &chars_to_replace, const char replacement);


bool ToUnsigned(const std::string &s, unsigned * const n);
bool ToDouble(const std::string &s, double * const n);


/** \brief Accepts true/false, yes/no, on/off and 1/0 in any case. */
bool ToBool(const std::string &value, bool * const b);


} // namespace StringUtil
