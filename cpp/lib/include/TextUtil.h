/** \file   TextUtil.h
 *  \brief  Various utility functions related to the processing of UTF-8 text.
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
#include <cstdint>


namespace TextUtil {


/** \brief Decodes "utf8_string" into code points.
 *  \note  Invalid byte sequences are decoded as U+FFFD so that even damaged text layers can be analysed.
 *  \return False if at least one invalid sequence was encountered, else true.
 */
bool UTF8ToUTF32(const std::string &utf8_string, std::vector<uint32_t> * const utf32_chars);


/** \throws std::runtime_error if "code_point" is not a valid Unicode code point. */
std::string UTF32ToUTF8(const uint32_t code_point);


/** \return True for ASCII whitespace, NBSP, the Unicode space separators and the ideographic space. */
bool IsWhitespace(const uint32_t code_point);


/** \return True for letters and digits of any script, as classified by the UTF-8 locale. */
bool IsLetterOrDigit(const uint32_t code_point);


/** \return True for ASCII punctuation as well as the CJK and fullwidth punctuation commonly found in Chinese texts. */
bool IsCommonPunctuation(const uint32_t code_point);


/** \brief Truncates "utf8_string" to at most "max_length" bytes without splitting a multibyte sequence. */
std::string &UTF8ByteTruncate(std::string * const utf8_string, const size_t max_length);


/** \brief Replaces runs of whitespace, incl. Unicode space separators, with a single ASCII space and trims both ends. */
std::string CollapseAndTrimWhitespace(const std::string &utf8_string);


std::string Base64Encode(const std::string &s);


/** \brief Quotes "value" for use as a CSV field as described in RFC 4180. */
std::string CSVEscape(const std::string &value);


} // namespace TextUtil
