/** \file   TextUtil.cc
 *  \brief  Implementation of UTF-8 text processing utility functions.
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
#include "TextUtil.h"
#include <stdexcept>
#include <clocale>
#include <cstdlib>
#include <cstring>
#include <cwctype>
#include <unistd.h>
#include "util.h"


namespace TextUtil {


namespace {


const uint32_t REPLACEMENT_CHARACTER(0xFFFDu);


// IsLetterOrDigit() relies on the character classes of a UTF-8 locale.
__attribute__((constructor)) void InitializeLocale() {
    for (const char * const locale_name : { "C.UTF-8", "en_US.UTF-8" }) {
        if (std::setlocale(LC_CTYPE, locale_name) != nullptr)
            return;
    }

    const std::string error_message("in InitializeLocale: setlocale(3) failed for C.UTF-8 and en_US.UTF-8!\n");
    const ssize_t dummy = ::write(STDERR_FILENO, error_message.c_str(), error_message.length());
    (void)dummy;
    ::_exit(EXIT_FAILURE);
}


inline bool IsContinuationByte(const unsigned char ch) {
    return (ch & 0b11000000u) == 0b10000000u;
}


} // unnamed namespace


bool UTF8ToUTF32(const std::string &utf8_string, std::vector<uint32_t> * const utf32_chars) {
    utf32_chars->clear();
    utf32_chars->reserve(utf8_string.size());

    bool valid(true);
    size_t i(0);
    while (i < utf8_string.size()) {
        const unsigned char lead(static_cast<unsigned char>(utf8_string[i]));
        uint32_t code_point;
        unsigned continuation_count;
        if ((lead & 0b10000000u) == 0) {
            code_point = lead;
            continuation_count = 0;
        } else if ((lead & 0b11100000u) == 0b11000000u) {
            code_point = lead & 0b00011111u;
            continuation_count = 1;
        } else if ((lead & 0b11110000u) == 0b11100000u) {
            code_point = lead & 0b00001111u;
            continuation_count = 2;
        } else if ((lead & 0b11111000u) == 0b11110000u) {
            code_point = lead & 0b00000111u;
            continuation_count = 3;
        } else {
            utf32_chars->emplace_back(REPLACEMENT_CHARACTER);
            valid = false;
            ++i;
            continue;
        }

        ++i;
        unsigned consumed(0);
        while (consumed < continuation_count and i < utf8_string.size()
               and IsContinuationByte(static_cast<unsigned char>(utf8_string[i])))
        {
            code_point = (code_point << 6u) | (static_cast<unsigned char>(utf8_string[i]) & 0b00111111u);
            ++consumed, ++i;
        }

        // Overlong forms, surrogates and values beyond U+10FFFF are invalid, too.
        static const uint32_t MIN_CODE_POINTS[] = { 0x0u, 0x80u, 0x800u, 0x10000u };
        if (consumed != continuation_count or code_point < MIN_CODE_POINTS[continuation_count]
            or (code_point >= 0xD800u and code_point <= 0xDFFFu) or code_point > 0x10FFFFu)
        {
            utf32_chars->emplace_back(REPLACEMENT_CHARACTER);
            valid = false;
        } else
            utf32_chars->emplace_back(code_point);
    }

    return valid;
}


std::string UTF32ToUTF8(const uint32_t code_point) {
    std::string utf8;

    if (code_point <= 0x7Fu)
        utf8 += static_cast<char>(code_point);
    else if (code_point <= 0x7FFu) {
        utf8 += static_cast<char>(0b11000000u | (code_point >> 6u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else if (code_point <= 0xFFFFu) {
        utf8 += static_cast<char>(0b11100000u | (code_point >> 12u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 6u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else if (code_point <= 0x10FFFFu) {
        utf8 += static_cast<char>(0b11110000u | (code_point >> 18u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 12u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 6u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else
        throw std::runtime_error("in TextUtil::UTF32ToUTF8: invalid Unicode code point " + std::to_string(code_point) + "!");

    return utf8;
}


bool IsWhitespace(const uint32_t code_point) {
    switch (code_point) {
    case ' ':
    case '\t':
    case '\n':
    case '\v':
    case '\f':
    case '\r':
    case 0x85u:   // NEXT LINE
    case 0xA0u:   // NO-BREAK SPACE
    case 0x1680u: // OGHAM SPACE MARK
    case 0x2028u: // LINE SEPARATOR
    case 0x2029u: // PARAGRAPH SEPARATOR
    case 0x202Fu: // NARROW NO-BREAK SPACE
    case 0x205Fu: // MEDIUM MATHEMATICAL SPACE
    case 0x3000u: // IDEOGRAPHIC SPACE
        return true;
    default:
        return code_point >= 0x2000u and code_point <= 0x200Au;
    }
}


bool IsLetterOrDigit(const uint32_t code_point) {
    if (code_point < 0x80u)
        return (code_point >= '0' and code_point <= '9') or (code_point >= 'a' and code_point <= 'z')
               or (code_point >= 'A' and code_point <= 'Z');

    return std::iswalnum(static_cast<wint_t>(code_point)) != 0;
}


bool IsCommonPunctuation(const uint32_t code_point) {
    if (code_point < 0x80u)
        return code_point != 0 and std::strchr(".,;:!?'\"()-[]{}@#$%&*+=/<>", static_cast<char>(code_point)) != nullptr;

    return (code_point >= 0x3001u and code_point <= 0x3011u)    // 、。〃〄々〆〇〈〉《》「」『』【】
           or (code_point >= 0x2010u and code_point <= 0x2015u) // dashes
           or (code_point >= 0x2018u and code_point <= 0x201Fu) // quotation marks
           or code_point == 0x2026u                             // ellipsis
           or code_point == 0x060Cu or code_point == 0x061Bu    // Arabic comma and semicolon
           or code_point == 0x061Fu or code_point == 0x06D4u    // Arabic question mark and full stop
           or code_point == 0x0964u or code_point == 0x0965u    // Devanagari danda and double danda
           or code_point == 0x0E2Fu or code_point == 0x0E5Au    // Thai paiyannoi and angkhankhu
           or (code_point >= 0xFF01u and code_point <= 0xFF0Fu) // fullwidth ！＂＃...／
           or (code_point >= 0xFF1Au and code_point <= 0xFF20u) // fullwidth ：；＜＝＞？＠
           or code_point == 0xFF5Bu or code_point == 0xFF5Du;   // fullwidth braces
}


std::string &UTF8ByteTruncate(std::string * const utf8_string, const size_t max_length) {
    if (utf8_string->size() <= max_length)
        return *utf8_string;

    size_t cut(max_length);
    while (cut > 0 and IsContinuationByte(static_cast<unsigned char>((*utf8_string)[cut])))
        --cut;
    utf8_string->resize(cut);

    return *utf8_string;
}


std::string CollapseAndTrimWhitespace(const std::string &utf8_string) {
    std::vector<uint32_t> code_points;
    UTF8ToUTF32(utf8_string, &code_points);

    std::string collapsed;
    bool last_char_was_whitespace(true);
    for (const uint32_t code_point : code_points) {
        if (IsWhitespace(code_point)) {
            if (not last_char_was_whitespace)
                collapsed += ' ';
            last_char_was_whitespace = true;
        } else {
            collapsed += UTF32ToUTF8(code_point);
            last_char_was_whitespace = false;
        }
    }

    if (not collapsed.empty() and collapsed.back() == ' ')
        collapsed.resize(collapsed.size() - 1);

    return collapsed;
}


std::string Base64Encode(const std::string &s) {
    static const char BASE64_SYMBOLS[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string encoded_chars;
    encoded_chars.reserve((s.size() + 2) / 3 * 4);

    size_t i(0);
    while (i + 3 <= s.size()) {
        const uint32_t buf((static_cast<unsigned char>(s[i]) << 16u) | (static_cast<unsigned char>(s[i + 1]) << 8u)
                           | static_cast<unsigned char>(s[i + 2]));
        encoded_chars += BASE64_SYMBOLS[(buf >> 18u) & 0x3Fu];
        encoded_chars += BASE64_SYMBOLS[(buf >> 12u) & 0x3Fu];
        encoded_chars += BASE64_SYMBOLS[(buf >> 6u) & 0x3Fu];
        encoded_chars += BASE64_SYMBOLS[buf & 0x3Fu];
        i += 3;
    }

    const size_t remainder(s.size() - i);
    if (remainder == 1) {
        const uint32_t buf(static_cast<unsigned char>(s[i]) << 16u);
        encoded_chars += BASE64_SYMBOLS[(buf >> 18u) & 0x3Fu];
        encoded_chars += BASE64_SYMBOLS[(buf >> 12u) & 0x3Fu];
        encoded_chars += "==";
    } else if (remainder == 2) {
        const uint32_t buf((static_cast<unsigned char>(s[i]) << 16u) | (static_cast<unsigned char>(s[i + 1]) << 8u));
        encoded_chars += BASE64_SYMBOLS[(buf >> 18u) & 0x3Fu];
        encoded_chars += BASE64_SYMBOLS[(buf >> 12u) & 0x3Fu];
        encoded_chars += BASE64_SYMBOLS[(buf >> 6u) & 0x3Fu];
        encoded_chars += '=';
    }

    return encoded_chars;
}


std::string CSVEscape(const std::string &value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos)
        return value;

    std::string escaped_value("\"");
    for (const char ch : value) {
        if (unlikely(ch == '"'))
            escaped_value += '"';
        escaped_value += ch;
    }
    escaped_value += '"';

    return escaped_value;
}


} // namespace TextUtil
