/** \file   TextUtilTest.cc
 *  \brief  Tests for the UTF-8 aware text utility functions.
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
#include <vector>
#include <cstdint>
#include "TextUtil.h"
#include "UnitTest.h"


TEST(UTF8ToUTF32) {
    std::vector<uint32_t> code_points;
    CHECK_TRUE(TextUtil::UTF8ToUTF32("a\xE4\xB8\xAD", &code_points));
    CHECK_EQ(code_points.size(), 2u);
    CHECK_EQ(code_points[1], 0x4E2Du);

    CHECK_FALSE(TextUtil::UTF8ToUTF32("a\xFF" "b", &code_points));
    CHECK_EQ(code_points.size(), 3u);
    CHECK_EQ(code_points[1], 0xFFFDu);

    CHECK_EQ(TextUtil::UTF32ToUTF8(0x4E2Du), "\xE4\xB8\xAD");
}


TEST(UTF8ToUTF32RejectsInvalidCodePoints) {
    std::vector<uint32_t> code_points;

    // Beyond U+10FFFF.
    CHECK_FALSE(TextUtil::UTF8ToUTF32("\xF7\xBF\xBF\xBF", &code_points));
    CHECK_EQ(code_points.size(), 1u);
    CHECK_EQ(code_points[0], 0xFFFDu);

    // Overlong encoding of NUL.
    CHECK_FALSE(TextUtil::UTF8ToUTF32("\xC0\x80", &code_points));
    CHECK_EQ(code_points.size(), 1u);
    CHECK_EQ(code_points[0], 0xFFFDu);

    // High surrogate.
    CHECK_FALSE(TextUtil::UTF8ToUTF32("\xED\xA0\x80", &code_points));
    CHECK_EQ(code_points.size(), 1u);
    CHECK_EQ(code_points[0], 0xFFFDu);

    CHECK_TRUE(TextUtil::UTF8ToUTF32("\xF4\x8F\xBF\xBF", &code_points));
    CHECK_EQ(code_points[0], 0x10FFFFu);

    // Re-encoding the decoded text must not fail.
    const std::string collapsed(TextUtil::CollapseAndTrimWhitespace("Paper \xF7\xBF\xBF\xBF title"));
    CHECK_EQ(collapsed, "Paper \xEF\xBF\xBD title");
}


TEST(CharacterClasses) {
    CHECK_TRUE(TextUtil::IsLetterOrDigit('Q'));
    CHECK_TRUE(TextUtil::IsLetterOrDigit(0x4E2Du));
    CHECK_FALSE(TextUtil::IsLetterOrDigit('.'));
    CHECK_TRUE(TextUtil::IsLetterOrDigit(0x0639u)); // Arabic letter ain
    CHECK_TRUE(TextUtil::IsLetterOrDigit(0x0663u)); // Arabic-Indic digit three
    CHECK_TRUE(TextUtil::IsLetterOrDigit(0x0915u)); // Devanagari letter ka
    CHECK_TRUE(TextUtil::IsLetterOrDigit(0x0E01u)); // Thai character ko kai
    CHECK_FALSE(TextUtil::IsLetterOrDigit(0x2020u));
    CHECK_TRUE(TextUtil::IsCommonPunctuation(0x0964u)); // Devanagari danda
    CHECK_TRUE(TextUtil::IsCommonPunctuation('.'));
    CHECK_TRUE(TextUtil::IsCommonPunctuation(0x3002u)); // ideographic full stop
    CHECK_FALSE(TextUtil::IsCommonPunctuation(0x2020u)); // dagger
    CHECK_TRUE(TextUtil::IsWhitespace(0x3000u));
    CHECK_FALSE(TextUtil::IsWhitespace('x'));
}


TEST(CollapseAndTrimWhitespace) {
    CHECK_EQ(TextUtil::CollapseAndTrimWhitespace("\xE3\x80\x80 a \xC2\xA0 b  "), "a b");
}


TEST(UTF8ByteTruncate) {
    std::string s("ab\xE4\xB8\xAD");
    CHECK_EQ(TextUtil::UTF8ByteTruncate(&s, 4), "ab");
    s = "abc";
    CHECK_EQ(TextUtil::UTF8ByteTruncate(&s, 5), "abc");
}


TEST(Base64Encode) {
    CHECK_EQ(TextUtil::Base64Encode("Man"), "TWFu");
    CHECK_EQ(TextUtil::Base64Encode("Ma"), "TWE=");
    CHECK_EQ(TextUtil::Base64Encode("M"), "TQ==");
    CHECK_EQ(TextUtil::Base64Encode(""), "");
}


TEST(CSVEscape) {
    CHECK_EQ(TextUtil::CSVEscape("plain"), "plain");
    CHECK_EQ(TextUtil::CSVEscape("a,b"), "\"a,b\"");
    CHECK_EQ(TextUtil::CSVEscape("say \"hi\""), "\"say \"\"hi\"\"\"");
}


TEST_MAIN(TextUtil)
