/** \file   StringUtilTest.cc
 *  \brief  Tests for the string utility functions.
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
#include "StringUtil.h"
#include "UnitTest.h"


TEST(CollapseAndTrimWhitespace) {
    CHECK_EQ(StringUtil::CollapseAndTrimWhitespace("  a \t b\n\nc  "), "a b c");
    CHECK_EQ(StringUtil::CollapseAndTrimWhitespace(" \t\n "), "");
    CHECK_EQ(StringUtil::CollapseAndTrimWhitespace("abc"), "abc");
}


TEST(Trim) {
    CHECK_EQ(StringUtil::TrimWhite("\t x y \n"), "x y");
    CHECK_EQ(StringUtil::Trim("\"',.;", "10.1234/abc.;"), "10.1234/abc");
    std::string s("   ");
    CHECK_EQ(StringUtil::TrimWhite(&s), "");
}


TEST(StartsWithAndEndsWith) {
    CHECK_TRUE(StringUtil::StartsWith("--config=x", "--config="));
    CHECK_FALSE(StringUtil::StartsWith("--con", "--config="));
    CHECK_TRUE(StringUtil::StartsWith("HTTPS://x", "https://", /* ignore_case = */ true));
    CHECK_TRUE(StringUtil::EndsWith("paper.PDF", ".pdf", /* ignore_case = */ true));
    CHECK_FALSE(StringUtil::EndsWith("paper.PDF", ".pdf"));
    CHECK_FALSE(StringUtil::EndsWith("f", ".pdf"));
}


TEST(Split) {
    std::vector<std::string> components;
    CHECK_EQ(StringUtil::Split("a,,b,", ',', &components), 2u);
    CHECK_EQ(components[0], "a");
    CHECK_EQ(components[1], "b");

    CHECK_EQ(StringUtil::Split("a,,b,", ',', &components, /* suppress_empty_components = */ false), 4u);
    CHECK_EQ(components[1], "");
    CHECK_EQ(components[3], "");

    CHECK_EQ(StringUtil::Split("x--y", "--", &components), 2u);
    CHECK_EQ(components[1], "y");

    CHECK_EQ(StringUtil::Split("", ',', &components), 0u);
    CHECK_TRUE(components.empty());
}


TEST(Join) {
    CHECK_EQ(StringUtil::Join({ "a", "b", "c" }, ", "), "a, b, c");
    CHECK_EQ(StringUtil::Join({}, ", "), "");
}


TEST(ReplaceString) {
    std::string selector("#orderList li#%ID%");
    CHECK_EQ(StringUtil::ReplaceString("%ID%", "FFD", &selector), 1u);
    CHECK_EQ(selector, "#orderList li#FFD");

    std::string s("aaa");
    CHECK_EQ(StringUtil::ReplaceString("a", "aa", &s), 3u);
    CHECK_EQ(s, "aaaaaa");
}


TEST(Conversions) {
    unsigned n(0);
    CHECK_TRUE(StringUtil::ToUnsigned("42", &n));
    CHECK_EQ(n, 42u);
    CHECK_FALSE(StringUtil::ToUnsigned("-1", &n));
    CHECK_FALSE(StringUtil::ToUnsigned("", &n));
    CHECK_FALSE(StringUtil::ToUnsigned("99999999999", &n));

    double d(0.0);
    CHECK_TRUE(StringUtil::ToDouble("0.25", &d));
    CHECK_EQ(d, 0.25);
    CHECK_FALSE(StringUtil::ToDouble("0.25x", &d));

    bool b(false);
    CHECK_TRUE(StringUtil::ToBool(" Yes ", &b));
    CHECK_TRUE(b);
    CHECK_TRUE(StringUtil::ToBool("off", &b));
    CHECK_FALSE(b);
    CHECK_FALSE(StringUtil::ToBool("maybe", &b));
}


TEST_MAIN(StringUtil)
