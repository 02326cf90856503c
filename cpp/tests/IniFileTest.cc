/** \file   IniFileTest.cc
 *  \brief  Tests for the IniFile class.
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
#include <stdexcept>
#include <string>
#include "FileUtil.h"
#include "IniFile.h"
#include "UnitTest.h"


namespace {


// Writes "contents" to a file in "directory" and parses it.
IniFile ParseIniFile(const FileUtil::AutoTempDirectory &directory, const std::string &contents) {
    const std::string path(FileUtil::JoinPaths(directory.getDirectoryPath(), "test.conf"));
    if (not FileUtil::WriteString(path, contents))
        throw std::runtime_error("can't write \"" + path + "\"!");
    return IniFile(path);
}


bool ParseFails(const FileUtil::AutoTempDirectory &directory, const std::string &contents) {
    try {
        ParseIniFile(directory, contents);
    } catch (const std::runtime_error &) {
        return true;
    }

    return false;
}


} // unnamed namespace


TEST(SectionsAndValues) {
    const FileUtil::AutoTempDirectory directory("/tmp/IniFileTest");
    const IniFile ini_file(ParseIniFile(directory,
                                        "global_entry = 1\n"
                                        "# a comment\n"
                                        "[Search]\n"
                                        "row_selector = \"#gridTable tbody tr\"   # quoted because of the hash mark\n"
                                        "max_results = 25 # trailing comment\n"
                                        "\n"
                                        "[Conversion]\n"
                                        "min_readable_ratio = 0.75\n"
                                        "post_process = yes\n"
                                        "add_table_of_contents\n"
                                        "ocr_prompt = \"line 1\\nline 2\"\n"));

    CHECK_EQ(ini_file.getSections().size(), 3u);
    CHECK_EQ(ini_file.getString("", "global_entry"), "1");
    CHECK_EQ(ini_file.getString("Search", "row_selector"), "#gridTable tbody tr");
    CHECK_EQ(ini_file.getUnsigned("Search", "max_results"), 25u);
    CHECK_EQ(ini_file.getDouble("Conversion", "min_readable_ratio"), 0.75);
    CHECK_TRUE(ini_file.getBool("Conversion", "post_process"));
    CHECK_TRUE(ini_file.getBool("Conversion", "add_table_of_contents"));
    CHECK_EQ(ini_file.getString("Conversion", "ocr_prompt"), "line 1\nline 2");

    const IniFile::Section * const section(ini_file.getSection("Search"));
    CHECK_NE(section, nullptr);
    CHECK_EQ(section->size(), 2u);
    CHECK_EQ(section->begin()->name_, "row_selector");
    CHECK_EQ(ini_file.getSection("Session"), nullptr);
}


TEST(Defaults) {
    const FileUtil::AutoTempDirectory directory("/tmp/IniFileTest");
    const IniFile ini_file(ParseIniFile(directory, "[Session]\nbase_delay = 500\n"));

    CHECK_EQ(ini_file.getUnsigned("Session", "base_delay", 2000), 500u);
    CHECK_EQ(ini_file.getUnsigned("Session", "jitter", 1000), 1000u);
    CHECK_EQ(ini_file.getString("Acquisition", "sources", "direct"), "direct");
    CHECK_FALSE(ini_file.getBool("Session", "headless", false));
}


TEST(Errors) {
    const FileUtil::AutoTempDirectory directory("/tmp/IniFileTest");
    CHECK_TRUE(ParseFails(directory, "[Search\n"));
    CHECK_TRUE(ParseFails(directory, "[A]\n[A]\n"));
    CHECK_TRUE(ParseFails(directory, "[A]\nbad name = 1\n"));
    CHECK_TRUE(ParseFails(directory, "[A]\nx = \"unterminated\n"));

    const IniFile ini_file(ParseIniFile(directory, "[A]\nn = twelve\nb = perhaps\n"));
    bool threw(false);
    try {
        ini_file.getUnsigned("A", "n", 1);
    } catch (const std::runtime_error &) {
        threw = true;
    }
    CHECK_TRUE(threw);

    threw = false;
    try {
        ini_file.getBool("A", "b");
    } catch (const std::runtime_error &) {
        threw = true;
    }
    CHECK_TRUE(threw);
}


TEST(MissingFile) {
    const IniFile empty_ini_file("/nonexistent/docfetch.conf", /* create_empty = */ true);
    CHECK_TRUE(empty_ini_file.getSections().empty());

    bool threw(false);
    try {
        const IniFile ini_file("/nonexistent/docfetch.conf");
    } catch (const std::runtime_error &) {
        threw = true;
    }
    CHECK_TRUE(threw);
}


TEST_MAIN(IniFile)
