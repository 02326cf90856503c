/** \file   DocFetchConfigTest.cc
 *  \brief  Tests for the configuration file handling.
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
#include <cstdlib>
#include "DocFetchConfig.h"
#include "FileUtil.h"
#include "StringUtil.h"
#include "UnitTest.h"


namespace {


// Writes "contents" to a config file in "directory" and returns its path.
std::string WriteConfig(const FileUtil::AutoTempDirectory &directory, const std::string &contents) {
    const std::string config_path(FileUtil::JoinPaths(directory.getDirectoryPath(), "docfetch.conf"));
    if (not FileUtil::WriteString(config_path, contents))
        throw std::runtime_error("can't write \"" + config_path + "\"!");
    return config_path;
}


} // unnamed namespace


TEST(SplitList) {
    const auto list(DocFetch::Config::SplitList(" #verify-bar-box | .verify-wrap||  .nc-container "));
    CHECK_EQ(list.size(), 3u);
    CHECK_EQ(list[0], "#verify-bar-box");
    CHECK_EQ(list[2], ".nc-container");
    CHECK_TRUE(DocFetch::Config::SplitList("").empty());
    CHECK_TRUE(DocFetch::Config::SplitList(" | ").empty());
}


TEST(MissingFileMeansDefaults) {
    const FileUtil::AutoTempDirectory directory("/tmp/DocFetchConfigTest_");
    const DocFetch::Config::GlobalParams global_params(FileUtil::JoinPaths(directory.getDirectoryPath(), "missing.conf"));
    CHECK_EQ(global_params.search_params_.max_results_, 20u);
    CHECK_TRUE(global_params.search_params_.get_details_);
    CHECK_TRUE(global_params.search_params_.sort_order_ == SortOrder::RELEVANCE);
    CHECK_EQ(global_params.conversion_params_.router_params_.lightweight_backend_, "pdftotext");
    CHECK_EQ(global_params.conversion_params_.router_params_.ocr_backend_, "vision_ocr");
    CHECK_FALSE(global_params.conversion_params_.post_process_);
    CHECK_TRUE(global_params.acquisition_params_.sources_.empty());
}


TEST(SectionsOverrideDefaults) {
    const FileUtil::AutoTempDirectory directory("/tmp/DocFetchConfigTest_");
    const std::string config_path(WriteConfig(directory,
        "[Session]\n"
        "base_delay = 0\n"
        "headless = false\n"
        "\n"
        "[Search]\n"
        "max_results = 5\n"
        "sort = cited\n"
        "get_details = no\n"
        "row_selector = \"#gridTable tr\" # a comment\n"
        "block_title_keywords = 验证 | captcha\n"
        "\n"
        "[Acquisition]\n"
        "sources = doi | web_search\n"
        "max_filename_length = 50\n"
        "\n"
        "[Conversion]\n"
        "min_readable_ratio = 0.7\n"
        "max_pages = 3\n"
        "add_table_of_contents = yes\n"));

    const DocFetch::Config::GlobalParams global_params(config_path);
    CHECK_EQ(global_params.session_params_.fetch_session_params_.base_delay_, 0u);
    CHECK_FALSE(global_params.session_params_.webdriver_params_.headless_);

    const auto &search_params(global_params.search_params_);
    CHECK_EQ(search_params.max_results_, 5u);
    CHECK_TRUE(search_params.sort_order_ == SortOrder::CITED_COUNT);
    CHECK_FALSE(search_params.get_details_);
    CHECK_EQ(search_params.crawler_params_.row_selectors_.primary_, "#gridTable tr");
    CHECK_EQ(search_params.anti_block_params_.title_keywords_.size(), 2u);
    CHECK_EQ(search_params.anti_block_params_.title_keywords_[0], "验证");

    const auto &acquisition_params(global_params.acquisition_params_);
    CHECK_EQ(StringUtil::Join(acquisition_params.sources_, ","), "doi,web_search");
    CHECK_EQ(acquisition_params.pipeline_params_.max_filename_length_, 50u);

    const auto &conversion_params(global_params.conversion_params_);
    CHECK_EQ(conversion_params.router_params_.classifier_params_.min_readable_ratio_, 0.7);
    CHECK_EQ(conversion_params.pdftotext_params_.max_pages_, 3u);
    CHECK_EQ(conversion_params.tesseract_params_.max_pages_, 3u);
    CHECK_TRUE(conversion_params.add_table_of_contents_);
}


TEST(InvalidValuesAreRejected) {
    const FileUtil::AutoTempDirectory directory("/tmp/DocFetchConfigTest_");
    bool threw(false);
    try {
        const DocFetch::Config::GlobalParams global_params(WriteConfig(directory, "[Search]\nsort = alphabetical\n"));
    } catch (const std::runtime_error &) {
        threw = true;
    }
    CHECK_TRUE(threw);

    threw = false;
    try {
        const DocFetch::Config::GlobalParams global_params(WriteConfig(directory, "[Search]\nmax_results = many\n"));
    } catch (const std::runtime_error &) {
        threw = true;
    }
    CHECK_TRUE(threw);
}


TEST(GetOcrCredential) {
    ::unsetenv("DOCFETCH_OCR_API_KEY");
    ::unsetenv("DS_OCR_API_KEY");
    ::unsetenv("SILICONFLOW_API_KEY");
    ::unsetenv("OPENAI_API_KEY");
    CHECK_EQ(DocFetch::Config::GetOcrCredential(""), "");

    ::setenv("OPENAI_API_KEY", "openai-key", /* overwrite = */ 1);
    CHECK_EQ(DocFetch::Config::GetOcrCredential(""), "openai-key");
    ::setenv("DS_OCR_API_KEY", "ds-key", /* overwrite = */ 1);
    CHECK_EQ(DocFetch::Config::GetOcrCredential(""), "ds-key");
    CHECK_EQ(DocFetch::Config::GetOcrCredential("configured-key"), "configured-key");
}


TEST_MAIN(DocFetchConfig)
