/** \file   cnki_search.cc
 *  \brief  Searches CNKI for a keyword and writes the hits, optionally enriched from their detail pages.
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
#include <iostream>
#include <string>
#include <vector>
#include <cstdlib>
#include "ArticleRecord.h"
#include "DocFetchConfig.h"
#include "FileUtil.h"
#include "RecordUtil.h"
#include "SearchCrawler.h"
#include "StringUtil.h"
#include "util.h"


namespace {


[[noreturn]] void Usage() {
    ::Usage("[--config=path] [--webdriver-url=url] [--max=N] [--sort=(relevance|date|cited|download)] [--fields=a,b,c]\n"
            "[--no-details] [--output=path] keyword\n"
            "Without --output the records are written to stdout as JSON.  An output path ending in \".csv\" selects CSV.\n"
            "--fields restricts the output to the listed fields, e.g. --fields=title,authors,doi.\n"
            "--no-details skips the detail pages and only reports what the result list shows.");
}


} // unnamed namespace


int Main(int argc, char *argv[]) {
    if (argc < 2)
        Usage();

    std::string config_path(DocFetch::GetConfigPath()), webdriver_url, max_results_string, sort_order_name, fields, output_path;
    bool config_path_given(false), no_details(false);
    while (argc > 2 and StringUtil::StartsWith(argv[1], "--")) {
        const std::string arg(argv[1]);
        if (StringUtil::StartsWith(arg, "--config=")) {
            config_path = arg.substr(__builtin_strlen("--config="));
            config_path_given = true;
        } else if (StringUtil::StartsWith(arg, "--webdriver-url="))
            webdriver_url = arg.substr(__builtin_strlen("--webdriver-url="));
        else if (StringUtil::StartsWith(arg, "--max="))
            max_results_string = arg.substr(__builtin_strlen("--max="));
        else if (StringUtil::StartsWith(arg, "--sort="))
            sort_order_name = arg.substr(__builtin_strlen("--sort="));
        else if (StringUtil::StartsWith(arg, "--fields="))
            fields = arg.substr(__builtin_strlen("--fields="));
        else if (arg == "--no-details")
            no_details = true;
        else if (StringUtil::StartsWith(arg, "--output="))
            output_path = arg.substr(__builtin_strlen("--output="));
        else
            Usage();
        --argc, ++argv;
    }
    if (argc != 2)
        Usage();
    const std::string keyword(StringUtil::TrimWhite(argv[1]));
    if (keyword.empty())
        LOG_ERROR("the keyword must not be empty!");

    if (config_path_given and not FileUtil::Exists(config_path))
        LOG_ERROR("configuration file \"" + config_path + "\" does not exist!");
    DocFetch::Config::GlobalParams global_params(config_path);
    auto &search_params(global_params.search_params_);
    if (not webdriver_url.empty())
        global_params.session_params_.webdriver_params_.webdriver_url_ = webdriver_url;
    if (not max_results_string.empty()
        and (not StringUtil::ToUnsigned(max_results_string, &search_params.max_results_) or search_params.max_results_ == 0))
        LOG_ERROR("\"" + max_results_string + "\" is not a valid maximum number of results!");
    if (not sort_order_name.empty() and not ParseSortOrder(sort_order_name, &search_params.sort_order_))
        LOG_ERROR("unknown sort order \"" + sort_order_name + "\"!");
    if (no_details)
        search_params.get_details_ = false;

    std::vector<std::string> field_names;
    StringUtil::Split(fields, ',', &field_names, /* suppress_empty_components = */ true);
    for (auto &field_name : field_names)
        StringUtil::TrimWhite(&field_name);

    std::vector<RecordUtil::FlatRecord> records;
    SearchCrawler::State final_state;
    {
        const auto session(DocFetch::CreateFetchSession(global_params.session_params_));
        SearchCrawler crawler(session.get(), AntiBlockDetector(search_params.anti_block_params_), search_params.crawler_params_);
        for (const auto &article_detail : crawler.searchAndCrawl(keyword, search_params.max_results_, search_params.sort_order_,
                                                                 search_params.get_details_))
            records.emplace_back(RecordUtil::ProjectFields(ToFlatRecord(article_detail), field_names));
        final_state = crawler.getState();
    }

    if (final_state == SearchCrawler::BLOCKED)
        LOG_WARNING("the site blocked us, the results are incomplete");
    LOG_INFO("found " + std::to_string(records.size()) + " record(s) for \"" + keyword + "\"");

    if (output_path.empty())
        RecordUtil::WriteJSON(records, std::cout);
    else {
        std::string error_message;
        if (not RecordUtil::WriteRecordsToFile(records, output_path, &error_message))
            LOG_ERROR(error_message);
        LOG_INFO("wrote the records to \"" + output_path + "\"");
    }

    return (final_state == SearchCrawler::BLOCKED and records.empty()) ? EXIT_FAILURE : EXIT_SUCCESS;
}
