/** \file   fetch_articles.cc
 *  \brief  Downloads the full text PDFs of articles, trying several sources for each.
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
#include "AcquisitionPipeline.h"
#include "AcquisitionSource.h"
#include "ArticleRecord.h"
#include "DocFetchConfig.h"
#include "FileUtil.h"
#include "RecordUtil.h"
#include "SearchCrawler.h"
#include "StringUtil.h"
#include "util.h"


namespace {


[[noreturn]] void Usage() {
    ::Usage("[--config=path] [--webdriver-url=url] [--sources=name1,name2,...] [--stop-on-failure]\n"
            "[--download-dir=path] [--report=path] [--max=N] [--sort=order] mode\n"
            "where mode is one of\n"
            "    --doi=doi [--title=title] [--link=url]\n"
            "    --title=title [--link=url]\n"
            "    --batch=records.json\n"
            "    --search=keyword\n"
            "--batch reads a JSON array of objects with \"title\", \"doi\" and \"link\" members, e.g. the output of\n"
            "cnki_search.  --search runs a search, incl. the detail pages, and then fetches all hits.  --max and --sort\n"
            "only apply to --search.  Source names are direct, doi, doi_title, aggregator and web_search.  The default\n"
            "is to try all of them in this order.  --report writes one record per article as JSON, or CSV if the path\n"
            "ends in \".csv\".");
}


std::string GetValue(const RecordUtil::FlatRecord &record, const std::string &key) {
    const auto key_and_value(record.find(key));
    return key_and_value == record.cend() ? "" : StringUtil::TrimWhite(key_and_value->second);
}


void LoadBatch(const std::string &path, std::vector<AcquisitionRequest> * const requests) {
    std::vector<RecordUtil::FlatRecord> records;
    std::string error_message;
    if (not RecordUtil::ReadRecords(path, &records, &error_message))
        LOG_ERROR(error_message);

    for (const auto &record : records) {
        // "url" is the absolute form of the possibly relative "link".
        std::string link(GetValue(record, "url"));
        if (link.empty())
            link = GetValue(record, "link");

        const AcquisitionRequest request(GetValue(record, "title"), GetValue(record, "doi"), link);
        if (request.title_.empty() and request.doi_.empty())
            LOG_WARNING("skipping a record w/o a title and a DOI in \"" + path + "\"");
        else
            requests->emplace_back(request);
    }
}


void SearchForRequests(FetchSession * const session, const DocFetch::Config::SearchParams &search_params,
                       const std::string &keyword, std::vector<AcquisitionRequest> * const requests)
{
    SearchCrawler crawler(session, AntiBlockDetector(search_params.anti_block_params_), search_params.crawler_params_);
    for (const auto &article_detail : crawler.searchAndCrawl(keyword, search_params.max_results_, search_params.sort_order_,
                                                             /* get_details = */ true))
        requests->emplace_back(article_detail.title_, article_detail.doi_,
                               article_detail.url_.empty() ? article_detail.link_ : article_detail.url_);

    if (crawler.getState() == SearchCrawler::BLOCKED)
        LOG_WARNING("the site blocked us during the search, only " + std::to_string(requests->size())
                    + " hit(s) will be fetched");
}


} // unnamed namespace


int Main(int argc, char *argv[]) {
    if (argc < 2)
        Usage();

    std::string config_path(DocFetch::GetConfigPath()), webdriver_url, source_list, download_directory, report_path,
                max_results_string, sort_order_name, doi, title, link, batch_path, keyword;
    bool config_path_given(false), stop_on_failure(false);
    for (--argc, ++argv; argc > 0; --argc, ++argv) {
        const std::string arg(argv[0]);
        if (StringUtil::StartsWith(arg, "--config=")) {
            config_path = arg.substr(__builtin_strlen("--config="));
            config_path_given = true;
        } else if (StringUtil::StartsWith(arg, "--webdriver-url="))
            webdriver_url = arg.substr(__builtin_strlen("--webdriver-url="));
        else if (StringUtil::StartsWith(arg, "--sources="))
            source_list = arg.substr(__builtin_strlen("--sources="));
        else if (arg == "--stop-on-failure")
            stop_on_failure = true;
        else if (StringUtil::StartsWith(arg, "--download-dir="))
            download_directory = arg.substr(__builtin_strlen("--download-dir="));
        else if (StringUtil::StartsWith(arg, "--report="))
            report_path = arg.substr(__builtin_strlen("--report="));
        else if (StringUtil::StartsWith(arg, "--max="))
            max_results_string = arg.substr(__builtin_strlen("--max="));
        else if (StringUtil::StartsWith(arg, "--sort="))
            sort_order_name = arg.substr(__builtin_strlen("--sort="));
        else if (StringUtil::StartsWith(arg, "--doi="))
            doi = StringUtil::TrimWhite(arg.substr(__builtin_strlen("--doi=")));
        else if (StringUtil::StartsWith(arg, "--title="))
            title = StringUtil::TrimWhite(arg.substr(__builtin_strlen("--title=")));
        else if (StringUtil::StartsWith(arg, "--link="))
            link = StringUtil::TrimWhite(arg.substr(__builtin_strlen("--link=")));
        else if (StringUtil::StartsWith(arg, "--batch="))
            batch_path = arg.substr(__builtin_strlen("--batch="));
        else if (StringUtil::StartsWith(arg, "--search="))
            keyword = StringUtil::TrimWhite(arg.substr(__builtin_strlen("--search=")));
        else
            Usage();
    }

    const unsigned mode_count((doi.empty() and title.empty() ? 0 : 1) + (batch_path.empty() ? 0 : 1) + (keyword.empty() ? 0 : 1));
    if (mode_count != 1)
        Usage();
    if (not link.empty() and doi.empty() and title.empty())
        LOG_ERROR("--link requires --title or --doi!");

    if (config_path_given and not FileUtil::Exists(config_path))
        LOG_ERROR("configuration file \"" + config_path + "\" does not exist!");
    DocFetch::Config::GlobalParams global_params(config_path);
    if (not webdriver_url.empty())
        global_params.session_params_.webdriver_params_.webdriver_url_ = webdriver_url;
    auto &acquisition_params(global_params.acquisition_params_);
    if (not download_directory.empty())
        acquisition_params.pipeline_params_.download_directory_ = download_directory;
    auto &search_params(global_params.search_params_);
    if (not max_results_string.empty()
        and (not StringUtil::ToUnsigned(max_results_string, &search_params.max_results_) or search_params.max_results_ == 0))
        LOG_ERROR("\"" + max_results_string + "\" is not a valid maximum number of results!");
    if (not sort_order_name.empty() and not ParseSortOrder(sort_order_name, &search_params.sort_order_))
        LOG_ERROR("unknown sort order \"" + sort_order_name + "\"!");

    std::vector<std::string> source_names(acquisition_params.sources_);
    if (not source_list.empty()) {
        StringUtil::Split(source_list, ',', &source_names, /* suppress_empty_components = */ true);
        for (auto &source_name : source_names)
            StringUtil::TrimWhite(&source_name);
    }

    std::vector<AcquisitionRequest> requests;
    if (not batch_path.empty())
        LoadBatch(batch_path, &requests);

    std::vector<AcquisitionResult> results;
    {
        const auto session(DocFetch::CreateFetchSession(global_params.session_params_));
        AcquisitionPipeline pipeline(CreateDefaultSources(session.get(), acquisition_params.source_params_),
                                     acquisition_params.pipeline_params_);
        for (const auto &source_name : source_names) {
            if (not pipeline.isKnownSource(source_name))
                LOG_ERROR("unknown source \"" + source_name + "\", known sources are "
                          + StringUtil::Join(pipeline.getSourceNames(), ", ") + "!");
        }

        if (not keyword.empty())
            SearchForRequests(session.get(), search_params, keyword, &requests);
        else if (batch_path.empty())
            requests.emplace_back(title, doi, link);

        if (requests.empty())
            LOG_WARNING("nothing to fetch");
        results = pipeline.acquireBatch(requests, source_names, stop_on_failure);
    }

    unsigned success_count(0);
    std::vector<RecordUtil::FlatRecord> records;
    for (const auto &result : results) {
        if (result.success_) {
            ++success_count;
            std::cout << result.filepath_ << '\t' << result.source_used_ << '\n';
        } else
            std::cerr << (result.title_.empty() ? result.doi_ : result.title_) << ": " << result.message_ << '\n';
        records.emplace_back(ToFlatRecord(result));
    }

    if (not report_path.empty()) {
        std::string error_message;
        if (not RecordUtil::WriteRecordsToFile(records, report_path, &error_message))
            LOG_ERROR(error_message);
    }

    LOG_INFO("fetched " + std::to_string(success_count) + " of " + std::to_string(requests.size()) + " article(s)");
    return (success_count == requests.size()) ? EXIT_SUCCESS : EXIT_FAILURE;
}
