/** \file   ArticleRecordTest.cc
 *  \brief  Tests for the article records and their JSON and CSV representations.
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
#include <sstream>
#include <string>
#include <vector>
#include "ArticleRecord.h"
#include "FileUtil.h"
#include "RecordUtil.h"
#include "StringUtil.h"
#include "UnitTest.h"


namespace {


SearchResult MakeSearchResult() {
    SearchResult search_result;
    search_result.title_          = "基于深度学习的文本分类";
    search_result.link_           = "/kcms2/article/abstract?v=abc";
    search_result.authors_        = "张三; 李四";
    search_result.source_         = "计算机学报";
    search_result.pub_date_       = "2023-05-01";
    search_result.cite_count_     = "12";
    search_result.download_count_ = "0";
    return search_result;
}


} // unnamed namespace


TEST(SortOrders) {
    SortOrder sort_order(SortOrder::RELEVANCE);
    CHECK_TRUE(ParseSortOrder("Date", &sort_order));
    CHECK_TRUE(sort_order == SortOrder::DATE);
    CHECK_TRUE(ParseSortOrder("citedCount", &sort_order));
    CHECK_TRUE(sort_order == SortOrder::CITED_COUNT);
    CHECK_TRUE(ParseSortOrder("download", &sort_order));
    CHECK_TRUE(sort_order == SortOrder::DOWNLOAD_COUNT);
    CHECK_FALSE(ParseSortOrder("popularity", &sort_order));
    CHECK_TRUE(sort_order == SortOrder::DOWNLOAD_COUNT);

    CHECK_EQ(SortOrderToString(SortOrder::CITED_COUNT), "cited");
    CHECK_EQ(SortOrderToQueryCode(SortOrder::RELEVANCE), "");
    CHECK_EQ(SortOrderToQueryCode(SortOrder::DATE), "PT");
    CHECK_EQ(SortOrderToControlId(SortOrder::DOWNLOAD_COUNT), "DFR");
}


TEST(MergeArticleDetail) {
    const SearchResult search_result(MakeSearchResult());

    ArticleDetail detail;
    detail.title_          = "基于深度学习的文本分类研究";
    detail.authors_        = "";
    detail.abstract_       = "本文提出了一种方法。";
    detail.doi_            = "10.1234/jc.2023.001";
    detail.cite_count_     = "99";
    detail.download_count_ = "345";
    detail.enriched_       = true;

    const ArticleDetail merged(MergeArticleDetail(search_result, detail));
    CHECK_EQ(merged.title_, detail.title_);
    CHECK_EQ(merged.authors_, search_result.authors_);
    CHECK_EQ(merged.source_, search_result.source_);
    CHECK_EQ(merged.link_, search_result.link_);
    CHECK_EQ(merged.abstract_, detail.abstract_);
    CHECK_EQ(merged.doi_, detail.doi_);
    CHECK_EQ(merged.cite_count_, "12");
    CHECK_EQ(merged.download_count_, "345");
    CHECK_TRUE(merged.enriched_);
}


TEST(FlatRecords) {
    const SearchResult search_result(MakeSearchResult());
    const RecordUtil::FlatRecord search_record(ToFlatRecord(search_result));
    CHECK_EQ(search_record.size(), 7u);
    CHECK_EQ(search_record.at("pubDate"), "2023-05-01");
    CHECK_EQ(search_record.at("citeCount"), "12");

    const ArticleDetail unenriched(search_result);
    CHECK_FALSE(unenriched.enriched_);
    const RecordUtil::FlatRecord unenriched_record(ToFlatRecord(unenriched));
    CHECK_EQ(unenriched_record.size(), 7u);
    CHECK_TRUE(unenriched_record.find("abstract") == unenriched_record.cend());

    ArticleDetail detail;
    detail.doi_ = "10.1234/x";
    const RecordUtil::FlatRecord enriched_record(ToFlatRecord(MergeArticleDetail(search_result, detail)));
    CHECK_EQ(enriched_record.size(), 13u);
    CHECK_EQ(enriched_record.at("doi"), "10.1234/x");
    CHECK_EQ(enriched_record.at("title"), search_result.title_);
}


TEST(ProjectFields) {
    const RecordUtil::FlatRecord record(ToFlatRecord(MakeSearchResult()));

    const RecordUtil::FlatRecord projected(RecordUtil::ProjectFields(record, { "title", "doi" }));
    CHECK_EQ(projected.size(), 2u);
    CHECK_EQ(projected.at("title"), record.at("title"));
    CHECK_EQ(projected.at("doi"), "");

    CHECK_EQ(RecordUtil::ProjectFields(record, {}).size(), record.size());
}


TEST(WriteJSON) {
    std::ostringstream empty_output;
    RecordUtil::WriteJSON({}, empty_output);
    CHECK_EQ(empty_output.str(), "[]\n");

    std::ostringstream output;
    RecordUtil::WriteJSON({ { { "title", "A \"quoted\" title" } }, { { "doi", "10.1/x" } } }, output);
    const std::string json(output.str());
    CHECK_TRUE(StringUtil::Contains(json, "\"title\": \"A \\\"quoted\\\" title\""));
    CHECK_TRUE(StringUtil::Contains(json, "\"doi\": \"10.1/x\""));
    CHECK_TRUE(StringUtil::Contains(json, "\"doi\": \"\""));
}


TEST(WriteCSV) {
    std::ostringstream output;
    RecordUtil::WriteCSV({ { { "title", "A, B" }, { "doi", "10.1/x" } }, { { "title", "C" } } }, output);
    CHECK_EQ(output.str(), "doi,title\r\n10.1/x,\"A, B\"\r\n,C\r\n");
}


TEST(ReadRecords) {
    const FileUtil::AutoTempDirectory directory("/tmp/ArticleRecordTest");
    const std::string path(FileUtil::JoinPaths(directory.getDirectoryPath(), "records.json"));
    CHECK_TRUE(FileUtil::WriteString(path, "[ { \"title\": \"T\", \"year\": 2020, \"note\": null }, { \"doi\": \"10.1/y\" } ]"));

    std::vector<RecordUtil::FlatRecord> records;
    std::string error_message;
    CHECK_TRUE(RecordUtil::ReadRecords(path, &records, &error_message));
    CHECK_EQ(records.size(), 2u);
    CHECK_EQ(records[0].at("title"), "T");
    CHECK_EQ(records[0].at("year"), "2020");
    CHECK_TRUE(records[0].find("note") == records[0].cend());
    CHECK_EQ(records[1].at("doi"), "10.1/y");

    CHECK_TRUE(FileUtil::WriteString(path, "{ \"title\": \"not an array\" }"));
    CHECK_FALSE(RecordUtil::ReadRecords(path, &records, &error_message));
    CHECK_TRUE(FileUtil::WriteString(path, "[ 1, 2 ]"));
    CHECK_FALSE(RecordUtil::ReadRecords(path, &records, &error_message));
    CHECK_TRUE(FileUtil::WriteString(path, "[ { \"title\": "));
    CHECK_FALSE(RecordUtil::ReadRecords(path, &records, &error_message));
}


TEST(WriteRecordsToFile) {
    const FileUtil::AutoTempDirectory directory("/tmp/ArticleRecordTest");
    const std::vector<RecordUtil::FlatRecord> records{ ToFlatRecord(MakeSearchResult()) };

    const std::string csv_path(FileUtil::JoinPaths(directory.getDirectoryPath(), "out/records.CSV"));
    std::string error_message;
    CHECK_TRUE(RecordUtil::WriteRecordsToFile(records, csv_path, &error_message));
    std::string csv;
    CHECK_TRUE(FileUtil::ReadString(csv_path, &csv));
    CHECK_TRUE(StringUtil::StartsWith(csv, "authors,citeCount,downloadCount,link,pubDate,source,title\r\n"));

    const std::string json_path(FileUtil::JoinPaths(directory.getDirectoryPath(), "records.json"));
    CHECK_TRUE(RecordUtil::WriteRecordsToFile(records, json_path, &error_message));
    std::vector<RecordUtil::FlatRecord> read_records;
    CHECK_TRUE(RecordUtil::ReadRecords(json_path, &read_records, &error_message));
    CHECK_EQ(read_records.size(), 1u);
    CHECK_TRUE(read_records[0] == records[0]);
}


TEST_MAIN(ArticleRecord)
