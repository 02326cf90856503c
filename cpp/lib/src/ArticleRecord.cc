/** \file   ArticleRecord.cc
 *  \brief  Implementation of the article record functions.
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
#include "ArticleRecord.h"
#include "StringUtil.h"
#include "util.h"


namespace {


inline bool CounterIsSet(const std::string &counter) {
    return not counter.empty() and counter != "0";
}


inline const std::string &PreferNonEmpty(const std::string &preferred_value, const std::string &fallback_value) {
    return preferred_value.empty() ? fallback_value : preferred_value;
}


} // unnamed namespace


bool ParseSortOrder(const std::string &name, SortOrder * const sort_order) {
    const std::string lowercase_name(StringUtil::ASCIIToLower(name));
    if (lowercase_name == "relevance")
        *sort_order = SortOrder::RELEVANCE;
    else if (lowercase_name == "date")
        *sort_order = SortOrder::DATE;
    else if (lowercase_name == "cited" or lowercase_name == "citedcount")
        *sort_order = SortOrder::CITED_COUNT;
    else if (lowercase_name == "download" or lowercase_name == "downloadcount")
        *sort_order = SortOrder::DOWNLOAD_COUNT;
    else
        return false;

    return true;
}


std::string SortOrderToString(const SortOrder sort_order) {
    switch (sort_order) {
    case SortOrder::RELEVANCE:
        return "relevance";
    case SortOrder::DATE:
        return "date";
    case SortOrder::CITED_COUNT:
        return "cited";
    case SortOrder::DOWNLOAD_COUNT:
        return "download";
    }

    LOG_ERROR("unknown sort order " + std::to_string(static_cast<int>(sort_order)) + "!");
}


std::string SortOrderToQueryCode(const SortOrder sort_order) {
    switch (sort_order) {
    case SortOrder::RELEVANCE:
        return "";
    case SortOrder::DATE:
        return "PT";
    case SortOrder::CITED_COUNT:
        return "FC";
    case SortOrder::DOWNLOAD_COUNT:
        return "FD";
    }

    LOG_ERROR("unknown sort order " + std::to_string(static_cast<int>(sort_order)) + "!");
}


std::string SortOrderToControlId(const SortOrder sort_order) {
    switch (sort_order) {
    case SortOrder::RELEVANCE:
        return "FFD";
    case SortOrder::DATE:
        return "PT";
    case SortOrder::CITED_COUNT:
        return "CF";
    case SortOrder::DOWNLOAD_COUNT:
        return "DFR";
    }

    LOG_ERROR("unknown sort order " + std::to_string(static_cast<int>(sort_order)) + "!");
}


ArticleDetail::ArticleDetail(const SearchResult &search_result)
    : title_(search_result.title_), link_(search_result.link_), authors_(search_result.authors_),
      source_(search_result.source_), pub_date_(search_result.pub_date_), cite_count_(search_result.cite_count_),
      download_count_(search_result.download_count_), enriched_(false)
{
}


ArticleDetail MergeArticleDetail(const SearchResult &search_result, const ArticleDetail &detail) {
    ArticleDetail merged(detail);

    merged.title_   = PreferNonEmpty(detail.title_, search_result.title_);
    merged.link_    = PreferNonEmpty(detail.link_, search_result.link_);
    merged.authors_ = PreferNonEmpty(detail.authors_, search_result.authors_);
    merged.source_  = PreferNonEmpty(detail.source_, search_result.source_);
    merged.pub_date_ = PreferNonEmpty(detail.pub_date_, search_result.pub_date_);

    merged.cite_count_ = CounterIsSet(search_result.cite_count_) ? search_result.cite_count_
                                                                 : PreferNonEmpty(detail.cite_count_, "0");
    merged.download_count_ = CounterIsSet(search_result.download_count_) ? search_result.download_count_
                                                                         : PreferNonEmpty(detail.download_count_, "0");
    merged.enriched_ = true;

    return merged;
}


RecordUtil::FlatRecord ToFlatRecord(const SearchResult &search_result) {
    return RecordUtil::FlatRecord{
        { "title", search_result.title_ },
        { "link", search_result.link_ },
        { "authors", search_result.authors_ },
        { "source", search_result.source_ },
        { "pubDate", search_result.pub_date_ },
        { "citeCount", search_result.cite_count_ },
        { "downloadCount", search_result.download_count_ },
    };
}


RecordUtil::FlatRecord ToFlatRecord(const ArticleDetail &article_detail) {
    RecordUtil::FlatRecord record{
        { "title", article_detail.title_ },
        { "link", article_detail.link_ },
        { "authors", article_detail.authors_ },
        { "source", article_detail.source_ },
        { "pubDate", article_detail.pub_date_ },
        { "citeCount", article_detail.cite_count_ },
        { "downloadCount", article_detail.download_count_ },
    };

    if (article_detail.enriched_) {
        record["abstract"]     = article_detail.abstract_;
        record["keywords"]     = article_detail.keywords_;
        record["doi"]          = article_detail.doi_;
        record["organization"] = article_detail.organization_;
        record["url"]          = article_detail.url_;
        record["crawlTime"]    = article_detail.crawl_time_;
    }

    return record;
}
