/** \file   ArticleRecord.h
 *  \brief  The records produced by searching for and crawling articles.
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
#include "RecordUtil.h"


enum class SortOrder { RELEVANCE, DATE, CITED_COUNT, DOWNLOAD_COUNT };


/** \brief  Parses "relevance", "date", "cited" and "download".  "citedCount" and "downloadCount" are accepted, too.
 *  \return False if "name" is none of the above.
 */
bool ParseSortOrder(const std::string &name, SortOrder * const sort_order);


std::string SortOrderToString(const SortOrder sort_order);


/** \return The value of the sort query parameter for "sort_order" or the empty string for relevance ranking. */
std::string SortOrderToQueryCode(const SortOrder sort_order);


/** \return The ID of the element on the results page that switches to "sort_order". */
std::string SortOrderToControlId(const SortOrder sort_order);


// One row of a result list.
struct SearchResult {
    std::string title_;
    std::string link_;
    std::string authors_;
    std::string source_;
    std::string pub_date_;
    std::string cite_count_;
    std::string download_count_;
public:
    SearchResult(): cite_count_("0"), download_count_("0") { }
};


struct ArticleDetail {
    std::string title_;
    std::string link_;
    std::string authors_;
    std::string source_;
    std::string pub_date_;
    std::string cite_count_;
    std::string download_count_;
    std::string abstract_;
    std::string keywords_;
    std::string doi_;
    std::string organization_;
    std::string url_;        // the normalised detail page URL
    std::string crawl_time_; // "YYYY-MM-DD HH:MM:SS"
    bool enriched_;          // false if no detail page has been merged in
public:
    ArticleDetail(): cite_count_("0"), download_count_("0"), enriched_(false) { }

    /** \brief Wraps a result list row w/o detail information. */
    explicit ArticleDetail(const SearchResult &search_result);
};


/** \brief  Combines a row of a result list with the data scraped from the article's detail page.
 *  \note   The counters take the value from the result list unless it is "0" or empty.  All other fields take the
 *          value from the detail page unless it is empty.
 */
ArticleDetail MergeArticleDetail(const SearchResult &search_result, const ArticleDetail &detail);


/** \brief  Converts to a flat record with the keys title, link, authors, source, pubDate, citeCount and downloadCount. */
RecordUtil::FlatRecord ToFlatRecord(const SearchResult &search_result);


/** \brief  Like the SearchResult version, but if "article_detail" has been enriched the keys abstract, keywords, doi,
 *          organization, url and crawlTime are included as well.
 */
RecordUtil::FlatRecord ToFlatRecord(const ArticleDetail &article_detail);
