/** \file   SearchCrawler.h
 *  \brief  Searches the CNKI portal and scrapes the detail pages of the hits.
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
#include <vector>
#include "AntiBlockDetector.h"
#include "ArticleRecord.h"
#include "PageAutomationClient.h"


class FetchSession;


/** \class  SearchCrawler
 *  \brief  Drives a FetchSession through a search, the result list and the detail pages of the hits.
 *  \note   All selectors are CSS selectors.  Every field has a primary and an alternate selector.  The alternate is only
 *          tried if the primary does not match and an empty alternate is skipped.
 */
class SearchCrawler {
public:
    enum State { IDLE, SEARCHING, BLOCKED, RESULTS_PARSED, DETAIL_FETCHING, DONE };

    struct SelectorPair {
        std::string primary_;
        std::string alternate_;
    public:
        SelectorPair() = default;
        SelectorPair(const std::string &primary, const std::string &alternate): primary_(primary), alternate_(alternate) { }
    };

    struct Params {
        std::string search_url_;
        std::string classid_;
        std::string site_url_;       // scheme and host, used to resolve relative links
        std::string sort_parameter_; // the name of the query parameter carrying the sort code

        SelectorPair row_selectors_;
        unsigned row_timeout_;           // in ms, for the primary row selector
        unsigned alternate_row_timeout_; // in ms
        SelectorPair title_link_selectors_;
        SelectorPair author_selectors_;
        SelectorPair source_selectors_;
        SelectorPair date_selectors_;
        unsigned cite_count_cell_index_;     // 0-based index of the table cell with the citation count
        unsigned download_count_cell_index_; // 0-based index of the table cell with the download count
        std::string sort_control_selector_;  // "%ID%" is replaced with the control ID of the sort order

        SelectorPair detail_title_selectors_;
        SelectorPair detail_author_selectors_;
        SelectorPair detail_organization_selectors_;
        SelectorPair detail_abstract_selectors_;
        SelectorPair detail_keywords_selectors_;
        unsigned detail_field_timeout_; // in ms
    public:
        Params();
    };

private:
    FetchSession * const session_;
    AntiBlockDetector anti_block_detector_;
    Params params_;
    State state_;

public:
    /** \note "session" must outlive the crawler. */
    SearchCrawler(FetchSession * const session, const AntiBlockDetector &anti_block_detector = AntiBlockDetector(),
                  const Params &params = Params());

    /** \brief  Runs a search and parses at most "max_results" rows of the first result page.
     *  \return The parsed rows.  Empty if we have been blocked or nothing was found.
     */
    std::vector<SearchResult> search(const std::string &keyword, const unsigned max_results,
                                     const SortOrder sort_order = SortOrder::RELEVANCE);

    /** \brief  Scrapes the detail page "link".  Relative and protocol-relative links are resolved against the site URL.
     *  \return False if we are or became blocked or the page could not be loaded.
     */
    bool getDetail(const std::string &link, ArticleDetail * const detail);

    /** \brief  Runs a search and, if "get_details" is true, merges the detail page of each hit into its record.
     *  \note   If we get blocked while fetching details, the remaining hits are returned w/o details.
     */
    std::vector<ArticleDetail> searchAndCrawl(const std::string &keyword, const unsigned max_results,
                                              const SortOrder sort_order = SortOrder::RELEVANCE, const bool get_details = true);

    State getState() const { return state_; }
    const Params &getParams() const { return params_; }

    /** \return The search URL for "keyword" and "sort_order". */
    std::string buildSearchUrl(const std::string &keyword, const SortOrder sort_order) const;

    /** \return The first DOI found in "page_source" or the empty string. */
    static std::string ExtractDOI(const std::string &page_source);

    static std::string StateToString(const State state);

private:
    void setState(const State new_state);
    void applySortOrder(const SortOrder sort_order);
    bool parseRow(const PageAutomationClient::ElementHandle &row, SearchResult * const search_result);
    std::string getChildTextWithFallback(const PageAutomationClient::ElementHandle &parent, const SelectorPair &selectors);
    std::string getPageTextWithFallback(const SelectorPair &selectors);
};
