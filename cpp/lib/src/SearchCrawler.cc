/** \file   SearchCrawler.cc
 *  \brief  Implementation of the SearchCrawler class.
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
#include "SearchCrawler.h"
#include "FetchSession.h"
#include "RegexMatcher.h"
#include "StringUtil.h"
#include "TimeUtil.h"
#include "UrlUtil.h"
#include "util.h"


namespace {


// Characters that frequently trail a DOI in running text but are never part of it.
const std::string DOI_TRAILING_JUNK("\"',.;");


// \return The text of the table cell, but only if it consists of digits, else "0".
std::string GetCounterFromCell(FetchSession * const session, const std::vector<PageAutomationClient::ElementHandle> &cells,
                               const unsigned cell_index)
{
    if (cell_index >= cells.size())
        return "0";

    const std::string cell_text(StringUtil::TrimWhite(session->getText(cells[cell_index])));
    return StringUtil::IsUnsignedNumber(cell_text) ? cell_text : "0";
}


} // unnamed namespace


SearchCrawler::Params::Params()
    : search_url_("https://kns.cnki.net/kns8s/search"), classid_("WD0FTY92"), site_url_("https://kns.cnki.net"),
      sort_parameter_("sort"),
      row_selectors_(".result-table-list tbody tr", "#gridTable tbody tr"), row_timeout_(10000), alternate_row_timeout_(5000),
      title_link_selectors_(".name a", "td.name a"), author_selectors_(".author", "td.author"),
      source_selectors_(".source", "td.source"), date_selectors_(".date", "td.date"), cite_count_cell_index_(6),
      download_count_cell_index_(7), sort_control_selector_("#orderList li#%ID%"),
      detail_title_selectors_(".wx-tit h1", "h1.title"), detail_author_selectors_(".author", ""),
      detail_organization_selectors_(".orgn", ""), detail_abstract_selectors_(".abstract-text", "#ChDivSummary"),
      detail_keywords_selectors_(".keywords", ""), detail_field_timeout_(3000)
{
}


SearchCrawler::SearchCrawler(FetchSession * const session, const AntiBlockDetector &anti_block_detector, const Params &params)
    : session_(session), anti_block_detector_(anti_block_detector), params_(params), state_(IDLE)
{
}


std::vector<SearchResult> SearchCrawler::search(const std::string &keyword, const unsigned max_results, const SortOrder sort_order) {
    setState(SEARCHING);

    const std::string search_url(buildSearchUrl(keyword, sort_order));
    LOG_INFO("searching for \"" + keyword + "\", sorted by " + SortOrderToString(sort_order));
    if (not session_->navigate(search_url)) {
        if (session_->isBlocked())
            setState(BLOCKED);
        else
            LOG_WARNING("failed to load \"" + search_url + "\"!");
        return {};
    }

    session_->pause();
    if (anti_block_detector_.check(session_)) {
        setState(BLOCKED);
        return {};
    }

    if (sort_order != SortOrder::RELEVANCE)
        applySortOrder(sort_order);

    auto rows(session_->findElements(params_.row_selectors_.primary_, params_.row_timeout_));
    if (rows.empty() and not params_.row_selectors_.alternate_.empty())
        rows = session_->findElements(params_.row_selectors_.alternate_, params_.alternate_row_timeout_);
    LOG_INFO("found " + std::to_string(rows.size()) + " result row(s)");

    std::vector<SearchResult> search_results;
    for (const auto &row : rows) {
        if (search_results.size() >= max_results or session_->isBlocked())
            break;

        SearchResult search_result;
        if (parseRow(row, &search_result))
            search_results.emplace_back(search_result);
    }

    setState(session_->isBlocked() ? BLOCKED : RESULTS_PARSED);
    return search_results;
}


bool SearchCrawler::getDetail(const std::string &link, ArticleDetail * const detail) {
    if (session_->isBlocked()) {
        setState(BLOCKED);
        return false;
    }

    const std::string url(UrlUtil::MakeAbsoluteUrl(params_.site_url_, link));
    if (not session_->navigate(url)) {
        LOG_WARNING("failed to load the detail page \"" + url + "\"!");
        return false;
    }

    session_->pause();
    if (anti_block_detector_.check(session_)) {
        setState(BLOCKED);
        return false;
    }

    *detail = ArticleDetail();
    detail->title_        = getPageTextWithFallback(params_.detail_title_selectors_);
    detail->authors_      = getPageTextWithFallback(params_.detail_author_selectors_);
    detail->organization_ = getPageTextWithFallback(params_.detail_organization_selectors_);
    detail->abstract_     = getPageTextWithFallback(params_.detail_abstract_selectors_);
    detail->keywords_     = getPageTextWithFallback(params_.detail_keywords_selectors_);
    detail->doi_          = ExtractDOI(session_->getPageSource());
    detail->link_         = link;
    detail->url_          = url;
    detail->crawl_time_   = TimeUtil::GetCurrentDateAndTime(TimeUtil::DEFAULT_FORMAT);
    detail->enriched_     = true;

    return true;
}


std::vector<ArticleDetail> SearchCrawler::searchAndCrawl(const std::string &keyword, const unsigned max_results,
                                                         const SortOrder sort_order, const bool get_details)
{
    const auto search_results(search(keyword, max_results, sort_order));

    std::vector<ArticleDetail> article_details;
    if (not get_details or state_ == BLOCKED) {
        for (const auto &search_result : search_results)
            article_details.emplace_back(search_result);
        if (state_ != BLOCKED)
            setState(DONE);
        return article_details;
    }

    setState(DETAIL_FETCHING);
    for (auto search_result(search_results.cbegin()); search_result != search_results.cend(); ++search_result) {
        if (session_->isBlocked()) {
            LOG_WARNING("blocked, returning the remaining " + std::to_string(search_results.cend() - search_result)
                        + " hit(s) w/o details");
            for (/* Intentionally empty! */; search_result != search_results.cend(); ++search_result)
                article_details.emplace_back(*search_result);
            break;
        }

        if (search_result != search_results.cbegin())
            session_->pause();

        ArticleDetail detail;
        if (not search_result->link_.empty() and getDetail(search_result->link_, &detail))
            article_details.emplace_back(MergeArticleDetail(*search_result, detail));
        else
            article_details.emplace_back(*search_result);
    }

    setState(session_->isBlocked() ? BLOCKED : DONE);
    return article_details;
}


std::string SearchCrawler::buildSearchUrl(const std::string &keyword, const SortOrder sort_order) const {
    std::string search_url(UrlUtil::AddQueryParameter(params_.search_url_, "classid", params_.classid_));
    search_url = UrlUtil::AddQueryParameter(search_url, "kw", keyword);
    const std::string sort_code(SortOrderToQueryCode(sort_order));
    if (not sort_code.empty() and not params_.sort_parameter_.empty())
        search_url = UrlUtil::AddQueryParameter(search_url, params_.sort_parameter_, sort_code);

    return search_url;
}


std::string SearchCrawler::ExtractDOI(const std::string &page_source) {
    static const ThreadSafeRegexMatcher labelled_doi_matcher("DOI[：:]\\s*(10\\.\\d{4,}/[^\\s<>]+)");
    static const ThreadSafeRegexMatcher bare_doi_matcher("(10\\.\\d{4,}/[^\\s<>]+)");

    auto match_result(labelled_doi_matcher.match(page_source));
    if (not match_result)
        match_result = bare_doi_matcher.match(page_source);
    if (not match_result)
        return "";

    // A DOI inside an attribute value ends at the closing quote.
    std::string doi(match_result[1]);
    const auto quote_pos(doi.find_first_of("\"'"));
    if (quote_pos != std::string::npos)
        doi.resize(quote_pos);
    while (not doi.empty() and DOI_TRAILING_JUNK.find(doi.back()) != std::string::npos)
        doi.pop_back();

    return doi;
}


std::string SearchCrawler::StateToString(const State state) {
    switch (state) {
    case IDLE:
        return "IDLE";
    case SEARCHING:
        return "SEARCHING";
    case BLOCKED:
        return "BLOCKED";
    case RESULTS_PARSED:
        return "RESULTS_PARSED";
    case DETAIL_FETCHING:
        return "DETAIL_FETCHING";
    case DONE:
        return "DONE";
    }

    LOG_ERROR("unknown state " + std::to_string(static_cast<int>(state)) + "!");
}


void SearchCrawler::setState(const State new_state) {
    if (new_state != state_)
        LOG_DEBUG(StateToString(state_) + " -> " + StateToString(new_state));
    state_ = new_state;
}


void SearchCrawler::applySortOrder(const SortOrder sort_order) {
    const std::string control_id(SortOrderToControlId(sort_order));

    std::string control_selector(params_.sort_control_selector_);
    StringUtil::ReplaceString("%ID%", control_id, &control_selector);
    for (const auto &selector : { control_selector, "#" + control_id }) {
        PageAutomationClient::ElementHandle sort_control;
        if (session_->findElement(selector, params_.detail_field_timeout_, &sort_control) and session_->click(sort_control)) {
            session_->pause();
            return;
        }
    }

    LOG_WARNING("could not switch to sort order \"" + SortOrderToString(sort_order) + "\", results are unsorted");
}


bool SearchCrawler::parseRow(const PageAutomationClient::ElementHandle &row, SearchResult * const search_result) {
    PageAutomationClient::ElementHandle title_link;
    if (not session_->findChildElement(row, params_.title_link_selectors_.primary_, &title_link)
        and (params_.title_link_selectors_.alternate_.empty()
             or not session_->findChildElement(row, params_.title_link_selectors_.alternate_, &title_link)))
        return false;

    search_result->title_ = StringUtil::TrimWhite(session_->getText(title_link));
    if (search_result->title_.empty())
        return false;
    search_result->link_     = session_->getAttribute(title_link, "href");
    search_result->authors_  = getChildTextWithFallback(row, params_.author_selectors_);
    search_result->source_   = getChildTextWithFallback(row, params_.source_selectors_);
    search_result->pub_date_ = getChildTextWithFallback(row, params_.date_selectors_);

    const auto cells(session_->findChildElements(row, "td"));
    search_result->cite_count_     = GetCounterFromCell(session_, cells, params_.cite_count_cell_index_);
    search_result->download_count_ = GetCounterFromCell(session_, cells, params_.download_count_cell_index_);

    LOG_DEBUG("parsed \"" + search_result->title_ + "\" (cited: " + search_result->cite_count_ + ", downloaded: "
              + search_result->download_count_ + ")");
    return true;
}


std::string SearchCrawler::getChildTextWithFallback(const PageAutomationClient::ElementHandle &parent, const SelectorPair &selectors) {
    const std::string text(session_->getChildText(parent, selectors.primary_));
    if (not text.empty() or selectors.alternate_.empty())
        return text;
    return session_->getChildText(parent, selectors.alternate_);
}


std::string SearchCrawler::getPageTextWithFallback(const SelectorPair &selectors) {
    for (const auto &selector : { selectors.primary_, selectors.alternate_ }) {
        PageAutomationClient::ElementHandle element;
        if (not selector.empty() and session_->findElement(selector, params_.detail_field_timeout_, &element)) {
            const std::string text(StringUtil::TrimWhite(session_->getText(element)));
            if (not text.empty())
                return text;
        }
    }

    return "";
}
