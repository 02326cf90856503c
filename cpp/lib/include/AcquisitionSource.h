/** \file   AcquisitionSource.h
 *  \brief  Strategies for obtaining the full text PDF of an article.
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


#include <memory>
#include <string>
#include <vector>
#include "TimeLimit.h"


class FetchSession;


// What we know about the article we want.  At least one of title and DOI must be non-empty.
struct AcquisitionRequest {
    std::string title_;
    std::string doi_;
    std::string link_; // the article's detail page on the originating site
public:
    AcquisitionRequest() = default;
    AcquisitionRequest(const std::string &title, const std::string &doi, const std::string &link = "")
        : title_(title), doi_(doi), link_(link) { }
};


/** \return True if "path" is at least "min_size" bytes long and either "media_type" mentions PDF or the file starts
 *          with "%PDF".
 */
bool IsPlausiblePdf(const std::string &path, const std::string &media_type, const size_t min_size);


/** \brief  Waits for a browser to finish a download into "download_directory".
 *  \note   A download is finished when no ".crdownload", ".part" or ".tmp" file is left and the size of the newest PDF
 *          is the same non-zero value in two consecutive samples taken "poll_interval" ms apart.
 *  \return True if a finished PDF was found before "time_limit" expired, else false.
 */
bool WaitForBrowserDownload(const std::string &download_directory, const TimeLimit &time_limit, const unsigned poll_interval,
                            std::string * const downloaded_path);


/** \class  AcquisitionSource
 *  \brief  The base class of all strategies.
 *
 *  A source only looks at the fields of an AcquisitionRequest it needs.  isApplicable() tells whether those fields are
 *  present.  attempt() stores a candidate document at the given staging path.  The caller verifies it.
 */
class AcquisitionSource {
public:
    struct Params {
        std::string site_url_;    // scheme and host of the originating site
        std::string site_domain_; // links in this domain are handled by the "direct" source
        std::vector<std::string> doi_mirrors_;
        std::string aggregator_url_;
        std::string web_search_url_;
        std::string user_agent_;
        size_t min_pdf_size_;              // in bytes
        unsigned http_timeout_;            // in ms
        unsigned browser_download_timeout_; // in ms
        unsigned download_poll_interval_;  // in ms
        unsigned element_timeout_;         // in ms
        unsigned max_download_links_;      // per source
    public:
        Params();
    };

private:
    unsigned success_count_;

protected:
    FetchSession * const session_;
    const Params params_;

public:
    AcquisitionSource(FetchSession * const session, const Params &params)
        : success_count_(0), session_(session), params_(params) { }
    virtual ~AcquisitionSource() = default;

    virtual std::string getName() const = 0;

    /** \return True if "request" contains what this source needs, else false. */
    virtual bool isApplicable(const AcquisitionRequest &request) const = 0;

    /** \brief  Tries to download the document described by "request" to "staging_path".
     *  \return True if a plausible PDF has been stored at "staging_path", else false and "error_message" says why.
     */
    bool attempt(const AcquisitionRequest &request, const std::string &staging_path, std::string * const error_message);

    /** \return How often attempt() returned true. */
    unsigned getSuccessCount() const { return success_count_; }

protected:
    virtual bool attemptImpl(const AcquisitionRequest &request, const std::string &staging_path,
                             std::string * const error_message) = 0;

    /** \brief  Downloads "url" via HTTP, using the session's cookies, falling back to letting the browser download it.
     *  \return True if a plausible PDF has been stored at "staging_path".
     */
    bool fetchCandidate(const std::string &url, const std::string &referer, const std::string &staging_path,
                        std::string * const error_message);

    /** \return The value of "attribute_name" of the first element matching "css_selector" or the empty string. */
    std::string findAttribute(const std::string &css_selector, const std::string &attribute_name);

    /** \return The "href"s of all elements matching "css_selector" for which "filter" returns true. */
    std::vector<std::string> findLinks(const std::string &css_selector, const unsigned timeout,
                                       bool (*filter)(const std::string &href) = nullptr);

private:
    bool fetchViaHttp(const std::string &url, const std::string &referer, const std::string &staging_path,
                      std::string * const error_message);
    bool fetchViaBrowser(const std::string &url, const std::string &staging_path, std::string * const error_message);
};


/** \class DirectSource
 *  \brief Downloads from the article's detail page on the originating site.  Usually requires an institutional login.
 */
class DirectSource : public AcquisitionSource {
public:
    DirectSource(FetchSession * const session, const Params &params): AcquisitionSource(session, params) { }

    virtual std::string getName() const override { return "direct"; }
    virtual bool isApplicable(const AcquisitionRequest &request) const override;

    /** \return The PDF download link found in "page_source" or the empty string. */
    static std::string FindPdfLinkInPageSource(const std::string &page_source);
protected:
    virtual bool attemptImpl(const AcquisitionRequest &request, const std::string &staging_path,
                             std::string * const error_message) override;
};


/** \class MirrorLookupSource
 *  \brief Looks up a key on each of the DOI resolver mirrors in turn.
 */
class MirrorLookupSource : public AcquisitionSource {
public:
    MirrorLookupSource(FetchSession * const session, const Params &params): AcquisitionSource(session, params) { }

    /** \return The PDF link found in "page_source" or the empty string. */
    static std::string FindPdfLinkInPageSource(const std::string &page_source);
protected:
    virtual std::string getLookupKey(const AcquisitionRequest &request) const = 0;
    virtual bool attemptImpl(const AcquisitionRequest &request, const std::string &staging_path,
                             std::string * const error_message) override;
private:
    bool tryMirror(const std::string &mirror, const std::string &lookup_key, const std::string &staging_path,
                   std::string * const error_message);
};


class DoiLookupSource : public MirrorLookupSource {
public:
    DoiLookupSource(FetchSession * const session, const Params &params): MirrorLookupSource(session, params) { }

    virtual std::string getName() const override { return "doi"; }
    virtual bool isApplicable(const AcquisitionRequest &request) const override { return not request.doi_.empty(); }
protected:
    virtual std::string getLookupKey(const AcquisitionRequest &request) const override { return request.doi_; }
};


class TitleLookupSource : public MirrorLookupSource {
public:
    TitleLookupSource(FetchSession * const session, const Params &params): MirrorLookupSource(session, params) { }

    virtual std::string getName() const override { return "doi_title"; }
    virtual bool isApplicable(const AcquisitionRequest &request) const override { return not request.title_.empty(); }
protected:
    virtual std::string getLookupKey(const AcquisitionRequest &request) const override;
};


/** \class AggregatorSource
 *  \brief Searches a shadow library aggregator by title and follows its download mirrors.
 */
class AggregatorSource : public AcquisitionSource {
public:
    AggregatorSource(FetchSession * const session, const Params &params): AcquisitionSource(session, params) { }

    virtual std::string getName() const override { return "aggregator"; }
    virtual bool isApplicable(const AcquisitionRequest &request) const override { return not request.title_.empty(); }
protected:
    virtual bool attemptImpl(const AcquisitionRequest &request, const std::string &staging_path,
                             std::string * const error_message) override;
};


/** \class WebSearchSource
 *  \brief Searches a scholarly web search engine by title for freely available PDFs hosted elsewhere.
 */
class WebSearchSource : public AcquisitionSource {
public:
    WebSearchSource(FetchSession * const session, const Params &params): AcquisitionSource(session, params) { }

    virtual std::string getName() const override { return "web_search"; }
    virtual bool isApplicable(const AcquisitionRequest &request) const override { return not request.title_.empty(); }
protected:
    virtual bool attemptImpl(const AcquisitionRequest &request, const std::string &staging_path,
                             std::string * const error_message) override;
};


/** \return The sources in their default order: direct, doi, doi_title, aggregator, web_search. */
std::vector<std::unique_ptr<AcquisitionSource>> CreateDefaultSources(FetchSession * const session,
                                                                     const AcquisitionSource::Params &params);
