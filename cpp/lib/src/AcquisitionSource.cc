/** \file   AcquisitionSource.cc
 *  \brief  Implementation of the acquisition sources.
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
#include "AcquisitionSource.h"
#include "Downloader.h"
#include "FetchSession.h"
#include "FileUtil.h"
#include "MediaTypeUtil.h"
#include "RegexMatcher.h"
#include "StringUtil.h"
#include "TimeUtil.h"
#include "UrlUtil.h"
#include "util.h"


namespace {


const std::vector<std::string> INCOMPLETE_DOWNLOAD_SUFFIXES{ ".crdownload", ".part", ".tmp" };


// Hrefs lifted from raw markup may still contain character references.
std::string UnescapeHref(std::string href) {
    StringUtil::ReplaceString("&amp;", "&", &href);
    return href;
}


std::string StripFragment(const std::string &url) {
    const auto hash_pos(url.find('#'));
    return (hash_pos == std::string::npos) ? url : url.substr(0, hash_pos);
}


bool IsIncompleteDownload(const std::string &filename) {
    for (const auto &suffix : INCOMPLETE_DOWNLOAD_SUFFIXES) {
        if (StringUtil::EndsWith(filename, suffix, /* ignore_case = */ true))
            return true;
    }

    return false;
}


void ClearDirectory(const std::string &directory) {
    std::vector<std::string> filenames;
    FileUtil::GetFileNameList(".", &filenames, directory);
    for (const auto &filename : filenames) {
        const std::string path(FileUtil::JoinPaths(directory, filename));
        if (not FileUtil::IsDirectory(path) and not FileUtil::DeleteFile(path))
            LOG_WARNING("can't delete \"" + path + "\"!");
    }
}


bool IsExternalPdfLink(const std::string &href) {
    const std::string lowercase_href(StringUtil::ASCIIToLower(href));
    return StringUtil::Contains(lowercase_href, ".pdf") and not StringUtil::Contains(lowercase_href, "cnki");
}


void AppendMessage(const std::string &message, std::string * const messages) {
    if (not messages->empty())
        *messages += "; ";
    *messages += message;
}


} // unnamed namespace


bool IsPlausiblePdf(const std::string &path, const std::string &media_type, const size_t min_size) {
    const off_t file_size(FileUtil::GetFileSize(path));
    if (file_size < 0 or static_cast<size_t>(file_size) < min_size)
        return false;

    if (MediaTypeUtil::IsPdfMediaType(media_type))
        return true;

    std::string prefix;
    return FileUtil::ReadPrefix(path, 4, &prefix) and prefix == "%PDF";
}


bool WaitForBrowserDownload(const std::string &download_directory, const TimeLimit &time_limit, const unsigned poll_interval,
                            std::string * const downloaded_path)
{
    for (;;) {
        std::vector<std::string> filenames;
        FileUtil::GetFileNameList(".", &filenames, download_directory);

        bool incomplete(false);
        std::string newest_pdf;
        time_t newest_mtime(0);
        for (const auto &filename : filenames) {
            if (IsIncompleteDownload(filename)) {
                incomplete = true;
                break;
            }
            if (not StringUtil::EndsWith(filename, ".pdf", /* ignore_case = */ true))
                continue;

            const std::string path(FileUtil::JoinPaths(download_directory, filename));
            const time_t mtime(FileUtil::GetLastModificationTime(path));
            if (newest_pdf.empty() or mtime > newest_mtime) {
                newest_pdf = path;
                newest_mtime = mtime;
            }
        }

        if (not incomplete and not newest_pdf.empty()) {
            const off_t first_size(FileUtil::GetFileSize(newest_pdf));
            TimeUtil::Millisleep(poll_interval);
            if (first_size > 0 and FileUtil::GetFileSize(newest_pdf) == first_size) {
                *downloaded_path = newest_pdf;
                return true;
            }
        } else
            TimeUtil::Millisleep(poll_interval);

        if (time_limit.limitExceeded())
            return false;
    }
}


AcquisitionSource::Params::Params()
    : site_url_("https://kns.cnki.net"), site_domain_("cnki.net"),
      doi_mirrors_{ "https://sci-hub.ren", "https://sci-hub.se", "https://sci-hub.st", "https://sci-hub.ru",
                    "https://sci-hub.shop", "https://sci-hub.wf" },
      aggregator_url_("https://annas-archive.org"), web_search_url_("https://scholar.google.com"),
      user_agent_(Downloader::DEFAULT_USER_AGENT_STRING), min_pdf_size_(1000), http_timeout_(60000),
      browser_download_timeout_(60000), download_poll_interval_(1000), element_timeout_(5000), max_download_links_(3)
{
}


bool AcquisitionSource::attempt(const AcquisitionRequest &request, const std::string &staging_path,
                                std::string * const error_message)
{
    error_message->clear();
    if (not attemptImpl(request, staging_path, error_message)) {
        if (error_message->empty())
            *error_message = "no document found";
        return false;
    }

    ++success_count_;
    return true;
}


bool AcquisitionSource::fetchCandidate(const std::string &url, const std::string &referer, const std::string &staging_path,
                                       std::string * const error_message)
{
    std::string http_error_message;
    if (fetchViaHttp(url, referer, staging_path, &http_error_message))
        return true;
    LOG_DEBUG("HTTP download of \"" + url + "\" failed (" + http_error_message + "), trying the browser");

    std::string browser_error_message;
    if (fetchViaBrowser(url, staging_path, &browser_error_message))
        return true;

    *error_message = http_error_message + ", " + browser_error_message;
    return false;
}


std::string AcquisitionSource::findAttribute(const std::string &css_selector, const std::string &attribute_name) {
    PageAutomationClient::ElementHandle element;
    if (not session_->findElement(css_selector, params_.element_timeout_, &element))
        return "";
    return StringUtil::TrimWhite(session_->getAttribute(element, attribute_name));
}


std::vector<std::string> AcquisitionSource::findLinks(const std::string &css_selector, const unsigned timeout,
                                                      bool (*filter)(const std::string &href))
{
    std::vector<std::string> links;
    for (const auto &element : session_->findElements(css_selector, timeout)) {
        const std::string href(StringUtil::TrimWhite(session_->getAttribute(element, "href")));
        if (not href.empty() and (filter == nullptr or filter(href)))
            links.emplace_back(href);
    }

    return links;
}


bool AcquisitionSource::fetchViaHttp(const std::string &url, const std::string &referer, const std::string &staging_path,
                                     std::string * const error_message)
{
    const Downloader::Params downloader_params(params_.user_agent_, Downloader::DEFAULT_MAX_REDIRECTS,
                                               /* follow_redirects = */ true, /* ignore_ssl_certificates = */ false,
                                               /* fail_on_http_error = */ true, /* additional_headers = */ {},
                                               session_->getCookieHeader(), referer);
    Downloader downloader(downloader_params);
    if (not downloader.downloadToFile(url, staging_path, params_.http_timeout_)) {
        *error_message = "HTTP download failed: " + downloader.getLastErrorMessage();
        FileUtil::DeleteFile(staging_path);
        return false;
    }

    if (not IsPlausiblePdf(staging_path, downloader.getMediaType(), params_.min_pdf_size_)) {
        *error_message = "not a PDF (" + std::to_string(downloader.getBytesReceived()) + " bytes of "
                         + downloader.getMediaType() + ")";
        FileUtil::DeleteFile(staging_path);
        return false;
    }

    return true;
}


bool AcquisitionSource::fetchViaBrowser(const std::string &url, const std::string &staging_path,
                                        std::string * const error_message)
{
    const std::string download_directory(session_->getDownloadDirectory());
    ClearDirectory(download_directory);

    // Loading a URL that triggers a download is usually reported as an aborted navigation.
    if (not session_->navigate(url) and session_->isBlocked()) {
        *error_message = "browser download refused, we have been blocked";
        return false;
    }

    std::string downloaded_path;
    if (not WaitForBrowserDownload(download_directory, params_.browser_download_timeout_, params_.download_poll_interval_,
                                   &downloaded_path))
    {
        *error_message = "browser download timed out";
        return false;
    }

    if (not FileUtil::RenameFile(downloaded_path, staging_path)) {
        *error_message = "can't move \"" + downloaded_path + "\" to \"" + staging_path + "\"";
        return false;
    }

    if (not IsPlausiblePdf(staging_path, "", params_.min_pdf_size_)) {
        *error_message = "the browser downloaded something that is not a PDF";
        FileUtil::DeleteFile(staging_path);
        return false;
    }

    return true;
}


// A relative link does not tell us which site it belongs to.
bool DirectSource::isApplicable(const AcquisitionRequest &request) const {
    const std::string lowercase_link(StringUtil::ASCIIToLower(request.link_));
    if (not StringUtil::StartsWith(lowercase_link, "http://") and not StringUtil::StartsWith(lowercase_link, "https://")
        and not StringUtil::StartsWith(lowercase_link, "//"))
        return false;

    return UrlUtil::IsInDomain(UrlUtil::MakeAbsoluteUrl(params_.site_url_, request.link_), params_.site_domain_);
}


std::string DirectSource::FindPdfLinkInPageSource(const std::string &page_source) {
    static const ThreadSafeRegexMatcher pdfdown_matcher("href=[\"']([^\"']*dflag=pdfdown[^\"']*)[\"']");
    static const ThreadSafeRegexMatcher nhdown_matcher("href=[\"']([^\"']*nhdown[^\"']*)[\"']");

    const auto pdfdown_match(pdfdown_matcher.match(page_source));
    if (pdfdown_match)
        return UnescapeHref(pdfdown_match[1]);

    const auto nhdown_match(nhdown_matcher.match(page_source));
    if (not nhdown_match)
        return "";

    std::string pdf_link(UnescapeHref(nhdown_match[1]));
    StringUtil::ReplaceString("nhdown", "pdfdown", &pdf_link);
    return pdf_link;
}


bool DirectSource::attemptImpl(const AcquisitionRequest &request, const std::string &staging_path,
                               std::string * const error_message)
{
    const std::string detail_url(UrlUtil::MakeAbsoluteUrl(params_.site_url_, request.link_));
    if (not session_->navigate(detail_url)) {
        *error_message = "can't load the detail page";
        return false;
    }
    session_->pause();

    // The CAJ download links turn into PDF download links by replacing "nhdown" with "pdfdown".
    std::string pdf_link(findAttribute("a.btn-dlpdf", "href"));
    if (pdf_link.empty()) {
        std::string caj_link(findAttribute("a.btn-dlcaj", "href"));
        if (caj_link.empty())
            caj_link = findAttribute("a[href*='nhdown']", "href");
        if (not caj_link.empty()) {
            pdf_link = caj_link;
            StringUtil::ReplaceString("nhdown", "pdfdown", &pdf_link);
        }
    }
    if (pdf_link.empty())
        pdf_link = FindPdfLinkInPageSource(session_->getPageSource());

    if (pdf_link.empty()) {
        *error_message = "no download link, probably a login is required";
        return false;
    }

    return fetchCandidate(UrlUtil::MakeAbsoluteUrl(params_.site_url_, pdf_link), detail_url, staging_path, error_message);
}


std::string MirrorLookupSource::FindPdfLinkInPageSource(const std::string &page_source) {
    static const ThreadSafeRegexMatcher pdf_url_matcher("(https?://[^\"'<>\\s]+\\.pdf[^\"'<>\\s]*)");
    const auto match_result(pdf_url_matcher.match(page_source));
    return match_result ? UnescapeHref(match_result[1]) : "";
}


bool MirrorLookupSource::attemptImpl(const AcquisitionRequest &request, const std::string &staging_path,
                                     std::string * const error_message)
{
    const std::string lookup_key(getLookupKey(request));

    std::string mirror_messages;
    for (auto mirror(params_.doi_mirrors_.cbegin()); mirror != params_.doi_mirrors_.cend(); ++mirror) {
        if (mirror != params_.doi_mirrors_.cbegin())
            session_->pause();

        std::string mirror_message;
        if (tryMirror(*mirror, lookup_key, staging_path, &mirror_message))
            return true;
        LOG_DEBUG(*mirror + ": " + mirror_message);
        AppendMessage(UrlUtil::GetHost(*mirror) + ": " + mirror_message, &mirror_messages);

        if (session_->isBlocked())
            break;
    }

    *error_message = mirror_messages.empty() ? "no mirrors configured" : mirror_messages;
    return false;
}


bool MirrorLookupSource::tryMirror(const std::string &mirror, const std::string &lookup_key, const std::string &staging_path,
                                   std::string * const error_message)
{
    if (not session_->navigate(mirror + "/" + lookup_key)) {
        *error_message = "can't load the lookup page";
        return false;
    }
    session_->pause();

    const std::string page_source(session_->getPageSource());
    const std::string lowercase_page_source(StringUtil::ASCIIToLower(page_source));
    if (StringUtil::Contains(lowercase_page_source, "article not found")
        or StringUtil::Contains(page_source, "статья не найдена"))
    {
        *error_message = "not found";
        return false;
    }

    std::string pdf_link(findAttribute("embed#pdf", "src"));
    if (pdf_link.empty())
        pdf_link = findAttribute("iframe#pdf", "src");
    if (pdf_link.empty()) {
        PageAutomationClient::ElementHandle button;
        if (session_->findElement("a[onclick*='.pdf']", params_.element_timeout_, &button)) {
            pdf_link = session_->getAttribute(button, "href");
            if (pdf_link.empty() or StringUtil::Contains(pdf_link, "location.href")) {
                static const ThreadSafeRegexMatcher location_matcher("location\\.href='([^']+)'");
                const auto match_result(location_matcher.match(session_->getAttribute(button, "onclick")));
                pdf_link = match_result ? match_result[1] : "";
            }
        }
    }
    if (pdf_link.empty())
        pdf_link = FindPdfLinkInPageSource(page_source);

    if (pdf_link.empty()) {
        *error_message = "no PDF link";
        return false;
    }

    return fetchCandidate(StripFragment(UrlUtil::MakeAbsoluteUrl(mirror, pdf_link)), mirror, staging_path, error_message);
}


std::string TitleLookupSource::getLookupKey(const AcquisitionRequest &request) const {
    return UrlUtil::UrlEncode(request.title_);
}


bool AggregatorSource::attemptImpl(const AcquisitionRequest &request, const std::string &staging_path,
                                   std::string * const error_message)
{
    const std::string search_url(UrlUtil::AddQueryParameter(params_.aggregator_url_ + "/search", "q", request.title_));
    if (not session_->navigate(search_url)) {
        *error_message = "can't load the search page";
        return false;
    }
    session_->pause();

    const auto record_links(findLinks("a[href*='/md5/']", params_.element_timeout_));
    if (record_links.empty()) {
        *error_message = "no matching record";
        return false;
    }

    const std::string record_url(UrlUtil::MakeAbsoluteUrl(params_.aggregator_url_, record_links.front()));
    if (not session_->navigate(record_url)) {
        *error_message = "can't load the record page";
        return false;
    }
    session_->pause();

    std::vector<std::string> download_links;
    for (const auto &selector : { "a[href*='library.lol']", "a[href*='libgen']", "a.js-download-link" }) {
        download_links = findLinks(selector, params_.element_timeout_);
        if (not download_links.empty())
            break;
    }
    if (download_links.empty()) {
        *error_message = "no download links on the record page";
        return false;
    }

    std::string link_messages;
    for (size_t link_no(0); link_no < download_links.size() and link_no < params_.max_download_links_; ++link_no) {
        const std::string download_page_url(UrlUtil::MakeAbsoluteUrl(params_.aggregator_url_, download_links[link_no]));
        std::string link_message;

        // Download mirrors either serve the PDF right away or show a page with the actual link.
        if (session_->navigate(download_page_url)) {
            const std::string pdf_link(findAttribute("a[href$='.pdf']", "href"));
            if (not pdf_link.empty()
                and fetchCandidate(UrlUtil::MakeAbsoluteUrl(download_page_url, pdf_link), download_page_url, staging_path,
                                   &link_message))
                return true;
        }
        if (fetchCandidate(download_page_url, record_url, staging_path, &link_message))
            return true;

        AppendMessage(UrlUtil::GetHost(download_page_url) + ": " + link_message, &link_messages);
        if (session_->isBlocked())
            break;
    }

    *error_message = link_messages;
    return false;
}


bool WebSearchSource::attemptImpl(const AcquisitionRequest &request, const std::string &staging_path,
                                  std::string * const error_message)
{
    const std::string search_url(UrlUtil::AddQueryParameter(params_.web_search_url_ + "/scholar", "q", request.title_));
    if (not session_->navigate(search_url)) {
        *error_message = "can't load the search page";
        return false;
    }
    session_->pause();

    if (StringUtil::Contains(StringUtil::ASCIIToLower(session_->getCurrentUrl()), "sorry")
        or StringUtil::Contains(StringUtil::ASCIIToLower(session_->getPageSource()), "captcha"))
    {
        *error_message = "the search engine wants us to solve a captcha";
        return false;
    }

    auto pdf_links(findLinks(".gs_or_ggsm a", params_.element_timeout_, IsExternalPdfLink));
    for (const auto &side_link : findLinks(".gs_ggs a", params_.element_timeout_, IsExternalPdfLink))
        pdf_links.emplace_back(side_link);
    if (pdf_links.empty()) {
        *error_message = "no freely available PDF";
        return false;
    }

    std::string link_messages;
    for (size_t link_no(0); link_no < pdf_links.size() and link_no < params_.max_download_links_; ++link_no) {
        std::string link_message;
        if (fetchCandidate(pdf_links[link_no], search_url, staging_path, &link_message))
            return true;
        AppendMessage(UrlUtil::GetHost(pdf_links[link_no]) + ": " + link_message, &link_messages);
    }

    *error_message = link_messages;
    return false;
}


std::vector<std::unique_ptr<AcquisitionSource>> CreateDefaultSources(FetchSession * const session,
                                                                     const AcquisitionSource::Params &params)
{
    std::vector<std::unique_ptr<AcquisitionSource>> sources;
    sources.emplace_back(new DirectSource(session, params));
    sources.emplace_back(new DoiLookupSource(session, params));
    sources.emplace_back(new TitleLookupSource(session, params));
    sources.emplace_back(new AggregatorSource(session, params));
    sources.emplace_back(new WebSearchSource(session, params));

    return sources;
}
