/** \file   Downloader.h
 *  \brief  Functions for downloading of web resources.
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
#include <cstdio>
#include <curl/curl.h>
#include "TimeLimit.h"
#include "util.h"


/** \class  Downloader
 *  \brief  Implements an object that can download Web pages and documents via HTTP(S).
 */
class Downloader {
public:
    static const long DEFAULT_MAX_REDIRECTS = 10;
    static const std::string DEFAULT_USER_AGENT_STRING;
    static const unsigned DEFAULT_TIME_LIMIT = 20000; // In ms.

    struct Params {
        std::string user_agent_;
        long max_redirect_count_;
        bool follow_redirects_;
        bool ignore_ssl_certificates_;
        bool fail_on_http_error_; // If true, responses w/ status codes >= 400 are errors.
        std::vector<std::string> additional_headers_;
        std::string cookie_header_; // E.g. "a=1; b=2", sent as the "Cookie" header if non-empty.
        std::string referer_;
    public:
        explicit Params(const std::string &user_agent = DEFAULT_USER_AGENT_STRING, const long max_redirect_count = DEFAULT_MAX_REDIRECTS,
                        const bool follow_redirects = true, const bool ignore_ssl_certificates = false,
                        const bool fail_on_http_error = true, const std::vector<std::string> &additional_headers = {},
                        const std::string &cookie_header = "", const std::string &referer = "")
            : user_agent_(user_agent), max_redirect_count_(max_redirect_count), follow_redirects_(follow_redirects),
              ignore_ssl_certificates_(ignore_ssl_certificates), fail_on_http_error_(fail_on_http_error),
              additional_headers_(additional_headers), cookie_header_(cookie_header), referer_(referer) { }
    };

private:
    enum class Method { GET, POST, DELETE };

    CURL *easy_handle_;
    CURLcode curl_error_code_;
    mutable std::string last_error_message_;
    std::string concatenated_headers_;
    std::string body_;
    std::string post_data_;
    std::string output_filename_;
    FILE *output_file_;
    size_t bytes_received_;
    char error_buffer_[CURL_ERROR_SIZE];
    curl_slist *additional_http_headers_;
    Params params_;

public:
    explicit Downloader(const Params &params = Params());
    Downloader(const Downloader &rhs) = delete;
    ~Downloader();

    /** \brief Issues an HTTP GET request and stores the response body in memory. */
    bool newUrl(const std::string &url, const TimeLimit &time_limit = DEFAULT_TIME_LIMIT);

    /** \brief Issues an HTTP POST request with "data" as the request body. */
    bool postData(const std::string &url, const std::string &data, const TimeLimit &time_limit = DEFAULT_TIME_LIMIT);

    /** \brief Issues an HTTP DELETE request. */
    bool deleteUrl(const std::string &url, const TimeLimit &time_limit = DEFAULT_TIME_LIMIT);

    /** \brief  Issues an HTTP GET request and streams the response body to "output_filename".
     *  \note   On failure "output_filename" may contain a partial download.  It is up to the caller to remove it.
     */
    bool downloadToFile(const std::string &url, const std::string &output_filename, const TimeLimit &time_limit = DEFAULT_TIME_LIMIT);

    /** \return The header block of the last response, i.e. the one after following all redirects. */
    std::string getMessageHeader() const;
    const std::string &getMessageBody() const { return body_; }

    /** \brief  Tries its best to get the MIME type of the most recently downloaded document.
     *  \return The "Content-Type" sent by the server, or, if there was none, a guess based on the document's contents,
     *          lowercased and w/o parameters.  The empty string if nothing was downloaded.
     */
    std::string getMediaType() const;

    /** \return The URL of the last response after redirects or the empty string if nothing has been retrieved yet. */
    std::string getEffectiveUrl() const;

    /** \return The number of body bytes received by the most recent request, in memory or on disk. */
    size_t getBytesReceived() const { return bytes_received_; }

    bool anErrorOccurred() const { return not getLastErrorMessage().empty(); }
    const std::string &getLastErrorMessage() const;
    const std::string &getUserAgent() const { return params_.user_agent_; }

    /** \return The HTTP status code of the last response or 0 if no response was received. */
    unsigned getResponseCode() const;

private:
    void init();
    bool performRequest(const Method method, const std::string &url, const TimeLimit &time_limit);
    size_t writeFunction(void *data, size_t size, size_t nmemb);
    static size_t WriteFunction(void *data, size_t size, size_t nmemb, void *this_pointer);
    size_t headerFunction(void *data, size_t size, size_t nmemb);
    static size_t HeaderFunction(void *data, size_t size, size_t nmemb, void *this_pointer);
    template <typename OptionType>
    void curlEasySetopt(const CURLoption option, OptionType value, const std::string &caller_info) {
        if ((curl_error_code_ = ::curl_easy_setopt(easy_handle_, option, value)) != CURLE_OK)
            LOG_ERROR("curl_easy_setopt(" + caller_info + ") failed!");
    }
};

