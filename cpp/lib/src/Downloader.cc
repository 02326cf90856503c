/** \file   Downloader.cc
 *  \brief  Implementation of class Downloader.
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
#include "Downloader.h"
#include <stdexcept>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include "FileUtil.h"
#include "MediaTypeUtil.h"
#include "StringUtil.h"


namespace {


int GlobalInit() {
    if (unlikely(::curl_global_init(CURL_GLOBAL_ALL) != 0)) {
        const std::string error_message("curl_global_init(3) failed!\n");
        const ssize_t dummy = ::write(STDERR_FILENO, error_message.c_str(), error_message.length());
        (void)dummy;
        ::_exit(EXIT_FAILURE);
    }

    return 0;
}


int dummy(GlobalInit());


} // unnamed namespace


const std::string Downloader::DEFAULT_USER_AGENT_STRING(
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36");


Downloader::Downloader(const Params &params)
    : easy_handle_(nullptr), curl_error_code_(CURLE_OK), output_file_(nullptr), bytes_received_(0), additional_http_headers_(nullptr),
      params_(params)
{
    error_buffer_[0] = '\0';
    init();
}


Downloader::~Downloader() {
    if (additional_http_headers_ != nullptr)
        ::curl_slist_free_all(additional_http_headers_);
    if (likely(easy_handle_ != nullptr))
        ::curl_easy_cleanup(easy_handle_);
}


bool Downloader::newUrl(const std::string &url, const TimeLimit &time_limit) {
    output_filename_.clear();
    return performRequest(Method::GET, url, time_limit);
}


bool Downloader::postData(const std::string &url, const std::string &data, const TimeLimit &time_limit) {
    output_filename_.clear();
    post_data_ = data;
    return performRequest(Method::POST, url, time_limit);
}


bool Downloader::deleteUrl(const std::string &url, const TimeLimit &time_limit) {
    output_filename_.clear();
    return performRequest(Method::DELETE, url, time_limit);
}


bool Downloader::downloadToFile(const std::string &url, const std::string &output_filename, const TimeLimit &time_limit) {
    output_filename_ = output_filename;
    output_file_ = std::fopen(output_filename.c_str(), "wb");
    if (output_file_ == nullptr) {
        last_error_message_ = "can't open \"" + output_filename + "\" for writing!";
        return false;
    }

    const bool success(performRequest(Method::GET, url, time_limit));
    const bool close_failed(std::fclose(output_file_) != 0);
    output_file_ = nullptr;
    if (close_failed and success) {
        last_error_message_ = "failed to close \"" + output_filename + "\"!";
        return false;
    }

    return success;
}


std::string Downloader::getMessageHeader() const {
    return concatenated_headers_;
}


std::string Downloader::getMediaType() const {
    char *content_type(nullptr);
    if (::curl_easy_getinfo(easy_handle_, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK and content_type != nullptr
        and *content_type != '\0')
    {
        std::string media_type(content_type);
        MediaTypeUtil::SimplifyMediaType(&media_type);
        return media_type;
    }

    if (not body_.empty())
        return MediaTypeUtil::GetMediaType(body_);
    if (not output_filename_.empty() and FileUtil::GetFileSize(output_filename_) > 0)
        return MediaTypeUtil::GetFileMediaType(output_filename_);

    return "";
}


std::string Downloader::getEffectiveUrl() const {
    char *effective_url(nullptr);
    if (::curl_easy_getinfo(easy_handle_, CURLINFO_EFFECTIVE_URL, &effective_url) != CURLE_OK or effective_url == nullptr)
        return "";
    return effective_url;
}


const std::string &Downloader::getLastErrorMessage() const {
    if (curl_error_code_ != CURLE_OK and last_error_message_.empty())
        last_error_message_ = (error_buffer_[0] != '\0') ? std::string(error_buffer_) : ::curl_easy_strerror(curl_error_code_);

    return last_error_message_;
}


unsigned Downloader::getResponseCode() const {
    long response_code(0);
    if (::curl_easy_getinfo(easy_handle_, CURLINFO_RESPONSE_CODE, &response_code) != CURLE_OK)
        return 0;
    return static_cast<unsigned>(response_code);
}


void Downloader::init() {
    easy_handle_ = ::curl_easy_init();
    if (unlikely(easy_handle_ == nullptr))
        throw std::runtime_error("in Downloader::init: curl_easy_init() failed!");

    curlEasySetopt(CURLOPT_HEADER, 0L, "Downloader::init:CURLOPT_HEADER");
    curlEasySetopt(CURLOPT_NOPROGRESS, 1L, "Downloader::init:CURLOPT_NOPROGRESS");
    curlEasySetopt(CURLOPT_NOSIGNAL, 1L, "Downloader::init:CURLOPT_NOSIGNAL");
    curlEasySetopt(CURLOPT_WRITEFUNCTION, WriteFunction, "Downloader::init:CURLOPT_WRITEFUNCTION");
    curlEasySetopt(CURLOPT_WRITEDATA, reinterpret_cast<void *>(this), "Downloader::init:CURLOPT_WRITEDATA");
    curlEasySetopt(CURLOPT_HEADERFUNCTION, HeaderFunction, "Downloader::init:CURLOPT_HEADERFUNCTION");
    curlEasySetopt(CURLOPT_HEADERDATA, reinterpret_cast<void *>(this), "Downloader::init:CURLOPT_HEADERDATA");
    curlEasySetopt(CURLOPT_ERRORBUFFER, error_buffer_, "Downloader::init:CURLOPT_ERRORBUFFER");
    curlEasySetopt(CURLOPT_FAILONERROR, params_.fail_on_http_error_ ? 1L : 0L, "Downloader::init:CURLOPT_FAILONERROR");
    curlEasySetopt(CURLOPT_ACCEPT_ENCODING, "", "Downloader::init:CURLOPT_ACCEPT_ENCODING");

    curlEasySetopt(CURLOPT_FOLLOWLOCATION, params_.follow_redirects_ ? 1L : 0L, "Downloader::init:CURLOPT_FOLLOWLOCATION");
    curlEasySetopt(CURLOPT_MAXREDIRS, params_.max_redirect_count_, "Downloader::init:CURLOPT_MAXREDIRS");
    curlEasySetopt(CURLOPT_AUTOREFERER, 1L, "Downloader::init:CURLOPT_AUTOREFERER");

    curlEasySetopt(CURLOPT_USERAGENT,
                   params_.user_agent_.empty() ? DEFAULT_USER_AGENT_STRING.c_str() : params_.user_agent_.c_str(),
                   "Downloader::init:CURLOPT_USERAGENT");

    if (not params_.referer_.empty())
        curlEasySetopt(CURLOPT_REFERER, params_.referer_.c_str(), "Downloader::init:CURLOPT_REFERER");
    if (not params_.cookie_header_.empty())
        curlEasySetopt(CURLOPT_COOKIE, params_.cookie_header_.c_str(), "Downloader::init:CURLOPT_COOKIE");

    for (const auto &additional_header : params_.additional_headers_)
        additional_http_headers_ = ::curl_slist_append(additional_http_headers_, additional_header.c_str());
    if (additional_http_headers_ != nullptr)
        curlEasySetopt(CURLOPT_HTTPHEADER, additional_http_headers_, "Downloader::init:CURLOPT_HTTPHEADER");

    if (params_.ignore_ssl_certificates_) {
        curlEasySetopt(CURLOPT_SSL_VERIFYPEER, 0L, "Downloader::init:CURLOPT_SSL_VERIFYPEER");
        curlEasySetopt(CURLOPT_SSL_VERIFYHOST, 0L, "Downloader::init:CURLOPT_SSL_VERIFYHOST");
    }
}


bool Downloader::performRequest(const Method method, const std::string &url, const TimeLimit &time_limit) {
    curl_error_code_ = CURLE_OK;
    last_error_message_.clear();
    error_buffer_[0] = '\0';
    concatenated_headers_.clear();
    body_.clear();
    bytes_received_ = 0;

    if (time_limit.limitExceeded()) {
        last_error_message_ = "time limit exceeded before the request to \"" + url + "\" could be made!";
        return false;
    }

    curlEasySetopt(CURLOPT_URL, url.c_str(), "Downloader::performRequest:CURLOPT_URL");
    const long timeout_in_ms(static_cast<long>(time_limit.getRemainingTime()));
    curlEasySetopt(CURLOPT_TIMEOUT_MS, timeout_in_ms, "Downloader::performRequest:CURLOPT_TIMEOUT_MS");
    curlEasySetopt(CURLOPT_CONNECTTIMEOUT_MS, timeout_in_ms, "Downloader::performRequest:CURLOPT_CONNECTTIMEOUT_MS");

    switch (method) {
    case Method::GET:
        curlEasySetopt(CURLOPT_HTTPGET, 1L, "Downloader::performRequest:CURLOPT_HTTPGET");
        curlEasySetopt(CURLOPT_CUSTOMREQUEST, static_cast<char *>(nullptr), "Downloader::performRequest:CURLOPT_CUSTOMREQUEST");
        break;
    case Method::POST:
        curlEasySetopt(CURLOPT_POST, 1L, "Downloader::performRequest:CURLOPT_POST");
        curlEasySetopt(CURLOPT_POSTFIELDSIZE, static_cast<long>(post_data_.length()), "Downloader::performRequest:CURLOPT_POSTFIELDSIZE");
        curlEasySetopt(CURLOPT_POSTFIELDS, post_data_.c_str(), "Downloader::performRequest:CURLOPT_POSTFIELDS");
        curlEasySetopt(CURLOPT_CUSTOMREQUEST, static_cast<char *>(nullptr), "Downloader::performRequest:CURLOPT_CUSTOMREQUEST");
        break;
    case Method::DELETE:
        curlEasySetopt(CURLOPT_HTTPGET, 1L, "Downloader::performRequest:CURLOPT_HTTPGET");
        curlEasySetopt(CURLOPT_CUSTOMREQUEST, "DELETE", "Downloader::performRequest:CURLOPT_CUSTOMREQUEST");
        break;
    }

    curl_error_code_ = ::curl_easy_perform(easy_handle_);
    if (curl_error_code_ != CURLE_OK) {
        LOG_DEBUG("request for \"" + url + "\" failed: " + getLastErrorMessage());
        return false;
    }

    return true;
}


size_t Downloader::writeFunction(void *data, size_t size, size_t nmemb) {
    const size_t total_size(size * nmemb);
    if (output_file_ != nullptr) {
        const size_t written(std::fwrite(data, 1, total_size, output_file_));
        bytes_received_ += written;
        return written;
    }

    body_.append(reinterpret_cast<char *>(data), total_size);
    bytes_received_ += total_size;
    return total_size;
}


size_t Downloader::WriteFunction(void *data, size_t size, size_t nmemb, void *this_pointer) {
    Downloader * const downloader(reinterpret_cast<Downloader *>(this_pointer));
    return downloader->writeFunction(data, size, nmemb);
}


size_t Downloader::headerFunction(void *data, size_t size, size_t nmemb) {
    const size_t total_size(size * nmemb);
    const std::string header_line(reinterpret_cast<char *>(data), total_size);

    // Each status line starts a new header block, e.g. after a redirect.  We only keep the most recent one.
    if (StringUtil::StartsWith(header_line, "HTTP/"))
        concatenated_headers_.clear();
    concatenated_headers_ += header_line;

    return total_size;
}


size_t Downloader::HeaderFunction(void *data, size_t size, size_t nmemb, void *this_pointer) {
    Downloader * const downloader(reinterpret_cast<Downloader *>(this_pointer));
    return downloader->headerFunction(data, size, nmemb);
}
