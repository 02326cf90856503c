/** \file   FetchSession.cc
 *  \brief  Implementation of the FetchSession class.
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
#include "FetchSession.h"
#include <stdexcept>
#include "StringUtil.h"
#include "TimeUtil.h"
#include "util.h"


namespace {


const std::string PROFILE_SUBDIRECTORY("profile");
const std::string DOWNLOAD_SUBDIRECTORY("downloads");
const std::string STAGING_SUBDIRECTORY("staging");


} // unnamed namespace


FetchSession::FetchSession(const ClientFactory &client_factory, const Params &params)
    : params_(params), block_state_(NOT_BLOCKED), random_engine_(std::random_device()())
{
    session_directory_.reset(new FileUtil::AutoTempDirectory(FileUtil::JoinPaths(params_.tmp_directory_, "docfetch_session_")));
    session_directory_path_ = session_directory_->getDirectoryPath();
    for (const auto &subdirectory : { PROFILE_SUBDIRECTORY, DOWNLOAD_SUBDIRECTORY, STAGING_SUBDIRECTORY }) {
        if (not FileUtil::MakeDirectory(FileUtil::JoinPaths(session_directory_path_, subdirectory)))
            throw std::runtime_error("in FetchSession::FetchSession: failed to create \"" + subdirectory + "\" in \""
                                     + session_directory_path_ + "\"!");
    }

    client_ = client_factory(FileUtil::JoinPaths(session_directory_path_, PROFILE_SUBDIRECTORY), getDownloadDirectory());
    if (client_ == nullptr)
        throw std::runtime_error("in FetchSession::FetchSession: the client factory returned no client!");
}


bool FetchSession::navigate(const std::string &url) {
    return navigate(url, params_.navigation_timeout_);
}


bool FetchSession::navigate(const std::string &url, const TimeLimit &time_limit) {
    if (isBlocked()) {
        LOG_DEBUG("refusing to load \"" + url + "\" because we have been blocked");
        return false;
    }
    if (isClosed()) {
        LOG_WARNING("refusing to load \"" + url + "\" because the session has been closed");
        return false;
    }

    LOG_DEBUG("loading \"" + url + "\"");
    return client_->navigate(url, time_limit);
}


bool FetchSession::findElement(const std::string &css_selector, const TimeLimit &time_limit,
                               PageAutomationClient::ElementHandle * const element)
{
    if (isClosed() or css_selector.empty())
        return false;
    return client_->findElement(css_selector, time_limit, element);
}


std::vector<PageAutomationClient::ElementHandle> FetchSession::findElements(const std::string &css_selector,
                                                                            const TimeLimit &time_limit)
{
    if (isClosed() or css_selector.empty())
        return {};
    return client_->findElements(css_selector, time_limit);
}


bool FetchSession::findChildElement(const PageAutomationClient::ElementHandle &parent, const std::string &css_selector,
                                    PageAutomationClient::ElementHandle * const child)
{
    if (isClosed() or css_selector.empty())
        return false;
    return client_->findChildElement(parent, css_selector, child);
}


std::vector<PageAutomationClient::ElementHandle> FetchSession::findChildElements(const PageAutomationClient::ElementHandle &parent,
                                                                                 const std::string &css_selector)
{
    if (isClosed() or css_selector.empty())
        return {};
    return client_->findChildElements(parent, css_selector);
}


std::string FetchSession::getChildText(const PageAutomationClient::ElementHandle &parent, const std::string &css_selector) {
    PageAutomationClient::ElementHandle child;
    if (not findChildElement(parent, css_selector, &child))
        return "";
    return StringUtil::TrimWhite(getText(child));
}


std::string FetchSession::getText(const PageAutomationClient::ElementHandle &element) {
    return isClosed() ? "" : client_->getText(element);
}


std::string FetchSession::getAttribute(const PageAutomationClient::ElementHandle &element, const std::string &attribute_name) {
    return isClosed() ? "" : client_->getAttribute(element, attribute_name);
}


bool FetchSession::click(const PageAutomationClient::ElementHandle &element) {
    return isClosed() ? false : client_->click(element);
}


std::string FetchSession::getTitle() {
    return isClosed() ? "" : client_->getTitle();
}


std::string FetchSession::getCurrentUrl() {
    return isClosed() ? "" : client_->getCurrentUrl();
}


std::string FetchSession::getPageSource() {
    return isClosed() ? "" : client_->getPageSource();
}


std::vector<PageAutomationClient::Cookie> FetchSession::getCookies() {
    if (isClosed())
        return {};
    return client_->getCookies();
}


std::string FetchSession::getCookieHeader() {
    std::string cookie_header;
    for (const auto &cookie : getCookies()) {
        if (not cookie_header.empty())
            cookie_header += "; ";
        cookie_header += cookie.name_ + "=" + cookie.value_;
    }

    return cookie_header;
}


void FetchSession::pause() {
    unsigned delay(params_.base_delay_);
    if (params_.jitter_ > 0) {
        std::uniform_int_distribution<unsigned> distribution(0, params_.jitter_);
        delay += distribution(random_engine_);
    }

    TimeUtil::Millisleep(delay);
}


void FetchSession::recordBlocked() {
    if (block_state_ == NOT_BLOCKED)
        LOG_WARNING("the site has blocked us, no further pages will be requested in this session");
    block_state_ = BLOCKED;
}


std::string FetchSession::getDownloadDirectory() const {
    return FileUtil::JoinPaths(session_directory_path_, DOWNLOAD_SUBDIRECTORY);
}


std::string FetchSession::getStagingDirectory() const {
    return FileUtil::JoinPaths(session_directory_path_, STAGING_SUBDIRECTORY);
}


void FetchSession::close() {
    if (client_ != nullptr) {
        client_->quit();
        client_.reset();
    }

    if (session_directory_ != nullptr) {
        session_directory_->remove();
        session_directory_.reset();
    }
}
