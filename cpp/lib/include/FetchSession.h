/** \file   FetchSession.h
 *  \brief  A browser session with its own scratch directory and a sticky "we have been blocked" state.
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


#include <functional>
#include <memory>
#include <random>
#include <string>
#include <vector>
#include "FileUtil.h"
#include "PageAutomationClient.h"
#include "TimeLimit.h"


/** \class  FetchSession
 *  \brief  Owns one PageAutomationClient and a temporary directory holding the browser profile, the browser's download
 *          directory and a staging area for downloads.
 *  \note   Once recordBlocked() has been called navigate() refuses to touch the network for the rest of the session's
 *          lifetime.  The session directory is removed by close() and the destructor, whatever happened before.
 */
class FetchSession {
public:
    enum BlockState { NOT_BLOCKED, BLOCKED };

    /** Creates a client given the browser profile directory and the browser download directory. */
    typedef std::function<std::unique_ptr<PageAutomationClient>(const std::string &profile_directory,
                                                                const std::string &download_directory)> ClientFactory;

    struct Params {
        unsigned base_delay_;         // in ms
        unsigned jitter_;             // in ms, a random delay in [0, jitter_] is added to base_delay_
        unsigned navigation_timeout_; // in ms
        std::string tmp_directory_;   // the session directory will be created in here
    public:
        explicit Params(const unsigned base_delay = 2000, const unsigned jitter = 1000,
                        const unsigned navigation_timeout = 30000, const std::string &tmp_directory = "/tmp")
            : base_delay_(base_delay), jitter_(jitter), navigation_timeout_(navigation_timeout),
              tmp_directory_(tmp_directory) { }
    };

private:
    Params params_;
    std::unique_ptr<FileUtil::AutoTempDirectory> session_directory_;
    std::string session_directory_path_;
    std::unique_ptr<PageAutomationClient> client_;
    BlockState block_state_;
    std::mt19937 random_engine_;

public:
    /** \throws std::runtime_error if the session directory can't be set up, or whatever "client_factory" throws. */
    FetchSession(const ClientFactory &client_factory, const Params &params = Params());
    FetchSession(const FetchSession &rhs) = delete;
    ~FetchSession() { close(); }

    /** \return False if we are blocked, the session has been closed or the page could not be loaded. */
    bool navigate(const std::string &url);
    bool navigate(const std::string &url, const TimeLimit &time_limit);

    bool findElement(const std::string &css_selector, const TimeLimit &time_limit,
                     PageAutomationClient::ElementHandle * const element);
    std::vector<PageAutomationClient::ElementHandle> findElements(const std::string &css_selector, const TimeLimit &time_limit);
    bool findChildElement(const PageAutomationClient::ElementHandle &parent, const std::string &css_selector,
                          PageAutomationClient::ElementHandle * const child);
    std::vector<PageAutomationClient::ElementHandle> findChildElements(const PageAutomationClient::ElementHandle &parent,
                                                                       const std::string &css_selector);

    /** \return The trimmed text of the first descendant of "parent" matching "css_selector" or the empty string. */
    std::string getChildText(const PageAutomationClient::ElementHandle &parent, const std::string &css_selector);

    std::string getText(const PageAutomationClient::ElementHandle &element);
    std::string getAttribute(const PageAutomationClient::ElementHandle &element, const std::string &attribute_name);
    bool click(const PageAutomationClient::ElementHandle &element);
    std::string getTitle();
    std::string getCurrentUrl();
    std::string getPageSource();
    std::vector<PageAutomationClient::Cookie> getCookies();

    /** \return The browser's cookies in the format of an HTTP "Cookie" header, e.g. "a=1; b=2". */
    std::string getCookieHeader();

    /** \brief Sleeps for the base delay plus a random jitter. */
    void pause();

    void recordBlocked();
    BlockState getBlockState() const { return block_state_; }
    bool isBlocked() const { return block_state_ == BLOCKED; }
    bool isClosed() const { return client_ == nullptr; }

    const std::string &getSessionDirectory() const { return session_directory_path_; }
    std::string getDownloadDirectory() const;
    std::string getStagingDirectory() const;
    const Params &getParams() const { return params_; }

    /** \brief Shuts down the browser and removes the session directory.  May be called more than once. */
    void close();
};
