/** \file   WebDriverClient.h
 *  \brief  A PageAutomationClient that talks to a W3C WebDriver server like chromedriver.
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
#include <nlohmann/json.hpp>
#include "Downloader.h"
#include "PageAutomationClient.h"


class WebDriverClient : public PageAutomationClient {
public:
    static const std::string DEFAULT_WEBDRIVER_URL;

    struct Params {
        std::string webdriver_url_;
        std::string browser_binary_; // If empty, the WebDriver server picks the browser.
        bool headless_;
        std::string profile_directory_;
        std::string download_directory_;
        std::string user_agent_;
        unsigned command_timeout_; // in ms
    public:
        explicit Params(const std::string &webdriver_url = DEFAULT_WEBDRIVER_URL, const std::string &browser_binary = "",
                        const bool headless = true, const std::string &profile_directory = "",
                        const std::string &download_directory = "",
                        const std::string &user_agent = Downloader::DEFAULT_USER_AGENT_STRING,
                        const unsigned command_timeout = 30000)
            : webdriver_url_(webdriver_url), browser_binary_(browser_binary), headless_(headless),
              profile_directory_(profile_directory), download_directory_(download_directory), user_agent_(user_agent),
              command_timeout_(command_timeout) { }
    };

private:
    enum class HttpMethod { GET, POST, DELETE };

    Params params_;
    Downloader downloader_;
    std::string session_id_;

public:
    /** \throws std::runtime_error if no browser session could be created. */
    explicit WebDriverClient(const Params &params);
    WebDriverClient(const WebDriverClient &rhs) = delete;
    virtual ~WebDriverClient() override { quit(); }

    virtual bool navigate(const std::string &url, const TimeLimit &time_limit) override;
    virtual bool findElement(const std::string &css_selector, const TimeLimit &time_limit, ElementHandle * const element) override;
    virtual std::vector<ElementHandle> findElements(const std::string &css_selector, const TimeLimit &time_limit) override;
    virtual bool findChildElement(const ElementHandle &parent, const std::string &css_selector, ElementHandle * const child) override;
    virtual std::vector<ElementHandle> findChildElements(const ElementHandle &parent, const std::string &css_selector) override;
    virtual std::string getText(const ElementHandle &element) override;
    virtual std::string getAttribute(const ElementHandle &element, const std::string &attribute_name) override;
    virtual bool click(const ElementHandle &element) override;
    virtual std::string getTitle() override;
    virtual std::string getCurrentUrl() override;
    virtual std::string getPageSource() override;
    virtual std::vector<Cookie> getCookies() override;
    virtual void quit() override;

    /** \return The capabilities payload sent when creating a session. */
    static nlohmann::json BuildCapabilities(const Params &params);

private:
    /** \brief  Sends one WebDriver command.
     *  \param  path   Relative to the session, e.g. "/url", or absolute, e.g. "/session".
     *  \param  value  Where the "value" member of the response is stored.
     *  \return False if the command could not be sent or the server returned a WebDriver error.
     */
    bool executeCommand(const HttpMethod method, const std::string &path, const nlohmann::json &payload,
                        nlohmann::json * const value, std::string * const error_message, const TimeLimit &time_limit);
    bool executeSessionCommand(const HttpMethod method, const std::string &path, const nlohmann::json &payload,
                               nlohmann::json * const value, std::string * const error_message);
    bool getStringValue(const std::string &path, std::string * const string_value);
    static std::vector<ElementHandle> ExtractElementHandles(const nlohmann::json &value);
};
