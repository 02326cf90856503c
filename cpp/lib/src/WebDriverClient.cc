/** \file   WebDriverClient.cc
 *  \brief  Implementation of the WebDriverClient class.
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
#include "WebDriverClient.h"
#include <algorithm>
#include <stdexcept>
#include "TimeUtil.h"
#include "UrlUtil.h"
#include "util.h"


namespace {


// The key under which W3C WebDriver servers return element references.
const std::string ELEMENT_KEY("element-6066-11e4-a52e-4f735466cecf");
const unsigned ELEMENT_POLL_INTERVAL(250); // in ms


nlohmann::json MakeLocator(const std::string &css_selector) {
    return nlohmann::json{ { "using", "css selector" }, { "value", css_selector } };
}


} // unnamed namespace


const std::string WebDriverClient::DEFAULT_WEBDRIVER_URL("http://127.0.0.1:9515");


WebDriverClient::WebDriverClient(const Params &params)
    : params_(params),
      downloader_(Downloader::Params(params.user_agent_, Downloader::DEFAULT_MAX_REDIRECTS, /* follow_redirects = */ true,
                                     /* ignore_ssl_certificates = */ false, /* fail_on_http_error = */ false,
                                     { "Content-Type: application/json; charset=utf-8", "Accept: application/json" }))
{
    nlohmann::json value;
    std::string error_message;
    if (not executeCommand(HttpMethod::POST, "/session", BuildCapabilities(params_), &value, &error_message,
                           params_.command_timeout_))
        throw std::runtime_error("in WebDriverClient::WebDriverClient: can't create a browser session via "
                                 + params_.webdriver_url_ + ": " + error_message);

    if (not value.is_object() or not value.contains("sessionId") or not value["sessionId"].is_string())
        throw std::runtime_error("in WebDriverClient::WebDriverClient: the WebDriver server returned no session ID!");
    session_id_ = value["sessionId"].get<std::string>();
    LOG_DEBUG("created WebDriver session " + session_id_);
}


nlohmann::json WebDriverClient::BuildCapabilities(const Params &params) {
    nlohmann::json args = nlohmann::json::array();
    if (params.headless_)
        args.push_back("--headless=new");
    args.push_back("--no-sandbox");
    args.push_back("--disable-dev-shm-usage");
    args.push_back("--disable-blink-features=AutomationControlled");
    args.push_back("--window-size=1920,1080");
    if (not params.profile_directory_.empty())
        args.push_back("--user-data-dir=" + params.profile_directory_);
    if (not params.user_agent_.empty())
        args.push_back("--user-agent=" + params.user_agent_);

    nlohmann::json chrome_options{ { "args", args } };
    if (not params.browser_binary_.empty())
        chrome_options["binary"] = params.browser_binary_;
    if (not params.download_directory_.empty()) {
        chrome_options["prefs"] = {
            { "download.default_directory", params.download_directory_ },
            { "download.prompt_for_download", false },
            { "plugins.always_open_pdf_externally", true },
        };
    }

    return nlohmann::json{
        { "capabilities", { { "alwaysMatch", { { "browserName", "chrome" }, { "goog:chromeOptions", chrome_options } } } } }
    };
}


bool WebDriverClient::navigate(const std::string &url, const TimeLimit &time_limit) {
    if (session_id_.empty())
        return false;

    nlohmann::json value;
    std::string error_message;
    if (not executeCommand(HttpMethod::POST, "/session/" + session_id_ + "/timeouts",
                           nlohmann::json{ { "pageLoad", time_limit.getRemainingTime() } }, &value, &error_message,
                           params_.command_timeout_))
        LOG_WARNING("can't set the page load timeout: " + error_message);

    // Leave the server some time to report its own page load timeout.
    if (not executeCommand(HttpMethod::POST, "/session/" + session_id_ + "/url", nlohmann::json{ { "url", url } }, &value,
                           &error_message, time_limit.getRemainingTime() + 5000))
    {
        LOG_WARNING("failed to load \"" + url + "\": " + error_message);
        return false;
    }

    return true;
}


bool WebDriverClient::findElement(const std::string &css_selector, const TimeLimit &time_limit, ElementHandle * const element) {
    if (session_id_.empty())
        return false;

    for (;;) {
        nlohmann::json value;
        std::string error_message;
        if (executeSessionCommand(HttpMethod::POST, "/element", MakeLocator(css_selector), &value, &error_message)) {
            const auto handles(ExtractElementHandles(nlohmann::json::array({ value })));
            if (not handles.empty()) {
                *element = handles.front();
                return true;
            }
        }

        if (time_limit.limitExceeded()) {
            LOG_DEBUG("no element matches \"" + css_selector + "\": " + error_message);
            return false;
        }
        TimeUtil::Millisleep(std::min(ELEMENT_POLL_INTERVAL, time_limit.getRemainingTime()));
    }
}


std::vector<PageAutomationClient::ElementHandle> WebDriverClient::findElements(const std::string &css_selector,
                                                                               const TimeLimit &time_limit)
{
    if (session_id_.empty())
        return {};

    for (;;) {
        nlohmann::json value;
        std::string error_message;
        if (executeSessionCommand(HttpMethod::POST, "/elements", MakeLocator(css_selector), &value, &error_message)) {
            const auto handles(ExtractElementHandles(value));
            if (not handles.empty())
                return handles;
        }

        if (time_limit.limitExceeded())
            return {};
        TimeUtil::Millisleep(std::min(ELEMENT_POLL_INTERVAL, time_limit.getRemainingTime()));
    }
}


bool WebDriverClient::findChildElement(const ElementHandle &parent, const std::string &css_selector, ElementHandle * const child) {
    nlohmann::json value;
    std::string error_message;
    if (not executeSessionCommand(HttpMethod::POST, "/element/" + parent + "/element", MakeLocator(css_selector), &value,
                                  &error_message))
        return false;

    const auto handles(ExtractElementHandles(nlohmann::json::array({ value })));
    if (handles.empty())
        return false;
    *child = handles.front();
    return true;
}


std::vector<PageAutomationClient::ElementHandle> WebDriverClient::findChildElements(const ElementHandle &parent,
                                                                                    const std::string &css_selector)
{
    nlohmann::json value;
    std::string error_message;
    if (not executeSessionCommand(HttpMethod::POST, "/element/" + parent + "/elements", MakeLocator(css_selector), &value,
                                  &error_message))
        return {};
    return ExtractElementHandles(value);
}


std::string WebDriverClient::getText(const ElementHandle &element) {
    std::string text;
    getStringValue("/element/" + element + "/text", &text);
    return text;
}


std::string WebDriverClient::getAttribute(const ElementHandle &element, const std::string &attribute_name) {
    std::string attribute_value;
    getStringValue("/element/" + element + "/attribute/" + UrlUtil::UrlEncode(attribute_name), &attribute_value);
    return attribute_value;
}


bool WebDriverClient::click(const ElementHandle &element) {
    nlohmann::json value;
    std::string error_message;
    if (not executeSessionCommand(HttpMethod::POST, "/element/" + element + "/click", nlohmann::json::object(), &value,
                                  &error_message))
    {
        LOG_WARNING("click failed: " + error_message);
        return false;
    }

    return true;
}


std::string WebDriverClient::getTitle() {
    std::string title;
    getStringValue("/title", &title);
    return title;
}


std::string WebDriverClient::getCurrentUrl() {
    std::string current_url;
    getStringValue("/url", &current_url);
    return current_url;
}


std::string WebDriverClient::getPageSource() {
    std::string page_source;
    getStringValue("/source", &page_source);
    return page_source;
}


std::vector<PageAutomationClient::Cookie> WebDriverClient::getCookies() {
    nlohmann::json value;
    std::string error_message;
    if (not executeSessionCommand(HttpMethod::GET, "/cookie", nullptr, &value, &error_message)) {
        LOG_WARNING("can't retrieve cookies: " + error_message);
        return {};
    }

    std::vector<Cookie> cookies;
    if (not value.is_array())
        return cookies;
    for (const auto &cookie : value) {
        if (not cookie.is_object())
            continue;
        const std::string name(cookie.value("name", std::string()));
        if (not name.empty())
            cookies.emplace_back(name, cookie.value("value", std::string()), cookie.value("domain", std::string()));
    }

    return cookies;
}


void WebDriverClient::quit() {
    if (session_id_.empty())
        return;

    nlohmann::json value;
    std::string error_message;
    if (not executeCommand(HttpMethod::DELETE, "/session/" + session_id_, nullptr, &value, &error_message,
                           params_.command_timeout_))
        LOG_WARNING("failed to close WebDriver session " + session_id_ + ": " + error_message);
    session_id_.clear();
}


bool WebDriverClient::executeCommand(const HttpMethod method, const std::string &path, const nlohmann::json &payload,
                                     nlohmann::json * const value, std::string * const error_message,
                                     const TimeLimit &time_limit)
{
    const std::string url(params_.webdriver_url_ + path);
    bool sent(false);
    switch (method) {
    case HttpMethod::GET:
        sent = downloader_.newUrl(url, time_limit);
        break;
    case HttpMethod::POST:
        sent = downloader_.postData(url, payload.is_null() ? "{}" : payload.dump(), time_limit);
        break;
    case HttpMethod::DELETE:
        sent = downloader_.deleteUrl(url, time_limit);
        break;
    default:
        LOG_ERROR("unknown HTTP method!");
    }

    if (not sent) {
        *error_message = downloader_.getLastErrorMessage();
        return false;
    }

    const nlohmann::json response(nlohmann::json::parse(downloader_.getMessageBody(), /* callback = */ nullptr,
                                                        /* allow_exceptions = */ false));
    if (response.is_discarded() or not response.is_object()) {
        *error_message = "unparsable response from " + url + " (HTTP status " + std::to_string(downloader_.getResponseCode())
                         + ")";
        return false;
    }

    *value = response.contains("value") ? response["value"] : nlohmann::json();
    if (value->is_object() and value->contains("error")) {
        *error_message = value->value("error", std::string("unknown error"));
        const std::string message(value->value("message", std::string()));
        if (not message.empty())
            *error_message += ": " + message;
        return false;
    }

    if (downloader_.getResponseCode() >= 400) {
        *error_message = "HTTP status " + std::to_string(downloader_.getResponseCode()) + " from " + url;
        return false;
    }

    return true;
}


bool WebDriverClient::executeSessionCommand(const HttpMethod method, const std::string &path, const nlohmann::json &payload,
                                            nlohmann::json * const value, std::string * const error_message)
{
    if (session_id_.empty()) {
        *error_message = "no active session";
        return false;
    }

    return executeCommand(method, "/session/" + session_id_ + path, payload, value, error_message, params_.command_timeout_);
}


bool WebDriverClient::getStringValue(const std::string &path, std::string * const string_value) {
    string_value->clear();

    nlohmann::json value;
    std::string error_message;
    if (not executeSessionCommand(HttpMethod::GET, path, nullptr, &value, &error_message)) {
        LOG_DEBUG("GET " + path + " failed: " + error_message);
        return false;
    }

    if (value.is_string())
        *string_value = value.get<std::string>();
    return true;
}


std::vector<PageAutomationClient::ElementHandle> WebDriverClient::ExtractElementHandles(const nlohmann::json &value) {
    std::vector<ElementHandle> handles;
    if (not value.is_array())
        return handles;

    for (const auto &element : value) {
        if (element.is_object() and element.contains(ELEMENT_KEY) and element[ELEMENT_KEY].is_string())
            handles.emplace_back(element[ELEMENT_KEY].get<std::string>());
    }

    return handles;
}
