/** \file   FakePageAutomationClient.h
 *  \brief  An in-memory PageAutomationClient for tests.
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
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "PageAutomationClient.h"


// An element of a FakeSite.  Children are looked up by the exact selector string.
struct FakeElement {
    std::string text_;
    std::map<std::string, std::string> attributes_;
    std::map<std::string, std::vector<PageAutomationClient::ElementHandle>> children_;
};


// A page of a FakeSite.  Elements are looked up by the exact selector string.
struct FakePage {
    std::string title_;
    std::string source_;
    std::map<std::string, std::vector<PageAutomationClient::ElementHandle>> elements_;
};


// The state shared by all clients of one test.
struct FakeSite {
    std::map<std::string, FakePage> pages_;                        // by URL
    std::map<PageAutomationClient::ElementHandle, FakeElement> elements_;
    std::map<PageAutomationClient::ElementHandle, std::string> click_targets_; // the URL a click on the element loads
    std::vector<PageAutomationClient::Cookie> cookies_;
    std::vector<std::string> visited_urls_;
    std::vector<PageAutomationClient::ElementHandle> clicked_elements_;
    std::string profile_directory_;
    std::string download_directory_;
    bool quit_called_ = false;
public:
    // Adds an element with "text" to "page" under "selector" and returns its handle.
    PageAutomationClient::ElementHandle addElement(FakePage * const page, const std::string &selector, const std::string &text) {
        const std::string handle("element" + std::to_string(elements_.size()));
        elements_[handle].text_ = text;
        page->elements_[selector].emplace_back(handle);
        return handle;
    }

    PageAutomationClient::ElementHandle addChild(const PageAutomationClient::ElementHandle &parent, const std::string &selector,
                                                 const std::string &text)
    {
        const std::string handle("element" + std::to_string(elements_.size()));
        elements_[handle].text_ = text;
        elements_[parent].children_[selector].emplace_back(handle);
        return handle;
    }

    bool wasVisited(const std::string &url) const {
        for (const auto &visited_url : visited_urls_) {
            if (visited_url == url)
                return true;
        }
        return false;
    }
};


class FakePageAutomationClient : public PageAutomationClient {
    std::shared_ptr<FakeSite> site_;
    std::string current_url_;
public:
    explicit FakePageAutomationClient(const std::shared_ptr<FakeSite> &site): site_(site) { }

    virtual bool navigate(const std::string &url, const TimeLimit &/*time_limit*/) override {
        site_->visited_urls_.emplace_back(url);
        if (site_->pages_.find(url) == site_->pages_.end())
            return false;
        current_url_ = url;
        return true;
    }

    virtual bool findElement(const std::string &css_selector, const TimeLimit &/*time_limit*/, ElementHandle * const element) override {
        const auto elements(getElements(css_selector));
        if (elements.empty())
            return false;
        *element = elements.front();
        return true;
    }

    virtual std::vector<ElementHandle> findElements(const std::string &css_selector, const TimeLimit &/*time_limit*/) override {
        return getElements(css_selector);
    }

    virtual bool findChildElement(const ElementHandle &parent, const std::string &css_selector, ElementHandle * const child) override {
        const auto children(findChildElements(parent, css_selector));
        if (children.empty())
            return false;
        *child = children.front();
        return true;
    }

    virtual std::vector<ElementHandle> findChildElements(const ElementHandle &parent, const std::string &css_selector) override {
        const auto element(site_->elements_.find(parent));
        if (element == site_->elements_.end())
            return {};
        const auto children(element->second.children_.find(css_selector));
        return (children == element->second.children_.end()) ? std::vector<ElementHandle>() : children->second;
    }

    virtual std::string getText(const ElementHandle &element) override {
        const auto fake_element(site_->elements_.find(element));
        return (fake_element == site_->elements_.end()) ? "" : fake_element->second.text_;
    }

    virtual std::string getAttribute(const ElementHandle &element, const std::string &attribute_name) override {
        const auto fake_element(site_->elements_.find(element));
        if (fake_element == site_->elements_.end())
            return "";
        const auto attribute(fake_element->second.attributes_.find(attribute_name));
        return (attribute == fake_element->second.attributes_.end()) ? "" : attribute->second;
    }

    virtual bool click(const ElementHandle &element) override {
        site_->clicked_elements_.emplace_back(element);
        const auto click_target(site_->click_targets_.find(element));
        if (click_target != site_->click_targets_.end())
            current_url_ = click_target->second;
        return true;
    }

    virtual std::string getTitle() override { return getCurrentPage().title_; }
    virtual std::string getCurrentUrl() override { return current_url_; }
    virtual std::string getPageSource() override { return getCurrentPage().source_; }
    virtual std::vector<Cookie> getCookies() override { return site_->cookies_; }
    virtual void quit() override { site_->quit_called_ = true; }

private:
    const FakePage &getCurrentPage() const {
        static const FakePage EMPTY_PAGE = FakePage();
        const auto page(site_->pages_.find(current_url_));
        return (page == site_->pages_.end()) ? EMPTY_PAGE : page->second;
    }

    std::vector<ElementHandle> getElements(const std::string &css_selector) const {
        const FakePage &page(getCurrentPage());
        const auto elements(page.elements_.find(css_selector));
        return (elements == page.elements_.end()) ? std::vector<ElementHandle>() : elements->second;
    }
};


// \return A factory for FetchSession that hands out clients of "site" and records the directories it was given.
inline std::function<std::unique_ptr<PageAutomationClient>(const std::string &, const std::string &)>
    MakeFakeClientFactory(const std::shared_ptr<FakeSite> &site)
{
    return [site](const std::string &profile_directory, const std::string &download_directory) {
        site->profile_directory_  = profile_directory;
        site->download_directory_ = download_directory;
        return std::unique_ptr<PageAutomationClient>(new FakePageAutomationClient(site));
    };
}
