/** \file   PageAutomationClient.h
 *  \brief  The interface to a remote-controlled web browser.
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
#include "TimeLimit.h"


/** \class  PageAutomationClient
 *  \brief  Drives one browser window.
 *  \note   Elements are addressed by opaque handles that are only valid until the next navigation.  Failures are
 *          reported through the return values.  Implementations log them as warnings.
 */
class PageAutomationClient {
public:
    typedef std::string ElementHandle;

    struct Cookie {
        std::string name_;
        std::string value_;
        std::string domain_;
    public:
        Cookie() = default;
        Cookie(const std::string &name, const std::string &value, const std::string &domain = "")
            : name_(name), value_(value), domain_(domain) { }
    };

public:
    virtual ~PageAutomationClient() = default;

    /** \brief Loads "url" and waits until the document has been loaded or "time_limit" has been exceeded. */
    virtual bool navigate(const std::string &url, const TimeLimit &time_limit) = 0;

    /** \brief  Waits up to "time_limit" for an element matching the CSS selector "css_selector" to appear.
     *  \return True if an element was found, else false.
     */
    virtual bool findElement(const std::string &css_selector, const TimeLimit &time_limit, ElementHandle * const element) = 0;

    /** \brief  Waits up to "time_limit" for at least one element matching "css_selector".
     *  \return All matching elements in document order, possibly none.
     */
    virtual std::vector<ElementHandle> findElements(const std::string &css_selector, const TimeLimit &time_limit) = 0;

    /** \brief Looks for a descendant of "parent" matching "css_selector".  Does not wait. */
    virtual bool findChildElement(const ElementHandle &parent, const std::string &css_selector, ElementHandle * const child) = 0;
    virtual std::vector<ElementHandle> findChildElements(const ElementHandle &parent, const std::string &css_selector) = 0;

    /** \return The rendered text of "element" or the empty string if it is gone. */
    virtual std::string getText(const ElementHandle &element) = 0;

    /** \return The value of the attribute or property "attribute_name" or the empty string if there is none. */
    virtual std::string getAttribute(const ElementHandle &element, const std::string &attribute_name) = 0;

    virtual bool click(const ElementHandle &element) = 0;
    virtual std::string getTitle() = 0;
    virtual std::string getCurrentUrl() = 0;
    virtual std::string getPageSource() = 0;
    virtual std::vector<Cookie> getCookies() = 0;

    /** \brief Closes the browser.  All other member functions fail after this has been called. */
    virtual void quit() = 0;
};
