/** \file   AntiBlockDetector.h
 *  \brief  Recognises the verification and captcha pages a site serves to suspected robots.
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


class FetchSession;


class AntiBlockDetector {
public:
    struct Params {
        std::vector<std::string> marker_selectors_; // CSS selectors of elements that only occur on block pages
        std::vector<std::string> title_keywords_;   // matched against the lowercased page title
        unsigned marker_timeout_;                   // per selector, in ms
    public:
        Params();
        Params(const std::vector<std::string> &marker_selectors, const std::vector<std::string> &title_keywords,
               const unsigned marker_timeout)
            : marker_selectors_(marker_selectors), title_keywords_(title_keywords), marker_timeout_(marker_timeout) { }
    };

private:
    Params params_;

public:
    explicit AntiBlockDetector(const Params &params = Params()): params_(params) { }

    /** \brief  Looks at the page currently loaded in "session".
     *  \return True if the page looks like a block page.  In that case the block is also recorded in "session".
     *  \note   Neither navigates nor clicks.
     */
    bool check(FetchSession * const session) const;

    const Params &getParams() const { return params_; }
};
