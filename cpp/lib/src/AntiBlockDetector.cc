/** \file   AntiBlockDetector.cc
 *  \brief  Implementation of the AntiBlockDetector class.
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
#include "AntiBlockDetector.h"
#include "FetchSession.h"
#include "StringUtil.h"
#include "util.h"


AntiBlockDetector::Params::Params()
    : marker_selectors_{ "#verify-bar-box", ".verify-wrap", ".captcha-container", ".nc-container" },
      title_keywords_{ "验证", "captcha", "verify" }, marker_timeout_(500)
{
}


bool AntiBlockDetector::check(FetchSession * const session) const {
    if (session->isBlocked())
        return true;

    for (const auto &marker_selector : params_.marker_selectors_) {
        PageAutomationClient::ElementHandle marker;
        if (session->findElement(marker_selector, params_.marker_timeout_, &marker)) {
            LOG_WARNING("found block page marker \"" + marker_selector + "\"");
            session->recordBlocked();
            return true;
        }
    }

    const std::string lowercase_title(StringUtil::ASCIIToLower(session->getTitle()));
    for (const auto &title_keyword : params_.title_keywords_) {
        if (not title_keyword.empty() and StringUtil::Contains(lowercase_title, StringUtil::ASCIIToLower(title_keyword))) {
            LOG_WARNING("page title \"" + lowercase_title + "\" contains \"" + title_keyword + "\"");
            session->recordBlocked();
            return true;
        }
    }

    return false;
}
