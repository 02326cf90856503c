/** \file   RegexMatcher.h
 *  \brief  Thread-safe wrapper around the PCRE library for UTF-8 subjects.
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


#include <memory>
#include <string>
#include <vector>
#include <pcre.h>


/** \class ThreadSafeRegexMatcher
 *  \brief A compiled pattern that may be shared between threads.  Every call to match() returns its own MatchResult.
 */
class ThreadSafeRegexMatcher {
public:
    class MatchResult {
        friend class ThreadSafeRegexMatcher;

        std::string subject_;
        bool matched_;
        unsigned match_count_;
        std::vector<int> substr_indices_;

    public:
        explicit MatchResult(const std::string &subject);

        inline operator bool() const { return matched_; }
        inline unsigned size() const { return match_count_; }

        /** \return The full match for group 0, else the n-th parenthesised subexpression.
         *  \throws std::out_of_range if "group" >= size().
         */
        std::string operator[](const unsigned group) const;
    };

    // Needed to use the incomplete PCRE types with a shared_ptr.
    struct PcreData {
        ::pcre *pcre_;
        ::pcre_extra *pcre_extra_;

    public:
        PcreData(): pcre_(nullptr), pcre_extra_(nullptr) { }
        ~PcreData();
    };

    enum Option { ENABLE_UTF8 = 1, CASE_INSENSITIVE = 2, MULTILINE = 4, DOTALL = 8 };

private:
    static constexpr size_t MAX_SUBSTRING_MATCHES = 20;

    std::string pattern_;
    unsigned options_;
    std::shared_ptr<PcreData> pcre_data_;

public:
    /** \note Aborts via LOG_ERROR if "pattern" does not compile. */
    explicit ThreadSafeRegexMatcher(const std::string &pattern, const unsigned options = ENABLE_UTF8);

    inline const std::string &getPattern() const { return pattern_; }

    /** \param start_pos  If non-null, receives the byte offset of the first character of the match.
     *  \param end_pos    If non-null, receives the byte offset one past the last character of the match.
     */
    MatchResult match(const std::string &subject, const size_t subject_start_offset = 0, size_t * const start_pos = nullptr,
                      size_t * const end_pos = nullptr) const;

    /** \brief Returns all non-overlapping matches, group "group" of each. */
    std::vector<std::string> matchAll(const std::string &subject, const unsigned group = 0) const;

    std::string replaceAll(const std::string &subject, const std::string &replacement) const;
};
