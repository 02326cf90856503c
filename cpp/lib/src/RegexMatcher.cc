/** \file   RegexMatcher.cc
 *  \brief  Implementation of class ThreadSafeRegexMatcher.
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
#include "RegexMatcher.h"
#include <stdexcept>
#include "util.h"


namespace {


bool CompileRegex(const std::string &pattern, const unsigned options, ::pcre **pcre_arg, ::pcre_extra **pcre_extra_arg,
                  std::string * const err_msg)
{
    int pcre_options(0);
    if (options & ThreadSafeRegexMatcher::ENABLE_UTF8)
        pcre_options |= PCRE_UTF8 | PCRE_UCP;
    if (options & ThreadSafeRegexMatcher::CASE_INSENSITIVE)
        pcre_options |= PCRE_CASELESS;
    if (options & ThreadSafeRegexMatcher::MULTILINE)
        pcre_options |= PCRE_MULTILINE;
    if (options & ThreadSafeRegexMatcher::DOTALL)
        pcre_options |= PCRE_DOTALL;

    const char *errptr;
    int erroffset;
    *pcre_arg = ::pcre_compile(pattern.c_str(), pcre_options, &errptr, &erroffset, nullptr);
    if (*pcre_arg == nullptr) {
        *pcre_extra_arg = nullptr;
        *err_msg = std::string(errptr) + " at offset " + std::to_string(erroffset);
        return false;
    }

    // Can't use PCRE_STUDY_JIT_COMPILE because it's not thread safe.
    *pcre_extra_arg = ::pcre_study(*pcre_arg, 0, &errptr);
    if (*pcre_extra_arg == nullptr and errptr != nullptr) {
        ::pcre_free(*pcre_arg);
        *pcre_arg = nullptr;
        *err_msg = "failed to study the compiled pattern (" + std::string(errptr) + ")";
        return false;
    }

    return true;
}


} // unnamed namespace


ThreadSafeRegexMatcher::MatchResult::MatchResult(const std::string &subject): subject_(subject), matched_(false), match_count_(0) {
    substr_indices_.resize((1 + ThreadSafeRegexMatcher::MAX_SUBSTRING_MATCHES) * 3);
}


std::string ThreadSafeRegexMatcher::MatchResult::operator[](const unsigned group) const {
    if (unlikely(group >= match_count_))
        throw std::out_of_range("in ThreadSafeRegexMatcher::MatchResult::operator[]: group(" + std::to_string(group) + ") >= "
                                + std::to_string(match_count_) + "!");

    const int start(substr_indices_[group * 2]), end(substr_indices_[group * 2 + 1]);
    return (start < 0 or end <= start) ? "" : subject_.substr(start, end - start);
}


ThreadSafeRegexMatcher::PcreData::~PcreData() {
    if (pcre_extra_ != nullptr)
        ::pcre_free_study(pcre_extra_);
    if (pcre_ != nullptr)
        ::pcre_free(pcre_);
}


ThreadSafeRegexMatcher::ThreadSafeRegexMatcher(const std::string &pattern, const unsigned options)
    : pattern_(pattern), options_(options), pcre_data_(new PcreData)
{
    std::string err_msg;
    if (not CompileRegex(pattern_, options_, &pcre_data_->pcre_, &pcre_data_->pcre_extra_, &err_msg))
        LOG_ERROR("failed to compile pattern \"" + pattern + "\": " + err_msg);
}


ThreadSafeRegexMatcher::MatchResult ThreadSafeRegexMatcher::match(const std::string &subject, const size_t subject_start_offset,
                                                                  size_t * const start_pos, size_t * const end_pos) const
{
    MatchResult match_result(subject);
    const int retcode(::pcre_exec(pcre_data_->pcre_, pcre_data_->pcre_extra_, subject.data(), static_cast<int>(subject.length()),
                                  static_cast<int>(subject_start_offset), 0, &match_result.substr_indices_[0],
                                  static_cast<int>(match_result.substr_indices_.size())));
    if (retcode == 0)
        LOG_ERROR("too many captured substrings in \"" + pattern_ + "\"! (We only support " + std::to_string(MAX_SUBSTRING_MATCHES)
                  + " substrings.)");

    if (retcode > 0) {
        match_result.match_count_ = static_cast<unsigned>(retcode);
        match_result.matched_ = true;
        if (start_pos != nullptr)
            *start_pos = static_cast<size_t>(match_result.substr_indices_[0]);
        if (end_pos != nullptr)
            *end_pos = static_cast<size_t>(match_result.substr_indices_[1]);
        return match_result;
    }

    if (retcode != PCRE_ERROR_NOMATCH) {
        if (retcode == PCRE_ERROR_BADUTF8 or retcode == PCRE_ERROR_SHORTUTF8)
            LOG_DEBUG("invalid UTF-8 in subject for pattern \"" + pattern_ + "\"");
        else
            LOG_WARNING("unexpected PCRE error " + std::to_string(retcode) + " for pattern \"" + pattern_ + "\"");
    }

    return match_result;
}


std::vector<std::string> ThreadSafeRegexMatcher::matchAll(const std::string &subject, const unsigned group) const {
    std::vector<std::string> matches;

    size_t offset(0), match_start, match_end;
    while (offset <= subject.length()) {
        const auto result(match(subject, offset, &match_start, &match_end));
        if (not result)
            break;
        if (group < result.size())
            matches.emplace_back(result[group]);
        offset = (match_end > match_start) ? match_end : match_end + 1;
    }

    return matches;
}


std::string ThreadSafeRegexMatcher::replaceAll(const std::string &subject, const std::string &replacement) const {
    std::string replaced_string;

    size_t subject_start_offset(0), match_start_offset, match_end_offset;
    while (subject_start_offset < subject.length()) {
        if (not match(subject, subject_start_offset, &match_start_offset, &match_end_offset))
            break;

        replaced_string += subject.substr(subject_start_offset, match_start_offset - subject_start_offset);
        replaced_string += replacement;
        if (match_end_offset == match_start_offset) { // Empty match, copy one byte to make progress.
            if (match_end_offset < subject.length())
                replaced_string += subject[match_end_offset];
            subject_start_offset = match_end_offset + 1;
        } else
            subject_start_offset = match_end_offset;
    }

    if (subject_start_offset < subject.length())
        replaced_string += subject.substr(subject_start_offset);

    return replaced_string;
}
