/** \file   MarkdownUtil.h
 *  \brief  Clean-up of generated Markdown.
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


namespace MarkdownUtil {


struct PostProcessOptions {
    bool fix_equations_;
    bool fix_tables_;
    bool fix_headings_;
    bool add_table_of_contents_;
public:
    explicit PostProcessOptions(const bool fix_equations = true, const bool fix_tables = true, const bool fix_headings = true,
                                const bool add_table_of_contents = false)
        : fix_equations_(fix_equations), fix_tables_(fix_tables), fix_headings_(fix_headings),
          add_table_of_contents_(add_table_of_contents) { }
};


// Removes whitespace just inside "$" delimiters and puts "$$" delimiters on lines of their own.
std::string FixEquations(const std::string &markdown);


// Makes sure tables are preceded and followed by a blank line.
std::string FixTables(const std::string &markdown);


// Makes sure there is exactly one space between the "#"s of a heading and its text.
std::string FixHeadings(const std::string &markdown);


/** \return A GitHub-style anchor for "heading_text": lower case, punctuation removed, whitespace runs replaced by
 *          hyphens.
 */
std::string MakeAnchor(const std::string &heading_text);


/** \brief Prepends a bulleted list of links to all headings, indented according to the heading levels. */
std::string AddTableOfContents(const std::string &markdown);


std::string PostProcess(const std::string &markdown, const PostProcessOptions &options = PostProcessOptions());


/** \brief Post-processes the Markdown file "path" in place. */
bool PostProcessFile(const std::string &path, const PostProcessOptions &options, std::string * const error_message);


} // namespace MarkdownUtil
