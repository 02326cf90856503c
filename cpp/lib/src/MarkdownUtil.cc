/** \file   MarkdownUtil.cc
 *  \brief  Implementation of the Markdown clean-up functions.
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
#include "MarkdownUtil.h"
#include <vector>
#include <cstdint>
#include "FileUtil.h"
#include "StringUtil.h"
#include "TextUtil.h"


namespace MarkdownUtil {


namespace {


// Unlike StringUtil::Split this keeps empty lines.
std::vector<std::string> SplitLines(const std::string &text) {
    std::vector<std::string> lines;
    StringUtil::Split(text, '\n', &lines, /* suppress_empty_components = */ false);
    return lines;
}


std::string TrimBlanks(const std::string &s) {
    const size_t first(s.find_first_not_of(" \t"));
    if (first == std::string::npos)
        return "";
    const size_t last(s.find_last_not_of(" \t"));
    return s.substr(first, last - first + 1);
}


bool IsTableLine(const std::string &line) {
    const std::string trimmed_line(TrimBlanks(line));
    return not trimmed_line.empty() and trimmed_line[0] == '|';
}


// \return The heading level, i.e. the number of leading "#"s, or 0 if "line" is not a heading.
unsigned GetHeadingLevel(const std::string &line, std::string * const heading_text) {
    unsigned level(0);
    while (level < line.size() and line[level] == '#')
        ++level;
    if (level == 0 or level > 6)
        return 0;

    *heading_text = TrimBlanks(line.substr(level));
    return heading_text->empty() ? 0 : level;
}


} // unnamed namespace


std::string FixEquations(const std::string &markdown) {
    std::string fixed;
    size_t i(0);
    while (i < markdown.size()) {
        if (markdown.compare(i, 2, "$$") == 0) {
            const size_t closing_pos(markdown.find("$$", i + 2));
            if (closing_pos == std::string::npos) {
                fixed += markdown.substr(i);
                break;
            }

            const std::string formula(StringUtil::TrimWhite(markdown.substr(i + 2, closing_pos - i - 2)));
            while (not fixed.empty() and (fixed.back() == ' ' or fixed.back() == '\t'))
                fixed.pop_back();
            if (not fixed.empty() and fixed.back() != '\n')
                fixed += '\n';
            fixed += "$$\n" + formula + "\n$$";
            i = closing_pos + 2;
            while (i < markdown.size() and (markdown[i] == ' ' or markdown[i] == '\t'))
                ++i;
            if (i < markdown.size() and markdown[i] != '\n')
                fixed += '\n';
            continue;
        }

        if (markdown[i] == '$' and (i == 0 or markdown[i - 1] != '\\')) {
            const size_t line_end(markdown.find('\n', i));
            const size_t closing_pos(markdown.find('$', i + 1));
            if (closing_pos == std::string::npos or (line_end != std::string::npos and closing_pos > line_end)) {
                fixed += '$';
                ++i;
                continue;
            }

            const std::string formula(TrimBlanks(markdown.substr(i + 1, closing_pos - i - 1)));
            if (formula.empty())
                fixed += markdown.substr(i, closing_pos - i + 1);
            else
                fixed += "$" + formula + "$";
            i = closing_pos + 1;
            continue;
        }

        fixed += markdown[i++];
    }

    return fixed;
}


std::string FixTables(const std::string &markdown) {
    const std::vector<std::string> lines(SplitLines(markdown));
    std::vector<std::string> fixed_lines;
    for (size_t line_no(0); line_no < lines.size(); ++line_no) {
        const std::string &line(lines[line_no]);
        if (line_no > 0) {
            const std::string &previous_line(lines[line_no - 1]);
            const bool previous_is_blank(TrimBlanks(previous_line).empty());
            const bool current_is_blank(TrimBlanks(line).empty());
            if (IsTableLine(line) and not previous_is_blank and not IsTableLine(previous_line))
                fixed_lines.emplace_back("");
            else if (IsTableLine(previous_line) and not current_is_blank and not IsTableLine(line))
                fixed_lines.emplace_back("");
        }
        fixed_lines.emplace_back(line);
    }

    return StringUtil::Join(fixed_lines, "\n");
}


std::string FixHeadings(const std::string &markdown) {
    std::vector<std::string> lines(SplitLines(markdown));
    for (auto &line : lines) {
        std::string heading_text;
        const unsigned level(GetHeadingLevel(line, &heading_text));
        if (level > 0)
            line = std::string(level, '#') + " " + heading_text;
    }

    return StringUtil::Join(lines, "\n");
}


std::string MakeAnchor(const std::string &heading_text) {
    std::vector<uint32_t> code_points;
    if (not TextUtil::UTF8ToUTF32(heading_text, &code_points))
        return "";

    std::string anchor;
    bool in_whitespace(false);
    for (uint32_t code_point : code_points) {
        if (TextUtil::IsWhitespace(code_point)) {
            in_whitespace = true;
            continue;
        }
        if (not TextUtil::IsLetterOrDigit(code_point) and code_point != '_' and code_point != '-')
            continue;

        if (in_whitespace and not anchor.empty())
            anchor += '-';
        in_whitespace = false;

        if (code_point >= 'A' and code_point <= 'Z')
            code_point += 'a' - 'A';
        anchor += TextUtil::UTF32ToUTF8(code_point);
    }

    return anchor;
}


std::string AddTableOfContents(const std::string &markdown) {
    static const std::string TOC_TITLE("Contents");

    std::string table_of_contents("# " + TOC_TITLE + "\n\n");
    for (const auto &line : SplitLines(markdown)) {
        std::string heading_text;
        const unsigned level(GetHeadingLevel(line, &heading_text));
        if (level == 0 or heading_text == TOC_TITLE)
            continue;

        table_of_contents += std::string(2 * (level - 1), ' ') + "- [" + heading_text + "](#" + MakeAnchor(heading_text) + ")\n";
    }

    return table_of_contents + "\n---\n\n" + markdown;
}


std::string PostProcess(const std::string &markdown, const PostProcessOptions &options) {
    std::string processed(markdown);
    if (options.fix_equations_)
        processed = FixEquations(processed);
    if (options.fix_tables_)
        processed = FixTables(processed);
    if (options.fix_headings_)
        processed = FixHeadings(processed);
    if (options.add_table_of_contents_)
        processed = AddTableOfContents(processed);

    return processed;
}


bool PostProcessFile(const std::string &path, const PostProcessOptions &options, std::string * const error_message) {
    std::string markdown;
    if (not FileUtil::ReadString(path, &markdown)) {
        *error_message = "can't read \"" + path + "\"";
        return false;
    }

    if (not FileUtil::WriteString(path, PostProcess(markdown, options))) {
        *error_message = "can't write \"" + path + "\"";
        return false;
    }

    return true;
}


} // namespace MarkdownUtil
