/** \file   IniFile.cc
 *  \brief  Implementation of class IniFile.
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
#include "IniFile.h"
#include <stdexcept>
#include <cctype>
#include "FileUtil.h"
#include "StringUtil.h"


namespace {


// Removes a trailing comment, i.e. everything starting at the first hash mark that is neither escaped nor
// inside of a double-quoted string.
std::string StripComment(const std::string &line) {
    bool in_quotes(false), escaped(false);
    for (size_t i(0); i < line.length(); ++i) {
        const char ch(line[i]);
        if (escaped)
            escaped = false;
        else if (ch == '\\')
            escaped = true;
        else if (ch == '"')
            in_quotes = not in_quotes;
        else if (ch == '#' and not in_quotes)
            return line.substr(0, i);
    }

    return line;
}


bool CStyleUnescape(const std::string &escaped, std::string * const unescaped) {
    unescaped->clear();
    for (auto ch(escaped.cbegin()); ch != escaped.cend(); ++ch) {
        if (*ch != '\\') {
            *unescaped += *ch;
            continue;
        }

        ++ch;
        if (ch == escaped.cend())
            return false;
        switch (*ch) {
        case 'n':
            *unescaped += '\n';
            break;
        case 't':
            *unescaped += '\t';
            break;
        case 'r':
            *unescaped += '\r';
            break;
        case 'f':
            *unescaped += '\f';
            break;
        case 'v':
            *unescaped += '\v';
            break;
        case '\\':
        case '"':
        case '\'':
        case '#':
            *unescaped += *ch;
            break;
        default:
            return false;
        }
    }

    return true;
}


bool IsValidVariableName(const std::string &name) {
    if (name.empty())
        return false;
    for (const char ch : name) {
        if (not (std::isalnum(static_cast<unsigned char>(ch)) or ch == '_' or ch == '-' or ch == '.'))
            return false;
    }

    return true;
}


} // unnamed namespace


void IniFile::Section::insert(const std::string &variable_name, const std::string &value) {
    for (auto &entry : entries_) {
        if (entry.name_ == variable_name) {
            entry.value_ = value;
            return;
        }
    }

    entries_.emplace_back(variable_name, value);
}


bool IniFile::Section::lookup(const std::string &variable_name, std::string * const s) const {
    for (const auto &entry : entries_) {
        if (entry.name_ == variable_name) {
            *s = entry.value_;
            return true;
        }
    }

    return false;
}


std::string IniFile::Section::getString(const std::string &variable_name) const {
    std::string value;
    if (not lookup(variable_name, &value))
        throw std::runtime_error("in IniFile::Section::getString: can't find \"" + variable_name + "\" in section \""
                                 + section_name_ + "\"!");
    return value;
}


std::string IniFile::Section::getString(const std::string &variable_name, const std::string &default_value) const {
    std::string value;
    return lookup(variable_name, &value) ? value : default_value;
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name) const {
    const std::string string_value(getString(variable_name));
    unsigned value;
    if (not StringUtil::ToUnsigned(string_value, &value))
        throw std::runtime_error("in IniFile::Section::getUnsigned: invalid unsigned value \"" + string_value + "\" for \""
                                 + variable_name + "\" in section \"" + section_name_ + "\"!");
    return value;
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name, const unsigned default_value) const {
    std::string string_value;
    return lookup(variable_name, &string_value) ? getUnsigned(variable_name) : default_value;
}


double IniFile::Section::getDouble(const std::string &variable_name) const {
    const std::string string_value(getString(variable_name));
    double value;
    if (not StringUtil::ToDouble(string_value, &value))
        throw std::runtime_error("in IniFile::Section::getDouble: invalid floating point value \"" + string_value + "\" for \""
                                 + variable_name + "\" in section \"" + section_name_ + "\"!");
    return value;
}


double IniFile::Section::getDouble(const std::string &variable_name, const double default_value) const {
    std::string string_value;
    return lookup(variable_name, &string_value) ? getDouble(variable_name) : default_value;
}


bool IniFile::Section::getBool(const std::string &variable_name) const {
    const std::string string_value(getString(variable_name));
    bool value;
    if (not StringUtil::ToBool(string_value, &value))
        throw std::runtime_error("in IniFile::Section::getBool: invalid boolean value \"" + string_value + "\" for \""
                                 + variable_name + "\" in section \"" + section_name_ + "\"!");
    return value;
}


bool IniFile::Section::getBool(const std::string &variable_name, const bool default_value) const {
    std::string string_value;
    return lookup(variable_name, &string_value) ? getBool(variable_name) : default_value;
}


IniFile::IniFile(const std::string &ini_file_name, const bool create_empty): ini_file_name_(ini_file_name), current_line_no_(0) {
    if (not FileUtil::Exists(ini_file_name_)) {
        if (create_empty)
            return;
        throw std::runtime_error("in IniFile::IniFile: file \"" + ini_file_name_ + "\" does not exist!");
    }

    std::string contents;
    if (not FileUtil::ReadString(ini_file_name_, &contents))
        throw std::runtime_error("in IniFile::IniFile: can't read \"" + ini_file_name_ + "\"!");
    processFile(contents);
}


const IniFile::Section *IniFile::getSection(const std::string &section_name) const {
    for (const auto &section : sections_) {
        if (section.section_name_ == section_name)
            return &section;
    }

    return nullptr;
}


std::vector<std::string> IniFile::getSections() const {
    std::vector<std::string> section_names;
    for (const auto &section : sections_)
        section_names.emplace_back(section.section_name_);
    return section_names;
}


bool IniFile::lookup(const std::string &section_name, const std::string &variable_name, std::string * const s) const {
    const Section * const section(getSection(section_name));
    return section != nullptr and section->lookup(variable_name, s);
}


const IniFile::Section &IniFile::getSectionOrThrow(const std::string &section_name) const {
    const Section * const section(getSection(section_name));
    if (section == nullptr)
        throw std::runtime_error("in IniFile::getSectionOrThrow: no section \"" + section_name + "\" in \"" + ini_file_name_ + "\"!");
    return *section;
}


std::string IniFile::getString(const std::string &section_name, const std::string &variable_name) const {
    return getSectionOrThrow(section_name).getString(variable_name);
}


std::string IniFile::getString(const std::string &section_name, const std::string &variable_name, const std::string &default_value) const {
    const Section * const section(getSection(section_name));
    return (section == nullptr) ? default_value : section->getString(variable_name, default_value);
}


unsigned IniFile::getUnsigned(const std::string &section_name, const std::string &variable_name) const {
    return getSectionOrThrow(section_name).getUnsigned(variable_name);
}


unsigned IniFile::getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned default_value) const {
    const Section * const section(getSection(section_name));
    return (section == nullptr) ? default_value : section->getUnsigned(variable_name, default_value);
}


double IniFile::getDouble(const std::string &section_name, const std::string &variable_name) const {
    return getSectionOrThrow(section_name).getDouble(variable_name);
}


double IniFile::getDouble(const std::string &section_name, const std::string &variable_name, const double default_value) const {
    const Section * const section(getSection(section_name));
    return (section == nullptr) ? default_value : section->getDouble(variable_name, default_value);
}


bool IniFile::getBool(const std::string &section_name, const std::string &variable_name) const {
    return getSectionOrThrow(section_name).getBool(variable_name);
}


bool IniFile::getBool(const std::string &section_name, const std::string &variable_name, const bool default_value) const {
    const Section * const section(getSection(section_name));
    return (section == nullptr) ? default_value : section->getBool(variable_name, default_value);
}


std::string IniFile::lineInfo() const {
    return " on line " + std::to_string(current_line_no_) + " in \"" + ini_file_name_ + "\"!";
}


void IniFile::processSectionHeader(const std::string &line) {
    if (line.back() != ']')
        throw std::runtime_error("in IniFile::processSectionHeader: missing closing bracket" + lineInfo());

    const std::string section_name(StringUtil::TrimWhite(line.substr(1, line.length() - 2)));
    if (section_name.empty())
        throw std::runtime_error("in IniFile::processSectionHeader: empty section name" + lineInfo());
    if (sectionIsDefined(section_name))
        throw std::runtime_error("in IniFile::processSectionHeader: duplicate section \"" + section_name + "\"" + lineInfo());

    sections_.emplace_back(section_name);
}


void IniFile::processSectionEntry(const std::string &line) {
    if (sections_.empty())
        sections_.emplace_back(""); // The global section.

    const auto equal_pos(line.find('='));
    if (equal_pos == std::string::npos) {
        if (not IsValidVariableName(line))
            throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + line + "\"" + lineInfo());
        sections_.back().insert(line, "true");
        return;
    }

    const std::string variable_name(StringUtil::TrimWhite(line.substr(0, equal_pos)));
    if (not IsValidVariableName(variable_name))
        throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + variable_name + "\"" + lineInfo());

    std::string value(StringUtil::TrimWhite(line.substr(equal_pos + 1)));
    if (not value.empty() and value[0] == '"') {
        if (value.length() < 2 or value.back() != '"')
            throw std::runtime_error("in IniFile::processSectionEntry: improperly quoted value" + lineInfo());
        std::string unescaped_value;
        if (not CStyleUnescape(value.substr(1, value.length() - 2), &unescaped_value))
            throw std::runtime_error("in IniFile::processSectionEntry: bad escape" + lineInfo());
        value.swap(unescaped_value);
    }

    sections_.back().insert(variable_name, value);
}


void IniFile::processFile(const std::string &contents) {
    std::vector<std::string> lines;
    StringUtil::Split(contents, '\n', &lines, /* suppress_empty_components = */ false);

    current_line_no_ = 0;
    for (const auto &raw_line : lines) {
        ++current_line_no_;
        const std::string line(StringUtil::TrimWhite(StripComment(raw_line)));
        if (line.empty())
            continue;

        if (line[0] == '[')
            processSectionHeader(line);
        else
            processSectionEntry(line);
    }
}
