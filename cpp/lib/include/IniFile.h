/** \file   IniFile.h
 *  \brief  Declaration of class IniFile, a reader for our sectioned configuration files.
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


/** \class  IniFile
 *  \brief  Read a configuration file in our .ini format.
 *
 *  Files consist of "[Section]" headers followed by "name = value" lines.  A hash mark starts a comment unless it
 *  appears inside a double-quoted value.  Double-quoted values may contain C-style backslash escapes like \\n.  A name
 *  without "=" and a value is treated as if it had been assigned "true".  Entries before the first section header
 *  belong to the global section whose name is the empty string.
 */
class IniFile {
public:
    struct Entry {
        std::string name_, value_;
    public:
        Entry(const std::string &name, const std::string &value): name_(name), value_(value) { }
    };

    class Section {
        friend class IniFile;
        std::string section_name_;
        std::vector<Entry> entries_;
    public:
        typedef std::vector<Entry>::const_iterator const_iterator;
    public:
        explicit Section(const std::string &section_name): section_name_(section_name) { }

        inline const std::string &getSectionName() const { return section_name_; }
        inline const_iterator begin() const { return entries_.cbegin(); }
        inline const_iterator end() const { return entries_.cend(); }
        inline size_t size() const { return entries_.size(); }

        /** \brief Adds a new entry or replaces the value of an existing entry with the same name. */
        void insert(const std::string &variable_name, const std::string &value);

        bool lookup(const std::string &variable_name, std::string * const s) const;

        /** \throws std::runtime_error if the variable is not defined. */
        std::string getString(const std::string &variable_name) const;
        std::string getString(const std::string &variable_name, const std::string &default_value) const;

        /** \throws std::runtime_error if the variable is not defined or not an unsigned integer. */
        unsigned getUnsigned(const std::string &variable_name) const;

        /** \throws std::runtime_error if the variable is defined but not an unsigned integer. */
        unsigned getUnsigned(const std::string &variable_name, const unsigned default_value) const;

        double getDouble(const std::string &variable_name) const;
        double getDouble(const std::string &variable_name, const double default_value) const;

        /** \note Accepted values are "true", "yes", "on", "1", "false", "no", "off" and "0", in any case.  Anything
         *        else results in a std::runtime_error.
         */
        bool getBool(const std::string &variable_name) const;
        bool getBool(const std::string &variable_name, const bool default_value) const;
    };

    typedef std::vector<Section>::const_iterator const_iterator;

private:
    std::string ini_file_name_;
    std::vector<Section> sections_;
    unsigned current_line_no_;

public:
    /** \param  create_empty  If true, a nonexistent file results in an IniFile w/o any sections.
     *  \throws std::runtime_error if the file can't be read (and "create_empty" is false) or contains syntax errors.
     */
    explicit IniFile(const std::string &ini_file_name, const bool create_empty = false);

    inline const std::string &getFilename() const { return ini_file_name_; }
    inline const_iterator begin() const { return sections_.cbegin(); }
    inline const_iterator end() const { return sections_.cend(); }

    /** \return The named section or nullptr if there is no such section. */
    const Section *getSection(const std::string &section_name) const;

    bool sectionIsDefined(const std::string &section_name) const { return getSection(section_name) != nullptr; }
    std::vector<std::string> getSections() const;

    bool lookup(const std::string &section_name, const std::string &variable_name, std::string * const s) const;

    // The getters w/o a default throw a std::runtime_error if the section or variable is missing.  The getters with a
    // default return the default in that case.

    std::string getString(const std::string &section_name, const std::string &variable_name) const;
    std::string getString(const std::string &section_name, const std::string &variable_name, const std::string &default_value) const;
    unsigned getUnsigned(const std::string &section_name, const std::string &variable_name) const;
    unsigned getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned default_value) const;
    double getDouble(const std::string &section_name, const std::string &variable_name) const;
    double getDouble(const std::string &section_name, const std::string &variable_name, const double default_value) const;
    bool getBool(const std::string &section_name, const std::string &variable_name) const;
    bool getBool(const std::string &section_name, const std::string &variable_name, const bool default_value) const;

private:
    const Section &getSectionOrThrow(const std::string &section_name) const;
    void processFile(const std::string &contents);
    void processSectionHeader(const std::string &line);
    void processSectionEntry(const std::string &line);
    std::string lineInfo() const;
};
