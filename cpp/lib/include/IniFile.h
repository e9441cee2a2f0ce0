/** \file    IniFile.h
 *  \brief   Declarations for an initialisation file parsing class.
 */

/*
 *  Copyright 2002-2008 Project iVia.
 *  Copyright 2002-2008 The Regents of The University of California.
 *  Copyright 2015-2026 Universitätsbibliothek Tübingen
 *
 *  This file is part of the libiViaCore package.
 *
 *  The libiViaCore package is free software; you can redistribute it and/or
 *  modify it under the terms of the GNU Lesser General Public License as
 *  published by the Free Software Foundation; either version 2 of the License,
 *  or (at your option) any later version.
 *
 *  libiViaCore is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Lesser General Public License for more details.
 *
 *  You should have received a copy of the GNU Lesser General Public License
 *  along with libiViaCore; if not, write to the Free Software Foundation, Inc.,
 *  59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 */
#pragma once


#include <algorithm>
#include <string>
#include <vector>


/** \class  IniFile
 *  \brief  Read a configuration file in our .ini format.
 *
 *  This class allows access to the contents of an ini file.  It is initialised with the name of the file, and the
 *  settings stored in the file can then be accessed through the lookup and get* methods.  Double-quoted string
 *  constants can use the backslash escapes \\n, \\t, \\" and \\\\.  If you want to embed a hash mark in an unquoted
 *  value you must preceede it with a single backslash.  In order to extend a value over multiple lines, put
 *  backslashes just before the line ends on all but the last line.
 */
class IniFile {
public:
    struct Entry {
        std::string name_, value_;

    public:
        Entry(const std::string &name, const std::string &value): name_(name), value_(value) { }
    };

public:
    class Section {
        friend class IniFile;
        std::string section_name_;
        std::vector<Entry> entries_;

    public:
        typedef std::vector<Entry>::const_iterator const_iterator;

    public:
        explicit Section(const std::string &section_name): section_name_(section_name) { }

        inline bool operator==(const std::string &section_name) const { return section_name == section_name_; }


        inline const_iterator begin() const { return entries_.cbegin(); }
        inline const_iterator end() const { return entries_.cend(); }

        /** \note Throws if an entry named "variable_name" already exists. */
        void insert(const std::string &variable_name, const std::string &value);

        bool lookup(const std::string &variable_name, std::string * const s) const;

        /** \brief   Retrieves a floating point value from a configuration file.
         *  \throws  A std::runtime_error if the variable is not found or the value cannot be converted to a double.
         */
        double getDouble(const std::string &variable_name) const;
        double getDouble(const std::string &variable_name, const double default_value) const;

        /** \throws  A std::runtime_error if the variable is not found. */
        std::string getString(const std::string &variable_name) const;
        std::string getString(const std::string &variable_name, const std::string &default_value) const;

        /** \throws  A std::runtime_error if the variable is not found or the value is not a non-negative integer. */
        unsigned getUnsigned(const std::string &variable_name) const;
        unsigned getUnsigned(const std::string &variable_name, const unsigned default_value) const;

        /** \brief   Retrieves a boolean value from a configuration file.
         *  \note    Valid values are "true", "false", "yes", "no", "on" and "off" in any capitalisation.
         *  \throws  A std::runtime_error if the variable is not found or the value is not a valid boolean.
         */
        bool getBool(const std::string &variable_name) const;
        bool getBool(const std::string &variable_name, const bool default_value) const;

        // \return An iterator referencing the found entry or end() if no matching entry was found.
        inline const_iterator find(const std::string &variable_name) const {
            return std::find_if(entries_.cbegin(), entries_.cend(),
                                [&variable_name](const Entry &entry) { return entry.name_ == variable_name; });
        }

        inline bool hasEntry(const std::string &variable_name) const { return find(variable_name) != end(); }
    };

    typedef std::vector<Section> Sections;
    typedef Sections::const_iterator const_iterator;

private:
    std::string ini_file_name_;
    Sections sections_;
    unsigned current_line_no_;

public:
    /** \brief  Parses "ini_file_name".
     *  \note   Throws a std::runtime_error if the file can't be read or contains syntax errors.
     */
    explicit IniFile(const std::string &ini_file_name);

    inline const_iterator begin() const { return sections_.begin(); }
    inline const_iterator end() const { return sections_.end(); }

    inline const std::string &getFilename() const { return ini_file_name_; }

    bool sectionIsDefined(const std::string &section_name) const;

    /** \return The named section or nullptr if there is no such section. */
    const Section *getSection(const std::string &section_name) const;

    bool lookup(const std::string &section_name, const std::string &variable_name, std::string * const s) const;

private:
    void processSectionHeader(const std::string &line);
    void processSectionEntry(const std::string &line);
    std::string getLocation() const;
};
