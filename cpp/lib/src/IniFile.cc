/** \file    IniFile.cc
 *  \brief   Implementation of class IniFile.
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
#include "IniFile.h"
#include <fstream>
#include <stdexcept>
#include <cctype>
#include <cerrno>
#include <cstring>
#include "StringUtil.h"
#include "util.h"


namespace {


bool ToBool(const std::string &value, bool * const b) {
    const std::string lowercase_value(StringUtil::ToLower(value));
    if (lowercase_value == "true" or lowercase_value == "yes" or lowercase_value == "on") {
        *b = true;
        return true;
    }
    if (lowercase_value == "false" or lowercase_value == "no" or lowercase_value == "off") {
        *b = false;
        return true;
    }

    return false;
}


} // unnamed namespace


void IniFile::Section::insert(const std::string &variable_name, const std::string &value) {
    if (unlikely(hasEntry(variable_name)))
        throw std::runtime_error("in IniFile::Section::insert: duplicate entry \"" + variable_name + "\" in section \""
                                 + section_name_ + "\"!");
    entries_.emplace_back(variable_name, value);
}


bool IniFile::Section::lookup(const std::string &variable_name, std::string * const s) const {
    const auto existing_entry(find(variable_name));
    if (existing_entry == entries_.end()) {
        s->clear();
        return false;
    }

    *s = existing_entry->value_;
    return true;
}


double IniFile::Section::getDouble(const std::string &variable_name) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        throw std::runtime_error("can't find \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    double number;
    if (not StringUtil::ToDouble(existing_entry->value_, &number))
        throw std::runtime_error("invalid double entry \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    return number;
}


double IniFile::Section::getDouble(const std::string &variable_name, const double default_value) const {
    return hasEntry(variable_name) ? getDouble(variable_name) : default_value;
}


std::string IniFile::Section::getString(const std::string &variable_name) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        throw std::runtime_error("can't find \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    return existing_entry->value_;
}


std::string IniFile::Section::getString(const std::string &variable_name, const std::string &default_value) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        return default_value;

    return existing_entry->value_;
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        throw std::runtime_error("can't find \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    unsigned number;
    if (not StringUtil::ToUnsigned(existing_entry->value_, &number))
        throw std::runtime_error("invalid unsigned entry \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    return number;
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name, const unsigned default_value) const {
    return hasEntry(variable_name) ? getUnsigned(variable_name) : default_value;
}


bool IniFile::Section::getBool(const std::string &variable_name) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        throw std::runtime_error("can't find \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    bool retval;
    if (not ToBool(existing_entry->value_, &retval))
        throw std::runtime_error("invalid boolean value in section \"" + section_name_ + "\", entry \"" + variable_name
                                 + "\" (bad value is \"" + existing_entry->value_ + "\")!");

    return retval;
}


bool IniFile::Section::getBool(const std::string &variable_name, const bool default_value) const {
    return hasEntry(variable_name) ? getBool(variable_name) : default_value;
}


bool IniFile::sectionIsDefined(const std::string &section_name) const {
    return getSection(section_name) != nullptr;
}


const IniFile::Section *IniFile::getSection(const std::string &section_name) const {
    const auto section(std::find(sections_.cbegin(), sections_.cend(), section_name));
    return section == sections_.cend() ? nullptr : &*section;
}


bool IniFile::lookup(const std::string &section_name, const std::string &variable_name, std::string * const s) const {
    const Section * const section(getSection(section_name));
    if (section == nullptr) {
        s->clear();
        return false;
    }

    return section->lookup(variable_name, s);
}


std::string IniFile::getLocation() const {
    return "line " + std::to_string(current_line_no_) + " in file \"" + ini_file_name_ + "\"";
}


void IniFile::processSectionHeader(const std::string &line) {
    if (line[line.length() - 1] != ']')
        throw std::runtime_error("in IniFile::processSectionHeader: garbled section header on " + getLocation() + "!");

    std::string section_name(line.substr(1, line.length() - 2));
    StringUtil::Trim(" \t", &section_name);
    if (section_name.empty())
        throw std::runtime_error("in IniFile::processSectionHeader: empty section name on " + getLocation() + "!");

    if (sectionIsDefined(section_name))
        throw std::runtime_error("in IniFile::processSectionHeader: duplicate section \"" + section_name + "\" on " + getLocation() + "!");
    sections_.emplace_back(section_name);
}


namespace {


// IsValidVariableName -- only allow names that start with a letter followed by letters, digits,
// hyphens and underscores.
//
bool IsValidVariableName(const std::string &possible_variable_name) {
    if (unlikely(possible_variable_name.empty()))
        return false;

    auto ch(possible_variable_name.cbegin());
    if (not std::isalpha(static_cast<unsigned char>(*ch)))
        return false;

    for (++ch; ch != possible_variable_name.cend(); ++ch) {
        if (not std::isalnum(static_cast<unsigned char>(*ch)) and *ch != '-' and *ch != '_' and *ch != '.')
            return false;
    }

    return true;
}


std::string CStyleUnescape(const std::string &escaped) {
    std::string unescaped;
    for (auto ch(escaped.cbegin()); ch != escaped.cend(); ++ch) {
        if (*ch != '\\') {
            unescaped += *ch;
            continue;
        }

        ++ch;
        if (unlikely(ch == escaped.cend()))
            throw std::runtime_error("trailing backslash");
        switch (*ch) {
        case 'n':
            unescaped += '\n';
            break;
        case 't':
            unescaped += '\t';
            break;
        case '"':
        case '\\':
        case '#':
            unescaped += *ch;
            break;
        default:
            throw std::runtime_error("unknown escape \\" + std::string(1, *ch));
        }
    }

    return unescaped;
}


// Strips a trailing comment.  Hash marks inside of double-quoted strings or preceeded by a backslash are retained.
void StripComment(std::string * const line) {
    bool inside_string_literal(false);
    for (auto character(line->begin()); character != line->end(); ++character) {
        if (*character == '"')
            inside_string_literal = not inside_string_literal;
        else if (*character == '#') {
            if ((character != line->begin() and *(character - 1) == '\\') or inside_string_literal)
                continue;
            line->resize(character - line->begin());
            return;
        }
    }
}


} // unnamed namespace


void IniFile::processSectionEntry(const std::string &line) {
    const size_t equal_sign(line.find('='));
    if (equal_sign == std::string::npos) { // Not a normal "variable = value" type line.
        const std::string trimmed_line(StringUtil::TrimWhite(line));
        if (unlikely(not IsValidVariableName(trimmed_line)))
            throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + trimmed_line + "\" on "
                                     + getLocation() + "!");

        sections_.back().insert(trimmed_line, "true");
        return;
    }

    std::string variable_name(line.substr(0, equal_sign));
    StringUtil::Trim(" \t", &variable_name);
    if (not IsValidVariableName(variable_name))
        throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + variable_name + "\" on "
                                 + getLocation() + "!");

    std::string value(line.substr(equal_sign + 1));
    StringUtil::Trim(" \t", &value);

    if (not value.empty() and value[0] == '"') { // double-quoted string
        if (value.length() == 1 or value[value.length() - 1] != '"')
            throw std::runtime_error("in IniFile::processSectionEntry: improperly quoted value on " + getLocation() + "!");

        try {
            value = CStyleUnescape(value.substr(1, value.length() - 2));
        } catch (const std::runtime_error &x) {
            throw std::runtime_error("in IniFile::processSectionEntry: bad escape on " + getLocation() + "! (" + std::string(x.what())
                                     + ")");
        }
    } else {
        std::string::size_type escaped_hash_pos;
        while ((escaped_hash_pos = value.find("\\#")) != std::string::npos)
            value.erase(escaped_hash_pos, 1);
    }

    sections_.back().insert(variable_name, value);
}


IniFile::IniFile(const std::string &ini_file_name): ini_file_name_(ini_file_name), current_line_no_(0) {
    std::ifstream ini_file(ini_file_name_.c_str());
    if (ini_file.fail())
        throw std::runtime_error("in IniFile::IniFile: can't open \"" + ini_file_name_ + "\"! (" + std::string(std::strerror(errno)) + ")");

    while (not ini_file.eof()) {
        std::string line;

        // read lines until newline character is not preceeded by a '\'
        bool continued_line(false);
        do {
            std::string buf;
            if (not std::getline(ini_file, buf))
                break;
            ++current_line_no_;
            line += StringUtil::Trim(" \t\r", &buf);
            if (line.empty())
                break;

            continued_line = line[line.length() - 1] == '\\';
            if (continued_line) {
                line.resize(line.length() - 1);
                StringUtil::Trim(" \t", &line);
            }
        } while (continued_line);

        StripComment(&line);
        StringUtil::Trim(" \t", &line);
        if (line.empty())
            continue;

        if (line[0] == '[') // should be a section header!
            processSectionHeader(line);
        else { // should be a new setting!
            if (sections_.empty())
                sections_.emplace_back("");
            processSectionEntry(line);
        }
    }
}
