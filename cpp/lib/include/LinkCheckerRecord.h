/** \file   LinkCheckerRecord.h
 *  \brief  The records that flow between the stages of the link checker.
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


namespace LinkChecker {


typedef std::vector<std::string> Schema;


// Column names of the two stores.
extern const Schema RESOURCE_SCHEMA; // cid,rid,title,link
extern const Schema CHECKED_SCHEMA;  // cid,rid,title,link,code


// One link-bearing item within a collection.
struct ResourceRecord {
    std::string collection_id_;
    std::string resource_id_;
    std::string title_;
    std::string link_;

public:
    ResourceRecord() = default;
    ResourceRecord(const std::string &collection_id, const std::string &resource_id, const std::string &title,
                   const std::string &link)
        : collection_id_(collection_id), resource_id_(resource_id), title_(title), link_(link) { }

    // A resource without a link stands in for a collection whose resources could not be retrieved.
    bool empty() const { return link_.empty(); }
};


// A resource together with the status code that checking its link produced.
struct CheckedRecord {
    ResourceRecord resource_;
    int status_code_;

public:
    CheckedRecord(const ResourceRecord &resource, const int status_code): resource_(resource), status_code_(status_code) { }
};


/** \class  Record
 *  \brief  Either a ResourceRecord or a CheckedRecord.
 */
class Record {
public:
    enum Kind { RESOURCE, CHECKED };

private:
    Kind kind_;
    ResourceRecord resource_;
    int status_code_; // Only meaningful for CHECKED records.

public:
    explicit Record(const ResourceRecord &resource): kind_(RESOURCE), resource_(resource), status_code_(-1) { }
    explicit Record(const CheckedRecord &checked_record)
        : kind_(CHECKED), resource_(checked_record.resource_), status_code_(checked_record.status_code_) { }

    inline Kind getKind() const { return kind_; }
    inline const ResourceRecord &getResource() const { return resource_; }

    /** \note Throws if this is not a CHECKED record. */
    int getStatusCode() const;

    CheckedRecord toCheckedRecord() const { return CheckedRecord(resource_, getStatusCode()); }

    /** \return The names of our fields in the order in which toFields() returns them. */
    const Schema &getSchema() const { return kind_ == RESOURCE ? RESOURCE_SCHEMA : CHECKED_SCHEMA; }

    std::vector<std::string> toFields() const;

    /** \brief  Reconstructs a record from a row that was read from a store.
     *  \param  header  The column names of the store.  A header containing a "code" column yields CHECKED records.
     *  \return False if "values" does not have the shape described by "header" or if the header lacks required columns.
     */
    static bool FromFields(const std::vector<std::string> &header, const std::vector<std::string> &values, Record * const record);

    static std::string KindToString(const Kind kind) { return kind == RESOURCE ? "resource" : "checked resource"; }
};


} // namespace LinkChecker
