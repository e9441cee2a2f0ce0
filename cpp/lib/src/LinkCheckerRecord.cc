/** \file   LinkCheckerRecord.cc
 *  \brief  Implementation of the link checker's record types.
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
#include "LinkCheckerRecord.h"
#include <algorithm>
#include <stdexcept>
#include "StringUtil.h"
#include "util.h"


namespace LinkChecker {


const Schema RESOURCE_SCHEMA{ "cid", "rid", "title", "link" };
const Schema CHECKED_SCHEMA{ "cid", "rid", "title", "link", "code" };


int Record::getStatusCode() const {
    if (unlikely(kind_ != CHECKED))
        throw std::runtime_error("in LinkChecker::Record::getStatusCode: a " + KindToString(kind_) + " record has no status code!");
    return status_code_;
}


std::vector<std::string> Record::toFields() const {
    std::vector<std::string> fields{ resource_.collection_id_, resource_.resource_id_, resource_.title_, resource_.link_ };
    if (kind_ == CHECKED)
        fields.emplace_back(std::to_string(status_code_));
    return fields;
}


namespace {


bool GetColumnIndex(const std::vector<std::string> &header, const std::string &column_name, size_t * const index) {
    const auto column(std::find(header.cbegin(), header.cend(), column_name));
    if (column == header.cend())
        return false;

    *index = static_cast<size_t>(column - header.cbegin());
    return true;
}


} // unnamed namespace


bool Record::FromFields(const std::vector<std::string> &header, const std::vector<std::string> &values, Record * const record) {
    if (values.size() != header.size())
        return false;

    size_t cid_index, rid_index, title_index, link_index;
    if (not GetColumnIndex(header, "cid", &cid_index) or not GetColumnIndex(header, "rid", &rid_index)
        or not GetColumnIndex(header, "title", &title_index) or not GetColumnIndex(header, "link", &link_index))
        return false;

    const ResourceRecord resource(values[cid_index], values[rid_index], values[title_index], values[link_index]);

    size_t code_index;
    if (not GetColumnIndex(header, "code", &code_index)) {
        *record = Record(resource);
        return true;
    }

    int status_code;
    if (not StringUtil::ToInt(StringUtil::TrimWhite(values[code_index]), &status_code))
        return false;

    *record = Record(CheckedRecord(resource, status_code));
    return true;
}


} // namespace LinkChecker
