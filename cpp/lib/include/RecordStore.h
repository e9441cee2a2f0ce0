/** \file   RecordStore.h
 *  \brief  Append-only CSV storage that hands records from one stage of the link checker to the next.
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


#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "LinkCheckerRecord.h"
#include "TextUtil.h"
#include "util.h"


namespace LinkChecker {


class RecordStore;


// A finite, single-pass sequence of the records of a store.
class RecordStream {
    friend class RecordStore;

    const RecordStore &store_;
    std::unique_ptr<std::ifstream> input_;          // Only used when reading in storage order.
    std::unique_ptr<TextUtil::CSVReader> csv_reader_;
    std::vector<std::string> header_;
    std::vector<Record> shuffled_records_;          // Only used when reading in random order.
    size_t next_shuffled_record_;

    explicit RecordStream(const RecordStore &store): store_(store), next_shuffled_record_(0) { }
public:
    /** \return False if there are no more records. */
    bool next(Record * const record);

    RecordStream(const RecordStream &) = delete;
    const RecordStream &operator=(const RecordStream &) = delete;
};


/** \class  RecordStore
 *  \brief  Stores records, one per line, as CSV in a file whose first line holds the column names.
 *  \note   All operations may be called concurrently from any number of threads.  Writers are serialised by a mutex
 *          within this process and by an fcntl(2) lock between processes.  Failures are logged and never thrown.
 */
class RecordStore {
    friend class RecordStream;

    const std::string path_;
    const Schema schema_;
    Logger * const logger_;
    mutable std::mutex mutex_;
public:
    static const unsigned LOCK_TIMEOUT = 30; // In seconds.

    /** \brief  Opens the store at "path".
     *  \param  schema  The column names.  Every record that gets appended must have exactly these fields.
     *  \param  retain  If false, any existing contents of the store will be discarded.
     *  \note   Missing parent directories will be created.
     */
    RecordStore(const std::string &path, const Schema &schema, const bool retain, Logger * const logger = ::logger);

    inline const std::string &getPath() const { return path_; }
    inline const Schema &getSchema() const { return schema_; }

    /** \brief  Durably appends "record".  The header line is written first if the store is empty.
     *  \return True if the record was appended, false if nothing was added.
     */
    bool append(const Record &record);

    /** \brief  Reads the stored records back.
     *  \param  randomize  If true, the records are delivered in a random order, otherwise in the order in which they
     *                     were appended.  The header line is never part of the shuffled records.
     *  \note   Rows that do not form a valid record are skipped with a warning.  A missing or unreadable store yields
     *          an empty stream.
     */
    std::unique_ptr<RecordStream> stream(const bool randomize) const;

    /** \return The number of data rows, excluding the header.  0 if the store is empty, missing or unreadable. */
    size_t count() const;

    /** \brief Discards the contents of the store. */
    bool clear();
private:
    bool readNextRecord(TextUtil::CSVReader * const csv_reader, const std::vector<std::string> &header, Record * const record) const;
    bool openForReading(std::unique_ptr<std::ifstream> * const input, std::unique_ptr<TextUtil::CSVReader> * const csv_reader,
                        std::vector<std::string> * const header) const;
};


} // namespace LinkChecker
