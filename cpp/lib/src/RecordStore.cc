/** \file   RecordStore.cc
 *  \brief  Implementation of class RecordStore.
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
#include "RecordStore.h"
#include <stdexcept>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include "FileDescriptor.h"
#include "FileLocker.h"
#include "FileUtil.h"
#include "Random.h"
#include "StringUtil.h"


namespace LinkChecker {


bool RecordStream::next(Record * const record) {
    if (csv_reader_ == nullptr) {
        if (next_shuffled_record_ == shuffled_records_.size())
            return false;
        *record = shuffled_records_[next_shuffled_record_++];
        return true;
    }

    std::lock_guard<std::mutex> mutex_locker(store_.mutex_);
    if (store_.readNextRecord(csv_reader_.get(), header_, record))
        return true;

    csv_reader_.reset();
    input_.reset();
    return false;
}


RecordStore::RecordStore(const std::string &path, const Schema &schema, const bool retain, Logger * const logger)
    : path_(path), schema_(schema), logger_(logger)
{
    if (unlikely(schema_.empty()))
        throw std::runtime_error("in LinkChecker::RecordStore::RecordStore: empty schema for \"" + path_ + "\"!");

    const std::string directory(FileUtil::GetDirname(path_));
    if (not directory.empty() and not FileUtil::IsDirectory(directory) and not FileUtil::MakeDirectory(directory, /* recursive = */ true))
        LOG_WARNING_TO(logger_, "failed to create the directory \"" + directory + "\"!");

    if (not retain)
        clear();
}


bool RecordStore::append(const Record &record) {
    if (unlikely(record.getSchema() != schema_)) {
        LOG_WARNING_TO(logger_, "refusing to append a " + Record::KindToString(record.getKind()) + " record to \"" + path_
                                + "\" whose columns are " + StringUtil::Join(schema_, ",") + "!");
        return false;
    }

    std::lock_guard<std::mutex> mutex_locker(mutex_);

    FileDescriptor fd(::open(path_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644));
    if (not fd.isValid()) {
        LOG_WARNING_TO(logger_, "failed to open \"" + path_ + "\" for appending: " + std::string(std::strerror(errno)));
        errno = 0;
        return false;
    }

    try {
        const FileLocker file_locker(fd, FileLocker::READ_WRITE, LOCK_TIMEOUT);

        struct stat stat_buf;
        if (unlikely(::fstat(fd, &stat_buf) != 0))
            throw std::runtime_error("fstat(2) failed: " + std::string(std::strerror(errno)));

        std::string row;
        if (stat_buf.st_size == 0)
            row = TextUtil::CSVLine(schema_);
        row += TextUtil::CSVLine(record.toFields());

        // A single write(2) keeps rows whole even if another process appends at the same time.
        const ssize_t written(::write(fd, row.data(), row.size()));
        if (unlikely(written != static_cast<ssize_t>(row.size()))) {
            if (written > 0 and ::ftruncate(fd, stat_buf.st_size) != 0)
                throw std::runtime_error("short write and failed to remove the partial row: " + std::string(std::strerror(errno)));
            throw std::runtime_error("write(2) failed: " + std::string(written < 0 ? std::strerror(errno) : "short write"));
        }

        if (unlikely(::fsync(fd) != 0))
            throw std::runtime_error("fsync(2) failed: " + std::string(std::strerror(errno)));
    } catch (const std::runtime_error &x) {
        LOG_WARNING_TO(logger_, "failed to append to \"" + path_ + "\": " + std::string(x.what()));
        errno = 0;
        return false;
    }

    if (unlikely(not fd.close())) {
        LOG_WARNING_TO(logger_, "failed to close \"" + path_ + "\": " + std::string(std::strerror(errno)));
        errno = 0;
        return false;
    }

    return true;
}


bool RecordStore::openForReading(std::unique_ptr<std::ifstream> * const input,
                                 std::unique_ptr<TextUtil::CSVReader> * const csv_reader,
                                 std::vector<std::string> * const header) const
{
    if (not FileUtil::Exists(path_)) {
        LOG_DEBUG_TO(logger_, "\"" + path_ + "\" does not exist yet.");
        return false;
    }

    input->reset(new std::ifstream(path_, std::ios::binary));
    if (not (*input)->is_open()) {
        LOG_WARNING_TO(logger_, "failed to open \"" + path_ + "\" for reading!");
        return false;
    }

    csv_reader->reset(new TextUtil::CSVReader(**input));
    try {
        if (not (*csv_reader)->readRecord(header))
            return false;
    } catch (const std::runtime_error &x) {
        LOG_WARNING_TO(logger_, "failed to read the header of \"" + path_ + "\": " + std::string(x.what()));
        return false;
    }

    for (auto &column_name : *header)
        TextUtil::ReplaceInvalidUTF8Sequences(&column_name);
    if (*header != schema_)
        LOG_WARNING_TO(logger_, "the columns of \"" + path_ + "\" are " + StringUtil::Join(*header, ",") + " instead of "
                                + StringUtil::Join(schema_, ",") + "!");

    return true;
}


bool RecordStore::readNextRecord(TextUtil::CSVReader * const csv_reader, const std::vector<std::string> &header,
                                 Record * const record) const
{
    std::vector<std::string> values;
    for (;;) {
        try {
            if (not csv_reader->readRecord(&values))
                return false;
        } catch (const std::runtime_error &x) {
            LOG_WARNING_TO(logger_, "giving up on reading \"" + path_ + "\": " + std::string(x.what()));
            return false;
        }

        for (auto &value : values)
            TextUtil::ReplaceInvalidUTF8Sequences(&value);

        if (Record::FromFields(header, values, record))
            return true;

        LOG_WARNING_TO(logger_, "skipping a malformed row ending on line " + std::to_string(csv_reader->getLineNo()) + " of \""
                                + path_ + "\"!");
    }
}


std::unique_ptr<RecordStream> RecordStore::stream(const bool randomize) const {
    std::unique_ptr<RecordStream> record_stream(new RecordStream(*this));

    std::lock_guard<std::mutex> mutex_locker(mutex_);
    if (not openForReading(&record_stream->input_, &record_stream->csv_reader_, &record_stream->header_)) {
        record_stream->csv_reader_.reset();
        record_stream->input_.reset();
        return record_stream;
    }

    if (randomize) {
        Record record{ ResourceRecord() };
        while (readNextRecord(record_stream->csv_reader_.get(), record_stream->header_, &record))
            record_stream->shuffled_records_.emplace_back(record);
        Random::Shuffle(&record_stream->shuffled_records_);

        record_stream->csv_reader_.reset();
        record_stream->input_.reset();
    }

    return record_stream;
}


size_t RecordStore::count() const {
    std::lock_guard<std::mutex> mutex_locker(mutex_);

    std::unique_ptr<std::ifstream> input;
    std::unique_ptr<TextUtil::CSVReader> csv_reader;
    std::vector<std::string> header;
    if (not openForReading(&input, &csv_reader, &header))
        return 0;

    size_t row_count(0);
    std::vector<std::string> values;
    try {
        while (csv_reader->readRecord(&values))
            ++row_count;
    } catch (const std::runtime_error &x) {
        LOG_WARNING_TO(logger_, "failed to count the rows of \"" + path_ + "\": " + std::string(x.what()));
        return 0;
    }

    return row_count;
}


bool RecordStore::clear() {
    std::lock_guard<std::mutex> mutex_locker(mutex_);
    if (not FileUtil::Exists(path_))
        return true;

    if (unlikely(not FileUtil::DeleteFile(path_))) {
        LOG_WARNING_TO(logger_, "failed to delete \"" + path_ + "\": " + std::string(std::strerror(errno)));
        errno = 0;
        return false;
    }

    return true;
}


} // namespace LinkChecker
