/** \file   RecordStoreTests.cc
 *  \brief  Tests for LinkChecker::RecordStore.
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
#include <set>
#include <thread>
#include <vector>
#include "FileUtil.h"
#include "RecordStore.h"
#include "StringUtil.h"
#include "UnitTest.h"


namespace {


std::vector<LinkChecker::Record> ReadAll(const LinkChecker::RecordStore &store, const bool randomize) {
    std::vector<LinkChecker::Record> records;
    const std::unique_ptr<LinkChecker::RecordStream> stream(store.stream(randomize));
    LinkChecker::Record record{ LinkChecker::ResourceRecord() };
    while (stream->next(&record))
        records.emplace_back(record);
    return records;
}


std::set<std::string> GetResourceIds(const std::vector<LinkChecker::Record> &records) {
    std::set<std::string> resource_ids;
    for (const auto &record : records)
        resource_ids.emplace(record.getResource().resource_id_);
    return resource_ids;
}


unsigned CountOccurrences(const std::string &haystack, const std::string &needle) {
    unsigned count(0);
    for (size_t pos(haystack.find(needle)); pos != std::string::npos; pos = haystack.find(needle, pos + needle.length()))
        ++count;
    return count;
}


} // unnamed namespace


TEST(ConcurrentAppendsAreSerialised) {
    const FileUtil::AutoTempDirectory temp_dir("/tmp/RecordStoreTests");
    const std::string path(temp_dir.getDirectoryPath() + "/resources.csv");
    LinkChecker::RecordStore store(path, LinkChecker::RESOURCE_SCHEMA, /* retain = */ false);

    const unsigned THREAD_COUNT(8), RECORDS_PER_THREAD(25);
    std::vector<std::thread> threads;
    for (unsigned thread_no(0); thread_no < THREAD_COUNT; ++thread_no) {
        threads.emplace_back([&store, thread_no]() {
            for (unsigned record_no(0); record_no < RECORDS_PER_THREAD; ++record_no) {
                const std::string id(std::to_string(thread_no) + "-" + std::to_string(record_no));
                store.append(LinkChecker::Record(LinkChecker::ResourceRecord("C" + std::to_string(thread_no), id, "Title " + id,
                                                                             "https://example.com/" + id)));
            }
        });
    }
    for (auto &thread : threads)
        thread.join();

    CHECK_EQ(store.count(), THREAD_COUNT * RECORDS_PER_THREAD);

    const auto records(ReadAll(store, /* randomize = */ false));
    CHECK_EQ(records.size(), THREAD_COUNT * RECORDS_PER_THREAD);
    CHECK_EQ(GetResourceIds(records).size(), THREAD_COUNT * RECORDS_PER_THREAD);
    for (const auto &record : records)
        CHECK_EQ(record.getResource().link_, "https://example.com/" + record.getResource().resource_id_);

    std::string contents;
    CHECK_TRUE(FileUtil::ReadString(path, &contents));
    CHECK_EQ(CountOccurrences(contents, "\"cid\",\"rid\",\"title\",\"link\""), 1u);
    CHECK_TRUE(StringUtil::StartsWith(contents, "\"cid\",\"rid\",\"title\",\"link\"\r\n"));
}


TEST(RandomizedStreamIsAPermutation) {
    const FileUtil::AutoTempDirectory temp_dir("/tmp/RecordStoreTests");
    LinkChecker::RecordStore store(temp_dir.getDirectoryPath() + "/resources.csv", LinkChecker::RESOURCE_SCHEMA, false);
    for (unsigned i(0); i < 50; ++i)
        CHECK_TRUE(store.append(LinkChecker::Record(LinkChecker::ResourceRecord("C1", std::to_string(i), "", "https://a.example/" + std::to_string(i)))));

    const auto ordered_records(ReadAll(store, /* randomize = */ false));
    const auto shuffled_records(ReadAll(store, /* randomize = */ true));
    CHECK_EQ(ordered_records.size(), 50u);
    CHECK_EQ(shuffled_records.size(), 50u);
    CHECK_TRUE(GetResourceIds(ordered_records) == GetResourceIds(shuffled_records));

    // Storage order is append order.
    for (unsigned i(0); i < ordered_records.size(); ++i)
        CHECK_EQ(ordered_records[i].getResource().resource_id_, std::to_string(i));

    // The header must never show up as a record.
    for (const auto &record : shuffled_records)
        CHECK_NE(record.getResource().collection_id_, "cid");
}


TEST(CountIgnoresTheHeader) {
    const FileUtil::AutoTempDirectory temp_dir("/tmp/RecordStoreTests");
    const std::string path(temp_dir.getDirectoryPath() + "/results.csv");

    LinkChecker::RecordStore store(path, LinkChecker::CHECKED_SCHEMA, false);
    CHECK_EQ(store.count(), 0u);
    CHECK_FALSE(FileUtil::Exists(path));

    const LinkChecker::ResourceRecord resource("C1", "R1", "A title", "https://example.com/");
    for (unsigned k(1); k <= 3; ++k) {
        CHECK_TRUE(store.append(LinkChecker::Record(LinkChecker::CheckedRecord(resource, 200))));
        CHECK_EQ(store.count(), k);
    }
}


TEST(MissingStoreYieldsNothing) {
    const FileUtil::AutoTempDirectory temp_dir("/tmp/RecordStoreTests");
    const LinkChecker::RecordStore store(temp_dir.getDirectoryPath() + "/does/not/exist.csv", LinkChecker::RESOURCE_SCHEMA, true);
    CHECK_EQ(store.count(), 0u);
    CHECK_TRUE(ReadAll(store, false).empty());
    CHECK_TRUE(ReadAll(store, true).empty());
}


TEST(RetainKeepsOrDiscardsContents) {
    const FileUtil::AutoTempDirectory temp_dir("/tmp/RecordStoreTests");
    const std::string path(temp_dir.getDirectoryPath() + "/nested/dir/resources.csv");
    {
        LinkChecker::RecordStore store(path, LinkChecker::RESOURCE_SCHEMA, false);
        CHECK_TRUE(store.append(LinkChecker::Record(LinkChecker::ResourceRecord("C1", "R1", "", "https://example.com/"))));
    }

    const LinkChecker::RecordStore retained_store(path, LinkChecker::RESOURCE_SCHEMA, /* retain = */ true);
    CHECK_EQ(retained_store.count(), 1u);

    const LinkChecker::RecordStore fresh_store(path, LinkChecker::RESOURCE_SCHEMA, /* retain = */ false);
    CHECK_EQ(fresh_store.count(), 0u);
    CHECK_FALSE(FileUtil::Exists(path));
}


TEST(SpecialCharactersSurvive) {
    const FileUtil::AutoTempDirectory temp_dir("/tmp/RecordStoreTests");
    LinkChecker::RecordStore store(temp_dir.getDirectoryPath() + "/results.csv", LinkChecker::CHECKED_SCHEMA, false);

    const LinkChecker::ResourceRecord resource("C,1", "R\"1\"", "Line one\r\nLine two", "https://example.com/?a=1,2");
    CHECK_TRUE(store.append(LinkChecker::Record(LinkChecker::CheckedRecord(resource, -1))));

    const auto records(ReadAll(store, false));
    CHECK_EQ(records.size(), 1u);
    if (records.size() != 1)
        return;

    CHECK_TRUE(records[0].getKind() == LinkChecker::Record::CHECKED);
    CHECK_EQ(records[0].getResource().collection_id_, "C,1");
    CHECK_EQ(records[0].getResource().resource_id_, "R\"1\"");
    CHECK_EQ(records[0].getResource().title_, "Line one\r\nLine two");
    CHECK_EQ(records[0].getResource().link_, "https://example.com/?a=1,2");
    CHECK_EQ(records[0].getStatusCode(), -1);
    CHECK_EQ(store.count(), 1u);
}


TEST(WrongKindIsRejected) {
    const FileUtil::AutoTempDirectory temp_dir("/tmp/RecordStoreTests");
    LinkChecker::RecordStore store(temp_dir.getDirectoryPath() + "/resources.csv", LinkChecker::RESOURCE_SCHEMA, false);

    const LinkChecker::ResourceRecord resource("C1", "R1", "", "https://example.com/");
    CHECK_FALSE(store.append(LinkChecker::Record(LinkChecker::CheckedRecord(resource, 200))));
    CHECK_EQ(store.count(), 0u);
}


TEST(MalformedRowsAreSkipped) {
    const FileUtil::AutoTempDirectory temp_dir("/tmp/RecordStoreTests");
    const std::string path(temp_dir.getDirectoryPath() + "/results.csv");
    CHECK_TRUE(FileUtil::WriteString(path, "cid,rid,title,link,code\r\n"
                                           "C1,R1,T1,https://a.example/,200\r\n"
                                           "C1,R2,T2,https://b.example/\r\n"        // Too few fields.
                                           "C1,R3,T3,https://c.example/,abc\r\n"    // Not a status code.
                                           "C2,R4,\"T\xff\",https://d.example/,404\r\n"));

    const LinkChecker::RecordStore store(path, LinkChecker::CHECKED_SCHEMA, /* retain = */ true);
    const auto records(ReadAll(store, false));
    CHECK_EQ(records.size(), 2u);
    if (records.size() != 2)
        return;

    CHECK_EQ(records[0].getResource().resource_id_, "R1");
    CHECK_EQ(records[0].getStatusCode(), 200);
    CHECK_EQ(records[1].getResource().resource_id_, "R4");
    CHECK_EQ(records[1].getResource().title_, "T\xEF\xBF\xBD"); // U+FFFD
    CHECK_EQ(records[1].getStatusCode(), 404);
}


TEST_MAIN(RecordStoreTests)
