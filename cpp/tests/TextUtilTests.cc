/** \file   TextUtilTests.cc
 *  \brief  Tests for the TextUtil module.
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
#include <sstream>
#include "TextUtil.h"
#include "UnitTest.h"


TEST(CSVLine) {
    CHECK_EQ(TextUtil::CSVLine({ "C1", "Title, with \"quotes\"", "" }), "\"C1\",\"Title, with \"\"quotes\"\"\",\"\"\r\n");
}


TEST(CSVReader) {
    std::istringstream input("cid,title\r\n"
                             "C1,\"A, B\"\n"
                             "\n"
                             "C2,\"Line\nbreak and \"\"quote\"\"\"\n");
    TextUtil::CSVReader reader(input);

    std::vector<std::string> values;
    CHECK_TRUE(reader.readRecord(&values));
    CHECK_TRUE(values == std::vector<std::string>({ "cid", "title" }));
    CHECK_TRUE(reader.readRecord(&values));
    CHECK_TRUE(values == std::vector<std::string>({ "C1", "A, B" }));
    CHECK_TRUE(reader.readRecord(&values));
    CHECK_TRUE(values == std::vector<std::string>({ "C2", "Line\nbreak and \"quote\"" }));
    CHECK_FALSE(reader.readRecord(&values));
}


TEST(CSVLinesCanBeReadBack) {
    const std::vector<std::string> values{ "x", "\"", ",,", "multi\r\nline", "" };
    std::istringstream input(TextUtil::CSVLine(values));
    TextUtil::CSVReader reader(input);

    std::vector<std::string> read_values;
    CHECK_TRUE(reader.readRecord(&read_values));
    CHECK_TRUE(read_values == values);
}


TEST(ReplaceInvalidUTF8Sequences) {
    std::string s("Tübingen");
    CHECK_TRUE(TextUtil::IsValidUTF8(s));
    CHECK_EQ(TextUtil::ReplaceInvalidUTF8Sequences(&s), 0u);
    CHECK_EQ(s, "Tübingen");

    s = "a\xFF" "b";
    CHECK_FALSE(TextUtil::IsValidUTF8(s));
    CHECK_EQ(TextUtil::ReplaceInvalidUTF8Sequences(&s), 1u);
    CHECK_EQ(s, "a" + TextUtil::GetUTF8ReplacementCharacter() + "b");
    CHECK_TRUE(TextUtil::IsValidUTF8(s));
}


TEST_MAIN(TextUtilTests)
