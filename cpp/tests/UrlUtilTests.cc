/** \file   UrlUtilTests.cc
 *  \brief  Tests for the UrlUtil module.
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
#include "UrlUtil.h"
#include "UnitTest.h"


TEST(ParseUrl) {
    std::string scheme, host, path;
    CHECK_TRUE(UrlUtil::ParseUrl("HTTPS://User@Www.Example.COM:8080/a/b?c=d#e", &scheme, &host, &path));
    CHECK_EQ(scheme, "https");
    CHECK_EQ(host, "www.example.com");
    CHECK_EQ(path, "/a/b");

    CHECK_TRUE(UrlUtil::ParseUrl("http://example.org", &scheme, &host, &path));
    CHECK_EQ(path, "/");

    CHECK_FALSE(UrlUtil::ParseUrl("example.org/index.html", &scheme, &host, &path));
    CHECK_FALSE(UrlUtil::ParseUrl("https:///index.html", &scheme, &host, &path));
}


TEST(GetPath) {
    CHECK_EQ(UrlUtil::GetPath("https://example.org/journals/42?issue=3"), "/journals/42");
    CHECK_EQ(UrlUtil::GetPath("https://example.org?issue=3"), "/");
    CHECK_EQ(UrlUtil::GetPath("not a URL"), "/");
}


TEST(GetDomain) {
    CHECK_EQ(UrlUtil::GetDomain("https://google.com/"), "google.com");
    CHECK_EQ(UrlUtil::GetDomain("https://about.google.com/products"), "google.com");
    CHECK_EQ(UrlUtil::GetDomain("https://google.github.io/styleguide"), "google.github.io");
    CHECK_EQ(UrlUtil::GetDomain("http://www.bbc.co.uk/news"), "bbc.co.uk");
    CHECK_EQ(UrlUtil::GetDomain("http://news.bbc.co.uk./"), "bbc.co.uk");
    CHECK_EQ(UrlUtil::GetDomain("http://192.168.0.1/admin"), "192.168.0.1");
    CHECK_EQ(UrlUtil::GetDomain("http://localhost:8080/"), "localhost");
    CHECK_EQ(UrlUtil::GetDomain("mailto:someone"), "");
}


TEST(IsDomain) {
    CHECK_TRUE(UrlUtil::IsDomain("example.com"));
    CHECK_TRUE(UrlUtil::IsDomain("bbc.co.uk"));
    CHECK_TRUE(UrlUtil::IsDomain("my-site.example"));
    CHECK_FALSE(UrlUtil::IsDomain("localhost"));
    CHECK_FALSE(UrlUtil::IsDomain("-bad.example"));
    CHECK_FALSE(UrlUtil::IsDomain("example..com"));
    CHECK_FALSE(UrlUtil::IsDomain("example.c0m"));
    CHECK_FALSE(UrlUtil::IsDomain("https://example.com"));
}


TEST(GetRobotsDotTxtUrl) {
    CHECK_EQ(UrlUtil::GetRobotsDotTxtUrl("example.com"), "https://example.com/robots.txt");
}


TEST_MAIN(UrlUtilTests)
