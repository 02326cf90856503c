/** \file   AcquisitionSourceTest.cc
 *  \brief  Tests for the acquisition strategies, driven through a fake browser.
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
#include <memory>
#include <string>
#include <vector>
#include "AcquisitionPipeline.h"
#include "AcquisitionSource.h"
#include "FakePageAutomationClient.h"
#include "FetchSession.h"
#include "FileUtil.h"
#include "StringUtil.h"
#include "UrlUtil.h"
#include "UnitTest.h"


namespace {


const FetchSession::Params SESSION_PARAMS(/* base_delay = */ 0, /* jitter = */ 0, /* navigation_timeout = */ 1000, "/tmp");
const std::string DOI("10.1234/abcd");


AcquisitionSource::Params GetMirrorParams() {
    AcquisitionSource::Params params;
    params.doi_mirrors_ = { "https://mirror1.invalid", "https://mirror2.invalid", "https://mirror3.invalid" };
    return params;
}


std::vector<std::string> GetNames(const std::vector<AcquisitionSource *> &sources) {
    std::vector<std::string> names;
    for (const auto source : sources)
        names.emplace_back(source->getName());
    return names;
}


} // unnamed namespace


TEST(DirectSourceApplicability) {
    const DirectSource source(nullptr, AcquisitionSource::Params());
    CHECK_TRUE(source.isApplicable(AcquisitionRequest("A Title", "", "https://kns.cnki.net/kcms2/article/abstract?v=1")));
    CHECK_TRUE(source.isApplicable(AcquisitionRequest("A Title", "", "HTTPS://KNS.CNKI.NET/kcms2/article/abstract?v=1")));
    CHECK_TRUE(source.isApplicable(AcquisitionRequest("A Title", "", "//kns.cnki.net/kcms2/article/abstract?v=1")));

    CHECK_FALSE(source.isApplicable(AcquisitionRequest("A Title", "", "https://www.example.com/paper.html")));
    CHECK_FALSE(source.isApplicable(AcquisitionRequest("A Title", "", "https://notcnki.net/paper.html")));
    CHECK_FALSE(source.isApplicable(AcquisitionRequest("A Title", "", "/kcms2/article/abstract?v=1")));
    CHECK_FALSE(source.isApplicable(AcquisitionRequest("A Title", "", "")));
}


TEST(DirectSourceFindPdfLinkInPageSource) {
    // Only the CAJ link is present, so it gets rewritten.
    CHECK_EQ(DirectSource::FindPdfLinkInPageSource(
                 "<a class=\"btn-dlcaj\" href=\"https://bar.cnki.net/bar/download/order?id=7&amp;dflag=nhdown\">CAJ</a>"),
             "https://bar.cnki.net/bar/download/order?id=7&dflag=pdfdown");

    CHECK_EQ(DirectSource::FindPdfLinkInPageSource(
                 "<a href='/download?id=1&dflag=nhdown'>CAJ</a> <a href='/download?id=1&dflag=pdfdown'>PDF</a>"),
             "/download?id=1&dflag=pdfdown");

    CHECK_EQ(DirectSource::FindPdfLinkInPageSource("<html><a href=\"/login\">Log in</a></html>"), "");
}


TEST(DirectSourceWithoutDownloadLink) {
    const auto site(std::make_shared<FakeSite>());
    const std::string detail_url("https://kns.cnki.net/kcms2/article/abstract?v=1");
    site->pages_[detail_url].source_ = "<html><a href=\"/login\">Log in</a></html>";
    FetchSession session(MakeFakeClientFactory(site), SESSION_PARAMS);

    DirectSource source(&session, AcquisitionSource::Params());
    const FileUtil::AutoTempDirectory staging_directory("/tmp/AcquisitionSourceTest_");
    std::string error_message;
    CHECK_FALSE(source.attempt(AcquisitionRequest("A Title", "", detail_url),
                               FileUtil::JoinPaths(staging_directory.getDirectoryPath(), "a.pdf"), &error_message));
    CHECK_EQ(error_message, "no download link, probably a login is required");
    CHECK_EQ(site->visited_urls_.size(), 1u);
    CHECK_EQ(site->visited_urls_[0], detail_url);
    CHECK_EQ(source.getSuccessCount(), 0u);
}


TEST(MirrorLookupSourceFindPdfLinkInPageSource) {
    CHECK_EQ(MirrorLookupSource::FindPdfLinkInPageSource("<embed type=\"application/pdf\" src=\"https://cdn.example.org/a/b.pdf#view=FitH\">"),
             "https://cdn.example.org/a/b.pdf#view=FitH");
    CHECK_EQ(MirrorLookupSource::FindPdfLinkInPageSource("<p>no document here</p>"), "");
}


TEST(MirrorsAreTriedInOrder) {
    const auto site(std::make_shared<FakeSite>());
    site->pages_["https://mirror1.invalid/" + DOI].source_ = "<html><p>Sorry, article not found.</p></html>";
    site->pages_["https://mirror2.invalid/" + DOI].source_ = "<html><p>статья не найдена</p></html>";
    // The third mirror can't be loaded at all.
    FetchSession session(MakeFakeClientFactory(site), SESSION_PARAMS);

    DoiLookupSource source(&session, GetMirrorParams());
    const FileUtil::AutoTempDirectory staging_directory("/tmp/AcquisitionSourceTest_");
    std::string error_message;
    CHECK_FALSE(source.attempt(AcquisitionRequest("", DOI), FileUtil::JoinPaths(staging_directory.getDirectoryPath(), "a.pdf"),
                               &error_message));

    CHECK_EQ(site->visited_urls_.size(), 3u);
    CHECK_EQ(site->visited_urls_[0], "https://mirror1.invalid/" + DOI);
    CHECK_EQ(site->visited_urls_[1], "https://mirror2.invalid/" + DOI);
    CHECK_EQ(site->visited_urls_[2], "https://mirror3.invalid/" + DOI);
    CHECK_EQ(error_message, "mirror1.invalid: not found; mirror2.invalid: not found; mirror3.invalid: can't load the lookup page");
}


TEST(MirrorLookupStopsWhenBlocked) {
    const auto site(std::make_shared<FakeSite>());
    for (const auto &mirror : GetMirrorParams().doi_mirrors_)
        site->pages_[mirror + "/" + DOI].source_ = "<html><p>Article not found</p></html>";
    FetchSession session(MakeFakeClientFactory(site), SESSION_PARAMS);
    session.recordBlocked();

    DoiLookupSource source(&session, GetMirrorParams());
    const FileUtil::AutoTempDirectory staging_directory("/tmp/AcquisitionSourceTest_");
    std::string error_message;
    CHECK_FALSE(source.attempt(AcquisitionRequest("", DOI), FileUtil::JoinPaths(staging_directory.getDirectoryPath(), "a.pdf"),
                               &error_message));

    // Only the first mirror is reported and nothing reaches the browser.
    CHECK_TRUE(site->visited_urls_.empty());
    CHECK_EQ(error_message, "mirror1.invalid: can't load the lookup page");
}


TEST(TitleLookupUsesTheEncodedTitle) {
    const auto site(std::make_shared<FakeSite>());
    const std::string lookup_url("https://mirror1.invalid/" + UrlUtil::UrlEncode("Deep Learning"));
    site->pages_[lookup_url].source_ = "<html><p>article not found</p></html>";
    FetchSession session(MakeFakeClientFactory(site), SESSION_PARAMS);

    AcquisitionSource::Params params;
    params.doi_mirrors_ = { "https://mirror1.invalid" };
    TitleLookupSource source(&session, params);
    CHECK_FALSE(source.isApplicable(AcquisitionRequest("", DOI)));

    const FileUtil::AutoTempDirectory staging_directory("/tmp/AcquisitionSourceTest_");
    std::string error_message;
    CHECK_FALSE(source.attempt(AcquisitionRequest("Deep Learning", ""),
                               FileUtil::JoinPaths(staging_directory.getDirectoryPath(), "a.pdf"), &error_message));
    CHECK_TRUE(site->wasVisited(lookup_url));
    CHECK_EQ(error_message, "mirror1.invalid: not found");
}


TEST(DefaultSourceSelection) {
    const auto site(std::make_shared<FakeSite>());
    FetchSession session(MakeFakeClientFactory(site), SESSION_PARAMS);
    const FileUtil::AutoTempDirectory download_directory("/tmp/AcquisitionSourceTest_");
    AcquisitionPipeline pipeline(CreateDefaultSources(&session, AcquisitionSource::Params()),
                                 AcquisitionPipeline::Params(download_directory.getDirectoryPath()));

    CHECK_EQ(StringUtil::Join(pipeline.getSourceNames(), ","), "direct,doi,doi_title,aggregator,web_search");

    const auto doi_only(GetNames(pipeline.selectSources(AcquisitionRequest("", "10.1000/xyz"))));
    CHECK_EQ(doi_only.size(), 1u);
    CHECK_EQ(doi_only[0], "doi");

    const auto everything(GetNames(pipeline.selectSources(
        AcquisitionRequest("A Title", "10.1000/xyz", "https://kns.cnki.net/kcms2/article/abstract?v=1"))));
    CHECK_EQ(StringUtil::Join(everything, ","), "direct,doi,doi_title,aggregator,web_search");

    const auto foreign_link(GetNames(pipeline.selectSources(AcquisitionRequest("A Title", "", "https://www.example.com/x"))));
    CHECK_EQ(StringUtil::Join(foreign_link, ","), "doi_title,aggregator,web_search");

    // Selecting nothing must not touch the browser.
    CHECK_TRUE(site->visited_urls_.empty());
}


TEST_MAIN(AcquisitionSource)
