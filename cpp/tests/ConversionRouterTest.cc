/** \file   ConversionRouterTest.cc
 *  \brief  Tests for the routing of PDF documents to conversion backends.
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
#include <stdexcept>
#include <string>
#include "ConversionBackend.h"
#include "ConversionRouter.h"
#include "DocumentClassifier.h"
#include "FileUtil.h"
#include "StringUtil.h"
#include "UnitTest.h"


namespace {


const std::string READABLE_TEXT("Deep learning for the analysis of classical Chinese texts.");
const std::string GARBLED_TEXT("†††‡‡‡§§§†††‡‡‡§§§†††‡‡‡§§§");


// Writes a fixed Markdown text and counts how often it has been called.
class FakeBackend : public ConversionBackend {
    std::string name_;
    bool available_;
    bool succeeds_;
    std::string markdown_;
public:
    unsigned call_count_;
public:
    FakeBackend(const std::string &name, const bool available, const bool succeeds, const std::string &markdown)
        : name_(name), available_(available), succeeds_(succeeds), markdown_(markdown), call_count_(0) { }

    virtual std::string getName() const override { return name_; }
    virtual bool isAvailable() const override { return available_; }

    virtual ConversionOutcome convert(const std::string &/*pdf_path*/, const std::string &output_directory,
                                      const std::string &output_name) override
    {
        ++call_count_;
        if (not succeeds_)
            return ConversionOutcome(name_, name_ + " crashed");

        ConversionOutcome outcome(name_, "converted by " + name_);
        outcome.markdown_path_ = FileUtil::JoinPaths(output_directory, output_name + ".md");
        if (not FileUtil::WriteString(outcome.markdown_path_, markdown_))
            throw std::runtime_error("can't write \"" + outcome.markdown_path_ + "\"!");
        outcome.success_ = true;
        return outcome;
    }
};


class FakePdfSampler : public PdfSampler {
    std::string page_text_;
public:
    unsigned open_count_;
public:
    explicit FakePdfSampler(const std::string &page_text): page_text_(page_text), open_count_(0) { }

    virtual bool openDocument(const std::string &/*pdf_path*/, unsigned * const page_count, std::string * const /*error_message*/) override {
        ++open_count_;
        *page_count = 1;
        return true;
    }

    virtual bool extractPageText(const unsigned /*page_no*/, std::string * const page_text) override {
        *page_text = page_text_;
        return true;
    }
};


// A registry with a lightweight and an OCR backend plus a PDF file to convert.
struct Fixture {
    FileUtil::AutoTempDirectory directory_;
    std::string pdf_path_;
    BackendRegistry registry_;
    FakeBackend *lightweight_backend_;
    FakeBackend *ocr_backend_;
public:
    Fixture(const std::string &lightweight_markdown, const bool ocr_available = true, const bool ocr_succeeds = true)
        : directory_("/tmp/ConversionRouterTest")
    {
        pdf_path_ = FileUtil::JoinPaths(directory_.getDirectoryPath(), "paper.pdf");
        if (not FileUtil::WriteString(pdf_path_, "%PDF-1.4\n"))
            throw std::runtime_error("can't write \"" + pdf_path_ + "\"!");

        lightweight_backend_ = new FakeBackend("fake_text", true, true, lightweight_markdown);
        registry_.registerBackend(std::unique_ptr<ConversionBackend>(lightweight_backend_));
        ocr_backend_ = new FakeBackend("fake_ocr", ocr_available, ocr_succeeds, "# OCR output\n\n" + READABLE_TEXT);
        registry_.registerBackend(std::unique_ptr<ConversionBackend>(ocr_backend_));
    }

    const std::string &getOutputDirectory() const { return directory_.getDirectoryPath(); }
};


const ConversionRouter::Params ROUTER_PARAMS("fake_text", "fake_ocr");


} // unnamed namespace


TEST(RoutingTable) {
    CHECK_TRUE(ConversionRouter::Route(DocumentClassification::TEXT_LAYER, true) == RoutePlan::LIGHTWEIGHT);
    CHECK_TRUE(ConversionRouter::Route(DocumentClassification::TEXT_LAYER, false) == RoutePlan::LIGHTWEIGHT);
    CHECK_TRUE(ConversionRouter::Route(DocumentClassification::SCANNED, true) == RoutePlan::OCR);
    CHECK_TRUE(ConversionRouter::Route(DocumentClassification::SCANNED, false) == RoutePlan::LIGHTWEIGHT_DEGRADED);
    CHECK_TRUE(ConversionRouter::Route(DocumentClassification::GARBLED, true) == RoutePlan::LIGHTWEIGHT_THEN_RECHECK);
    CHECK_TRUE(ConversionRouter::Route(DocumentClassification::GARBLED, false) == RoutePlan::LIGHTWEIGHT_THEN_RECHECK);
    CHECK_TRUE(ConversionRouter::Route(DocumentClassification::UNKNOWN, true) == RoutePlan::LIGHTWEIGHT);
}


TEST(TextLayerDocument) {
    Fixture fixture(READABLE_TEXT);
    FakePdfSampler sampler(READABLE_TEXT);
    ConversionRouter router(fixture.registry_, &sampler, ROUTER_PARAMS);

    DocumentClassification classification(DocumentClassification::UNKNOWN);
    const ConversionOutcome outcome(router.convert(fixture.pdf_path_, fixture.getOutputDirectory(), "", &classification));
    CHECK_TRUE(classification == DocumentClassification::TEXT_LAYER);
    CHECK_TRUE(outcome.success_);
    CHECK_EQ(outcome.backend_used_, "fake_text");
    CHECK_EQ(outcome.markdown_path_, FileUtil::JoinPaths(fixture.getOutputDirectory(), "paper.md"));
    CHECK_TRUE(FileUtil::Exists(outcome.markdown_path_));
    CHECK_EQ(fixture.ocr_backend_->call_count_, 0u);
}


TEST(ScannedDocument) {
    Fixture fixture("");
    FakePdfSampler sampler("  \n ");
    ConversionRouter router(fixture.registry_, &sampler, ROUTER_PARAMS);

    const ConversionOutcome outcome(router.convert(fixture.pdf_path_, fixture.getOutputDirectory(), "scan"));
    CHECK_TRUE(outcome.success_);
    CHECK_EQ(outcome.backend_used_, "fake_ocr");
    CHECK_EQ(outcome.markdown_path_, FileUtil::JoinPaths(fixture.getOutputDirectory(), "scan.md"));
    CHECK_EQ(fixture.lightweight_backend_->call_count_, 0u);
}


TEST(ScannedDocumentWithoutOcr) {
    Fixture fixture("", /* ocr_available = */ false);
    FakePdfSampler sampler("");
    ConversionRouter router(fixture.registry_, &sampler, ROUTER_PARAMS);
    CHECK_FALSE(router.ocrIsAvailable());

    const ConversionOutcome outcome(router.convert(fixture.pdf_path_, fixture.getOutputDirectory()));
    CHECK_TRUE(outcome.success_);
    CHECK_EQ(outcome.backend_used_, "fake_text");
    CHECK_TRUE(StringUtil::Contains(outcome.message_, "no OCR backend is available"));
    CHECK_EQ(fixture.ocr_backend_->call_count_, 0u);
}


TEST(OcrFailureFallsBack) {
    Fixture fixture("", /* ocr_available = */ true, /* ocr_succeeds = */ false);
    FakePdfSampler sampler("");
    ConversionRouter router(fixture.registry_, &sampler, ROUTER_PARAMS);

    const ConversionOutcome outcome(router.convert(fixture.pdf_path_, fixture.getOutputDirectory()));
    CHECK_TRUE(outcome.success_);
    CHECK_EQ(outcome.backend_used_, "fake_text");
    CHECK_TRUE(StringUtil::Contains(outcome.message_, "fake_ocr crashed"));
    CHECK_EQ(fixture.ocr_backend_->call_count_, 1u);
    CHECK_EQ(fixture.lightweight_backend_->call_count_, 1u);
}


TEST(GarbledDocumentIsRechecked) {
    // The lightweight output is still garbled, so OCR takes over.
    Fixture garbled_fixture(GARBLED_TEXT);
    FakePdfSampler garbled_sampler(GARBLED_TEXT);
    ConversionRouter garbled_router(garbled_fixture.registry_, &garbled_sampler, ROUTER_PARAMS);
    const ConversionOutcome ocr_outcome(garbled_router.convert(garbled_fixture.pdf_path_, garbled_fixture.getOutputDirectory()));
    CHECK_TRUE(ocr_outcome.success_);
    CHECK_EQ(ocr_outcome.backend_used_, "fake_ocr");
    CHECK_EQ(garbled_fixture.lightweight_backend_->call_count_, 1u);
    CHECK_EQ(garbled_fixture.ocr_backend_->call_count_, 1u);

    // The lightweight output is fine, so it is kept.
    Fixture readable_fixture(READABLE_TEXT);
    FakePdfSampler readable_sampler(GARBLED_TEXT);
    ConversionRouter readable_router(readable_fixture.registry_, &readable_sampler, ROUTER_PARAMS);
    const ConversionOutcome outcome(readable_router.convert(readable_fixture.pdf_path_, readable_fixture.getOutputDirectory()));
    CHECK_TRUE(outcome.success_);
    CHECK_EQ(outcome.backend_used_, "fake_text");
    CHECK_EQ(readable_fixture.ocr_backend_->call_count_, 0u);
}


TEST(GarbledDocumentWithoutOcr) {
    Fixture fixture(GARBLED_TEXT, /* ocr_available = */ false);
    FakePdfSampler sampler(GARBLED_TEXT);
    ConversionRouter router(fixture.registry_, &sampler, ROUTER_PARAMS);

    const ConversionOutcome outcome(router.convert(fixture.pdf_path_, fixture.getOutputDirectory()));
    CHECK_TRUE(outcome.success_);
    CHECK_EQ(outcome.backend_used_, "fake_text");
    CHECK_TRUE(StringUtil::Contains(outcome.message_, "still garbled"));
    CHECK_EQ(fixture.ocr_backend_->call_count_, 0u);
}


TEST(InvalidInput) {
    Fixture fixture(READABLE_TEXT);
    FakePdfSampler sampler(READABLE_TEXT);
    ConversionRouter router(fixture.registry_, &sampler, ROUTER_PARAMS);

    const ConversionOutcome missing_outcome(router.convert("/nonexistent/paper.pdf", fixture.getOutputDirectory()));
    CHECK_FALSE(missing_outcome.success_);
    CHECK_TRUE(StringUtil::Contains(missing_outcome.message_, "does not exist"));

    const std::string text_path(FileUtil::JoinPaths(fixture.getOutputDirectory(), "notes.txt"));
    CHECK_TRUE(FileUtil::WriteString(text_path, READABLE_TEXT));
    const ConversionOutcome text_outcome(router.convert(text_path, fixture.getOutputDirectory()));
    CHECK_FALSE(text_outcome.success_);
    CHECK_TRUE(StringUtil::Contains(text_outcome.message_, "not a PDF"));

    CHECK_EQ(sampler.open_count_, 0u);
    CHECK_EQ(fixture.lightweight_backend_->call_count_, 0u);
}


TEST(MissingLightweightBackend) {
    Fixture fixture(READABLE_TEXT);
    FakePdfSampler sampler(READABLE_TEXT);
    ConversionRouter router(fixture.registry_, &sampler, ConversionRouter::Params("no_such_backend", "fake_ocr"));

    const ConversionOutcome outcome(router.convert(fixture.pdf_path_, fixture.getOutputDirectory()));
    CHECK_FALSE(outcome.success_);
    CHECK_TRUE(StringUtil::Contains(outcome.message_, "not registered"));
}


TEST(ExplicitBackend) {
    Fixture fixture(READABLE_TEXT);
    FakePdfSampler sampler(READABLE_TEXT);
    ConversionRouter router(fixture.registry_, &sampler, ROUTER_PARAMS);

    const ConversionOutcome outcome(router.convertWith("fake_ocr", fixture.pdf_path_, fixture.getOutputDirectory()));
    CHECK_TRUE(outcome.success_);
    CHECK_EQ(outcome.backend_used_, "fake_ocr");
    CHECK_EQ(sampler.open_count_, 0u);

    const ConversionOutcome unknown_outcome(router.convertWith("mystery", fixture.pdf_path_, fixture.getOutputDirectory()));
    CHECK_FALSE(unknown_outcome.success_);
    CHECK_TRUE(StringUtil::Contains(unknown_outcome.message_, "unknown backend"));
}


TEST(Registry) {
    Fixture fixture(READABLE_TEXT);
    CHECK_EQ(fixture.registry_.getBackendNames().size(), 2u);
    CHECK_EQ(fixture.registry_.getBackend("fake_text"), fixture.lightweight_backend_);
    CHECK_EQ(fixture.registry_.getBackend("mystery"), nullptr);
}


TEST(DefaultOutputName) {
    CHECK_EQ(ConversionRouter::DefaultOutputName("/data/papers/Paper.PDF"), "Paper");
    CHECK_EQ(ConversionRouter::DefaultOutputName("report.v2.pdf"), "report.v2");
}


TEST_MAIN(ConversionRouter)
