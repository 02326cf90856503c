/** \file   DocumentClassifierTest.cc
 *  \brief  Tests for the text layer classification of PDF documents.
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
#include <string>
#include <vector>
#include "DocumentClassifier.h"
#include "UnitTest.h"


namespace {


// Serves canned page texts.
class FakePdfSampler : public PdfSampler {
    std::vector<std::string> pages_;
    bool open_fails_;
    unsigned failing_page_no_;
public:
    unsigned highest_page_requested_;
public:
    explicit FakePdfSampler(const std::vector<std::string> &pages, const bool open_fails = false, const unsigned failing_page_no = 0)
        : pages_(pages), open_fails_(open_fails), failing_page_no_(failing_page_no), highest_page_requested_(0) { }

    virtual bool openDocument(const std::string &pdf_path, unsigned * const page_count, std::string * const error_message) override {
        if (open_fails_) {
            *error_message = "can't open \"" + pdf_path + "\"";
            return false;
        }
        *page_count = pages_.size();
        return true;
    }

    virtual bool extractPageText(const unsigned page_no, std::string * const page_text) override {
        if (page_no > highest_page_requested_)
            highest_page_requested_ = page_no;
        if (page_no == failing_page_no_ or page_no == 0 or page_no > pages_.size())
            return false;
        *page_text = pages_[page_no - 1];
        return true;
    }
};


std::string Repeat(const std::string &s, const unsigned count) {
    std::string repeated;
    for (unsigned i(0); i < count; ++i)
        repeated += s;
    return repeated;
}


} // unnamed namespace


TEST(ReadableText) {
    CHECK_TRUE(Classify("The quick brown fox jumps over the lazy dog.") == DocumentClassification::TEXT_LAYER);
    CHECK_TRUE(Classify("深度学习在自然语言处理中的应用研究。") == DocumentClassification::TEXT_LAYER);
    CHECK_TRUE(Classify("Results: 12.5% (n=40), see Table 3.") == DocumentClassification::TEXT_LAYER);
}


TEST(ReadableTextInOtherScripts) {
    CHECK_TRUE(Classify("هذا نص عربي واضح تماما ومقروء للجميع.") == DocumentClassification::TEXT_LAYER);
    CHECK_TRUE(Classify("يحتوي الجدول ٣ على النتائج، انظر الصفحة ١٢؟") == DocumentClassification::TEXT_LAYER);
    CHECK_TRUE(Classify("यह एक साधारण हिंदी वाक्य है जिसे आसानी से पढ़ा जा सकता है।") == DocumentClassification::TEXT_LAYER);
    CHECK_TRUE(Classify("ภาษาไทยเป็นภาษาที่อ่านได้ง่าย") == DocumentClassification::TEXT_LAYER);
}


TEST(BlankText) {
    CHECK_TRUE(Classify("") == DocumentClassification::SCANNED);
    CHECK_TRUE(Classify(" \n\t\n ") == DocumentClassification::SCANNED);
    CHECK_TRUE(Classify("\xE3\x80\x80\n") == DocumentClassification::SCANNED); // ideographic space
}


TEST(GarbledText) {
    CHECK_TRUE(Classify(Repeat("†††‡‡‡§§§", 10)) == DocumentClassification::GARBLED);
    CHECK_TRUE(Classify("abc xxxxxxxxxxxxxxxxxxxx") == DocumentClassification::GARBLED);
    CHECK_TRUE(Classify(Repeat("\xFF\xFE", 20)) == DocumentClassification::GARBLED);
}


TEST(Thresholds) {
    // 9 readable out of 12 non-whitespace code points.
    const std::string sample("abc def ghi †‡§");
    CHECK_TRUE(Classify(sample, ClassifierParams(/* min_readable_ratio = */ 0.7)) == DocumentClassification::TEXT_LAYER);
    CHECK_TRUE(Classify(sample, ClassifierParams(/* min_readable_ratio = */ 0.8)) == DocumentClassification::GARBLED);

    // One run of three identical letters in 35 code points.
    const std::string short_runs("aaa bcd efg hij klm nop qrs tuv wxy");
    CHECK_TRUE(Classify(short_runs) == DocumentClassification::TEXT_LAYER);
    CHECK_TRUE(Classify(short_runs, ClassifierParams(0.5, /* max_repeat_ratio = */ 0.01)) == DocumentClassification::GARBLED);
}


TEST(AssessTextQuality) {
    const TextQuality empty_quality(AssessTextQuality(""));
    CHECK_EQ(empty_quality.code_point_count_, 0u);
    CHECK_EQ(empty_quality.readable_ratio_, 0.0);

    const TextQuality quality(AssessTextQuality("ab \xFF"));
    CHECK_EQ(quality.code_point_count_, 4u);
    CHECK_GT(quality.readable_ratio_, 0.66);
    CHECK_LT(quality.readable_ratio_, 0.67);
    CHECK_EQ(quality.repeat_ratio_, 0.0);

    // Runs of 4 identical code points contain 2 runs of length 3.
    const TextQuality repeat_quality(AssessTextQuality("zzzz", 3));
    CHECK_EQ(repeat_quality.repeat_ratio_, 0.5);
}


TEST(ClassifyIsPure) {
    const std::string sample(Repeat("Lorem ipsum dolor sit amet. ", 20) + Repeat("§", 30));
    const DocumentClassification first(Classify(sample));
    for (unsigned i(0); i < 5; ++i)
        CHECK_TRUE(Classify(sample) == first);
}


TEST(ClassifyDocument) {
    FakePdfSampler text_sampler({ "Introduction", "Methods and materials", "Results", "Discussion", "References" });
    CHECK_TRUE(ClassifyDocument(&text_sampler, "paper.pdf") == DocumentClassification::TEXT_LAYER);
    CHECK_EQ(text_sampler.highest_page_requested_, 3u);

    FakePdfSampler scanned_sampler({ "", " ", "\n" });
    CHECK_TRUE(ClassifyDocument(&scanned_sampler, "scan.pdf") == DocumentClassification::SCANNED);

    FakePdfSampler short_sampler({ "Only one page." });
    CHECK_TRUE(ClassifyDocument(&short_sampler, "short.pdf", ClassifierParams(0.5, 0.1, 3, 10)) == DocumentClassification::TEXT_LAYER);
    CHECK_EQ(short_sampler.highest_page_requested_, 1u);
}


TEST(UnreadableDocument) {
    FakePdfSampler broken_sampler({}, /* open_fails = */ true);
    CHECK_TRUE(ClassifyDocument(&broken_sampler, "broken.pdf") == DocumentClassification::UNKNOWN);

    FakePdfSampler failing_page_sampler({ "page one", "page two" }, /* open_fails = */ false, /* failing_page_no = */ 2);
    CHECK_TRUE(ClassifyDocument(&failing_page_sampler, "partial.pdf") == DocumentClassification::UNKNOWN);

    std::string sample, error_message;
    CHECK_FALSE(SampleDocument(&failing_page_sampler, "partial.pdf", 3, &sample, &error_message));
    CHECK_FALSE(error_message.empty());
}


TEST(ClassificationToString) {
    CHECK_EQ(ClassificationToString(DocumentClassification::TEXT_LAYER), "text_layer");
    CHECK_EQ(ClassificationToString(DocumentClassification::SCANNED), "scanned");
    CHECK_EQ(ClassificationToString(DocumentClassification::GARBLED), "garbled");
    CHECK_EQ(ClassificationToString(DocumentClassification::UNKNOWN), "unknown");
}


TEST_MAIN(DocumentClassifier)
