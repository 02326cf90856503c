/** \file   DocumentClassifier.h
 *  \brief  Decides, based on a small text sample, whether a PDF has a usable text layer.
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


enum class DocumentClassification { TEXT_LAYER, SCANNED, GARBLED, UNKNOWN };


std::string ClassificationToString(const DocumentClassification classification);


struct ClassifierParams {
    double min_readable_ratio_;  // below this we consider the text to be garbled
    double max_repeat_ratio_;    // above this we consider the text to be garbled
    unsigned repeat_run_length_; // a run of this many identical non-whitespace code points counts as a repeat
    unsigned sample_page_count_; // the number of leading pages we sample
public:
    explicit ClassifierParams(const double min_readable_ratio = 0.5, const double max_repeat_ratio = 0.1,
                              const unsigned repeat_run_length = 3, const unsigned sample_page_count = 3)
        : min_readable_ratio_(min_readable_ratio), max_repeat_ratio_(max_repeat_ratio),
          repeat_run_length_(repeat_run_length), sample_page_count_(sample_page_count) { }
};


// The two ratios Classify() bases its decision on.
struct TextQuality {
    double readable_ratio_; // letters, digits and common punctuation over non-whitespace code points
    double repeat_ratio_;   // starting positions of repeat runs over all code points
    size_t code_point_count_;
public:
    TextQuality(): readable_ratio_(0.0), repeat_ratio_(0.0), code_point_count_(0) { }
};


/** \brief  Computes the readable and repeat ratios of "text".
 *  \note   Invalid UTF-8 sequences count as unreadable code points.
 */
TextQuality AssessTextQuality(const std::string &text, const unsigned repeat_run_length = 3);


/** \brief  Classifies a text sample.
 *  \return SCANNED if "sample" is empty or whitespace only, GARBLED if too few code points are readable or too many
 *          belong to runs of identical characters and TEXT_LAYER otherwise.  Never UNKNOWN.
 *  \note   Has no side effects, equal inputs always yield equal results.
 */
DocumentClassification Classify(const std::string &sample, const ClassifierParams &params = ClassifierParams());


// Provides the text of individual pages of a document.
class PdfSampler {
public:
    virtual ~PdfSampler() = default;

    /** \return False if the document can't be opened or has no pages. */
    virtual bool openDocument(const std::string &pdf_path, unsigned * const page_count, std::string * const error_message) = 0;

    /** \param page_no 1-based. */
    virtual bool extractPageText(const unsigned page_no, std::string * const page_text) = 0;
};


// Samples documents with the Poppler command-line utilities.
class PopplerPdfSampler : public PdfSampler {
    std::string pdf_path_;
public:
    virtual bool openDocument(const std::string &pdf_path, unsigned * const page_count, std::string * const error_message) override;
    virtual bool extractPageText(const unsigned page_no, std::string * const page_text) override;
};


/** \brief  Concatenates the text of the first "page_count" pages, separated by newlines.
 *  \return False if the document could not be opened or a page could not be read.
 */
bool SampleDocument(PdfSampler * const sampler, const std::string &pdf_path, const unsigned page_count,
                    std::string * const sample, std::string * const error_message);


/** \brief  Samples "pdf_path" and classifies the sample.
 *  \return UNKNOWN if no sample could be obtained.
 */
DocumentClassification ClassifyDocument(PdfSampler * const sampler, const std::string &pdf_path,
                                        const ClassifierParams &params = ClassifierParams());
