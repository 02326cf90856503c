/** \file   DocumentClassifier.cc
 *  \brief  Implementation of the document classification functions.
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
#include "DocumentClassifier.h"
#include <vector>
#include <cstdint>
#include "PdfUtil.h"
#include "TextUtil.h"
#include "util.h"


std::string ClassificationToString(const DocumentClassification classification) {
    switch (classification) {
    case DocumentClassification::TEXT_LAYER:
        return "text_layer";
    case DocumentClassification::SCANNED:
        return "scanned";
    case DocumentClassification::GARBLED:
        return "garbled";
    case DocumentClassification::UNKNOWN:
        return "unknown";
    }

    LOG_ERROR("unhandled classification " + std::to_string(static_cast<int>(classification)) + "!");
}


namespace {


// \return True if the "run_length" code points starting at "start" are identical and not whitespace.
bool IsRepeatRun(const std::vector<uint32_t> &code_points, const size_t start, const unsigned run_length) {
    if (TextUtil::IsWhitespace(code_points[start]))
        return false;

    for (size_t i(start + 1); i < start + run_length; ++i) {
        if (code_points[i] != code_points[start])
            return false;
    }

    return true;
}


// \note Invalid UTF-8 sequences are decoded as replacement characters.
std::vector<uint32_t> DecodeText(const std::string &text) {
    std::vector<uint32_t> code_points;
    if (not TextUtil::UTF8ToUTF32(text, &code_points))
        LOG_DEBUG("sample contains invalid UTF-8");
    return code_points;
}


} // unnamed namespace


TextQuality AssessTextQuality(const std::string &text, const unsigned repeat_run_length) {
    TextQuality quality;

    const std::vector<uint32_t> code_points(DecodeText(text));
    if (code_points.empty())
        return quality;
    quality.code_point_count_ = code_points.size();

    size_t non_whitespace_count(0), readable_count(0);
    for (const uint32_t code_point : code_points) {
        if (TextUtil::IsWhitespace(code_point))
            continue;
        ++non_whitespace_count;
        if (TextUtil::IsLetterOrDigit(code_point) or TextUtil::IsCommonPunctuation(code_point))
            ++readable_count;
    }
    if (non_whitespace_count > 0)
        quality.readable_ratio_ = static_cast<double>(readable_count) / non_whitespace_count;

    size_t repeat_count(0);
    const unsigned run_length(repeat_run_length < 2 ? 2 : repeat_run_length);
    for (size_t i(0); i + run_length <= code_points.size(); ++i) {
        if (IsRepeatRun(code_points, i, run_length))
            ++repeat_count;
    }
    quality.repeat_ratio_ = static_cast<double>(repeat_count) / code_points.size();

    return quality;
}


DocumentClassification Classify(const std::string &sample, const ClassifierParams &params) {
    bool blank(true);
    for (const uint32_t code_point : DecodeText(sample)) {
        if (not TextUtil::IsWhitespace(code_point)) {
            blank = false;
            break;
        }
    }
    if (blank)
        return DocumentClassification::SCANNED;

    const TextQuality quality(AssessTextQuality(sample, params.repeat_run_length_));
    if (quality.readable_ratio_ < params.min_readable_ratio_ or quality.repeat_ratio_ > params.max_repeat_ratio_)
        return DocumentClassification::GARBLED;

    return DocumentClassification::TEXT_LAYER;
}


bool PopplerPdfSampler::openDocument(const std::string &pdf_path, unsigned * const page_count, std::string * const error_message) {
    pdf_path_ = pdf_path;
    if (not PdfUtil::GetPageCount(pdf_path, page_count, error_message))
        return false;

    if (*page_count == 0) {
        *error_message = "\"" + pdf_path + "\" has no pages";
        return false;
    }

    return true;
}


bool PopplerPdfSampler::extractPageText(const unsigned page_no, std::string * const page_text) {
    return PdfUtil::ExtractPageText(pdf_path_, page_no, page_text);
}


bool SampleDocument(PdfSampler * const sampler, const std::string &pdf_path, const unsigned page_count,
                    std::string * const sample, std::string * const error_message)
{
    sample->clear();

    unsigned document_page_count;
    if (not sampler->openDocument(pdf_path, &document_page_count, error_message))
        return false;

    const unsigned last_page(page_count < document_page_count ? page_count : document_page_count);
    for (unsigned page_no(1); page_no <= last_page; ++page_no) {
        std::string page_text;
        if (not sampler->extractPageText(page_no, &page_text)) {
            *error_message = "can't extract the text of page " + std::to_string(page_no) + " of \"" + pdf_path + "\"";
            return false;
        }

        if (page_no > 1)
            *sample += '\n';
        *sample += page_text;
    }

    return true;
}


DocumentClassification ClassifyDocument(PdfSampler * const sampler, const std::string &pdf_path, const ClassifierParams &params) {
    std::string sample, error_message;
    if (not SampleDocument(sampler, pdf_path, params.sample_page_count_, &sample, &error_message)) {
        LOG_WARNING("can't sample \"" + pdf_path + "\": " + error_message);
        return DocumentClassification::UNKNOWN;
    }

    const DocumentClassification classification(Classify(sample, params));
    LOG_DEBUG("\"" + pdf_path + "\" is " + ClassificationToString(classification));
    return classification;
}
