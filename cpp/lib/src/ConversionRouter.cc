/** \file   ConversionRouter.cc
 *  \brief  Implementation of the ConversionRouter class.
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
#include "ConversionRouter.h"
#include "FileUtil.h"
#include "StringUtil.h"
#include "util.h"


std::string RoutePlanToString(const RoutePlan route_plan) {
    switch (route_plan) {
    case RoutePlan::LIGHTWEIGHT:
        return "lightweight";
    case RoutePlan::LIGHTWEIGHT_DEGRADED:
        return "lightweight (degraded)";
    case RoutePlan::OCR:
        return "OCR";
    case RoutePlan::LIGHTWEIGHT_THEN_RECHECK:
        return "lightweight, then recheck";
    }

    LOG_ERROR("unhandled route plan " + std::to_string(static_cast<int>(route_plan)) + "!");
}


RoutePlan ConversionRouter::Route(const DocumentClassification classification, const bool ocr_available) {
    switch (classification) {
    case DocumentClassification::TEXT_LAYER:
        return RoutePlan::LIGHTWEIGHT;
    case DocumentClassification::SCANNED:
        return ocr_available ? RoutePlan::OCR : RoutePlan::LIGHTWEIGHT_DEGRADED;
    case DocumentClassification::GARBLED:
        return RoutePlan::LIGHTWEIGHT_THEN_RECHECK;
    case DocumentClassification::UNKNOWN:
        return RoutePlan::LIGHTWEIGHT;
    }

    LOG_ERROR("unhandled classification " + std::to_string(static_cast<int>(classification)) + "!");
}


ConversionOutcome ConversionRouter::convert(const std::string &pdf_path, const std::string &output_directory,
                                            const std::string &output_name, DocumentClassification * const classification)
{
    ConversionOutcome outcome;
    if (not validateInput(pdf_path, &outcome))
        return outcome;

    const std::string name(output_name.empty() ? DefaultOutputName(pdf_path) : output_name);
    const DocumentClassification document_classification(ClassifyDocument(sampler_, pdf_path, params_.classifier_params_));
    if (classification != nullptr)
        *classification = document_classification;

    const RoutePlan route_plan(Route(document_classification, ocrIsAvailable()));
    LOG_INFO("\"" + pdf_path + "\" is " + ClassificationToString(document_classification) + ", route: "
             + RoutePlanToString(route_plan));

    switch (route_plan) {
    case RoutePlan::LIGHTWEIGHT:
        return convertLightweight(pdf_path, output_directory, name);
    case RoutePlan::LIGHTWEIGHT_DEGRADED:
        outcome = convertLightweight(pdf_path, output_directory, name);
        if (outcome.success_)
            outcome.message_ += "; the document looks scanned but no OCR backend is available, expect degraded quality";
        return outcome;
    case RoutePlan::OCR: {
        ConversionBackend * const ocr_backend(registry_.getBackend(params_.ocr_backend_));
        outcome = ocr_backend->convert(pdf_path, output_directory, name);
        if (outcome.success_)
            return outcome;

        LOG_WARNING(params_.ocr_backend_ + " failed on \"" + pdf_path + "\": " + outcome.message_);
        const std::string ocr_failure(outcome.message_);
        outcome = convertLightweight(pdf_path, output_directory, name);
        if (outcome.success_)
            outcome.message_ += "; fell back after " + params_.ocr_backend_ + " failed (" + ocr_failure + ")";
        return outcome;
    }
    case RoutePlan::LIGHTWEIGHT_THEN_RECHECK:
        return convertWithRecheck(pdf_path, output_directory, name);
    }

    LOG_ERROR("unhandled route plan " + std::to_string(static_cast<int>(route_plan)) + "!");
}


ConversionOutcome ConversionRouter::convertWith(const std::string &backend_name, const std::string &pdf_path,
                                                const std::string &output_directory, const std::string &output_name)
{
    ConversionOutcome outcome(backend_name, "");
    if (not validateInput(pdf_path, &outcome))
        return outcome;

    ConversionBackend * const backend(registry_.getBackend(backend_name));
    if (backend == nullptr) {
        outcome.message_ = "unknown backend \"" + backend_name + "\"";
        return outcome;
    }

    return backend->convert(pdf_path, output_directory, output_name.empty() ? DefaultOutputName(pdf_path) : output_name);
}


bool ConversionRouter::ocrIsAvailable() const {
    const ConversionBackend * const ocr_backend(registry_.getBackend(params_.ocr_backend_));
    return ocr_backend != nullptr and ocr_backend->isAvailable();
}


std::string ConversionRouter::DefaultOutputName(const std::string &pdf_path) {
    std::string basename(FileUtil::GetBasename(pdf_path));
    if (StringUtil::EndsWith(basename, ".pdf", /* ignore_case = */ true))
        basename.resize(basename.size() - 4);
    return basename;
}


bool ConversionRouter::validateInput(const std::string &pdf_path, ConversionOutcome * const outcome) const {
    if (not FileUtil::Exists(pdf_path)) {
        outcome->message_ = "\"" + pdf_path + "\" does not exist";
        return false;
    }

    if (not StringUtil::EndsWith(pdf_path, ".pdf", /* ignore_case = */ true)) {
        outcome->message_ = "\"" + pdf_path + "\" is not a PDF file";
        return false;
    }

    return true;
}


ConversionOutcome ConversionRouter::convertLightweight(const std::string &pdf_path, const std::string &output_directory,
                                                       const std::string &output_name)
{
    ConversionBackend * const backend(registry_.getBackend(params_.lightweight_backend_));
    if (backend == nullptr)
        return ConversionOutcome(params_.lightweight_backend_,
                                 "the lightweight backend \"" + params_.lightweight_backend_ + "\" is not registered");

    return backend->convert(pdf_path, output_directory, output_name);
}


ConversionOutcome ConversionRouter::convertWithRecheck(const std::string &pdf_path, const std::string &output_directory,
                                                       const std::string &output_name)
{
    ConversionOutcome outcome(convertLightweight(pdf_path, output_directory, output_name));
    if (not outcome.success_)
        return outcome;

    std::string markdown;
    if (not FileUtil::ReadString(outcome.markdown_path_, &markdown)) {
        LOG_WARNING("can't read back \"" + outcome.markdown_path_ + "\"");
        return outcome;
    }
    if (Classify(markdown, params_.classifier_params_) != DocumentClassification::GARBLED)
        return outcome;

    if (not ocrIsAvailable()) {
        outcome.message_ += "; the output is still garbled and no OCR backend is available";
        return outcome;
    }

    LOG_INFO("the output for \"" + pdf_path + "\" is still garbled, trying " + params_.ocr_backend_);
    const ConversionOutcome ocr_outcome(registry_.getBackend(params_.ocr_backend_)->convert(pdf_path, output_directory,
                                                                                           output_name));
    if (ocr_outcome.success_)
        return ocr_outcome;

    outcome.message_ += "; the output is still garbled and " + params_.ocr_backend_ + " failed (" + ocr_outcome.message_ + ")";
    return outcome;
}
