/** \file   ConversionRouter.h
 *  \brief  Picks a conversion backend for a PDF based on its classification.
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
#include "ConversionBackend.h"
#include "DocumentClassifier.h"


enum class RoutePlan {
    LIGHTWEIGHT,              // use the lightweight backend
    LIGHTWEIGHT_DEGRADED,     // OCR would be needed but is unavailable, use the lightweight backend anyway
    OCR,                      // use the OCR backend
    LIGHTWEIGHT_THEN_RECHECK, // use the lightweight backend and switch to OCR if its output is still garbled
};


std::string RoutePlanToString(const RoutePlan route_plan);


/** \class  ConversionRouter
 *  \brief  Classifies a PDF and converts it with the backend that suits the classification.
 *  \note   The decision path is deterministic.  The same document with the same backends always takes the same route.
 */
class ConversionRouter {
public:
    struct Params {
        std::string lightweight_backend_;
        std::string ocr_backend_;
        ClassifierParams classifier_params_;
    public:
        explicit Params(const std::string &lightweight_backend = "pdftotext", const std::string &ocr_backend = "vision_ocr",
                        const ClassifierParams &classifier_params = ClassifierParams())
            : lightweight_backend_(lightweight_backend), ocr_backend_(ocr_backend), classifier_params_(classifier_params) { }
    };

private:
    const BackendRegistry &registry_;
    PdfSampler * const sampler_;
    const Params params_;

public:
    ConversionRouter(const BackendRegistry &registry, PdfSampler * const sampler, const Params &params = Params())
        : registry_(registry), sampler_(sampler), params_(params) { }

    /** \brief  The routing table.
     *  \param  ocr_available  True if an OCR backend is registered and has its credential.
     */
    static RoutePlan Route(const DocumentClassification classification, const bool ocr_available);

    /** \brief  Classifies "pdf_path" and converts it along the route Route() picks.
     *  \param  output_name     If empty, the basename of "pdf_path" w/o the ".pdf" extension is used.
     *  \param  classification  If non-null, receives the classification of the document.
     */
    ConversionOutcome convert(const std::string &pdf_path, const std::string &output_directory, const std::string &output_name = "",
                              DocumentClassification * const classification = nullptr);

    /** \brief Converts "pdf_path" with the backend named "backend_name" w/o classifying it first. */
    ConversionOutcome convertWith(const std::string &backend_name, const std::string &pdf_path,
                                  const std::string &output_directory, const std::string &output_name = "");

    /** \return True if the OCR backend is registered and available. */
    bool ocrIsAvailable() const;

    static std::string DefaultOutputName(const std::string &pdf_path);

private:
    bool validateInput(const std::string &pdf_path, ConversionOutcome * const outcome) const;
    ConversionOutcome convertLightweight(const std::string &pdf_path, const std::string &output_directory,
                                         const std::string &output_name);
    ConversionOutcome convertWithRecheck(const std::string &pdf_path, const std::string &output_directory,
                                         const std::string &output_name);
};
