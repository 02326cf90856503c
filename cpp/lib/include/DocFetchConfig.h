/** \file   DocFetchConfig.h
 *  \brief  The configuration of the docfetch programs, read from an ini file.
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


#include <memory>
#include <string>
#include <vector>
#include "AcquisitionPipeline.h"
#include "AcquisitionSource.h"
#include "AntiBlockDetector.h"
#include "ArticleRecord.h"
#include "ConversionBackend.h"
#include "ConversionRouter.h"
#include "DocFetch.h"
#include "FetchSession.h"
#include "IniFile.h"
#include "SearchCrawler.h"
#include "WebDriverClient.h"


namespace DocFetch {


// Each struct in this namespace corresponds to one section of the configuration file.  Missing entries keep their
// built-in defaults.  See docfetch.conf for the meaning of the individual entries.
namespace Config {


// List valued entries use vertical bars as separators.
std::vector<std::string> SplitList(const std::string &value);


// [Session]
struct SessionParams {
    WebDriverClient::Params webdriver_params_; // The profile and download directories are supplied by the FetchSession.
    FetchSession::Params fetch_session_params_;
public:
    SessionParams() = default;
    explicit SessionParams(const IniFile::Section &section);
};


// [Search]
struct SearchParams {
    SearchCrawler::Params crawler_params_;
    AntiBlockDetector::Params anti_block_params_;
    unsigned max_results_;
    SortOrder sort_order_;
    bool get_details_;
public:
    SearchParams(): max_results_(20), sort_order_(SortOrder::RELEVANCE), get_details_(true) { }
    explicit SearchParams(const IniFile::Section &section);
};


// [Acquisition]
struct AcquisitionParams {
    AcquisitionSource::Params source_params_;
    AcquisitionPipeline::Params pipeline_params_;
    std::vector<std::string> sources_; // If empty, all sources in their default order.
public:
    AcquisitionParams() = default;
    explicit AcquisitionParams(const IniFile::Section &section);
};


// [Conversion]
struct ConversionParams {
    ConversionRouter::Params router_params_;
    PdfToTextBackend::Params pdftotext_params_;
    TesseractBackend::Params tesseract_params_;
    VisionOcrBackend::Params vision_ocr_params_;
    std::string output_directory_; // If empty, the directory of the PDF.
    bool post_process_;
    bool add_table_of_contents_;
public:
    ConversionParams();
    explicit ConversionParams(const IniFile::Section &section);
};


struct GlobalParams {
    SessionParams session_params_;
    SearchParams search_params_;
    AcquisitionParams acquisition_params_;
    ConversionParams conversion_params_;
public:
    /** \note   A missing file or section means built-in defaults.
     *  \throws std::runtime_error if the file is malformed or contains invalid values.
     */
    explicit GlobalParams(const std::string &config_path = GetConfigPath());
};


/** \return "configured_key" if it is non-empty, else the first non-empty value of the environment variables
 *          DOCFETCH_OCR_API_KEY, DS_OCR_API_KEY, SILICONFLOW_API_KEY and OPENAI_API_KEY, else the empty string.
 */
std::string GetOcrCredential(const std::string &configured_key);


} // namespace Config


/** \brief Starts a browser session via the WebDriver server named in "session_params". */
std::unique_ptr<FetchSession> CreateFetchSession(const Config::SessionParams &session_params);


/** \brief Registers the "pdftotext", "tesseract" and "vision_ocr" backends. */
void RegisterDefaultBackends(const Config::ConversionParams &conversion_params, BackendRegistry * const registry);


} // namespace DocFetch
