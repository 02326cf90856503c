/** \file   DocFetchConfig.cc
 *  \brief  Implementation of the configuration of the docfetch programs.
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
#include "DocFetchConfig.h"
#include <set>
#include <stdexcept>
#include <cstdlib>
#include "StringUtil.h"
#include "util.h"


namespace DocFetch {


namespace Config {


namespace {


// Remembers which entries have been asked for so that we can warn about misspelled ones.
class SectionReader {
    const IniFile::Section &section_;
    std::set<std::string> known_names_;
public:
    explicit SectionReader(const IniFile::Section &section): section_(section) { }

    std::string getString(const std::string &name, const std::string &default_value) {
        known_names_.emplace(name);
        return section_.getString(name, default_value);
    }

    unsigned getUnsigned(const std::string &name, const unsigned default_value) {
        known_names_.emplace(name);
        return section_.getUnsigned(name, default_value);
    }

    double getDouble(const std::string &name, const double default_value) {
        known_names_.emplace(name);
        return section_.getDouble(name, default_value);
    }

    bool getBool(const std::string &name, const bool default_value) {
        known_names_.emplace(name);
        return section_.getBool(name, default_value);
    }

    std::vector<std::string> getList(const std::string &name, const std::vector<std::string> &default_value) {
        known_names_.emplace(name);
        std::string value;
        return section_.lookup(name, &value) ? SplitList(value) : default_value;
    }

    // Reads "name" and "alternate_" + "name".
    void getSelectorPair(const std::string &name, SearchCrawler::SelectorPair * const selector_pair) {
        selector_pair->primary_ = getString(name, selector_pair->primary_);
        selector_pair->alternate_ = getString("alternate_" + name, selector_pair->alternate_);
    }

    void warnAboutUnknownEntries() const {
        for (const auto &entry : section_) {
            if (not entry.name_.empty() and known_names_.find(entry.name_) == known_names_.end())
                LOG_WARNING("unknown entry \"" + entry.name_ + "\" in section [" + section_.getSectionName() + "]");
        }
    }
};


} // unnamed namespace


std::vector<std::string> SplitList(const std::string &value) {
    std::vector<std::string> components;
    StringUtil::Split(value, '|', &components, /* suppress_empty_components = */ true);

    std::vector<std::string> list;
    for (const auto &component : components) {
        const std::string trimmed_component(StringUtil::TrimWhite(component));
        if (not trimmed_component.empty())
            list.emplace_back(trimmed_component);
    }

    return list;
}


SessionParams::SessionParams(const IniFile::Section &section) {
    SectionReader reader(section);

    auto &webdriver(webdriver_params_);
    webdriver.webdriver_url_   = reader.getString("webdriver_url", webdriver.webdriver_url_);
    webdriver.browser_binary_  = reader.getString("browser_binary", webdriver.browser_binary_);
    webdriver.headless_        = reader.getBool("headless", webdriver.headless_);
    webdriver.user_agent_      = reader.getString("user_agent", webdriver.user_agent_);
    webdriver.command_timeout_ = reader.getUnsigned("command_timeout", webdriver.command_timeout_);

    auto &session(fetch_session_params_);
    session.base_delay_         = reader.getUnsigned("base_delay", session.base_delay_);
    session.jitter_             = reader.getUnsigned("jitter", session.jitter_);
    session.navigation_timeout_ = reader.getUnsigned("navigation_timeout", session.navigation_timeout_);
    session.tmp_directory_      = reader.getString("tmp_directory", session.tmp_directory_);

    reader.warnAboutUnknownEntries();
}


SearchParams::SearchParams(const IniFile::Section &section): SearchParams() {
    SectionReader reader(section);

    auto &crawler(crawler_params_);
    crawler.search_url_     = reader.getString("search_url", crawler.search_url_);
    crawler.classid_        = reader.getString("classid", crawler.classid_);
    crawler.site_url_       = reader.getString("site_url", crawler.site_url_);
    crawler.sort_parameter_ = reader.getString("sort_parameter", crawler.sort_parameter_);

    reader.getSelectorPair("row_selector", &crawler.row_selectors_);
    crawler.row_timeout_           = reader.getUnsigned("row_timeout", crawler.row_timeout_);
    crawler.alternate_row_timeout_ = reader.getUnsigned("alternate_row_timeout", crawler.alternate_row_timeout_);
    reader.getSelectorPair("title_link_selector", &crawler.title_link_selectors_);
    reader.getSelectorPair("author_selector", &crawler.author_selectors_);
    reader.getSelectorPair("source_selector", &crawler.source_selectors_);
    reader.getSelectorPair("date_selector", &crawler.date_selectors_);
    crawler.cite_count_cell_index_     = reader.getUnsigned("cite_count_cell_index", crawler.cite_count_cell_index_);
    crawler.download_count_cell_index_ = reader.getUnsigned("download_count_cell_index", crawler.download_count_cell_index_);
    crawler.sort_control_selector_     = reader.getString("sort_control_selector", crawler.sort_control_selector_);

    reader.getSelectorPair("detail_title_selector", &crawler.detail_title_selectors_);
    reader.getSelectorPair("detail_author_selector", &crawler.detail_author_selectors_);
    reader.getSelectorPair("detail_organization_selector", &crawler.detail_organization_selectors_);
    reader.getSelectorPair("detail_abstract_selector", &crawler.detail_abstract_selectors_);
    reader.getSelectorPair("detail_keywords_selector", &crawler.detail_keywords_selectors_);
    crawler.detail_field_timeout_ = reader.getUnsigned("detail_field_timeout", crawler.detail_field_timeout_);

    auto &anti_block(anti_block_params_);
    anti_block.marker_selectors_ = reader.getList("block_marker_selectors", anti_block.marker_selectors_);
    anti_block.title_keywords_   = reader.getList("block_title_keywords", anti_block.title_keywords_);
    anti_block.marker_timeout_   = reader.getUnsigned("block_marker_timeout", anti_block.marker_timeout_);

    max_results_ = reader.getUnsigned("max_results", max_results_);
    const std::string sort_order_name(reader.getString("sort", SortOrderToString(sort_order_)));
    if (not ParseSortOrder(sort_order_name, &sort_order_))
        throw std::runtime_error("in DocFetch::Config::SearchParams::SearchParams: invalid sort order \"" + sort_order_name
                                 + "\"!");
    get_details_ = reader.getBool("get_details", get_details_);

    reader.warnAboutUnknownEntries();
}


AcquisitionParams::AcquisitionParams(const IniFile::Section &section) {
    SectionReader reader(section);

    auto &source(source_params_);
    source.site_url_                 = reader.getString("site_url", source.site_url_);
    source.site_domain_              = reader.getString("site_domain", source.site_domain_);
    source.doi_mirrors_              = reader.getList("doi_mirrors", source.doi_mirrors_);
    source.aggregator_url_           = reader.getString("aggregator_url", source.aggregator_url_);
    source.web_search_url_           = reader.getString("web_search_url", source.web_search_url_);
    source.user_agent_               = reader.getString("user_agent", source.user_agent_);
    source.min_pdf_size_             = reader.getUnsigned("min_pdf_size", static_cast<unsigned>(source.min_pdf_size_));
    source.http_timeout_             = reader.getUnsigned("http_timeout", source.http_timeout_);
    source.browser_download_timeout_ = reader.getUnsigned("browser_download_timeout", source.browser_download_timeout_);
    source.download_poll_interval_   = reader.getUnsigned("download_poll_interval", source.download_poll_interval_);
    source.element_timeout_          = reader.getUnsigned("element_timeout", source.element_timeout_);
    source.max_download_links_       = reader.getUnsigned("max_download_links", source.max_download_links_);

    auto &pipeline(pipeline_params_);
    pipeline.download_directory_  = reader.getString("download_directory", pipeline.download_directory_);
    pipeline.staging_directory_   = reader.getString("staging_directory", pipeline.staging_directory_);
    pipeline.max_filename_length_ = reader.getUnsigned("max_filename_length",
                                                       static_cast<unsigned>(pipeline.max_filename_length_));
    pipeline.base_delay_          = reader.getUnsigned("base_delay", pipeline.base_delay_);
    pipeline.jitter_              = reader.getUnsigned("jitter", pipeline.jitter_);

    sources_ = reader.getList("sources", sources_);

    reader.warnAboutUnknownEntries();
}


ConversionParams::ConversionParams(): post_process_(false), add_table_of_contents_(false) {
}


ConversionParams::ConversionParams(const IniFile::Section &section): ConversionParams() {
    SectionReader reader(section);

    auto &router(router_params_);
    router.lightweight_backend_ = reader.getString("lightweight_backend", router.lightweight_backend_);
    router.ocr_backend_         = reader.getString("ocr_backend", router.ocr_backend_);

    auto &classifier(router.classifier_params_);
    classifier.min_readable_ratio_ = reader.getDouble("min_readable_ratio", classifier.min_readable_ratio_);
    classifier.max_repeat_ratio_   = reader.getDouble("max_repeat_ratio", classifier.max_repeat_ratio_);
    classifier.repeat_run_length_  = reader.getUnsigned("repeat_run_length", classifier.repeat_run_length_);
    classifier.sample_page_count_  = reader.getUnsigned("sample_pages", classifier.sample_page_count_);

    const unsigned max_pages(reader.getUnsigned("max_pages", 0));
    pdftotext_params_.extract_images_ = reader.getBool("extract_images", pdftotext_params_.extract_images_);
    pdftotext_params_.max_pages_      = max_pages;

    tesseract_params_.languages_ = reader.getString("tesseract_languages", tesseract_params_.languages_);
    tesseract_params_.dpi_       = reader.getUnsigned("tesseract_dpi", tesseract_params_.dpi_);
    tesseract_params_.max_pages_ = max_pages;

    auto &vision_ocr(vision_ocr_params_);
    vision_ocr.api_key_         = reader.getString("ocr_api_key", vision_ocr.api_key_);
    vision_ocr.base_url_        = reader.getString("ocr_base_url", vision_ocr.base_url_);
    vision_ocr.model_           = reader.getString("ocr_model", vision_ocr.model_);
    vision_ocr.prompt_          = reader.getString("ocr_prompt", vision_ocr.prompt_);
    vision_ocr.dpi_             = reader.getUnsigned("ocr_dpi", vision_ocr.dpi_);
    vision_ocr.max_tokens_      = reader.getUnsigned("ocr_max_tokens", vision_ocr.max_tokens_);
    vision_ocr.temperature_     = reader.getDouble("ocr_temperature", vision_ocr.temperature_);
    vision_ocr.request_timeout_ = reader.getUnsigned("ocr_request_timeout", vision_ocr.request_timeout_);
    vision_ocr.max_pages_       = max_pages;

    output_directory_      = reader.getString("output_directory", output_directory_);
    post_process_          = reader.getBool("post_process", post_process_);
    add_table_of_contents_ = reader.getBool("add_table_of_contents", add_table_of_contents_);

    reader.warnAboutUnknownEntries();
}


GlobalParams::GlobalParams(const std::string &config_path) {
    const IniFile ini_file(config_path, /* create_empty = */ true);
    if (ini_file.getSections().empty())
        LOG_DEBUG("no configuration in \"" + config_path + "\", using the built-in defaults");

    const IniFile::Section *section;
    if ((section = ini_file.getSection("Session")) != nullptr)
        session_params_ = SessionParams(*section);
    if ((section = ini_file.getSection("Search")) != nullptr)
        search_params_ = SearchParams(*section);
    if ((section = ini_file.getSection("Acquisition")) != nullptr)
        acquisition_params_ = AcquisitionParams(*section);
    if ((section = ini_file.getSection("Conversion")) != nullptr)
        conversion_params_ = ConversionParams(*section);

    for (const auto &section_name : ini_file.getSections()) {
        if (section_name != "" and section_name != "Session" and section_name != "Search" and section_name != "Acquisition"
            and section_name != "Conversion")
            LOG_WARNING("unknown section [" + section_name + "] in \"" + config_path + "\"");
    }
}


std::string GetOcrCredential(const std::string &configured_key) {
    if (not configured_key.empty())
        return configured_key;

    for (const auto &variable_name : { "DOCFETCH_OCR_API_KEY", "DS_OCR_API_KEY", "SILICONFLOW_API_KEY", "OPENAI_API_KEY" }) {
        const char * const value(std::getenv(variable_name));
        if (value != nullptr and *value != '\0')
            return value;
    }

    return "";
}


} // namespace Config


std::unique_ptr<FetchSession> CreateFetchSession(const Config::SessionParams &session_params) {
    const WebDriverClient::Params webdriver_params(session_params.webdriver_params_);
    const FetchSession::ClientFactory client_factory(
        [webdriver_params](const std::string &profile_directory, const std::string &download_directory)
        {
            WebDriverClient::Params params(webdriver_params);
            params.profile_directory_  = profile_directory;
            params.download_directory_ = download_directory;
            return std::unique_ptr<PageAutomationClient>(new WebDriverClient(params));
        });

    return std::unique_ptr<FetchSession>(new FetchSession(client_factory, session_params.fetch_session_params_));
}


void RegisterDefaultBackends(const Config::ConversionParams &conversion_params, BackendRegistry * const registry) {
    registry->registerBackend(std::unique_ptr<ConversionBackend>(new PdfToTextBackend(conversion_params.pdftotext_params_)));
    registry->registerBackend(std::unique_ptr<ConversionBackend>(new TesseractBackend(conversion_params.tesseract_params_)));

    VisionOcrBackend::Params vision_ocr_params(conversion_params.vision_ocr_params_);
    vision_ocr_params.api_key_ = Config::GetOcrCredential(vision_ocr_params.api_key_);
    registry->registerBackend(std::unique_ptr<ConversionBackend>(new VisionOcrBackend(vision_ocr_params)));
}


} // namespace DocFetch
