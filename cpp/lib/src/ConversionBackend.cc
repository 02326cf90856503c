/** \file   ConversionBackend.cc
 *  \brief  Implementation of the conversion backends.
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
#include "ConversionBackend.h"
#include <algorithm>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "Downloader.h"
#include "ExecUtil.h"
#include "FileUtil.h"
#include "PdfUtil.h"
#include "RegexMatcher.h"
#include "StringUtil.h"
#include "TextUtil.h"
#include "util.h"


RecordUtil::FlatRecord ToFlatRecord(const ConversionOutcome &conversion_outcome) {
    return RecordUtil::FlatRecord{
        { "success", conversion_outcome.success_ ? "true" : "false" },
        { "markdownPath", conversion_outcome.markdown_path_ },
        { "imageCount", std::to_string(conversion_outcome.image_count_) },
        { "backendUsed", conversion_outcome.backend_used_ },
        { "message", conversion_outcome.message_ },
    };
}


namespace {


const std::string PAGE_SEPARATOR("\n\n---\n\n");


// Only pages up to "max_pages" are converted unless "max_pages" is 0.
bool DetermineLastPage(const std::string &pdf_path, const unsigned max_pages, unsigned * const last_page,
                       std::string * const error_message)
{
    unsigned page_count;
    if (not PdfUtil::GetPageCount(pdf_path, &page_count, error_message))
        return false;
    if (page_count == 0) {
        *error_message = "the document has no pages";
        return false;
    }

    *last_page = (max_pages == 0 or max_pages > page_count) ? page_count : max_pages;
    return true;
}


bool WriteMarkdown(const std::string &markdown, const std::string &output_directory, const std::string &output_name,
                   ConversionOutcome * const outcome)
{
    if (not FileUtil::MakeDirectory(output_directory, /* recursive = */ true)) {
        outcome->message_ = "can't create \"" + output_directory + "\"";
        return false;
    }

    const std::string markdown_path(FileUtil::JoinPaths(output_directory, output_name + ".md"));
    if (not FileUtil::WriteString(markdown_path, markdown)) {
        outcome->message_ = "can't write \"" + markdown_path + "\"";
        return false;
    }

    outcome->success_ = true;
    outcome->markdown_path_ = markdown_path;
    return true;
}


// Extracts the embedded images to "output_name"_images and appends references to them to "markdown".
unsigned AppendImages(const std::string &pdf_path, const std::string &output_directory, const std::string &output_name,
                      std::string * const markdown)
{
    const std::string images_subdirectory(output_name + "_images");
    const std::string images_directory(FileUtil::JoinPaths(output_directory, images_subdirectory));
    if (not FileUtil::MakeDirectory(images_directory, /* recursive = */ true)) {
        LOG_WARNING("can't create \"" + images_directory + "\"");
        return 0;
    }

    const int image_count(PdfUtil::ExtractImages(pdf_path, images_directory, "image"));
    if (image_count <= 0) {
        if (image_count < 0)
            LOG_WARNING("image extraction from \"" + pdf_path + "\" failed");
        if (not FileUtil::RemoveDirectory(images_directory))
            LOG_WARNING("can't remove the empty directory \"" + images_directory + "\"");
        return 0;
    }

    std::vector<std::string> image_filenames;
    FileUtil::GetFileNameList("^image-.*\\.png$", &image_filenames, images_directory);
    std::sort(image_filenames.begin(), image_filenames.end());

    *markdown += PAGE_SEPARATOR;
    for (const auto &image_filename : image_filenames)
        *markdown += "![image](" + images_subdirectory + "/" + image_filename + ")\n\n";

    return static_cast<unsigned>(image_count);
}


bool HaveTools(const std::vector<std::string> &tools) {
    for (const auto &tool : tools) {
        if (ExecUtil::Which(tool).empty())
            return false;
    }

    return true;
}


// Renders the pages 1 to "last_page" and hands each image to "recogniser".  Pages the recogniser fails on are
// represented by a comment.
template<typename Recogniser> bool RecognisePages(const std::string &pdf_path, const unsigned last_page, const unsigned dpi,
                                                  Recogniser recogniser, std::string * const markdown,
                                                  std::string * const error_message)
{
    const FileUtil::AutoTempDirectory page_directory("/tmp/docfetch_pages_");
    unsigned failed_page_count(0);
    std::string last_page_error;
    for (unsigned page_no(1); page_no <= last_page; ++page_no) {
        if (page_no > 1)
            *markdown += PAGE_SEPARATOR;

        std::string png_path, page_markdown, page_error;
        const std::string output_prefix(FileUtil::JoinPaths(page_directory.getDirectoryPath(), "page_" + std::to_string(page_no)));
        if (not PdfUtil::RenderPageToPng(pdf_path, page_no, dpi, output_prefix, &png_path))
            page_error = "can't render the page";
        else if (not recogniser(png_path, &page_markdown, &page_error))
            LOG_WARNING("page " + std::to_string(page_no) + " of \"" + pdf_path + "\": " + page_error);

        if (not page_error.empty()) {
            ++failed_page_count;
            last_page_error = page_error;
            *markdown += "<!-- Page " + std::to_string(page_no) + ": recognition failed -->\n";
        } else
            *markdown += "<!-- Page " + std::to_string(page_no) + " -->\n\n" + StringUtil::TrimWhite(page_markdown) + "\n";
    }

    if (failed_page_count == last_page) {
        *error_message = "recognition failed on all pages, last error: " + last_page_error;
        return false;
    }

    return true;
}


} // unnamed namespace


bool PdfToTextBackend::isAvailable() const {
    return HaveTools({ "pdfinfo", "pdftotext" }) and (not params_.extract_images_ or HaveTools({ "pdfimages" }));
}


ConversionOutcome PdfToTextBackend::convert(const std::string &pdf_path, const std::string &output_directory,
                                            const std::string &output_name)
{
    ConversionOutcome outcome(getName(), "");

    unsigned last_page;
    if (not DetermineLastPage(pdf_path, params_.max_pages_, &last_page, &outcome.message_))
        return outcome;

    std::string markdown;
    for (unsigned page_no(1); page_no <= last_page; ++page_no) {
        std::string page_text;
        if (not PdfUtil::ExtractPageText(pdf_path, page_no, &page_text, /* layout = */ true)) {
            outcome.message_ = "pdftotext failed on page " + std::to_string(page_no);
            return outcome;
        }

        if (page_no > 1)
            markdown += "\n---\n\n";
        markdown += PageTextToMarkdown(page_text);
    }

    if (params_.extract_images_)
        outcome.image_count_ = AppendImages(pdf_path, output_directory, output_name, &markdown);

    if (WriteMarkdown(markdown, output_directory, output_name, &outcome))
        outcome.message_ = "converted " + std::to_string(last_page) + " page(s)";
    return outcome;
}


std::string PdfToTextBackend::PageTextToMarkdown(const std::string &page_text) {
    std::string markdown;
    std::vector<std::string> lines;
    StringUtil::Split(page_text, '\n', &lines, /* suppress_empty_components = */ true);
    for (const auto &line : lines) {
        const std::string trimmed_line(TextUtil::CollapseAndTrimWhitespace(line));
        if (trimmed_line.empty())
            continue;

        if (IsHeadingCandidate(trimmed_line))
            markdown += "\n## " + trimmed_line + "\n\n";
        else
            markdown += trimmed_line + "\n";
    }

    return markdown;
}


bool PdfToTextBackend::IsHeadingCandidate(const std::string &line) {
    static const ThreadSafeRegexMatcher section_number_matcher("^\\d+\\.?\\s+");

    std::vector<uint32_t> code_points;
    if (line.empty() or not TextUtil::UTF8ToUTF32(line, &code_points) or code_points.size() >= 80)
        return false;

    if (section_number_matcher.match(line))
        return true;

    bool seen_upper_case(false);
    for (const uint32_t code_point : code_points) {
        if (code_point >= 'a' and code_point <= 'z')
            return false;
        if (code_point >= 'A' and code_point <= 'Z')
            seen_upper_case = true;
    }

    return seen_upper_case;
}


bool TesseractBackend::isAvailable() const {
    return HaveTools({ "pdfinfo", "pdftoppm", "tesseract" });
}


ConversionOutcome TesseractBackend::convert(const std::string &pdf_path, const std::string &output_directory,
                                            const std::string &output_name)
{
    ConversionOutcome outcome(getName(), "");

    unsigned last_page;
    if (not DetermineLastPage(pdf_path, params_.max_pages_, &last_page, &outcome.message_))
        return outcome;

    const std::string languages(params_.languages_);
    const auto recogniser([&languages](const std::string &png_path, std::string * const page_markdown,
                                       std::string * const error_message)
    {
        if (PdfUtil::GetTextFromImage(png_path, languages, page_markdown))
            return true;
        *error_message = "tesseract failed";
        return false;
    });

    std::string markdown;
    if (not RecognisePages(pdf_path, last_page, params_.dpi_, recogniser, &markdown, &outcome.message_))
        return outcome;

    if (WriteMarkdown(markdown, output_directory, output_name, &outcome))
        outcome.message_ = "recognised " + std::to_string(last_page) + " page(s)";
    return outcome;
}


const std::string VisionOcrBackend::DEFAULT_BASE_URL("https://api.siliconflow.cn/v1");
const std::string VisionOcrBackend::DEFAULT_MODEL("deepseek-ai/DeepSeek-OCR");
const std::string VisionOcrBackend::DEFAULT_PROMPT(
    "Convert the content of this page of an academic paper to Markdown.  Keep the paragraph structure, use # headings"
    " of the appropriate level, write formulas as LaTeX ($ inline, $$ for display formulas), write tables as Markdown"
    " tables and keep the formatting of references.  Only output the recognised content without any explanations.");


bool VisionOcrBackend::isAvailable() const {
    return not params_.api_key_.empty() and HaveTools({ "pdfinfo", "pdftoppm" });
}


ConversionOutcome VisionOcrBackend::convert(const std::string &pdf_path, const std::string &output_directory,
                                            const std::string &output_name)
{
    ConversionOutcome outcome(getName(), "");
    if (params_.api_key_.empty()) {
        outcome.message_ = "no API credential has been configured";
        return outcome;
    }

    unsigned last_page;
    if (not DetermineLastPage(pdf_path, params_.max_pages_, &last_page, &outcome.message_))
        return outcome;

    const auto recogniser([this](const std::string &png_path, std::string * const page_markdown,
                                 std::string * const error_message)
    {
        return recognisePage(png_path, page_markdown, error_message);
    });

    std::string markdown;
    if (not RecognisePages(pdf_path, last_page, params_.dpi_, recogniser, &markdown, &outcome.message_))
        return outcome;

    if (WriteMarkdown(markdown, output_directory, output_name, &outcome))
        outcome.message_ = "recognised " + std::to_string(last_page) + " page(s) with " + params_.model_;
    return outcome;
}


std::string VisionOcrBackend::buildRequestBody(const std::string &png_contents) const {
    nlohmann::json image_url;
    image_url["url"] = "data:image/png;base64," + TextUtil::Base64Encode(png_contents);

    nlohmann::json content(nlohmann::json::array());
    content.push_back({ { "type", "text" }, { "text", params_.prompt_ } });
    content.push_back({ { "type", "image_url" }, { "image_url", image_url } });

    nlohmann::json message;
    message["role"] = "user";
    message["content"] = content;

    nlohmann::json request;
    request["model"] = params_.model_;
    request["messages"] = nlohmann::json::array({ message });
    request["max_tokens"] = params_.max_tokens_;
    request["temperature"] = params_.temperature_;

    return request.dump();
}


bool VisionOcrBackend::ExtractCompletion(const std::string &response_body, std::string * const completion,
                                         std::string * const error_message)
{
    const nlohmann::json response(nlohmann::json::parse(response_body, /* callback = */ nullptr,
                                                        /* allow_exceptions = */ false));
    if (response.is_discarded() or not response.is_object()) {
        *error_message = "the response is not a JSON object";
        return false;
    }

    if (response.contains("error")) {
        const nlohmann::json &error(response["error"]);
        *error_message = "API error: " + (error.is_object() ? error.value("message", std::string("unknown error")) : error.dump());
        return false;
    }

    if (not response.contains("choices") or not response["choices"].is_array() or response["choices"].empty()) {
        *error_message = "the response has no choices";
        return false;
    }

    const nlohmann::json &first_choice(response["choices"][0]);
    if (not first_choice.is_object() or not first_choice.contains("message") or not first_choice["message"].is_object()
        or not first_choice["message"].contains("content") or not first_choice["message"]["content"].is_string())
    {
        *error_message = "the first choice has no message content";
        return false;
    }

    *completion = first_choice["message"]["content"].get<std::string>();
    return true;
}


bool VisionOcrBackend::recognisePage(const std::string &png_path, std::string * const page_markdown,
                                     std::string * const error_message) const
{
    std::string png_contents;
    if (not FileUtil::ReadString(png_path, &png_contents)) {
        *error_message = "can't read \"" + png_path + "\"";
        return false;
    }

    const Downloader::Params downloader_params(Downloader::DEFAULT_USER_AGENT_STRING, Downloader::DEFAULT_MAX_REDIRECTS,
                                               /* follow_redirects = */ true, /* ignore_ssl_certificates = */ false,
                                               /* fail_on_http_error = */ false,
                                               { "Authorization: Bearer " + params_.api_key_,
                                                 "Content-Type: application/json" });
    Downloader downloader(downloader_params);
    if (not downloader.postData(params_.base_url_ + "/chat/completions", buildRequestBody(png_contents),
                                params_.request_timeout_))
    {
        *error_message = "request failed: " + downloader.getLastErrorMessage();
        return false;
    }

    if (not ExtractCompletion(downloader.getMessageBody(), page_markdown, error_message)) {
        *error_message = "HTTP " + std::to_string(downloader.getResponseCode()) + ", " + *error_message;
        return false;
    }

    return true;
}


void BackendRegistry::registerBackend(std::unique_ptr<ConversionBackend> &&backend) {
    if (getBackend(backend->getName()) != nullptr)
        LOG_ERROR("a backend named \"" + backend->getName() + "\" has already been registered!");
    backends_.emplace_back(std::move(backend));
}


ConversionBackend *BackendRegistry::getBackend(const std::string &name) const {
    for (const auto &backend : backends_) {
        if (backend->getName() == name)
            return backend.get();
    }

    return nullptr;
}


std::vector<std::string> BackendRegistry::getBackendNames() const {
    std::vector<std::string> names;
    for (const auto &backend : backends_)
        names.emplace_back(backend->getName());
    return names;
}
