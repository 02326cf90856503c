/** \file   ConversionBackend.h
 *  \brief  PDF to Markdown converters and a registry for looking them up by name.
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
#include "RecordUtil.h"


struct ConversionOutcome {
    bool success_;
    std::string markdown_path_; // empty unless success_ is true
    unsigned image_count_;
    std::string backend_used_;
    std::string message_;
public:
    ConversionOutcome(): success_(false), image_count_(0) { }
    ConversionOutcome(const std::string &backend_used, const std::string &message)
        : success_(false), image_count_(0), backend_used_(backend_used), message_(message) { }
};


/** \brief Converts to a flat record with the keys success, markdownPath, imageCount, backendUsed and message. */
RecordUtil::FlatRecord ToFlatRecord(const ConversionOutcome &conversion_outcome);


class ConversionBackend {
public:
    virtual ~ConversionBackend() = default;

    virtual std::string getName() const = 0;

    /** \return True if this backend needs an API credential to work. */
    virtual bool requiresCredential() const { return false; }

    /** \return False if a required external program or credential is missing. */
    virtual bool isAvailable() const = 0;

    /** \brief  Converts "pdf_path" to "output_directory"/"output_name".md.
     *  \note   Extracted images, if any, end up in "output_directory"/"output_name"_images.
     */
    virtual ConversionOutcome convert(const std::string &pdf_path, const std::string &output_directory,
                                      const std::string &output_name) = 0;
};


/** \class  PdfToTextBackend
 *  \brief  Converts the text layer with "pdftotext" and extracts embedded images with "pdfimages".
 *  \note   Short lines that are all upper case or start with a section number become level-2 headings.
 */
class PdfToTextBackend : public ConversionBackend {
public:
    struct Params {
        bool extract_images_;
        unsigned max_pages_; // 0 means all pages
    public:
        explicit Params(const bool extract_images = true, const unsigned max_pages = 0)
            : extract_images_(extract_images), max_pages_(max_pages) { }
    };
private:
    const Params params_;
public:
    explicit PdfToTextBackend(const Params &params = Params()): params_(params) { }

    virtual std::string getName() const override { return "pdftotext"; }
    virtual bool isAvailable() const override;
    virtual ConversionOutcome convert(const std::string &pdf_path, const std::string &output_directory,
                                      const std::string &output_name) override;

    /** \brief Turns the plain text of one page into Markdown. */
    static std::string PageTextToMarkdown(const std::string &page_text);

    /** \return True if "line", which must be trimmed, looks like a section heading. */
    static bool IsHeadingCandidate(const std::string &line);
};


/** \class  TesseractBackend
 *  \brief  Renders each page with "pdftoppm" and runs the Tesseract command-line program on it.
 */
class TesseractBackend : public ConversionBackend {
public:
    struct Params {
        std::string languages_; // Tesseract language codes, e.g. "chi_sim+eng"
        unsigned dpi_;
        unsigned max_pages_;    // 0 means all pages
    public:
        explicit Params(const std::string &languages = "chi_sim+eng", const unsigned dpi = 300, const unsigned max_pages = 0)
            : languages_(languages), dpi_(dpi), max_pages_(max_pages) { }
    };
private:
    const Params params_;
public:
    explicit TesseractBackend(const Params &params = Params()): params_(params) { }

    virtual std::string getName() const override { return "tesseract"; }
    virtual bool isAvailable() const override;
    virtual ConversionOutcome convert(const std::string &pdf_path, const std::string &output_directory,
                                      const std::string &output_name) override;
};


/** \class  VisionOcrBackend
 *  \brief  Renders each page and sends it to a vision model behind an OpenAI compatible "chat/completions" endpoint.
 */
class VisionOcrBackend : public ConversionBackend {
public:
    static const std::string DEFAULT_BASE_URL;
    static const std::string DEFAULT_MODEL;
    static const std::string DEFAULT_PROMPT;

    struct Params {
        std::string base_url_;
        std::string model_;
        std::string api_key_;
        std::string prompt_;
        unsigned dpi_;
        unsigned max_tokens_;
        double temperature_;
        unsigned request_timeout_; // in ms, per page
        unsigned max_pages_;       // 0 means all pages
    public:
        explicit Params(const std::string &api_key = "", const std::string &base_url = DEFAULT_BASE_URL,
                        const std::string &model = DEFAULT_MODEL, const std::string &prompt = DEFAULT_PROMPT,
                        const unsigned dpi = 200, const unsigned max_tokens = 4096, const double temperature = 0.1,
                        const unsigned request_timeout = 120000, const unsigned max_pages = 0)
            : base_url_(base_url), model_(model), api_key_(api_key), prompt_(prompt), dpi_(dpi), max_tokens_(max_tokens),
              temperature_(temperature), request_timeout_(request_timeout), max_pages_(max_pages) { }
    };
private:
    const Params params_;
public:
    explicit VisionOcrBackend(const Params &params): params_(params) { }

    virtual std::string getName() const override { return "vision_ocr"; }
    virtual bool requiresCredential() const override { return true; }
    virtual bool isAvailable() const override;
    virtual ConversionOutcome convert(const std::string &pdf_path, const std::string &output_directory,
                                      const std::string &output_name) override;

    /** \return The JSON request body for one page image. */
    std::string buildRequestBody(const std::string &png_contents) const;

    /** \brief  Extracts the generated text from a "chat/completions" response.
     *  \return False if "response_body" is not a well-formed response.
     */
    static bool ExtractCompletion(const std::string &response_body, std::string * const completion,
                                  std::string * const error_message);
private:
    bool recognisePage(const std::string &png_path, std::string * const page_markdown, std::string * const error_message) const;
};


class BackendRegistry {
    std::vector<std::unique_ptr<ConversionBackend>> backends_;
public:
    BackendRegistry() = default;
    BackendRegistry(const BackendRegistry &rhs) = delete;

    /** \note Aborts if a backend with the same name has already been registered. */
    void registerBackend(std::unique_ptr<ConversionBackend> &&backend);

    /** \return The backend named "name" or nullptr. */
    ConversionBackend *getBackend(const std::string &name) const;

    std::vector<std::string> getBackendNames() const;
};
