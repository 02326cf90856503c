/** \file   PdfUtil.cc
 *  \brief  Implementation of functions relating to PDF documents.
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
#include "PdfUtil.h"
#include <vector>
#include "ExecUtil.h"
#include "FileUtil.h"
#include "StringUtil.h"
#include "util.h"


namespace {


const unsigned TOOL_TIMEOUT(300); // in seconds


// \return The path of "tool_name" or the empty string after logging a warning if it is not installed.
std::string LocateTool(const std::string &tool_name) {
    const std::string tool_path(ExecUtil::Which(tool_name));
    if (tool_path.empty())
        LOG_WARNING("\"" + tool_name + "\" is not installed or not on the PATH!");
    return tool_path;
}


} // unnamed namespace


namespace PdfUtil {


bool GetPageCount(const std::string &pdf_path, unsigned * const page_count, std::string * const error_message) {
    static const std::string pdfinfo_path(LocateTool("pdfinfo"));
    if (pdfinfo_path.empty()) {
        *error_message = "pdfinfo is not available";
        return false;
    }

    std::string stdout_output, stderr_output;
    if (not ExecUtil::ExecSubcommandAndCaptureStdoutAndStderr(pdfinfo_path, { pdf_path }, &stdout_output, &stderr_output,
                                                              TOOL_TIMEOUT))
    {
        *error_message = "pdfinfo failed on \"" + pdf_path + "\": " + StringUtil::TrimWhite(stderr_output);
        return false;
    }

    std::vector<std::string> lines;
    StringUtil::Split(stdout_output, '\n', &lines);
    for (const auto &line : lines) {
        if (not StringUtil::StartsWith(line, "Pages:"))
            continue;
        if (StringUtil::ToUnsigned(StringUtil::TrimWhite(line.substr(__builtin_strlen("Pages:"))), page_count))
            return true;
        break;
    }

    *error_message = "no page count in the pdfinfo output for \"" + pdf_path + "\"";
    return false;
}


bool ExtractText(const std::string &pdf_path, const unsigned first_page, const unsigned last_page,
                 std::string * const extracted_text, const bool layout)
{
    extracted_text->clear();

    static const std::string pdftotext_path(LocateTool("pdftotext"));
    if (pdftotext_path.empty())
        return false;

    std::vector<std::string> pdftotext_params { "-enc", "UTF-8" };
    if (first_page == last_page)
        pdftotext_params.emplace_back("-nopgbrk");
    if (layout)
        pdftotext_params.emplace_back("-layout");
    pdftotext_params.insert(pdftotext_params.end(), { "-f", std::to_string(first_page), "-l", std::to_string(last_page) });
    pdftotext_params.insert(pdftotext_params.end(), { pdf_path, "-" /* write to stdout */ });

    std::string stderr_output;
    if (not ExecUtil::ExecSubcommandAndCaptureStdoutAndStderr(pdftotext_path, pdftotext_params, extracted_text,
                                                              &stderr_output, TOOL_TIMEOUT))
    {
        LOG_WARNING("failed to extract text from \"" + pdf_path + "\": " + StringUtil::TrimWhite(stderr_output));
        return false;
    }

    return true;
}


bool RenderPageToPng(const std::string &pdf_path, const unsigned page_no, const unsigned dpi,
                     const std::string &output_prefix, std::string * const png_path)
{
    static const std::string pdftoppm_path(LocateTool("pdftoppm"));
    if (pdftoppm_path.empty())
        return false;

    const std::string page(std::to_string(page_no));
    if (ExecUtil::Exec(pdftoppm_path, { "-png", "-r", std::to_string(dpi), "-f", page, "-l", page, "-singlefile",
                                        pdf_path, output_prefix }, "", "", "", TOOL_TIMEOUT) != 0)
    {
        LOG_WARNING("failed to render page " + page + " of \"" + pdf_path + "\"!");
        return false;
    }

    *png_path = output_prefix + ".png";
    return FileUtil::Exists(*png_path);
}


bool GetTextFromImage(const std::string &img_path, const std::string &tesseract_language_codes,
                      std::string * const extracted_text)
{
    extracted_text->clear();

    static const std::string tesseract_path(LocateTool("tesseract"));
    if (tesseract_path.empty())
        return false;

    std::string stderr_output;
    if (not ExecUtil::ExecSubcommandAndCaptureStdoutAndStderr(
            tesseract_path, { img_path, "stdout" /*tesseract arg to redirect*/,
            "-l", tesseract_language_codes,
            "--oem", "1" /* LSTM engine only */ },
            extracted_text, &stderr_output, TOOL_TIMEOUT,
            { { "OMP_THREAD_LIMIT", "1" } } /* address tesseract IPC problems */))
    {
        LOG_WARNING("While processing " + img_path + ": " + stderr_output);
        return false;
    }

    return true;
}


int ExtractImages(const std::string &pdf_path, const std::string &output_directory, const std::string &output_prefix) {
    static const std::string pdfimages_path(LocateTool("pdfimages"));
    if (pdfimages_path.empty())
        return -1;

    if (ExecUtil::Exec(pdfimages_path, { "-png", pdf_path, FileUtil::JoinPaths(output_directory, output_prefix) }, "", "", "",
                       TOOL_TIMEOUT) != 0)
    {
        LOG_WARNING("failed to extract images from \"" + pdf_path + "\"!");
        return -1;
    }

    std::vector<std::string> png_filenames;
    FileUtil::GetFileNameList("\\.png$", &png_filenames, output_directory);
    int image_count(0);
    for (const auto &png_filename : png_filenames) {
        if (StringUtil::StartsWith(png_filename, output_prefix))
            ++image_count;
    }

    return image_count;
}


} // namespace PdfUtil
