/** \file   PdfUtil.h
 *  \brief  Functions relating to PDF documents.
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


// All functions in this namespace use the Poppler command-line utilities and the Tesseract command-line program.
namespace PdfUtil {


/** \brief  Determines the number of pages of a PDF document with the help of "pdfinfo".
 *  \return True if the page count could be determined, else false.
 */
bool GetPageCount(const std::string &pdf_path, unsigned * const page_count, std::string * const error_message);


/** \brief  Extracts the text layer of the pages "first_page" through "last_page", both 1-based and inclusive.
 *  \param  layout  If true, "pdftotext" is asked to preserve the physical layout of the text.
 *  \note   Pages are separated by form feeds unless "first_page" == "last_page".
 *  \return False if "pdftotext" failed, else true.  An empty text layer is no error.
 */
bool ExtractText(const std::string &pdf_path, const unsigned first_page, const unsigned last_page,
                 std::string * const extracted_text, const bool layout = false);


/** \brief Extracts the text layer of the 1-based page "page_no". */
inline bool ExtractPageText(const std::string &pdf_path, const unsigned page_no, std::string * const extracted_text,
                            const bool layout = false)
{
    return ExtractText(pdf_path, page_no, page_no, extracted_text, layout);
}


/** \brief  Renders the 1-based page "page_no" as a PNG image.
 *  \param  output_prefix  The path of the generated image w/o the ".png" extension.
 *  \param  png_path       Where we return the path of the generated image.
 */
bool RenderPageToPng(const std::string &pdf_path, const unsigned page_no, const unsigned dpi,
                     const std::string &output_prefix, std::string * const png_path);


/** \brief  Runs Tesseract on an image.
 *  \param  tesseract_language_codes  E.g. "chi_sim+eng".
 */
bool GetTextFromImage(const std::string &img_path, const std::string &tesseract_language_codes,
                      std::string * const extracted_text);


/** \brief  Extracts all embedded images of a PDF document as PNG files.
 *  \param  output_prefix  The file name prefix, w/o directory, of the generated images.
 *  \return The number of images in "output_directory" with a name starting with "output_prefix" or -1 on error.
 */
int ExtractImages(const std::string &pdf_path, const std::string &output_directory, const std::string &output_prefix);


} // namespace PdfUtil
