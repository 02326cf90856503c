/** \file   pdf_to_markdown.cc
 *  \brief  Converts PDF documents to Markdown, picking a text extraction or an OCR backend per document.
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
#include <iostream>
#include <string>
#include <vector>
#include <cstdlib>
#include "ConversionBackend.h"
#include "ConversionRouter.h"
#include "DocFetchConfig.h"
#include "DocumentClassifier.h"
#include "FileUtil.h"
#include "MarkdownUtil.h"
#include "RecordUtil.h"
#include "StringUtil.h"
#include "util.h"


namespace {


[[noreturn]] void Usage() {
    ::Usage("[--config=path] [--backend=name] [--output-dir=path] [--output-name=name] [--post-process] [--add-toc]\n"
            "[--report=path] pdf1 [pdf2 .. pdfN]\n"
            "Without --backend each document is classified and routed to a suitable backend.  Backend names are\n"
            "pdftotext, tesseract and vision_ocr.  The default output directory is the one in the configuration file or,\n"
            "if none has been configured, the directory of each PDF.  --output-name is only allowed with a single PDF.\n"
            "--post-process cleans up equations, tables and headings of the generated Markdown.  --add-toc implies\n"
            "--post-process and prepends a table of contents.  --report writes one record per document as JSON, or as CSV\n"
            "if the path ends in \".csv\".");
}


std::string DetermineOutputDirectory(const std::string &pdf_path, const std::string &output_directory) {
    if (not output_directory.empty())
        return output_directory;

    const std::string pdf_directory(FileUtil::GetDirname(pdf_path));
    return pdf_directory.empty() ? "." : pdf_directory;
}


} // unnamed namespace


int Main(int argc, char *argv[]) {
    if (argc < 2)
        Usage();

    std::string config_path(DocFetch::GetConfigPath()), backend_name, output_directory, output_name, report_path;
    bool config_path_given(false), post_process(false), add_table_of_contents(false);
    while (argc > 1 and StringUtil::StartsWith(argv[1], "--")) {
        const std::string arg(argv[1]);
        if (StringUtil::StartsWith(arg, "--config=")) {
            config_path = arg.substr(__builtin_strlen("--config="));
            config_path_given = true;
        } else if (StringUtil::StartsWith(arg, "--backend="))
            backend_name = arg.substr(__builtin_strlen("--backend="));
        else if (StringUtil::StartsWith(arg, "--output-dir="))
            output_directory = arg.substr(__builtin_strlen("--output-dir="));
        else if (StringUtil::StartsWith(arg, "--output-name="))
            output_name = arg.substr(__builtin_strlen("--output-name="));
        else if (arg == "--post-process")
            post_process = true;
        else if (arg == "--add-toc")
            add_table_of_contents = true;
        else if (StringUtil::StartsWith(arg, "--report="))
            report_path = arg.substr(__builtin_strlen("--report="));
        else
            Usage();
        --argc, ++argv;
    }
    if (argc < 2)
        Usage();
    if (not output_name.empty() and argc > 2)
        LOG_ERROR("--output-name can only be used with a single PDF!");

    if (config_path_given and not FileUtil::Exists(config_path))
        LOG_ERROR("configuration file \"" + config_path + "\" does not exist!");
    const DocFetch::Config::GlobalParams global_params(config_path);
    const auto &conversion_params(global_params.conversion_params_);
    if (output_directory.empty())
        output_directory = conversion_params.output_directory_;
    if (conversion_params.post_process_)
        post_process = true;
    if (conversion_params.add_table_of_contents_)
        add_table_of_contents = true;
    if (add_table_of_contents)
        post_process = true;

    BackendRegistry registry;
    DocFetch::RegisterDefaultBackends(conversion_params, &registry);
    if (not backend_name.empty() and registry.getBackend(backend_name) == nullptr)
        LOG_ERROR("unknown backend \"" + backend_name + "\", known backends are "
                  + StringUtil::Join(registry.getBackendNames(), ", ") + "!");

    PopplerPdfSampler sampler;
    ConversionRouter router(registry, &sampler, conversion_params.router_params_);
    if (backend_name.empty() and not router.ocrIsAvailable())
        LOG_INFO("OCR backend \"" + conversion_params.router_params_.ocr_backend_
                 + "\" is unavailable, scanned documents will be converted in degraded mode");

    const MarkdownUtil::PostProcessOptions post_process_options(/* fix_equations = */ true, /* fix_tables = */ true,
                                                                /* fix_headings = */ true, add_table_of_contents);
    unsigned failure_count(0);
    std::vector<RecordUtil::FlatRecord> records;
    for (int arg_no(1); arg_no < argc; ++arg_no) {
        const std::string pdf_path(argv[arg_no]);
        const std::string document_output_directory(DetermineOutputDirectory(pdf_path, output_directory));

        DocumentClassification classification(DocumentClassification::UNKNOWN);
        ConversionOutcome outcome(backend_name.empty()
                                  ? router.convert(pdf_path, document_output_directory, output_name, &classification)
                                  : router.convertWith(backend_name, pdf_path, document_output_directory, output_name));

        if (outcome.success_ and post_process) {
            std::string error_message;
            if (not MarkdownUtil::PostProcessFile(outcome.markdown_path_, post_process_options, &error_message))
                LOG_WARNING("post-processing of \"" + outcome.markdown_path_ + "\" failed: " + error_message);
        }

        if (outcome.success_) {
            std::cout << outcome.markdown_path_ << '\t' << outcome.backend_used_ << '\t' << outcome.image_count_ << '\n';
            if (not outcome.message_.empty())
                LOG_INFO(pdf_path + ": " + outcome.message_);
        } else {
            ++failure_count;
            std::cerr << pdf_path << ": " << outcome.message_ << '\n';
        }

        auto record(ToFlatRecord(outcome));
        record["pdfPath"] = pdf_path;
        if (backend_name.empty())
            record["classification"] = ClassificationToString(classification);
        records.emplace_back(record);
    }

    if (not report_path.empty()) {
        std::string error_message;
        if (not RecordUtil::WriteRecordsToFile(records, report_path, &error_message))
            LOG_ERROR(error_message);
    }

    return (failure_count == 0) ? EXIT_SUCCESS : EXIT_FAILURE;
}
