/** \file   AcquisitionPipeline.cc
 *  \brief  Implementation of the AcquisitionPipeline class.
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
#include "AcquisitionPipeline.h"
#include <stdexcept>
#include "StringUtil.h"
#include "TextUtil.h"
#include "TimeUtil.h"
#include "util.h"


namespace {


const std::string ILLEGAL_FILENAME_CHARS("<>:\"/\\|?*");


} // unnamed namespace


RecordUtil::FlatRecord ToFlatRecord(const AcquisitionResult &acquisition_result) {
    return RecordUtil::FlatRecord{
        { "success", acquisition_result.success_ ? "true" : "false" },
        { "sourceUsed", acquisition_result.source_used_ },
        { "filepath", acquisition_result.filepath_ },
        { "message", acquisition_result.message_ },
        { "title", acquisition_result.title_ },
        { "doi", acquisition_result.doi_ },
    };
}


AcquisitionPipeline::AcquisitionPipeline(std::vector<std::unique_ptr<AcquisitionSource>> &&sources, const Params &params)
    : sources_(std::move(sources)), params_(params), random_engine_(std::random_device()())
{
    if (not FileUtil::MakeDirectory(params_.download_directory_, /* recursive = */ true))
        throw std::runtime_error("in AcquisitionPipeline::AcquisitionPipeline: can't create the download directory \""
                                 + params_.download_directory_ + "\"!");

    if (params_.staging_directory_.empty())
        tmp_staging_directory_.reset(new FileUtil::AutoTempDirectory("/tmp/docfetch_staging_"));
    else if (not FileUtil::MakeDirectory(params_.staging_directory_, /* recursive = */ true))
        throw std::runtime_error("in AcquisitionPipeline::AcquisitionPipeline: can't create the staging directory \""
                                 + params_.staging_directory_ + "\"!");
}


AcquisitionResult AcquisitionPipeline::acquire(const AcquisitionRequest &request, const std::vector<std::string> &source_names) {
    AcquisitionResult result;
    result.title_ = request.title_;
    result.doi_   = request.doi_;

    if (request.title_.empty() and request.doi_.empty()) {
        result.message_ = "neither a title nor a DOI was given";
        return result;
    }

    const auto selected_sources(selectSources(request, source_names));
    if (selected_sources.empty()) {
        result.message_ = "no applicable source";
        return result;
    }

    const std::string filename(MakeFilename(request, params_.max_filename_length_));
    LOG_INFO("acquiring \"" + (request.title_.empty() ? request.doi_ : request.title_) + "\"");

    std::string failure_messages;
    for (auto source(selected_sources.cbegin()); source != selected_sources.cend(); ++source) {
        if (source != selected_sources.cbegin())
            pause();

        std::string final_path, error_message;
        if (stageAndVerify(*source, request, filename, &final_path, &error_message)) {
            result.attempts_.emplace_back((*source)->getName(), true, "downloaded");
            result.success_     = true;
            result.source_used_ = (*source)->getName();
            result.filepath_    = final_path;
            result.message_     = "downloaded via " + result.source_used_;
            LOG_INFO(result.message_ + " to \"" + final_path + "\"");
            return result;
        }

        LOG_INFO((*source)->getName() + " failed: " + error_message);
        result.attempts_.emplace_back((*source)->getName(), false, error_message);
        if (not failure_messages.empty())
            failure_messages += "; ";
        failure_messages += (*source)->getName() + ": " + error_message;
    }

    result.message_ = "all sources failed (" + failure_messages + ")";
    return result;
}


std::vector<AcquisitionResult> AcquisitionPipeline::acquireBatch(const std::vector<AcquisitionRequest> &requests,
                                                                 const std::vector<std::string> &source_names,
                                                                 const bool stop_on_failure)
{
    std::vector<AcquisitionResult> results;
    for (auto request(requests.cbegin()); request != requests.cend(); ++request) {
        if (request != requests.cbegin())
            pause();

        results.emplace_back(acquire(*request, source_names));
        if (not results.back().success_ and stop_on_failure) {
            LOG_WARNING("stopping after a failed request");
            break;
        }
    }

    unsigned success_count(0);
    for (const auto &result : results) {
        if (result.success_)
            ++success_count;
    }
    LOG_INFO("acquired " + std::to_string(success_count) + " of " + std::to_string(results.size()) + " document(s)");

    return results;
}


std::vector<AcquisitionSource *> AcquisitionPipeline::selectSources(const AcquisitionRequest &request,
                                                                   const std::vector<std::string> &source_names) const
{
    std::vector<AcquisitionSource *> selected_sources;
    if (source_names.empty()) {
        for (const auto &source : sources_) {
            if (source->isApplicable(request))
                selected_sources.emplace_back(source.get());
        }
        return selected_sources;
    }

    for (const auto &source_name : source_names) {
        bool found(false);
        for (const auto &source : sources_) {
            if (source->getName() != source_name)
                continue;
            found = true;
            if (source->isApplicable(request))
                selected_sources.emplace_back(source.get());
            break;
        }
        if (not found)
            LOG_WARNING("unknown source \"" + source_name + "\"");
    }

    return selected_sources;
}


std::vector<std::string> AcquisitionPipeline::getSourceNames() const {
    std::vector<std::string> source_names;
    for (const auto &source : sources_)
        source_names.emplace_back(source->getName());
    return source_names;
}


bool AcquisitionPipeline::isKnownSource(const std::string &source_name) const {
    for (const auto &source : sources_) {
        if (source->getName() == source_name)
            return true;
    }

    return false;
}


const std::string &AcquisitionPipeline::getStagingDirectory() const {
    return tmp_staging_directory_ != nullptr ? tmp_staging_directory_->getDirectoryPath() : params_.staging_directory_;
}


std::string AcquisitionPipeline::SanitizeFilename(const std::string &title, const size_t max_length) {
    std::string filename(title);
    StringUtil::Map(&filename, ILLEGAL_FILENAME_CHARS, '_');
    filename = TextUtil::CollapseAndTrimWhitespace(filename);
    TextUtil::UTF8ByteTruncate(&filename, max_length);
    return StringUtil::TrimWhite(filename);
}


std::string AcquisitionPipeline::MakeFilename(const AcquisitionRequest &request, const size_t max_length) {
    if (not request.title_.empty()) {
        const std::string filename(SanitizeFilename(request.title_, max_length));
        if (not filename.empty())
            return filename;
    }

    std::string doi(request.doi_);
    StringUtil::Map(&doi, "/", '_');
    return SanitizeFilename(doi, max_length);
}


bool AcquisitionPipeline::stageAndVerify(AcquisitionSource * const source, const AcquisitionRequest &request,
                                         const std::string &filename, std::string * const final_path,
                                         std::string * const error_message)
{
    const std::string staging_path(FileUtil::JoinPaths(getStagingDirectory(), filename + ".pdf"));
    FileUtil::DeleteFile(staging_path);

    if (not source->attempt(request, staging_path, error_message)) {
        FileUtil::DeleteFile(staging_path);
        return false;
    }

    std::string prefix;
    if (FileUtil::GetFileSize(staging_path) <= 0 or not FileUtil::ReadPrefix(staging_path, 4, &prefix) or prefix != "%PDF") {
        *error_message = "the downloaded file is not a PDF";
        FileUtil::DeleteFile(staging_path);
        return false;
    }

    *final_path = FileUtil::JoinPaths(params_.download_directory_, filename + ".pdf");
    if (not FileUtil::RenameFile(staging_path, *final_path)) {
        *error_message = "can't move the download to \"" + *final_path + "\"";
        FileUtil::DeleteFile(staging_path);
        return false;
    }

    return true;
}


void AcquisitionPipeline::pause() {
    unsigned delay(params_.base_delay_);
    if (params_.jitter_ > 0) {
        std::uniform_int_distribution<unsigned> distribution(0, params_.jitter_);
        delay += distribution(random_engine_);
    }

    TimeUtil::Millisleep(delay);
}
