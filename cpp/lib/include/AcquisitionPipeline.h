/** \file   AcquisitionPipeline.h
 *  \brief  Tries a list of acquisition sources, in order, until one of them yields a PDF.
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
#include <random>
#include <string>
#include <vector>
#include "AcquisitionSource.h"
#include "FileUtil.h"
#include "RecordUtil.h"


struct AcquisitionAttempt {
    std::string source_name_;
    bool success_;
    std::string message_;
public:
    AcquisitionAttempt(const std::string &source_name, const bool success, const std::string &message)
        : source_name_(source_name), success_(success), message_(message) { }
};


struct AcquisitionResult {
    bool success_;
    std::string source_used_; // empty unless success_ is true
    std::string filepath_;    // empty unless success_ is true
    std::string message_;
    std::string title_;
    std::string doi_;
    std::vector<AcquisitionAttempt> attempts_; // in the order the sources were tried
public:
    AcquisitionResult(): success_(false) { }
};


/** \brief Converts to a flat record with the keys success, sourceUsed, filepath, message, title and doi. */
RecordUtil::FlatRecord ToFlatRecord(const AcquisitionResult &acquisition_result);


/** \class  AcquisitionPipeline
 *  \brief  Drives the acquisition sources for one request at a time.
 *  \note   Candidates are downloaded to a staging directory and only moved to the download directory after they have
 *          been verified.  Nothing is carried over from one request to the next.
 */
class AcquisitionPipeline {
public:
    struct Params {
        std::string download_directory_;
        std::string staging_directory_; // if empty, a temporary directory is used
        size_t max_filename_length_;    // in bytes, w/o the ".pdf" extension
        unsigned base_delay_;           // in ms, between sources and between batch items
        unsigned jitter_;               // in ms
    public:
        explicit Params(const std::string &download_directory = "downloads", const std::string &staging_directory = "",
                        const size_t max_filename_length = 100, const unsigned base_delay = 2000,
                        const unsigned jitter = 1000)
            : download_directory_(download_directory), staging_directory_(staging_directory),
              max_filename_length_(max_filename_length), base_delay_(base_delay), jitter_(jitter) { }
    };

private:
    std::vector<std::unique_ptr<AcquisitionSource>> sources_;
    Params params_;
    std::unique_ptr<FileUtil::AutoTempDirectory> tmp_staging_directory_;
    std::mt19937 random_engine_;

public:
    /** \param sources  In the default order.
     *  \throws std::runtime_error if the download or the staging directory can't be created.
     */
    AcquisitionPipeline(std::vector<std::unique_ptr<AcquisitionSource>> &&sources, const Params &params = Params());

    /** \brief  Tries the applicable sources until one of them yields a verified PDF.
     *  \param  source_names  If non-empty, only these sources are tried, in the given order.
     */
    AcquisitionResult acquire(const AcquisitionRequest &request, const std::vector<std::string> &source_names = {});

    /** \brief  Calls acquire() for each request, pausing between requests.
     *  \param  stop_on_failure  If true, we stop after the first failed request.
     */
    std::vector<AcquisitionResult> acquireBatch(const std::vector<AcquisitionRequest> &requests,
                                                const std::vector<std::string> &source_names = {},
                                                const bool stop_on_failure = false);

    /** \return The applicable sources for "request" in the order they will be tried. */
    std::vector<AcquisitionSource *> selectSources(const AcquisitionRequest &request,
                                                   const std::vector<std::string> &source_names = {}) const;

    /** \return The names of all sources in the default order. */
    std::vector<std::string> getSourceNames() const;

    bool isKnownSource(const std::string &source_name) const;

    const std::string &getStagingDirectory() const;

    /** \brief  Turns "title" into a file name w/o extension.  "<>:\"/\\|?*" are replaced with underscores, whitespace
     *          is collapsed and the result is truncated to at most "max_length" bytes w/o splitting a UTF-8 sequence.
     */
    static std::string SanitizeFilename(const std::string &title, const size_t max_length);

    /** \return The file name w/o extension for "request". */
    static std::string MakeFilename(const AcquisitionRequest &request, const size_t max_length);

private:
    bool stageAndVerify(AcquisitionSource * const source, const AcquisitionRequest &request, const std::string &filename,
                        std::string * const final_path, std::string * const error_message);
    void pause();
};
