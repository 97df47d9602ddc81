// Copyright (c) 2005-2022 Jay Berkenbilt
//
// This file is part of pdfscrub.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SCRUBJOB_HH
#define SCRUBJOB_HH

#include <pdfscrub/DLL.h>
#include <pdfscrub/ScrubBinarySanitizer.hh>
#include <pdfscrub/ScrubContentSanitizer.hh>
#include <pdfscrub/ScrubDocument.hh>
#include <pdfscrub/ScrubEncryptor.hh>
#include <pdfscrub/ScrubFinding.hh>
#include <pdfscrub/ScrubForensicScanner.hh>
#include <pdfscrub/ScrubIssue.hh>
#include <pdfscrub/ScrubMetadataSanitizer.hh>
#include <pdfscrub/ScrubStegoDetector.hh>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class ScrubLogger;

// ScrubJob runs the whole cleaning pipeline over one document:
//
//   Reference-Map, Reachability, Dedup, Stream-Merge, Compact,
//   XRef-Rebuild, Content-Sanitize, Binary-Sanitize, Metadata-Strip
//
// followed, if any of the last three changed the document, by a final
// cleanup that drops newly unreachable objects, compacts, and rebuilds
// the cross-reference table. Scanning may be run before and after
// cleaning, and encryption last.
//
// Each stage runs against a backup of the document. If a stage fails
// with a data error, the backup is restored, an error issue is
// recorded, and the job continues with the next stage. A document
// whose root does not resolve and an invalid configuration are the
// only errors that are thrown out of run.
class ScrubJob
{
  public:
    struct CleaningConfig
    {
        // Stream-Merge
        bool clean_streams{true};
        // Binary-Sanitize
        bool clean_binary{true};
        // Content-Sanitize
        bool clean_content{true};
        // Reference-Map, Reachability, Dedup, Compact, XRef-Rebuild,
        // and the final cleanup
        bool clean_structure{true};
        // Never remove resources, even with remove_hidden.
        bool preserve_functionality{true};
        // Metadata-Strip
        bool remove_metadata{true};
        // Remove content comments and resources that content never
        // uses.
        bool remove_hidden{true};
    };

    struct Config
    {
        CleaningConfig cleaning;
        ScrubDocument::StreamMergeConfig stream_merge;
        ScrubContentSanitizer::ProcessingConfig processing;
        ScrubForensicScanner::ScanningConfig scanning;
        ScrubStegoDetector::DetectionConfig detection;
        std::optional<ScrubEncryptor::EncryptionConfig> encryption;
        // 0 runs per-object stages in the calling thread.
        size_t worker_threads{0};
        // Limit on decode buffers, in bytes; 0 for no limit
        size_t memory_limit{0};
        bool scan_before{false};
        bool scan_after{false};
        // Write each issue to the logger's warn channel.
        bool verbose{false};
    };

    struct StageResult
    {
        std::string name;
        bool succeeded{true};
        // Objects removed, streams rewritten, and so on
        size_t changes{0};
        std::chrono::microseconds duration{0};
    };

    struct Result
    {
        ScrubDocument document;
        bool cancelled{false};
        std::vector<StageResult> stages;
        std::vector<ScrubFinding> findings_before;
        std::vector<ScrubFinding> findings_after;
        std::vector<ScrubIssue> issues;
        ScrubDocument::StructureStats structure;
        ScrubContentSanitizer::Stats content;
        ScrubBinarySanitizer::Stats binary;
        ScrubMetadataSanitizer::Stats metadata;
        ScrubForensicScanner::Stats scanning;
        ScrubStegoDetector::Stats detection;
        ScrubEncryptor::Stats encryption;
        size_t peak_memory{0};
        std::chrono::microseconds duration{0};
    };

    PDFSCRUB_DLL
    ScrubJob();
    PDFSCRUB_DLL
    explicit ScrubJob(Config const& config);
    PDFSCRUB_DLL
    ~ScrubJob();

    // Throws ScrubExc with scrub_e_config or
    // scrub_e_invalid_encryption_config.
    PDFSCRUB_DLL
    static void validateConfig(Config const& config);

    PDFSCRUB_DLL
    Config const& getConfig() const;
    PDFSCRUB_DLL
    void setLogger(std::shared_ptr<ScrubLogger>);
    PDFSCRUB_DLL
    std::shared_ptr<ScrubLogger> getLogger() const;

    // Run the pipeline. The document is owned by the job while it runs
    // and returned in the result. Throws ScrubExc with
    // scrub_e_structure if the document's root does not resolve.
    PDFSCRUB_DLL
    Result run(ScrubDocument doc);

    // Run the scanner and steganography detector without cleaning.
    PDFSCRUB_DLL
    std::vector<ScrubFinding> scan(ScrubDocument& doc);
    // Encrypt with config.encryption. Throws std::logic_error if no
    // encryption is configured.
    PDFSCRUB_DLL
    void encrypt(ScrubDocument& doc);

    // The encryptor used by run and encrypt, for retrieving the file
    // key afterward.
    PDFSCRUB_DLL
    ScrubEncryptor& getEncryptor();

    // Request that run stop before its next stage. Safe to call from
    // another thread. The document returned reflects the stages that
    // completed. A cancelled job stays cancelled.
    PDFSCRUB_DLL
    void cancel();
    PDFSCRUB_DLL
    bool isCancelled() const;

    PDFSCRUB_DLL
    static std::vector<std::string> const& getStageNames();

  private:
    ScrubJob(ScrubJob const&) = delete;
    ScrubJob& operator=(ScrubJob const&) = delete;

    bool runStage(
        std::string const& name,
        ScrubDocument& doc,
        Result& result,
        std::function<size_t(ScrubDocument&)> const& fn);
    void echoIssues(ScrubDocument const& doc, size_t from);

    class Members;

    std::unique_ptr<Members> m;
};

#endif // SCRUBJOB_HH
