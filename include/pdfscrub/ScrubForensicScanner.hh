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

#ifndef SCRUBFORENSICSCANNER_HH
#define SCRUBFORENSICSCANNER_HH

#include <pdfscrub/Constants.h>
#include <pdfscrub/DLL.h>
#include <pdfscrub/ScrubDetector.hh>
#include <pdfscrub/ScrubFinding.hh>
#include <pdfscrub/ScrubIssue.hh>
#include <pdfscrub/ScrubObjGen.hh>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class ScrubDocument;
class ScrubObject;
class ScrubResourceTracker;
class ScrubWorkerPool;

// ScrubForensicScanner runs a registry of detectors over a document
// and reports what it finds. It never modifies the document other than
// to record issues.
//
// Targets, each enabled separately:
//   content:   every string value and text-like stream data, with
//              Flate data inflated first
//   metadata:  the Info dictionary, /Metadata streams, and the
//              document-level XMP metadata
//   binary:    raw and decoded stream data, against file signatures
//   structure: dictionary keys that introduce active content or
//              attachments, such as /JavaScript and /Launch
//
// Findings whose confidence is below confidence_threshold are dropped.
// Every match is reported.
class ScrubForensicScanner
{
  public:
    struct CustomPattern
    {
        std::string id;
        scrub_pattern_type_e pattern_type{scrub_pt_custom};
        std::string regex;
        std::string description;
        scrub_severity_e severity{scrub_sev_medium};
    };

    struct ScanningConfig
    {
        bool scan_metadata{true};
        bool scan_content{true};
        bool scan_structure{true};
        bool scan_binary{true};
        std::vector<CustomPattern> custom_patterns;
        double confidence_threshold{0.5};
        // Bytes of context captured on each side of a match
        size_t context_size{64};
    };

    struct Stats
    {
        size_t objects_scanned{0};
        size_t patterns_detected{0};
        size_t suspicious_objects{0};
        size_t signatures_matched{0};
        std::chrono::microseconds duration{0};
    };

    // Custom patterns that do not compile are skipped and reported
    // through getPatternIssues and on every scanned document.
    PDFSCRUB_DLL
    ScrubForensicScanner();
    PDFSCRUB_DLL
    explicit ScrubForensicScanner(ScanningConfig const& config);
    PDFSCRUB_DLL
    ~ScrubForensicScanner();

    PDFSCRUB_DLL
    ScanningConfig const& getConfig() const;
    PDFSCRUB_DLL
    void setResourceTracker(ScrubResourceTracker* tracker);

    // Append a detector to the registry.
    PDFSCRUB_DLL
    void addDetector(std::shared_ptr<ScrubDetector> detector);
    PDFSCRUB_DLL
    std::vector<std::shared_ptr<ScrubDetector>> const& getDetectors() const;
    PDFSCRUB_DLL
    std::vector<ScrubIssue> const& getPatternIssues() const;

    // Run every text detector over `data'. Findings from built-in
    // detectors get `kind'; custom patterns keep their own type.
    PDFSCRUB_DLL
    std::vector<ScrubFinding> scanText(
        std::string const& data,
        std::optional<ScrubObjGen> og = std::nullopt,
        scrub_pattern_type_e kind = scrub_pt_content) const;
    // Run every binary detector over `data'.
    PDFSCRUB_DLL
    std::vector<ScrubFinding>
    scanBinary(std::string const& data, std::optional<ScrubObjGen> og = std::nullopt) const;

    // Scan one object with the enabled targets. `is_info' marks the
    // object named by the trailer's /Info. Decoding problems are added
    // to `issues'.
    PDFSCRUB_DLL
    std::vector<ScrubFinding> scanObject(
        ScrubObjGen og,
        ScrubObject const& obj,
        bool is_info,
        std::vector<ScrubIssue>& issues) const;

    // Scan every object, on `pool' if given, and the document-level
    // metadata. Findings are returned in ascending object order,
    // followed by document-level findings. Issues are recorded on the
    // document.
    PDFSCRUB_DLL
    std::vector<ScrubFinding> scanDocument(ScrubDocument& doc, ScrubWorkerPool* pool = nullptr);

    PDFSCRUB_DLL
    static std::vector<std::string> const& getStructureKeys();

    PDFSCRUB_DLL
    Stats const& getStats() const;
    PDFSCRUB_DLL
    void reset();

  private:
    ScrubForensicScanner(ScrubForensicScanner const&) = delete;
    ScrubForensicScanner& operator=(ScrubForensicScanner const&) = delete;

    void init();
    void runDetector(
        ScrubDetector const& detector,
        std::string const& data,
        std::optional<ScrubObjGen> og,
        std::optional<scrub_pattern_type_e> kind,
        std::vector<ScrubFinding>& result) const;
    void scanStructure(
        ScrubObjGen og, ScrubObject const& obj, std::vector<ScrubFinding>& result) const;
    void scanStream(
        ScrubObjGen og,
        ScrubObject const& obj,
        bool is_metadata,
        std::vector<ScrubFinding>& result,
        std::vector<ScrubIssue>& issues) const;

    class Members;

    std::unique_ptr<Members> m;
};

#endif // SCRUBFORENSICSCANNER_HH
