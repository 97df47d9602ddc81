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

#ifndef SCRUBDETECTOR_HH
#define SCRUBDETECTOR_HH

#include <pdfscrub/Constants.h>
#include <pdfscrub/DLL.h>
#include <pdfscrub/ScrubFinding.hh>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace re2
{
    class RE2;
} // namespace re2

// A detector finds one kind of pattern in a byte buffer. scan returns
// the first match that starts at or after `offset', with the
// finding's start and end set to the match's byte range in `data'.
// Callers that want every match call scan again from the end of the
// previous one. Detectors are immutable after construction, so one
// instance may be used from several threads at once.
class PDFSCRUB_DLL_CLASS ScrubDetector
{
  public:
    // Text detectors are run over strings and text-like stream data;
    // binary detectors over raw and decoded stream data.
    enum input_e { i_text, i_binary };

    PDFSCRUB_DLL
    ScrubDetector(
        std::string id,
        scrub_pattern_type_e kind,
        scrub_severity_e severity,
        double confidence,
        std::string description);
    PDFSCRUB_DLL
    virtual ~ScrubDetector();

    virtual input_e getInput() const = 0;
    virtual std::optional<ScrubFinding> scan(std::string_view data, size_t offset) const = 0;

    PDFSCRUB_DLL
    std::string const& getId() const;
    PDFSCRUB_DLL
    scrub_pattern_type_e getKind() const;
    PDFSCRUB_DLL
    scrub_severity_e getSeverity() const;
    PDFSCRUB_DLL
    double getConfidence() const;
    PDFSCRUB_DLL
    std::string const& getDescription() const;

    // The built-in file signature detectors: JPEG, PNG, ZIP, GZIP,
    // Windows executable, ELF, embedded PDF, and XMP packets.
    PDFSCRUB_DLL
    static std::vector<std::shared_ptr<ScrubDetector>> builtinSignatures();
    // The built-in personal data patterns: email, phone, ssn,
    // credit_card, ipv4, and url.
    PDFSCRUB_DLL
    static std::vector<std::shared_ptr<ScrubDetector>> builtinPatterns();

  protected:
    PDFSCRUB_DLL
    ScrubFinding makeFinding(size_t start, size_t end) const;

  private:
    ScrubDetector(ScrubDetector const&) = delete;
    ScrubDetector& operator=(ScrubDetector const&) = delete;

    std::string id;
    scrub_pattern_type_e kind;
    scrub_severity_e severity;
    double confidence;
    std::string description;
};

// Sliding-window comparison against a fixed byte sequence
class PDFSCRUB_DLL_CLASS ScrubSignatureDetector: public ScrubDetector
{
  public:
    PDFSCRUB_DLL
    ScrubSignatureDetector(
        std::string id,
        std::string signature,
        scrub_severity_e severity,
        double confidence,
        std::string description,
        scrub_pattern_type_e kind = scrub_pt_binary);
    PDFSCRUB_DLL
    ~ScrubSignatureDetector() override = default;

    PDFSCRUB_DLL
    input_e getInput() const override;
    PDFSCRUB_DLL
    std::optional<ScrubFinding> scan(std::string_view data, size_t offset) const override;

    PDFSCRUB_DLL
    std::string const& getSignature() const;

  private:
    std::string signature;
};

// RE2 regular expression, matched over bytes as Latin-1. RE2 runs in
// time linear in the input and without recursion, so arbitrarily long
// strings and streams can be scanned. The constructor throws ScrubExc
// with scrub_e_pattern if the expression does not compile.
class PDFSCRUB_DLL_CLASS ScrubRegexDetector: public ScrubDetector
{
  public:
    PDFSCRUB_DLL
    ScrubRegexDetector(
        std::string id,
        std::string const& pattern,
        scrub_severity_e severity,
        double confidence,
        std::string description,
        scrub_pattern_type_e kind = scrub_pt_content);
    PDFSCRUB_DLL
    ~ScrubRegexDetector() override;

    PDFSCRUB_DLL
    input_e getInput() const override;
    PDFSCRUB_DLL
    std::optional<ScrubFinding> scan(std::string_view data, size_t offset) const override;

    PDFSCRUB_DLL
    std::string const& getPattern() const;

  private:
    std::string pattern;
    std::unique_ptr<re2::RE2> re;
};

#endif // SCRUBDETECTOR_HH
