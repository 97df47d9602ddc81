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

#ifndef SCRUBFINDING_HH
#define SCRUBFINDING_HH

#include <pdfscrub/Constants.h>
#include <pdfscrub/DLL.h>
#include <pdfscrub/ScrubObjGen.hh>

#include <optional>
#include <string>
#include <utility>

// A detector result. Findings are additive and never describe a
// change to the document.
class ScrubFinding
{
  public:
    ScrubFinding() = default;
    ScrubFinding(
        scrub_pattern_type_e kind,
        std::string pattern_id,
        scrub_severity_e severity,
        double confidence,
        std::string description) :
        kind(kind),
        pattern_id(std::move(pattern_id)),
        severity(severity),
        confidence(confidence),
        description(std::move(description))
    {
    }

    PDFSCRUB_DLL
    static char const* severityName(scrub_severity_e);
    PDFSCRUB_DLL
    static char const* kindName(scrub_pattern_type_e);

    PDFSCRUB_DLL
    std::string unparse() const;

    scrub_pattern_type_e kind{scrub_pt_content};
    std::string pattern_id;
    std::optional<ScrubObjGen> og;
    scrub_severity_e severity{scrub_sev_info};
    double confidence{1.0};
    std::string description;

    // Byte range of the match within the scanned buffer and the
    // surrounding bytes, clipped to the buffer.
    size_t start{0};
    size_t end{0};
    std::string context_before;
    std::string context_after;
};

#endif // SCRUBFINDING_HH
