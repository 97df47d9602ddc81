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

#ifndef SCRUBISSUE_HH
#define SCRUBISSUE_HH

#include <pdfscrub/Constants.h>
#include <pdfscrub/DLL.h>
#include <pdfscrub/ScrubObjGen.hh>

#include <optional>
#include <string>
#include <utility>

// A non-fatal problem encountered while processing one object. Issues
// are accumulated on ScrubDocument and never interrupt a stage.
class ScrubIssue
{
  public:
    enum level_e { l_warning, l_error };

    ScrubIssue() = default;
    ScrubIssue(
        level_e level,
        scrub_error_code_e error_code,
        std::optional<ScrubObjGen> og,
        std::string description) :
        level(level),
        error_code(error_code),
        og(og),
        description(std::move(description))
    {
    }

    // Return a one-line human-readable form, e.g.
    // "WARNING: 3 0 R: content stream could not be tokenized".
    PDFSCRUB_DLL
    std::string unparse() const;

    level_e level{l_warning};
    scrub_error_code_e error_code{scrub_e_processing};
    std::optional<ScrubObjGen> og;
    std::string description;
};

#endif // SCRUBISSUE_HH
