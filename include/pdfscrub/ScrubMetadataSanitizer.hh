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

#ifndef SCRUBMETADATASANITIZER_HH
#define SCRUBMETADATASANITIZER_HH

#include <pdfscrub/DLL.h>

#include <set>
#include <string>

class ScrubDocument;
class ScrubObject;

// Removes document metadata. Document-level XMP is cleared, the
// trailer's /Info entry is dropped, and the keys /Metadata, /Info, and
// /PieceInfo are removed from every dictionary, including stream
// dictionaries and dictionaries nested inside other objects. No other
// keys are touched. Objects that were referenced only through removed
// keys become unreachable; ScrubJob prunes them afterwards.
class ScrubMetadataSanitizer
{
  public:
    struct Stats
    {
        size_t keys_removed{0};
        size_t objects_modified{0};
        bool document_metadata_removed{false};
        bool trailer_info_removed{false};
    };

    PDFSCRUB_DLL
    static std::set<std::string> const& getMetadataKeys();

    // Remove metadata keys from `obj' and everything nested in it.
    // Returns the number of keys removed.
    PDFSCRUB_DLL
    static size_t removeMetadataKeys(ScrubObject& obj);

    // Returns the number of keys removed, not counting the trailer.
    PDFSCRUB_DLL
    size_t sanitizeDocument(ScrubDocument& doc);

    PDFSCRUB_DLL
    Stats const& getStats() const;
    PDFSCRUB_DLL
    void reset();

  private:
    Stats stats;
};

#endif // SCRUBMETADATASANITIZER_HH
