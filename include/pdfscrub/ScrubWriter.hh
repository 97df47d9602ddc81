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

#ifndef SCRUBWRITER_HH
#define SCRUBWRITER_HH

#include <pdfscrub/DLL.h>
#include <pdfscrub/ScrubXRefEntry.hh>
#include <pdfscrub/Types.h>

#include <memory>
#include <string>

class Pipeline;
class ScrubDocument;

// ScrubWriter serializes a ScrubDocument as a PDF file with a classic
// cross-reference table. Its output is fully determined by the
// document: ScrubDocument::rebuildXRef runs a writer into a counting
// pipeline and records the offsets it observes, so a later write of
// the same document places every object at exactly those offsets.
//
// Output layout:
//
//   %PDF-1.7
//   %<four bytes with the high bit set>
//   N G obj
//   <object>
//   endobj
//   ...
//   xref
//   0 <size>
//   <one 20-byte entry per object number>
//   trailer << /Size ... /Root ... >>
//   startxref
//   <offset of xref>
//   %%EOF
class ScrubWriter
{
  public:
    PDFSCRUB_DLL
    ScrubWriter(ScrubDocument const& doc);
    PDFSCRUB_DLL
    ~ScrubWriter();

    // Output may be set only one time. If no output is set, output is
    // written to an internal buffer that can be retrieved with
    // getString().
    PDFSCRUB_DLL
    void setOutputPipeline(Pipeline*);

    // Write the document. May be called only once. Throws ScrubExc with
    // scrub_e_structure if two objects share an object number.
    PDFSCRUB_DLL
    void write();

    // Return the data written to the internal buffer. Throws
    // std::logic_error if an output pipeline was given.
    PDFSCRUB_DLL
    std::string getString();

    // Offsets recorded while writing
    PDFSCRUB_DLL
    ScrubXRefTable const& getXRefTable() const;
    PDFSCRUB_DLL
    scrub_offset_t getStartXRef() const;

    // Convenience: write `doc' and return the bytes.
    PDFSCRUB_DLL
    static std::string writeToString(ScrubDocument const& doc);

  private:
    ScrubWriter(ScrubWriter const&) = delete;
    ScrubWriter& operator=(ScrubWriter const&) = delete;

    void writeHeader();
    void writeObjects();
    void writeXRefTable();
    void writeTrailer();
    ScrubWriter& write(std::string const& str);

    class Members;

    std::unique_ptr<Members> m;
};

#endif // SCRUBWRITER_HH
