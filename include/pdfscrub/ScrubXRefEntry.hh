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

#ifndef SCRUBXREFENTRY_HH
#define SCRUBXREFENTRY_HH

#include <pdfscrub/DLL.h>
#include <pdfscrub/ScrubObjGen.hh>
#include <pdfscrub/Types.h>

#include <map>

class ScrubXRefEntry
{
  public:
    // Type constants are from ISO 32000-1, section 7.5.8 (cross-reference streams):
    // 0 = free entry; not used
    // 1 = "uncompressed"; field 1 = offset
    // 2 = "compressed"; field 1 = object stream number, field 2 = index

    // Create a type 0 "free" entry.
    PDFSCRUB_DLL
    ScrubXRefEntry();
    PDFSCRUB_DLL
    ScrubXRefEntry(int type, scrub_offset_t field1, int field2);
    // Create a type 1 "uncompressed" entry.
    ScrubXRefEntry(scrub_offset_t offset) :
        type(1),
        field1(offset)
    {
    }

    PDFSCRUB_DLL
    int getType() const;
    PDFSCRUB_DLL
    scrub_offset_t getOffset() const; // only for type 1
    PDFSCRUB_DLL
    int getObjStreamNumber() const; // only for type 2
    PDFSCRUB_DLL
    int getObjStreamIndex() const; // only for type 2

    bool
    operator==(ScrubXRefEntry const& rhs) const
    {
        return type == rhs.type && field1 == rhs.field1 && field2 == rhs.field2;
    }

  private:
    int type{0};
    scrub_offset_t field1{0};
    int field2{0};
};

// One cross-reference section. Offsets are meaningful only for the
// serialization that produced them.
typedef std::map<ScrubObjGen, ScrubXRefEntry> ScrubXRefTable;

#endif // SCRUBXREFENTRY_HH
