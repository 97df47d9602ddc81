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

#ifndef PL_COUNT_HH
#define PL_COUNT_HH

#include <pdfscrub/Pipeline.hh>
#include <pdfscrub/Types.h>

#include <memory>

// This pipeline is reusable; i.e., it is safe to call write() after
// calling finish(). ScrubWriter uses it to learn the exact offset of
// every object it emits.
class PDFSCRUB_DLL_CLASS Pl_Count: public Pipeline
{
  public:
    PDFSCRUB_DLL
    Pl_Count(char const* identifier, Pipeline* next);
    PDFSCRUB_DLL
    ~Pl_Count() override;
    PDFSCRUB_DLL
    void write(unsigned char const*, size_t) override;
    PDFSCRUB_DLL
    void finish() override;
    // Bytes written so far, which is the offset of the next byte
    PDFSCRUB_DLL
    scrub_offset_t getCount() const;

  private:
    class Members;

    std::unique_ptr<Members> m;
};

#endif // PL_COUNT_HH
