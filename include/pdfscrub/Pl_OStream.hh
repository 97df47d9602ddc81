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

// End-of-line pipeline that simply writes its data to a std::ostream.

#ifndef PL_OSTREAM_HH
#define PL_OSTREAM_HH

#include <pdfscrub/Pipeline.hh>

#include <iostream>
#include <memory>

// This pipeline is reusable.

class PDFSCRUB_DLL_CLASS Pl_OStream: public Pipeline
{
  public:
    // os is externally maintained; this class just writes to and
    // flushes it. It does not close it.
    PDFSCRUB_DLL
    Pl_OStream(char const* identifier, std::ostream& os);
    PDFSCRUB_DLL
    ~Pl_OStream() override;

    PDFSCRUB_DLL
    void write(unsigned char const* buf, size_t len) override;
    PDFSCRUB_DLL
    void finish() override;

  private:
    class Members;

    std::unique_ptr<Members> m;
};

#endif // PL_OSTREAM_HH
