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

#ifndef PL_BUFFER_HH
#define PL_BUFFER_HH

#include <pdfscrub/Pipeline.hh>

#include <memory>
#include <string>

// This pipeline accumulates the data passed to it into a memory
// buffer. Each subsequent use of this buffer appends to the data
// accumulated so far. getString() may be called only after calling
// finish() and before calling any subsequent write(). At that point,
// the accumulated data is returned and the internal buffer is reset.
//
// For this pipeline, "next" may be null. If a next pointer is
// provided, this pipeline will also pass the data through to it.
class PDFSCRUB_DLL_CLASS Pl_Buffer: public Pipeline
{
  public:
    PDFSCRUB_DLL
    Pl_Buffer(char const* identifier, Pipeline* next = nullptr);
    PDFSCRUB_DLL
    ~Pl_Buffer() override;
    PDFSCRUB_DLL
    void write(unsigned char const*, size_t) override;
    PDFSCRUB_DLL
    void finish() override;

    // Each call to getString() resets this object -- see notes above.
    PDFSCRUB_DLL
    std::string getString();

  private:
    class Members;

    std::unique_ptr<Members> m;
};

#endif // PL_BUFFER_HH
