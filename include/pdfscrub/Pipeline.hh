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

// A Pipeline receives bytes through write() and is flushed with
// finish(). Pipelines are chained: a pipeline that transforms data
// passes its output to the next one, and the last one in a chain
// stores or discards it. Subclasses are named Pl_Something.
//
// Whoever creates a pipeline destroys it; a pipeline never owns its
// successor. Call finish() before destroying a pipeline or buffered
// data may be lost. Destructors must not throw when finish() was not
// called.
//
// Decoding pipelines used on document data (Pl_Flate, Pl_DCT) throw
// std::runtime_error for bad input so that callers can turn the
// failure into an issue on the object being processed.

#ifndef PIPELINE_HH
#define PIPELINE_HH

#include <pdfscrub/DLL.h>

#include <string>

// Use PDFSCRUB_DLL_CLASS on anything derived from Pipeline so that
// dynamic_cast works across the shared library boundary.
class PDFSCRUB_DLL_CLASS Pipeline
{
  public:
    PDFSCRUB_DLL
    Pipeline(char const* identifier, Pipeline* next);

    PDFSCRUB_DLL
    virtual ~Pipeline() = default;

    // Subclasses that are not at the end of a chain forward to next().
    PDFSCRUB_DLL
    virtual void write(unsigned char const* data, size_t len) = 0;
    PDFSCRUB_DLL
    virtual void finish() = 0;

    PDFSCRUB_DLL
    void write(char const* data, size_t len);
    // Does not write the terminating null.
    PDFSCRUB_DLL
    void writeCStr(char const* cstr);
    PDFSCRUB_DLL
    void writeString(std::string const&);

    // For log lines and serialized syntax: *p << "n " << 3 << "\n"
    PDFSCRUB_DLL
    Pipeline& operator<<(char const* cstr);
    PDFSCRUB_DLL
    Pipeline& operator<<(std::string const&);
    PDFSCRUB_DLL
    Pipeline& operator<<(long long);

  protected:
    Pipeline*
    next() const noexcept
    {
        return next_;
    }
    std::string identifier;

  private:
    Pipeline(Pipeline const&) = delete;
    Pipeline& operator=(Pipeline const&) = delete;

    Pipeline* next_;
};

#endif // PIPELINE_HH
