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

#ifndef PL_FLATE_HH
#define PL_FLATE_HH

#include <pdfscrub/Pipeline.hh>

#include <functional>
#include <memory>
#include <string>

class ScrubResourceTracker;

class PDFSCRUB_DLL_CLASS Pl_Flate: public Pipeline
{
  public:
    static unsigned int const def_bufsize = 65536;

    enum action_e { a_inflate, a_deflate };

    PDFSCRUB_DLL
    Pl_Flate(
        char const* identifier,
        Pipeline* next,
        action_e action,
        unsigned int out_bufsize = def_bufsize);
    PDFSCRUB_DLL
    ~Pl_Flate() override;

    PDFSCRUB_DLL
    void write(unsigned char const* data, size_t len) override;
    PDFSCRUB_DLL
    void finish() override;

    // Globally set compression level from 1 (fastest, least
    // compression) to 9 (slowest, most compression). Use -1 to set
    // the default compression level. This is passed directly to zlib.
    PDFSCRUB_DLL
    static void setCompressionLevel(int);

    // Charge every inflated byte against `tracker'. When the tracker's
    // limit would be exceeded, write() throws ScrubExc with
    // scrub_e_processing. The bytes are released when the pipeline is
    // destroyed. The tracker must outlive this object.
    PDFSCRUB_DLL
    void setResourceTracker(ScrubResourceTracker* tracker);

    PDFSCRUB_DLL
    void setWarnCallback(std::function<void(char const*, int)> callback);

    // Convenience helpers for whole-buffer use
    PDFSCRUB_DLL
    static std::string
    inflate(std::string const& data, ScrubResourceTracker* tracker = nullptr);
    PDFSCRUB_DLL
    static std::string deflate(std::string const& data);

  private:
    PDFSCRUB_DLL_PRIVATE
    void handleData(unsigned char const* data, size_t len, int flush);
    PDFSCRUB_DLL_PRIVATE
    void checkError(char const* prefix, int error_code);
    PDFSCRUB_DLL_PRIVATE
    void warn(char const*, int error_code);

    PDFSCRUB_DLL_PRIVATE
    static int compression_level;

    class Members;

    std::unique_ptr<Members> m;
};

#endif // PL_FLATE_HH
