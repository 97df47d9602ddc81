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

#ifndef PL_DCT_HH
#define PL_DCT_HH

#include <pdfscrub/Pipeline.hh>

#include <cstddef>
#include <memory>

// jpeglib.h must be included after cstddef or else it messes up the
// definition of size_t.
#include <jpeglib.h>

class ScrubResourceTracker;

// Decompress or compress DCT (JPEG) image data with libjpeg. Data is
// buffered until finish() is called. Corrupt data is treated as an
// error: finish() throws std::runtime_error.
class PDFSCRUB_DLL_CLASS Pl_DCT: public Pipeline
{
  public:
    // Constructor for decompressing image data
    PDFSCRUB_DLL
    Pl_DCT(char const* identifier, Pipeline* next);

    // Constructor for compressing image data
    PDFSCRUB_DLL
    Pl_DCT(
        char const* identifier,
        Pipeline* next,
        JDIMENSION image_width,
        JDIMENSION image_height,
        int components,
        J_COLOR_SPACE color_space,
        int quality = 75);

    PDFSCRUB_DLL
    ~Pl_DCT() override;

    // Charge the decompressed image size against `tracker' before
    // decoding. The reservation is released when this object is
    // destroyed.
    PDFSCRUB_DLL
    void setResourceTracker(ScrubResourceTracker* tracker);

    PDFSCRUB_DLL
    void write(unsigned char const* data, size_t len) override;
    PDFSCRUB_DLL
    void finish() override;

    // After decompression, the dimensions of the decoded image
    PDFSCRUB_DLL
    JDIMENSION getOutputWidth() const;
    PDFSCRUB_DLL
    JDIMENSION getOutputHeight() const;
    PDFSCRUB_DLL
    int getOutputComponents() const;

  private:
    PDFSCRUB_DLL_PRIVATE
    void compress(void* cinfo, std::string const& data);
    PDFSCRUB_DLL_PRIVATE
    void decompress(void* cinfo, std::string const& data);

    enum action_e { a_compress, a_decompress };

    class Members;

    std::unique_ptr<Members> m;
};

#endif // PL_DCT_HH
