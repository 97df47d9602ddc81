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

#ifndef SCRUBBINARYSANITIZER_HH
#define SCRUBBINARYSANITIZER_HH

#include <pdfscrub/DLL.h>
#include <pdfscrub/ScrubIssue.hh>
#include <pdfscrub/ScrubObjGen.hh>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

class ScrubDocument;
class ScrubObject;
class ScrubResourceTracker;
class ScrubWorkerPool;

// Removes embedded metadata and slack bytes from binary payloads.
// Streams whose /Subtype is /Image, /Form, or /ICCProfile, or whose
// filter is /JPXDecode, are cleaned according to the type of their
// data:
//
//   JPEG: COM and APP1..APP13/APP15 segments are dropped; APP0 (JFIF)
//         and APP14 (Adobe) are kept; anything after EOI is dropped.
//   PNG:  tEXt, zTXt, iTXt, and tIME chunks are dropped, as is
//         anything after IEND.
//   ICC:  creation date and profile ID are zeroed, as are the text
//         payloads of the desc, cprt, dmnd, and dmdd tags.
//   other: trailing NUL padding is removed, except from raw image
//         samples.
//
// Flate-compressed data is cleaned after decompression and compressed
// again only if it changed. Data under other filters, apart from
// /DCTDecode, is left alone.
//
// Strings anywhere in the document that contain control characters
// other than white space have those characters removed. UTF-16
// strings, which start with a byte order mark, are left alone, as are
// byte strings: the values of /ID, /O, /U, /OE, /UE, /Perms, and
// /Cert, and the /Contents of a signature. Strings are not touched in
// encrypted documents.
class ScrubBinarySanitizer
{
  public:
    enum data_type_e { dt_generic, dt_jpeg, dt_png, dt_icc };

    struct Stats
    {
        size_t objects_sanitized{0};
        size_t bytes_processed{0};
        size_t bytes_removed{0};
        // Segments, chunks, or tags removed or blanked
        size_t metadata_removed{0};
        std::chrono::microseconds duration{0};
    };

    PDFSCRUB_DLL
    ScrubBinarySanitizer();
    PDFSCRUB_DLL
    ~ScrubBinarySanitizer();

    PDFSCRUB_DLL
    void setResourceTracker(ScrubResourceTracker* tracker);

    PDFSCRUB_DLL
    static data_type_e detectType(std::string const& data);

    // The cleaners throw std::runtime_error for truncated or malformed
    // input. `removed' is incremented for each segment, chunk, or tag
    // removed or blanked.
    PDFSCRUB_DLL
    static std::string cleanJPEG(std::string const& data, size_t& removed);
    PDFSCRUB_DLL
    static std::string cleanPNG(std::string const& data, size_t& removed);
    PDFSCRUB_DLL
    static std::string cleanICC(std::string const& data, size_t& removed);
    PDFSCRUB_DLL
    static std::string cleanGeneric(std::string const& data);
    // Dispatch on detectType
    PDFSCRUB_DLL
    static std::string clean(std::string const& data, size_t& removed);

    // True if `str' contains a byte below 32 that is not ASCII white
    // space.
    PDFSCRUB_DLL
    static bool hasControlCharacters(std::string const& str);
    // True if `str' starts with a UTF-16 byte order mark. NUL bytes
    // are part of the text in such strings.
    PDFSCRUB_DLL
    static bool isUnicodeString(std::string const& str);
    PDFSCRUB_DLL
    static std::string cleanString(std::string const& str);

    // Clean one object in place. Returns true if it changed. May be
    // called concurrently for different objects.
    PDFSCRUB_DLL
    bool sanitizeObject(
        ScrubObjGen og,
        ScrubObject& obj,
        bool clean_strings,
        Stats& stats,
        std::vector<ScrubIssue>& issues) const;

    // Clean every object, using `pool' if given. Returns the number of
    // objects changed.
    PDFSCRUB_DLL
    size_t sanitizeDocument(ScrubDocument& doc, ScrubWorkerPool* pool = nullptr);

    PDFSCRUB_DLL
    Stats const& getStats() const;
    PDFSCRUB_DLL
    void reset();

  private:
    bool sanitizeStream(ScrubObject& stream, Stats& stats) const;

    class Members;

    std::unique_ptr<Members> m;
};

#endif // SCRUBBINARYSANITIZER_HH
