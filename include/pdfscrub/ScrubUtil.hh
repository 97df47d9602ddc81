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

#ifndef SCRUBUTIL_HH
#define SCRUBUTIL_HH

#include <pdfscrub/DLL.h>

#include <string>
#include <string_view>

namespace ScrubUtil
{
    // This is a collection of useful utility functions that don't
    // really go anywhere else.
    PDFSCRUB_DLL
    std::string int_to_string(long long, int length = 0);
    PDFSCRUB_DLL
    std::string uint_to_string(unsigned long long, int length = 0);
    PDFSCRUB_DLL
    std::string double_to_string(double, int decimal_places = 0, bool trim_trailing_zeroes = true);

    // Pipeline's write method wants unsigned char*, but we often have
    // some other type of string. These methods do combinations of
    // const_cast and reinterpret_cast to give us an unsigned char*.
    // None of the pipelines modify the data passed to them.
    PDFSCRUB_DLL
    unsigned char* unsigned_char_pointer(std::string const& str);
    PDFSCRUB_DLL
    unsigned char* unsigned_char_pointer(char const* str);

    // Returns lower-case hex-encoded version of the string, treating
    // each character in the input string as unsigned. The output
    // string will be twice as long as the input string.
    PDFSCRUB_DLL
    std::string hex_encode(std::string const&);

    // Returns a string that is the result of decoding the input
    // string. The input string may consist of mixed case hexadecimal
    // digits. Any characters that are not hexadecimal digits will be
    // silently ignored. If there are an odd number of hexadecimal
    // digits, a trailing 0 will be assumed.
    PDFSCRUB_DLL
    std::string hex_decode(std::string const&);

    // Get the value of an environment variable in a portable fashion.
    // Returns true iff the variable is defined. If `value' is
    // non-null, initializes it with the value of the variable.
    PDFSCRUB_DLL
    bool get_env(std::string const& var, std::string* value = nullptr);

    // Shannon entropy of the bytes in `data' in bits per byte, in the
    // range [0, 8]. Returns 0 for empty input.
    PDFSCRUB_DLL
    double byte_entropy(std::string_view data);

    // Return true if every byte is printable ASCII or ASCII white
    // space.
    PDFSCRUB_DLL
    bool is_text(std::string_view data);
} // namespace ScrubUtil

#endif // SCRUBUTIL_HH
