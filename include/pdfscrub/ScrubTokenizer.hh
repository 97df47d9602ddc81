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

#ifndef SCRUBTOKENIZER_HH
#define SCRUBTOKENIZER_HH

#include <pdfscrub/DLL.h>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

// ScrubTokenizer splits content stream data into PDF lexical tokens.
// It reads from an in-memory buffer, which must outlive the
// tokenizer.
class ScrubTokenizer
{
  public:
    // Token type tt_eof is returned at the end of the data. tt_space
    // and tt_comment are returned only if includeIgnorable() has been
    // called.
    enum token_type_e {
        tt_bad,
        tt_array_close,
        tt_array_open,
        tt_brace_close,
        tt_brace_open,
        tt_dict_close,
        tt_dict_open,
        tt_integer,
        tt_name,
        tt_real,
        tt_string,
        tt_null,
        tt_bool,
        tt_word,
        tt_eof,
        tt_space,
        tt_comment,
        tt_inline_image,
    };

    class Token
    {
      public:
        Token() :
            type(tt_bad)
        {
        }
        // For strings and names, the raw value is generated from the
        // value.
        PDFSCRUB_DLL
        Token(token_type_e type, std::string const& value);
        Token(
            token_type_e type,
            std::string value,
            std::string raw_value,
            std::string error_message = "") :
            type(type),
            value(std::move(value)),
            raw_value(std::move(raw_value)),
            error_message(std::move(error_message))
        {
        }
        token_type_e
        getType() const
        {
            return this->type;
        }
        // For strings, the decoded bytes. For names, the name with
        // #xx escapes resolved. Otherwise the same as the raw value.
        std::string const&
        getValue() const
        {
            return this->value;
        }
        // The token as it appeared in the input
        std::string const&
        getRawValue() const
        {
            return this->raw_value;
        }
        std::string const&
        getErrorMessage() const
        {
            return this->error_message;
        }
        bool
        operator==(Token const& rhs) const
        {
            // Ignore fields other than type and value
            return (
                (this->type != tt_bad) && (this->type == rhs.type) && (this->value == rhs.value));
        }
        bool
        isWord() const
        {
            return this->type == tt_word;
        }
        bool
        isWord(std::string const& value) const
        {
            return this->type == tt_word && this->value == value;
        }

      private:
        token_type_e type;
        std::string value;
        std::string raw_value;
        std::string error_message;
    };

    PDFSCRUB_DLL
    ScrubTokenizer(std::string_view data);

    // If called, readToken will return "ignorable" tokens for space
    // and comments.
    PDFSCRUB_DLL
    void includeIgnorable();

    PDFSCRUB_DLL
    Token readToken();

    // Call this after reading the ID operator. The next call to
    // readToken returns all data up to but not including the next EI
    // token that is preceded by white space and followed by white
    // space, a delimiter, or the end of the data. The single white
    // space character that follows ID is skipped. The token is either
    // tt_inline_image or tt_bad.
    PDFSCRUB_DLL
    void expectInlineImage();

    // Offset of the next unread byte
    PDFSCRUB_DLL
    size_t getOffset() const;

    // Tokenize all of `data', stopping after the first bad token. The
    // tt_eof token is not included. Inline image data is handled
    // automatically.
    PDFSCRUB_DLL
    static std::vector<Token> tokenize(std::string_view data, bool include_ignorable = false);

  private:
    Token readString();
    Token readHexString();
    Token readName();
    Token readWord();
    Token readInlineImage();

    std::string_view data;
    size_t pos{0};
    bool include_ignorable{false};
    bool inline_image_expected{false};
};

#endif // SCRUBTOKENIZER_HH
