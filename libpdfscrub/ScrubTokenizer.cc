#include <pdfscrub/ScrubTokenizer.hh>

// DO NOT USE ctype -- it is locale dependent for some things, and it's
// not worth the risk of including it in case it may accidentally be
// used.

#include <pdfscrub/ScrubObject.hh>
#include <pdfscrub/Util.hh>

using namespace pdfscrub;

using Token = ScrubTokenizer::Token;

static inline bool
is_token_end(char ch)
{
    return util::is_space(ch) || util::is_delimiter(ch);
}

// [+-]?[0-9]+
static bool
is_integer(std::string const& str)
{
    size_t i = (!str.empty() && (str.at(0) == '+' || str.at(0) == '-')) ? 1 : 0;
    if (i >= str.length()) {
        return false;
    }
    for (; i < str.length(); ++i) {
        if (!util::is_digit(str.at(i))) {
            return false;
        }
    }
    return true;
}

// [+-]?([0-9]+\.[0-9]*|\.[0-9]+)
static bool
is_real(std::string const& str)
{
    size_t i = (!str.empty() && (str.at(0) == '+' || str.at(0) == '-')) ? 1 : 0;
    bool found_dot = false;
    bool found_digit = false;
    for (; i < str.length(); ++i) {
        char ch = str.at(i);
        if (ch == '.') {
            if (found_dot) {
                return false;
            }
            found_dot = true;
        } else if (util::is_digit(ch)) {
            found_digit = true;
        } else {
            return false;
        }
    }
    return found_dot && found_digit;
}

Token::Token(token_type_e type, std::string const& value) :
    type(type),
    value(value),
    raw_value(value)
{
    if (type == tt_string) {
        raw_value = ScrubObject::newString(value).unparse();
    } else if (type == tt_name) {
        raw_value = ScrubObject::newName(value).unparse();
    }
}

ScrubTokenizer::ScrubTokenizer(std::string_view data) :
    data(data)
{
}

void
ScrubTokenizer::includeIgnorable()
{
    include_ignorable = true;
}

void
ScrubTokenizer::expectInlineImage()
{
    inline_image_expected = true;
}

size_t
ScrubTokenizer::getOffset() const
{
    return pos;
}

Token
ScrubTokenizer::readToken()
{
    if (inline_image_expected) {
        inline_image_expected = false;
        return readInlineImage();
    }
    while (pos < data.size()) {
        size_t start = pos;
        char ch = data.at(pos);
        if (util::is_space(ch)) {
            while (pos < data.size() && util::is_space(data.at(pos))) {
                ++pos;
            }
            if (include_ignorable) {
                std::string space(data.substr(start, pos - start));
                return {tt_space, space, space};
            }
            continue;
        }
        if (ch == '%') {
            while (pos < data.size() && data.at(pos) != '\n' && data.at(pos) != '\r') {
                ++pos;
            }
            if (include_ignorable) {
                std::string comment(data.substr(start, pos - start));
                return {tt_comment, comment, comment};
            }
            continue;
        }
        switch (ch) {
        case '[':
            ++pos;
            return {tt_array_open, "[", "["};
        case ']':
            ++pos;
            return {tt_array_close, "]", "]"};
        case '{':
            ++pos;
            return {tt_brace_open, "{", "{"};
        case '}':
            ++pos;
            return {tt_brace_close, "}", "}"};
        case '(':
            return readString();
        case ')':
            ++pos;
            return {tt_bad, ")", ")", "unexpected )"};
        case '/':
            return readName();
        case '<':
            if (pos + 1 < data.size() && data.at(pos + 1) == '<') {
                pos += 2;
                return {tt_dict_open, "<<", "<<"};
            }
            return readHexString();
        case '>':
            if (pos + 1 < data.size() && data.at(pos + 1) == '>') {
                pos += 2;
                return {tt_dict_close, ">>", ">>"};
            }
            ++pos;
            return {tt_bad, ">", ">", "unexpected >"};
        default:
            return readWord();
        }
    }
    return {tt_eof, "", ""};
}

Token
ScrubTokenizer::readString()
{
    size_t start = pos;
    ++pos; // skip (
    std::string val;
    int depth = 1;
    while (pos < data.size()) {
        char ch = data.at(pos++);
        if (ch == '\\') {
            if (pos >= data.size()) {
                break;
            }
            char esc = data.at(pos++);
            switch (esc) {
            case 'n':
                val += '\n';
                break;
            case 'r':
                val += '\r';
                break;
            case 't':
                val += '\t';
                break;
            case 'b':
                val += '\b';
                break;
            case 'f':
                val += '\f';
                break;
            case '\r':
                // Line continuation; \r\n counts as one end of line
                if (pos < data.size() && data.at(pos) == '\n') {
                    ++pos;
                }
                break;
            case '\n':
                break;
            default:
                if (esc >= '0' && esc <= '7') {
                    int value = esc - '0';
                    for (int i = 0; i < 2 && pos < data.size() && data.at(pos) >= '0' &&
                         data.at(pos) <= '7';
                         ++i) {
                        value = 8 * value + (data.at(pos++) - '0');
                    }
                    val += static_cast<char>(value & 0xff);
                } else {
                    // \( \) \\ and unknown escapes yield the character
                    val += esc;
                }
                break;
            }
        } else if (ch == '(') {
            ++depth;
            val += ch;
        } else if (ch == ')') {
            if (--depth == 0) {
                return {tt_string, val, std::string(data.substr(start, pos - start))};
            }
            val += ch;
        } else {
            val += ch;
        }
    }
    return {tt_bad, val, std::string(data.substr(start, pos - start)), "unterminated string"};
}

Token
ScrubTokenizer::readHexString()
{
    size_t start = pos;
    ++pos; // skip <
    std::string digits;
    while (pos < data.size()) {
        char ch = data.at(pos++);
        if (ch == '>') {
            if (digits.length() % 2) {
                digits += '0';
            }
            std::string val;
            for (size_t i = 0; i < digits.length(); i += 2) {
                val += static_cast<char>(
                    (util::hex_decode_char(digits.at(i)) << 4) |
                    util::hex_decode_char(digits.at(i + 1)));
            }
            return {tt_string, val, std::string(data.substr(start, pos - start))};
        }
        if (util::is_hex_digit(ch)) {
            digits += ch;
        } else if (!util::is_space(ch)) {
            return {
                tt_bad,
                "",
                std::string(data.substr(start, pos - start)),
                "invalid character in hexstring"};
        }
    }
    return {tt_bad, "", std::string(data.substr(start, pos - start)), "unterminated hexstring"};
}

Token
ScrubTokenizer::readName()
{
    size_t start = pos;
    ++pos; // skip /
    std::string val = "/";
    while (pos < data.size() && !is_token_end(data.at(pos))) {
        char ch = data.at(pos++);
        if (ch == '#' && pos + 1 < data.size() && util::is_hex_digit(data.at(pos)) &&
            util::is_hex_digit(data.at(pos + 1))) {
            val += static_cast<char>(
                (util::hex_decode_char(data.at(pos)) << 4) |
                util::hex_decode_char(data.at(pos + 1)));
            pos += 2;
        } else {
            val += ch;
        }
    }
    return {tt_name, val, std::string(data.substr(start, pos - start))};
}

Token
ScrubTokenizer::readWord()
{
    size_t start = pos;
    while (pos < data.size() && !is_token_end(data.at(pos))) {
        ++pos;
    }
    std::string word(data.substr(start, pos - start));
    if (is_integer(word)) {
        return {tt_integer, word, word};
    }
    if (is_real(word)) {
        return {tt_real, word, word};
    }
    if (word == "true" || word == "false") {
        return {tt_bool, word, word};
    }
    if (word == "null") {
        return {tt_null, word, word};
    }
    return {tt_word, word, word};
}

Token
ScrubTokenizer::readInlineImage()
{
    // Skip the single white space character after ID.
    if (pos < data.size() && util::is_space(data.at(pos))) {
        ++pos;
    }
    size_t start = pos;
    size_t search = pos;
    while (true) {
        size_t found = data.find("EI", search);
        if (found == std::string_view::npos) {
            pos = data.size();
            return {
                tt_bad,
                "",
                std::string(data.substr(start)),
                "EI not found after inline image data"};
        }
        bool before_okay = (found > 0) && util::is_space(data.at(found - 1));
        bool after_okay = (found + 2 >= data.size()) || is_token_end(data.at(found + 2));
        if (before_okay && after_okay) {
            pos = found;
            std::string image(data.substr(start, found - start));
            return {tt_inline_image, image, image};
        }
        search = found + 1;
    }
}

std::vector<Token>
ScrubTokenizer::tokenize(std::string_view data, bool include_ignorable)
{
    std::vector<Token> result;
    ScrubTokenizer tokenizer(data);
    if (include_ignorable) {
        tokenizer.includeIgnorable();
    }
    while (true) {
        auto token = tokenizer.readToken();
        if (token.getType() == tt_eof) {
            break;
        }
        bool bad = (token.getType() == tt_bad);
        bool id = token.isWord("ID");
        result.push_back(std::move(token));
        if (bad) {
            break;
        }
        if (id) {
            tokenizer.expectInlineImage();
        }
    }
    return result;
}
