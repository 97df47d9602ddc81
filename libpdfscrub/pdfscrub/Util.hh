#ifndef UTIL_HH
#define UTIL_HH

#include <stdexcept>
#include <string>
#include <utility>

using namespace std::literals;

namespace pdfscrub::util
{
    // pdfscrub::util is a collection of small inline helpers for
    // internal use. Some of them are exposed as regular functions in
    // ScrubUtil.

    // Throw a logic_error if 'cond' does not hold.
    inline void
    assertion(bool cond, std::string const& msg)
    {
        if (!cond) {
            throw std::logic_error(msg);
        }
    }

    inline void
    internal_error_if(bool cond, std::string const& msg)
    {
        if (cond) {
            throw std::logic_error("INTERNAL ERROR: "s.append(msg).append(
                "\nThis is a pdfscrub bug. Please report it with a reproducing document."));
        }
    }

    inline constexpr char
    hex_decode_char(char digit)
    {
        return digit <= '9' && digit >= '0'
            ? char(digit - '0')
            : (digit >= 'a' ? (digit <= 'f' ? char(digit - 'a' + 10) : '\20')
                            : (digit >= 'A' && digit <= 'F' ? char(digit - 'A' + 10) : '\20'));
    }

    inline constexpr bool
    is_hex_digit(char ch)
    {
        return hex_decode_char(ch) < '\20';
    }

    inline constexpr bool
    is_space(char ch)
    {
        return ch == ' ' || ch == '\n' || ch == '\r' || ch == '\t' || ch == '\f' || ch == '\0';
    }

    inline constexpr bool
    is_delimiter(char ch)
    {
        return ch == '(' || ch == ')' || ch == '<' || ch == '>' || ch == '[' || ch == ']' ||
            ch == '{' || ch == '}' || ch == '/' || ch == '%';
    }

    inline constexpr bool
    is_digit(char ch)
    {
        return (ch >= '0' && ch <= '9');
    }

    // Returns lower-case hex-encoded version of the char including a leading "#".
    inline std::string
    hex_encode_char(char c)
    {
        static auto constexpr hexchars = "0123456789abcdef";
        return {'#', hexchars[static_cast<unsigned char>(c) >> 4], hexchars[c & 0x0f]};
    }

    // Little-endian encoding of the low `bytes' bytes of `value',
    // zero-filled past the width of `value'.
    inline std::string
    le_bytes(unsigned long long value, size_t bytes)
    {
        std::string result;
        for (size_t i = 0; i < bytes; ++i) {
            result += i < sizeof(value) ? static_cast<char>((value >> (8 * i)) & 0xff) : '\0';
        }
        return result;
    }
} // namespace pdfscrub::util

#endif // UTIL_HH
