#include <pdfscrub/ScrubUtil.hh>

#include <pdfscrub/ScrubIntC.hh>
#include <pdfscrub/Util.hh>

#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

using namespace pdfscrub;

template <typename T>
static std::string
int_to_string_internal(T num, int length)
{
    // A negative length appends spaces and a positive length prepends
    // zeroes, in the manner of sprintf with %0*d.
    std::string cvt = std::to_string(num);
    std::string result;
    int str_length = ScrubIntC::to_int(cvt.length());
    if ((length > 0) && (str_length < length)) {
        result.append(ScrubIntC::to_size(length - str_length), '0');
    }
    result += cvt;
    if ((length < 0) && (str_length < -length)) {
        result.append(ScrubIntC::to_size(-length - str_length), ' ');
    }
    return result;
}

std::string
ScrubUtil::int_to_string(long long num, int length)
{
    return int_to_string_internal(num, length);
}

std::string
ScrubUtil::uint_to_string(unsigned long long num, int length)
{
    return int_to_string_internal(num, length);
}

std::string
ScrubUtil::double_to_string(double num, int decimal_places, bool trim_trailing_zeroes)
{
    if (decimal_places <= 0) {
        decimal_places = 6;
    }
    std::ostringstream buf;
    buf.imbue(std::locale::classic());
    buf << std::setprecision(decimal_places) << std::fixed << num;
    std::string result = buf.str();
    if (trim_trailing_zeroes) {
        while ((result.length() > 1) && (result.back() == '0')) {
            result.pop_back();
        }
        if ((result.length() > 1) && (result.back() == '.')) {
            result.pop_back();
        }
    }
    if (result == "-0") {
        result = "0";
    }
    return result;
}

unsigned char*
ScrubUtil::unsigned_char_pointer(std::string const& str)
{
    return reinterpret_cast<unsigned char*>(const_cast<char*>(str.c_str()));
}

unsigned char*
ScrubUtil::unsigned_char_pointer(char const* str)
{
    return reinterpret_cast<unsigned char*>(const_cast<char*>(str));
}

std::string
ScrubUtil::hex_encode(std::string const& input)
{
    static auto constexpr hexchars = "0123456789abcdef";
    std::string result;
    result.reserve(2 * input.length());
    for (const char c: input) {
        result += hexchars[static_cast<unsigned char>(c) >> 4];
        result += hexchars[c & 0x0f];
    }
    return result;
}

std::string
ScrubUtil::hex_decode(std::string const& input)
{
    std::string result;
    bool first = true;
    char decoded = 0;
    for (auto ch: input) {
        ch = util::hex_decode_char(ch);
        if (ch < '\20') {
            if (first) {
                decoded = static_cast<char>(ch << 4);
                first = false;
            } else {
                result.push_back(decoded | ch);
                first = true;
            }
        }
    }
    if (!first) {
        result.push_back(decoded);
    }
    return result;
}

bool
ScrubUtil::get_env(std::string const& var, std::string* value)
{
    char* p = getenv(var.c_str());
    if (p == nullptr) {
        return false;
    }
    if (value) {
        *value = p;
    }
    return true;
}

double
ScrubUtil::byte_entropy(std::string_view data)
{
    if (data.empty()) {
        return 0.0;
    }
    size_t counts[256] = {0};
    for (auto ch: data) {
        ++counts[static_cast<unsigned char>(ch)];
    }
    double total = static_cast<double>(data.size());
    double entropy = 0.0;
    for (auto count: counts) {
        if (count) {
            double p = static_cast<double>(count) / total;
            entropy -= p * std::log2(p);
        }
    }
    return entropy;
}

bool
ScrubUtil::is_text(std::string_view data)
{
    for (auto ch: data) {
        auto uch = static_cast<unsigned char>(ch);
        if (!((uch >= 32 && uch < 127) || uch == '\n' || uch == '\r' || uch == '\t' ||
              uch == '\f')) {
            return false;
        }
    }
    return true;
}
