#include <pdfscrub/ScrubIssue.hh>

std::string
ScrubIssue::unparse() const
{
    std::string result = (level == l_error ? "ERROR: " : "WARNING: ");
    if (og) {
        result += og->toRef() + ": ";
    }
    result += description;
    return result;
}
