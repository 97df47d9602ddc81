#include <pdfscrub/ScrubFinding.hh>

#include <pdfscrub/ScrubUtil.hh>

char const*
ScrubFinding::severityName(scrub_severity_e severity)
{
    switch (severity) {
    case scrub_sev_info:
        return "info";
    case scrub_sev_low:
        return "low";
    case scrub_sev_medium:
        return "medium";
    case scrub_sev_high:
        return "high";
    case scrub_sev_critical:
        return "critical";
    }
    return "unknown";
}

char const*
ScrubFinding::kindName(scrub_pattern_type_e kind)
{
    switch (kind) {
    case scrub_pt_metadata:
        return "metadata";
    case scrub_pt_content:
        return "content";
    case scrub_pt_structure:
        return "structure";
    case scrub_pt_binary:
        return "binary";
    case scrub_pt_custom:
        return "custom";
    case scrub_pt_steganography:
        return "steganography";
    }
    return "unknown";
}

std::string
ScrubFinding::unparse() const
{
    std::string result = std::string(severityName(severity)) + " " + kindName(kind) + " " +
        pattern_id + " (confidence " + ScrubUtil::double_to_string(confidence, 2) + ")";
    if (og) {
        result += " in " + og->toRef();
    }
    result += ": " + description;
    return result;
}
