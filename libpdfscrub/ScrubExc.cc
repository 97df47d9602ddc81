#include <pdfscrub/ScrubExc.hh>

ScrubExc::ScrubExc(
    scrub_error_code_e error_code,
    std::string const& stage,
    std::string const& object,
    std::string const& message) :
    std::runtime_error(createWhat(stage, object, message)),
    error_code(error_code),
    stage(stage),
    object(object),
    message(message)
{
}

std::string
ScrubExc::createWhat(
    std::string const& stage, std::string const& object, std::string const& message)
{
    std::string result;
    if (!stage.empty()) {
        result += stage;
    }
    if (!object.empty()) {
        if (!stage.empty()) {
            result += " (" + object + ")";
        } else {
            result += object;
        }
    }
    if (!result.empty()) {
        result += ": ";
    }
    result += message;
    return result;
}

scrub_error_code_e
ScrubExc::getErrorCode() const
{
    return error_code;
}

std::string const&
ScrubExc::getStage() const
{
    return stage;
}

std::string const&
ScrubExc::getObject() const
{
    return object;
}

std::string const&
ScrubExc::getMessageDetail() const
{
    return message;
}
