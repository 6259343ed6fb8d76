#include "core/errors.h"

namespace crt
{
const char* ErrorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::None:           return "ok";
    case ErrorKind::Initialization: return "initialization error";
    case ErrorKind::NoMonitorFound: return "no monitor found";
    case ErrorKind::ResourceLimit:  return "resource limit";
    case ErrorKind::DeviceLost:     return "device lost";
    }
    return "unknown error";
}

std::string FormatError(const Error& err)
{
    std::string out = ErrorKindName(err.kind);
    if (!err.resource.empty())
        out += " (" + err.resource + ")";
    if (!err.message.empty())
        out += ": " + err.message;
    return out;
}
} // namespace crt
