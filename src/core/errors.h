// Error taxonomy shared by the core, the native backend and the host bridge.
//
// Fallible operations return `bool` and fill an `Error` out-parameter.
// Writes outside a console grid are not errors (they are silent no-ops).

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace crt
{
enum class ErrorKind : std::uint8_t
{
    None = 0,
    Initialization, // context/surface/shader/framebuffer/font creation failed
    NoMonitorFound, // fullscreen requested but no display is enumerable
    ResourceLimit,  // e.g. bridging more consoles than a host engine supports
    DeviceLost,     // GPU device invalidated mid-session
};

struct Error
{
    ErrorKind   kind = ErrorKind::None;
    std::string resource; // "context", "monitor", "shader", "framebuffer", "font", ...
    std::string message;

    bool Ok() const { return kind == ErrorKind::None; }

    void Clear()
    {
        kind = ErrorKind::None;
        resource.clear();
        message.clear();
    }

    // Fills the error and returns false so call sites can `return err.Set(...)`.
    bool Set(ErrorKind k, std::string res, std::string msg)
    {
        kind = k;
        resource = std::move(res);
        message = std::move(msg);
        return false;
    }
};

const char* ErrorKindName(ErrorKind kind);

// "<kind> (<resource>): <message>"
std::string FormatError(const Error& err);
} // namespace crt
