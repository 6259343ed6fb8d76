// JSON persistence for InitHints.
//
// Parsing is forgiving: defaults already in `out` are kept for missing or wrong-typed keys,
// and a file with an unknown schema_version is ignored instead of failing startup.

#pragma once

#include <string>

#include "core/init_hints.h"

namespace crt
{
constexpr int kInitHintsSchemaVersion = 1;

// Missing file: returns true and leaves `out` untouched.
bool LoadInitHints(const std::string& path, InitHints& out, std::string& err);

// Parses from a JSON string (same rules as LoadInitHints).
bool ParseInitHints(const std::string& text, InitHints& out, std::string& err);

// Atomic write (temp file + rename). The icon's pixel data is not persisted; `icon_path` is.
bool SaveInitHints(const std::string& path, const InitHints& hints, std::string& err);

std::string InitHintsToJson(const InitHints& hints);
} // namespace crt
