#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "text/whitespace_classifier.h"

enum class LocaleMode : uint8_t {
    Ascii,
    Unicode
};

// The three levels consulted, highest precedence first. An unset level is
// std::nullopt; an empty string is treated the same as unset.
struct LocaleEnvironment {
    std::optional<std::string> overrideValue;  // LC_ALL
    std::optional<std::string> categoryValue;  // LC_CTYPE
    std::optional<std::string> generalValue;   // LANG

    static LocaleEnvironment fromProcess();
};

class LocaleResolver {
public:
    // Process-wide mode. Computed on first use and cached; concurrent first
    // calls may each compute it, which is harmless because resolution is pure.
    static LocaleMode resolveMode();

    static LocaleMode resolveFrom(const LocaleEnvironment& env);

    // Case-insensitive search for "utf-8" or "utf8".
    static bool containsUtf8(std::string_view value);

    // Pins the answer of resolveMode() without touching the real environment.
    static void setOverride(LocaleMode mode);
    static void clearOverride();

    // Drops the cached value so the next resolveMode() re-reads the environment.
    static void resetCache();

private:
    static constexpr uint8_t UNRESOLVED = 0;

    static uint8_t encode(LocaleMode mode) {
        return static_cast<uint8_t>(mode) + 1;
    }
    static LocaleMode decode(uint8_t value) {
        return static_cast<LocaleMode>(value - 1);
    }

    static std::atomic<uint8_t> cached_;
    static std::atomic<uint8_t> override_;
};

// Byte-oriented locales count with the C-locale classifier, UTF-8 ones decode.
inline WhitespaceMode whitespaceModeFor(LocaleMode mode) {
    return mode == LocaleMode::Unicode ? WhitespaceMode::Unicode : WhitespaceMode::CLocale;
}
