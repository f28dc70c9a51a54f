#include "text/locale_resolver.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

std::atomic<uint8_t> LocaleResolver::cached_{LocaleResolver::UNRESOLVED};
std::atomic<uint8_t> LocaleResolver::override_{LocaleResolver::UNRESOLVED};

namespace {

std::optional<std::string> readEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) return std::nullopt;
    return std::string(value);
}

}

LocaleEnvironment LocaleEnvironment::fromProcess() {
    LocaleEnvironment env;
    env.overrideValue = readEnv("LC_ALL");
    env.categoryValue = readEnv("LC_CTYPE");
    env.generalValue = readEnv("LANG");
    return env;
}

bool LocaleResolver::containsUtf8(std::string_view value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("utf-8") != std::string::npos ||
           lower.find("utf8") != std::string::npos;
}

LocaleMode LocaleResolver::resolveFrom(const LocaleEnvironment& env) {
    const std::optional<std::string>* levels[] = {
        &env.overrideValue,
        &env.categoryValue,
        &env.generalValue,
    };

    for (const auto* level : levels) {
        if (!level->has_value() || (*level)->empty()) continue;

        const std::string& value = **level;
        if (value == "C" || value == "POSIX") {
            return LocaleMode::Ascii;
        }
        return containsUtf8(value) ? LocaleMode::Unicode : LocaleMode::Ascii;
    }

    return LocaleMode::Ascii;
}

LocaleMode LocaleResolver::resolveMode() {
    const uint8_t pinned = override_.load(std::memory_order_relaxed);
    if (pinned != UNRESOLVED) return decode(pinned);

    uint8_t cached = cached_.load(std::memory_order_relaxed);
    if (cached == UNRESOLVED) {
        cached = encode(resolveFrom(LocaleEnvironment::fromProcess()));
        cached_.store(cached, std::memory_order_relaxed);
    }
    return decode(cached);
}

void LocaleResolver::setOverride(LocaleMode mode) {
    override_.store(encode(mode), std::memory_order_relaxed);
}

void LocaleResolver::clearOverride() {
    override_.store(UNRESOLVED, std::memory_order_relaxed);
}

void LocaleResolver::resetCache() {
    cached_.store(UNRESOLVED, std::memory_order_relaxed);
}
