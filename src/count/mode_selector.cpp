#include "count/mode_selector.h"

#include <stdexcept>
#include <string>

CountMode ModeSelector::selectMode(bool wantLines, bool wantWords, bool wantBytes, bool wantChars) {
    if (wantWords || wantChars) return CountMode::Full;
    if (wantLines && wantBytes) return CountMode::LinesBytes;
    if (wantLines) return CountMode::LinesOnly;
    if (wantBytes) return CountMode::BytesOnly;
    return CountMode::Full;
}

bool ModeSelector::canUseSizeMetadata(const struct stat& st) {
    return S_ISREG(st.st_mode);
}

void ModeSelector::validate(CountMode mode) {
    switch (mode) {
        case CountMode::BytesOnly:
        case CountMode::LinesOnly:
        case CountMode::LinesBytes:
        case CountMode::Full:
            return;
    }
    throw std::invalid_argument("invalid CountMode " + std::to_string(static_cast<int>(mode)));
}

const char* ModeSelector::toString(CountMode mode) {
    switch (mode) {
        case CountMode::BytesOnly:  return "bytes";
        case CountMode::LinesOnly:  return "lines";
        case CountMode::LinesBytes: return "lines+bytes";
        case CountMode::Full:       return "full";
    }
    return "invalid";
}
