#pragma once

#include <sys/stat.h>

#include "count/counts.h"

class ModeSelector {
public:
    // Cheapest mode that still produces every requested field. Nothing
    // requested selects the default lines/words/bytes set, i.e. Full.
    static CountMode selectMode(bool wantLines, bool wantWords, bool wantBytes, bool wantChars);

    // st_size is only a byte count for regular files; pipes, sockets and
    // character devices report 0 or a buffer size.
    static bool canUseSizeMetadata(const struct stat& st);

    // Throws std::invalid_argument when `mode` is not a CountMode enumerator.
    static void validate(CountMode mode);

    static const char* toString(CountMode mode);
};
