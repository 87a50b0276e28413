#pragma once

#ifndef FASTXFER_VERSION
#define FASTXFER_VERSION "0.0.0"
#endif

namespace fastxfer {

inline const char *version() {
    return FASTXFER_VERSION;
}

} // namespace fastxfer
