#pragma once

#include <dlib/logger.h>

namespace annum {
    namespace core {
        extern dlib::logger dlog;///< the "annum.core" logger shared by the core library
    }
}
