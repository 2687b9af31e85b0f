#include "radariq/errors.hpp"

#include <cstring>

namespace radariq {

std::string errnoMessage(int errnum) {
    char buf[256];
    // GNU strerror_r may return a static string instead of filling buf
    const char* text = strerror_r(errnum, buf, sizeof(buf));
    return std::string(text);
}

}  // namespace radariq
