#pragma once

#define DRISHTI_VERSION "0.4.1"
#define DRISHTI_REPORT_FORMAT_MAJOR 1
#define DRISHTI_REPORT_FORMAT_MINOR 0

namespace drishti {
namespace version {

inline bool report_format_compatible(int major, int minor) {
    // Major must match; a newer reader accepts older minor revisions
    return major == DRISHTI_REPORT_FORMAT_MAJOR &&
           minor <= DRISHTI_REPORT_FORMAT_MINOR;
}

} // namespace version
} // namespace drishti
