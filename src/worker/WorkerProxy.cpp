#include "wrapmgr/worker/WorkerProxy.h"

namespace wrapmgr {
namespace worker {

const char* StartErrorName(StartError e) {
    switch (e) {
        case StartError::kNone: return "none";
        case StartError::kTwoFactorRequired: return "two_factor_required";
        case StartError::kAuthFailed: return "auth_failed";
        case StartError::kUnavailable: return "unavailable";
    }
    return "unknown";
}

} // namespace worker
} // namespace wrapmgr
