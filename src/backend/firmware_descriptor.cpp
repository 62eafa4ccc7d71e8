#include "backend/firmware_descriptor.hpp"

namespace fwsync {

const char* ToString(UpdateStatus status) {
    switch (status) {
        case UpdateStatus::Downloading: return "DOWNLOADING";
        case UpdateStatus::Downloaded:  return "DOWNLOADED";
        case UpdateStatus::Verified:    return "VERIFIED";
        case UpdateStatus::Updating:    return "UPDATING";
        case UpdateStatus::Updated:     return "UPDATED";
        case UpdateStatus::Failed:      return "FAILED";
    }
    return "FAILED";
}

} // namespace fwsync
