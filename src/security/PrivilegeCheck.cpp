#include "PrivilegeCheck.hpp"
#include <usb-audio/Errors.hpp>
#include <unistd.h>

namespace usb_audio {

bool runningAsRoot() {
    return ::geteuid() == 0;
}

void requireRoot(const std::string& action) {
    if (!runningAsRoot()) {
        throw PrivilegeError(action + " must be run as root. Please use sudo.");
    }
}

}
