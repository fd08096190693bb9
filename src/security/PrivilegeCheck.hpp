#pragma once
#include <string>

namespace usb_audio {

bool runningAsRoot();

// Throws PrivilegeError naming the action when not running as root.
void requireRoot(const std::string& action);

}
