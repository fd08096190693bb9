#pragma once
#include <usb-audio/Types.hpp>
#include <libusb-1.0/libusb.h>
#include <memory>
#include <optional>
#include <string>

namespace usb_audio {

// One libusb device. String descriptors are read on first use, which needs
// permission to open the device; without it serial and product stay empty.
class UsbDevice {
public:
    explicit UsbDevice(libusb_device* device);
    ~UsbDevice();

    UsbDevice(const UsbDevice&) = delete;
    UsbDevice& operator=(const UsbDevice&) = delete;

    UsbDeviceInfo info() const;
    std::string key() const;
    std::string description() const;

    // Kernel-style port name ("3-1.4") from the port numbers libusb reports.
    std::optional<std::string> portPath() const;

    libusb_device* nativeDevice() const;

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
