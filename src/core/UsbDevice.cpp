#include "UsbDevice.hpp"
#include "Logger.hpp"
#include <usb-audio/Constants.hpp>
#include <cstdio>

namespace usb_audio {

namespace {

std::string hex4(uint16_t value) {
    char buffer[5];
    snprintf(buffer, sizeof(buffer), "%04x", value);
    return buffer;
}

}

class UsbDevice::Private {
public:
    libusb_device* device{nullptr};
    libusb_device_descriptor descriptor{};
    bool hasDescriptor{false};

    mutable bool stringsRead{false};
    mutable std::optional<std::string> manufacturer;
    mutable std::optional<std::string> product;
    mutable std::optional<std::string> serial;

    std::optional<std::string> getStringDescriptor(libusb_device_handle* handle, uint8_t index) const {
        if (!handle || index == 0) return std::nullopt;

        unsigned char buffer[MAX_STRING_LENGTH];
        int ret = libusb_get_string_descriptor_ascii(handle, index, buffer, sizeof(buffer));
        if (ret <= 0) return std::nullopt;
        return std::string(reinterpret_cast<char*>(buffer), ret);
    }

    void readStrings() const {
        if (stringsRead || !hasDescriptor) return;
        stringsRead = true;

        libusb_device_handle* handle = nullptr;
        int ret = libusb_open(device, &handle);
        if (ret != LIBUSB_SUCCESS) {
            LOG_DEBUG("Cannot open " + hex4(descriptor.idVendor) + ":" + hex4(descriptor.idProduct) +
                      " for string descriptors: " + libusb_error_name(ret));
            return;
        }

        manufacturer = getStringDescriptor(handle, descriptor.iManufacturer);
        product = getStringDescriptor(handle, descriptor.iProduct);
        serial = getStringDescriptor(handle, descriptor.iSerialNumber);
        libusb_close(handle);
    }
};

UsbDevice::UsbDevice(libusb_device* device)
    : d(std::make_unique<Private>()) {
    d->device = device;
    libusb_ref_device(device);

    int ret = libusb_get_device_descriptor(device, &d->descriptor);
    d->hasDescriptor = (ret == LIBUSB_SUCCESS);
    if (!d->hasDescriptor) {
        LOG_WARNING(std::string("Failed to read device descriptor: ") + libusb_error_name(ret));
    }
}

UsbDevice::~UsbDevice() {
    if (d->device) {
        libusb_unref_device(d->device);
    }
}

UsbDeviceInfo UsbDevice::info() const {
    UsbDeviceInfo info;
    info.busNumber = libusb_get_bus_number(d->device);
    info.deviceNumber = libusb_get_device_address(d->device);
    info.vendorId = hex4(d->descriptor.idVendor);
    info.productId = hex4(d->descriptor.idProduct);

    d->readStrings();
    info.serial = d->serial;
    info.productName = d->product;
    return info;
}

std::string UsbDevice::key() const {
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%04x:%04x:%03d:%03d",
             d->descriptor.idVendor, d->descriptor.idProduct,
             static_cast<int>(libusb_get_bus_number(d->device)),
             static_cast<int>(libusb_get_device_address(d->device)));
    return buffer;
}

std::string UsbDevice::description() const {
    d->readStrings();

    std::string text;
    if (d->manufacturer) text += *d->manufacturer;
    if (d->product) text += (text.empty() ? "" : " ") + *d->product;

    if (text.empty()) {
        text = "Unknown Device";
    }
    return text;
}

std::optional<std::string> UsbDevice::portPath() const {
    uint8_t ports[8];
    int depth = libusb_get_port_numbers(d->device, ports, sizeof(ports));
    if (depth <= 0) {
        return std::nullopt;
    }

    std::string path = std::to_string(libusb_get_bus_number(d->device)) + "-";
    for (int i = 0; i < depth; ++i) {
        if (i > 0) path += ".";
        path += std::to_string(ports[i]);
    }
    return path;
}

libusb_device* UsbDevice::nativeDevice() const {
    return d->device;
}

} // namespace usb_audio
