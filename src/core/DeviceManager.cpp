#include "DeviceManager.hpp"
#include "UsbDevice.hpp"
#include "Logger.hpp"
#include <usb-audio/Constants.hpp>
#include <libusb-1.0/libusb.h>
#include <QTimer>
#include <cstdio>
#include <map>
#include <mutex>
#include <set>
#include <utility>

namespace usb_audio {

class DeviceManager::Private {
public:
    libusb_context* context{nullptr};
    std::map<std::string, std::shared_ptr<UsbDevice>> devices;
    mutable std::mutex devicesMutex;
    QTimer* pollTimer{nullptr};
    QTimer* eventTimer{nullptr};
    bool hotplugSupported{false};
    bool monitoring{false};
    libusb_hotplug_callback_handle hotplugHandle{};

    // Filled by the hot-plug callback, drained after libusb returns.
    std::vector<std::pair<libusb_hotplug_event, libusb_device*>> pendingEvents;

    // libusb forbids most device I/O inside the callback, so events are
    // only queued here.
    static int LIBUSB_CALL hotplugCallback(libusb_context*,
                                           libusb_device* device,
                                           libusb_hotplug_event event,
                                           void* user_data) {
        auto self = static_cast<Private*>(user_data);
        libusb_ref_device(device);
        self->pendingEvents.emplace_back(event, device);
        return 0;
    }
};

DeviceManager::DeviceManager(QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {

    int ret = libusb_init(&d->context);
    if (ret != LIBUSB_SUCCESS) {
        LOG_ERROR(std::string("Failed to initialize libusb: ") + libusb_error_name(ret));
        d->context = nullptr;
        return;
    }

    d->pollTimer = new QTimer(this);
    connect(d->pollTimer, &QTimer::timeout, this, &DeviceManager::pollDevices);

    d->eventTimer = new QTimer(this);
    connect(d->eventTimer, &QTimer::timeout, this, &DeviceManager::pumpEvents);
}

DeviceManager::~DeviceManager() {
    stopMonitoring();

    for (auto& [event, device] : d->pendingEvents) {
        libusb_unref_device(device);
    }
    d->pendingEvents.clear();

    {
        std::lock_guard<std::mutex> lock(d->devicesMutex);
        d->devices.clear();
    }

    if (d->context) {
        libusb_exit(d->context);
        d->context = nullptr;
    }
}

bool DeviceManager::isAvailable() const {
    return d->context != nullptr;
}

bool DeviceManager::hotplugSupported() const {
    return d->hotplugSupported;
}

void DeviceManager::startMonitoring() {
    if (!d->context || d->monitoring) {
        return;
    }
    d->monitoring = true;

    pollDevices();
    setupHotplugSupport();

    if (d->hotplugSupported) {
        d->eventTimer->start(HOTPLUG_PUMP_INTERVAL);
        LOG_INFO("USB hot-plug notifications enabled");
    } else {
        d->pollTimer->start(POLLING_INTERVAL);
        LOG_INFO("USB hot-plug unavailable, polling every " +
                 std::to_string(POLLING_INTERVAL) + " ms");
    }
}

void DeviceManager::stopMonitoring() {
    if (d->pollTimer) {
        d->pollTimer->stop();
    }
    if (d->eventTimer) {
        d->eventTimer->stop();
    }
    if (d->hotplugSupported) {
        libusb_hotplug_deregister_callback(d->context, d->hotplugHandle);
        d->hotplugSupported = false;
    }
    d->monitoring = false;
}

std::vector<std::shared_ptr<UsbDevice>> DeviceManager::getConnectedDevices() const {
    std::vector<std::shared_ptr<UsbDevice>> result;
    std::lock_guard<std::mutex> lock(d->devicesMutex);

    result.reserve(d->devices.size());
    for (const auto& [_, device] : d->devices) {
        result.push_back(device);
    }

    return result;
}

void DeviceManager::setupHotplugSupport() {
    if (!libusb_has_capability(LIBUSB_CAP_HAS_HOTPLUG)) {
        return;
    }

    // The current device set was just enumerated by pollDevices(), so
    // LIBUSB_HOTPLUG_ENUMERATE is not requested.
    int result = libusb_hotplug_register_callback(
        d->context,
        static_cast<libusb_hotplug_event>(
            LIBUSB_HOTPLUG_EVENT_DEVICE_ARRIVED |
            LIBUSB_HOTPLUG_EVENT_DEVICE_LEFT),
        static_cast<libusb_hotplug_flag>(0),
        LIBUSB_HOTPLUG_MATCH_ANY,
        LIBUSB_HOTPLUG_MATCH_ANY,
        LIBUSB_HOTPLUG_MATCH_ANY,
        Private::hotplugCallback,
        d.get(),
        &d->hotplugHandle
    );

    if (result == LIBUSB_SUCCESS) {
        d->hotplugSupported = true;
    } else {
        LOG_WARNING(std::string("Failed to register hot-plug callback: ") + libusb_error_name(result));
    }
}

void DeviceManager::pumpEvents() {
    timeval zero{0, 0};
    int ret = libusb_handle_events_timeout_completed(d->context, &zero, nullptr);
    if (ret != LIBUSB_SUCCESS && ret != LIBUSB_ERROR_INTERRUPTED) {
        std::string message = std::string("libusb event handling failed: ") + libusb_error_name(ret);
        LOG_ERROR(message);
        emit error(message);
    }

    auto events = std::move(d->pendingEvents);
    d->pendingEvents.clear();

    bool changed = false;
    for (auto& [event, device] : events) {
        if (event == LIBUSB_HOTPLUG_EVENT_DEVICE_ARRIVED) {
            changed |= handleDeviceArrival(device);
        } else if (event == LIBUSB_HOTPLUG_EVENT_DEVICE_LEFT) {
            changed |= handleDeviceRemoval(device);
        }
        libusb_unref_device(device);
    }

    if (changed) {
        emit devicesChanged();
    }
}

void DeviceManager::pollDevices() {
    if (!d->context) {
        return;
    }

    libusb_device** list = nullptr;
    ssize_t count = libusb_get_device_list(d->context, &list);
    if (count < 0) {
        std::string message = std::string("Failed to get device list: ") +
                              libusb_error_name(static_cast<int>(count));
        LOG_ERROR(message);
        emit error(message);
        return;
    }

    std::set<std::string> present;
    bool changed = false;
    for (ssize_t i = 0; i < count; i++) {
        present.insert(getDeviceIdentifier(list[i]));
        changed |= handleDeviceArrival(list[i]);
    }

    std::vector<std::shared_ptr<UsbDevice>> removed;
    {
        std::lock_guard<std::mutex> lock(d->devicesMutex);
        for (auto it = d->devices.begin(); it != d->devices.end();) {
            if (present.count(it->first) == 0) {
                removed.push_back(it->second);
                it = d->devices.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& device : removed) {
        LOG_DEBUG("USB device removed: " + device->key());
        emit deviceRemoved(device);
        changed = true;
    }

    libusb_free_device_list(list, 1);

    if (changed) {
        emit devicesChanged();
    }
}

bool DeviceManager::handleDeviceArrival(libusb_device* device) {
    std::string id = getDeviceIdentifier(device);

    {
        std::lock_guard<std::mutex> lock(d->devicesMutex);
        if (d->devices.find(id) != d->devices.end()) {
            return false;
        }
    }

    auto usbDevice = std::make_shared<UsbDevice>(device);

    {
        std::lock_guard<std::mutex> lock(d->devicesMutex);
        d->devices[id] = usbDevice;
    }

    LOG_DEBUG("USB device added: " + id);
    emit deviceAdded(usbDevice);
    return true;
}

bool DeviceManager::handleDeviceRemoval(libusb_device* device) {
    std::string id = getDeviceIdentifier(device);

    std::shared_ptr<UsbDevice> removedDevice;
    {
        std::lock_guard<std::mutex> lock(d->devicesMutex);
        auto it = d->devices.find(id);
        if (it != d->devices.end()) {
            removedDevice = it->second;
            d->devices.erase(it);
        }
    }

    if (!removedDevice) {
        return false;
    }

    LOG_DEBUG("USB device removed: " + id);
    emit deviceRemoved(removedDevice);
    return true;
}

std::string DeviceManager::getDeviceIdentifier(libusb_device* device) const {
    libusb_device_descriptor desc{};
    if (libusb_get_device_descriptor(device, &desc) != LIBUSB_SUCCESS) {
        desc.idVendor = 0;
        desc.idProduct = 0;
    }

    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%04x:%04x:%03d:%03d",
             desc.idVendor, desc.idProduct,
             static_cast<int>(libusb_get_bus_number(device)),
             static_cast<int>(libusb_get_device_address(device)));
    return buffer;
}

} // namespace usb_audio
