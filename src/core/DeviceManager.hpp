#pragma once
#include <QObject>
#include <memory>
#include <vector>
#include <string>

struct libusb_context;
struct libusb_device;

namespace usb_audio {

class UsbDevice;

// Tracks the USB devices present on the host. Uses libusb hot-plug events
// when the platform supports them and falls back to polling otherwise.
class DeviceManager : public QObject {
    Q_OBJECT

public:
    explicit DeviceManager(QObject* parent = nullptr);
    ~DeviceManager();

    bool isAvailable() const;
    bool hotplugSupported() const;

    // Begins emitting deviceAdded/deviceRemoved as devices come and go.
    void startMonitoring();
    void stopMonitoring();

    std::vector<std::shared_ptr<UsbDevice>> getConnectedDevices() const;

public slots:
    void pollDevices();

signals:
    void deviceAdded(std::shared_ptr<usb_audio::UsbDevice> device);
    void deviceRemoved(std::shared_ptr<usb_audio::UsbDevice> device);
    void devicesChanged();
    void error(const std::string& message);

private:
    void setupHotplugSupport();
    void pumpEvents();
    bool handleDeviceArrival(libusb_device* device);
    bool handleDeviceRemoval(libusb_device* device);
    std::string getDeviceIdentifier(libusb_device* device) const;

    class Private;
    std::unique_ptr<Private> d;
};

}
