#pragma once
#include <usb-audio/Types.hpp>
#include <usb-audio/Constants.hpp>
#include <QString>
#include <memory>
#include <optional>
#include <string>

namespace usb_audio {

class SystemQuery;

struct ResolverPaths {
    QString sysfsUsbRoot{QString::fromLatin1(DEFAULT_SYSFS_USB_ROOT)};
    QString devBusUsbRoot{QStringLiteral("/dev/bus/usb")};
    QString udevadmPath{QStringLiteral("udevadm")};
};

// Derives a durable physical-port identity for a bus/device pair. Each lookup
// strategy is tried in order and the first one that yields a port path wins;
// when none does, a usb-bus<N>-port<M> path is synthesized.
class TopologyResolver {
public:
    TopologyResolver(const ResolverPaths& paths, const SystemQuery& query);
    ~TopologyResolver();

    // Empty only when busNumber or deviceNumber is absent (<= 0).
    std::optional<PortIdentity> resolvePort(int busNumber, int deviceNumber) const;

    // First SERIAL_TOKEN_LENGTH characters of the serial, otherwise a hash of
    // bus, device, product and the current high-resolution time.
    static std::string uniquenessToken(int busNumber,
                                       int deviceNumber,
                                       const std::optional<std::string>& serial,
                                       const std::optional<std::string>& productName);

    static std::string synthesizedPortPath(int busNumber, int deviceNumber);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
