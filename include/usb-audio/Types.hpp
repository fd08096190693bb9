#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace usb_audio {

// A USB device as seen on one enumeration; never persisted.
struct UsbDeviceInfo {
    int busNumber{0};
    int deviceNumber{0};
    std::string vendorId;   // 4 lowercase hex digits
    std::string productId;  // 4 lowercase hex digits
    std::optional<std::string> serial;
    std::optional<std::string> productName;
};

// Which lookup produced PortIdentity::portPath.
enum class PortSource {
    Devpath,        // devpath attribute of the topology node
    CanonicalPath,  // trailing <bus>-<port>[.<port>]* of the resolved node path
    NodeName,       // leaf directory name of the resolved node path
    DeviceManager,  // udevadm reported path or properties
    Synthesized     // usb-bus<N>-port<M>
};

struct PortIdentity {
    std::string portPath;
    std::string uniquenessToken;
    PortSource source{PortSource::Synthesized};
    std::optional<std::string> serial;
    std::optional<std::string> productName;
    std::string canonicalNodePath;

    std::string identifier() const { return portPath + "-" + uniquenessToken; }
    bool hasTopology() const { return source != PortSource::Synthesized; }
};

enum class MatchMode {
    Basic,
    PortPattern,
    ExactPort
};

struct MappingRule {
    std::string vendorId;
    std::string productId;
    std::optional<std::string> portPattern;
    MatchMode matchMode{MatchMode::Basic};
    std::string friendlyName;
    std::chrono::system_clock::time_point createdAt{};
    std::string uniquenessTag;
    std::string deviceName;  // annotation only
};

struct CaptureDevice {
    int cardNumber{0};
    std::string cardId;
    std::string description;
    std::optional<std::string> usbInfo;
    int captureDeviceIndex{0};
    std::string resolvedStreamName;
    std::string endpointUrl;

    std::optional<UsbDeviceInfo> usb;
    std::optional<std::string> usbPath;   // usb-... token from the card list
    std::optional<std::string> friendlyName;
    bool mapped{false};
};

enum class StreamState {
    Starting,
    Running,
    Stopping,
    Dead
};

struct StreamProcess {
    std::string capturedBy;  // CaptureDevice::cardId
    long long pid{0};
    std::string endpointUrl;
    std::chrono::system_clock::time_point startedAt{};
    StreamState state{StreamState::Starting};
    int cardNumber{0};
    int captureDeviceIndex{0};
    std::string usbDescription;
};

const char* toString(PortSource source);
const char* toString(MatchMode mode);
const char* toString(StreamState state);

}
