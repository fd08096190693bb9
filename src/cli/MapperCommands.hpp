#pragma once
#include <usb-audio/Types.hpp>
#include <QString>
#include <optional>
#include <string>
#include <vector>

class QTextStream;

namespace usb_audio {

class CaptureEnumerator;
class RuleStore;
class SystemQuery;
class TopologyResolver;
struct CardEntry;

struct MapperContext {
    RuleStore& rules;
    const SystemQuery& query;
    const TopologyResolver& resolver;
    const CaptureEnumerator& enumerator;
    QString udevadmPath{QStringLiteral("udevadm")};
};

struct MappingRequest {
    std::string deviceName;
    std::string vendorId;
    std::string productId;
    std::optional<std::string> usbPort;
    std::string friendlyName;
    MatchMode matchMode{MatchMode::PortPattern};
};

// Non-interactive rule authoring and the port-detection test.
class MapperCommands {
public:
    MapperCommands(const MapperContext& context, QTextStream& out);

    // Appends one rule and reloads the device manager. Throws ValidationError
    // on bad input and StoreWriteError when the rules file cannot be written.
    int createMapping(const MappingRequest& request);

    // Resolves every device and reports how many got a topology-derived port.
    // Never writes a rule.
    int runPortTest(const std::vector<UsbDeviceInfo>& devices);

    // `udevadm control --reload-rules`
    bool reloadRules();

    // Card whose id equals the name, otherwise the first whose id contains it.
    static std::optional<CardEntry> findCard(const std::vector<CardEntry>& cards,
                                             const std::string& deviceName);

private:
    const MapperContext& m_context;
    QTextStream& m_out;
};

}
