#pragma once
#include <usb-audio/Types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace usb_audio {

struct StatusSnapshot {
    std::string generatedAt;
    std::string streamHost;
    int streamPort{0};
    std::optional<std::string> hostAddress;
    std::vector<StreamProcess> streams;
};

// Renders the active-stream report and persists it for `--status`.
class StatusReporter {
public:
    static std::string formatTable(const std::vector<StreamProcess>& streams);
    static std::string remoteAccessHint(const std::string& streamHost,
                                        const std::optional<std::string>& hostAddress);

    static bool writeStatusFile(const std::string& filename, const StatusSnapshot& snapshot);
    static std::optional<StatusSnapshot> readStatusFile(const std::string& filename);

    // First non-loopback IPv4 address of this host.
    static std::optional<std::string> primaryIPv4Address();
};

}
