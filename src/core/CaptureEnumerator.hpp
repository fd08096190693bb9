#pragma once
#include <usb-audio/Types.hpp>
#include <usb-audio/Constants.hpp>
#include "OutputParsers.hpp"
#include <QString>
#include <memory>
#include <string>
#include <vector>

namespace usb_audio {

class SystemQuery;
class RuleStore;
class TopologyResolver;

struct EnumeratorOptions {
    QString asoundRoot{QString::fromLatin1(DEFAULT_ASOUND_ROOT)};
    QString arecordPath{QStringLiteral("arecord")};
    std::string streamHost{"localhost"};
    int streamPort{DEFAULT_STREAM_PORT};
    std::vector<std::string> extraDenylist;
};

// Lists the sound cards that can capture audio and works out the stream
// each one should feed. Rule store and resolver are optional; without them
// every device is reported unmapped.
class CaptureEnumerator {
public:
    CaptureEnumerator(const EnumeratorOptions& options,
                      const SystemQuery& query,
                      const RuleStore* rules = nullptr,
                      const TopologyResolver* resolver = nullptr);
    ~CaptureEnumerator();

    std::vector<CaptureDevice> listCaptureDevices() const;

    std::vector<CardEntry> readCardList() const;
    bool isDenylisted(const std::string& cardId) const;

    static std::string sanitizeStreamName(const std::string& cardId);
    static std::string endpointUrl(const std::string& host, int port, const std::string& streamName);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
