#include "CaptureEnumerator.hpp"
#include "Logger.hpp"
#include "RuleStore.hpp"
#include "SystemQuery.hpp"
#include "TopologyResolver.hpp"
#include <QDir>
#include <QFile>
#include <algorithm>
#include <cctype>

namespace usb_audio {

namespace {

QString readText(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return {};
    }
    return QString::fromUtf8(file.readAll());
}

}

class CaptureEnumerator::Private {
public:
    EnumeratorOptions options;
    const SystemQuery& query;
    const RuleStore* rules;
    const TopologyResolver* resolver;

    Private(const EnumeratorOptions& o, const SystemQuery& q,
            const RuleStore* r, const TopologyResolver* t)
        : options(o), query(q), rules(r), resolver(t) {}

    QString cardDirectory(int card) const {
        return QDir(options.asoundRoot).filePath(QStringLiteral("card%1").arg(card));
    }

    std::vector<int> captureDirectories(int card) const {
        QDir dir(cardDirectory(card));
        const QStringList entries = dir.entryList(
            {QStringLiteral("pcm*c")}, QDir::Dirs | QDir::NoDotAndDotDot);

        std::vector<int> indices;
        for (const QString& entry : entries) {
            if (auto index = parsers::captureDirectoryIndex(entry)) {
                indices.push_back(*index);
            }
        }
        std::sort(indices.begin(), indices.end());
        return indices;
    }

    const CaptureEntry* findCaptureEntry(const std::vector<CaptureEntry>& listing,
                                         const CardEntry& card) const {
        for (const auto& entry : listing) {
            if (entry.cardIndex == card.index || entry.cardId == card.id) {
                return &entry;
            }
        }
        return nullptr;
    }

    // usbbus holds "BBB/DDD"; some kernels expose a separate usbdev file.
    std::optional<UsbDeviceInfo> readUsbAttributes(int card) const {
        const QString dir = cardDirectory(card);
        auto ids = parsers::parseUsbId(readText(dir + QStringLiteral("/usbid")));
        if (!ids) {
            return std::nullopt;
        }

        UsbDeviceInfo info;
        info.vendorId = ids->first;
        info.productId = ids->second;

        QString busText = readText(dir + QStringLiteral("/usbbus")).trimmed();
        if (busText.contains('/')) {
            info.busNumber = parsers::parseDecimal(busText.section('/', 0, 0)).value_or(0);
            info.deviceNumber = parsers::parseDecimal(busText.section('/', 1, 1)).value_or(0);
        } else {
            info.busNumber = parsers::parseDecimal(busText).value_or(0);
            info.deviceNumber = parsers::parseDecimal(
                readText(dir + QStringLiteral("/usbdev"))).value_or(0);
        }
        return info;
    }

    // Basic rules never look at the port, so skip the udevadm lookup for them.
    bool needsPort(const std::string& vendorId, const std::string& productId) const {
        for (const auto& rule : rules->findConflicts(vendorId, productId)) {
            if (rule.matchMode != MatchMode::Basic) {
                return true;
            }
        }
        return false;
    }

    void resolveFriendlyName(CaptureDevice& device) const {
        if (!rules || !device.usb) {
            return;
        }

        RuleMatchInput input;
        input.vendorId = device.usb->vendorId;
        input.productId = device.usb->productId;
        if (resolver && needsPort(input.vendorId, input.productId)) {
            if (auto identity = resolver->resolvePort(device.usb->busNumber, device.usb->deviceNumber)) {
                input.devicePath = identity->canonicalNodePath.empty()
                    ? identity->portPath : identity->canonicalNodePath;
            }
        }
        if (input.devicePath.empty() && device.usbPath) {
            input.devicePath = *device.usbPath;
        }

        if (auto rule = rules->match(input)) {
            device.friendlyName = rule->friendlyName;
            device.mapped = true;
        }
    }
};

CaptureEnumerator::CaptureEnumerator(const EnumeratorOptions& options,
                                     const SystemQuery& query,
                                     const RuleStore* rules,
                                     const TopologyResolver* resolver)
    : d(std::make_unique<Private>(options, query, rules, resolver)) {
}

CaptureEnumerator::~CaptureEnumerator() = default;

std::vector<CardEntry> CaptureEnumerator::readCardList() const {
    const QString cardsFile = QDir(d->options.asoundRoot).filePath(QStringLiteral("cards"));
    QFile file(cardsFile);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        LOG_ERROR("Cannot access " + cardsFile.toStdString() + ". Is ALSA installed properly?");
        return {};
    }
    return parsers::parseCardList(QString::fromUtf8(file.readAll()));
}

std::vector<CaptureDevice> CaptureEnumerator::listCaptureDevices() const {
    std::vector<CaptureDevice> devices;

    const auto cards = readCardList();
    const auto captureListing = parsers::parseCaptureList(
        d->query.run(d->options.arecordPath, {QStringLiteral("-l")}));
    if (captureListing.empty()) {
        LOG_DEBUG("Capture listing unavailable or empty, relying on pcm*c directories");
    }

    for (const auto& card : cards) {
        if (isDenylisted(card.id)) {
            LOG_INFO("Skipping system audio device: " + card.id);
            continue;
        }

        const CaptureEntry* listed = d->findCaptureEntry(captureListing, card);
        const std::vector<int> captureDirs = d->captureDirectories(card.index);
        if (!listed && captureDirs.empty()) {
            LOG_INFO("Skipping card " + std::to_string(card.index) + " [" + card.id +
                     "] - no capture device found");
            continue;
        }

        CaptureDevice device;
        device.cardNumber = card.index;
        device.cardId = card.id;
        device.description = card.description;
        device.usbPath = card.usbPath;

        if (!captureDirs.empty()) {
            device.captureDeviceIndex = captureDirs.front();
        } else if (listed) {
            device.captureDeviceIndex = listed->deviceIndex;
        }

        if (card.description.find("USB") != std::string::npos) {
            std::string info = card.description;
            auto dash = info.rfind("- ");
            if (dash != std::string::npos) {
                info = info.substr(dash + 2);
            }
            device.usbInfo = QString::fromStdString(info).trimmed().toStdString();
        }

        device.resolvedStreamName = sanitizeStreamName(card.id);
        if (device.resolvedStreamName.empty()) {
            device.resolvedStreamName = "card" + std::to_string(card.index);
            LOG_WARNING("Card id '" + card.id + "' has no usable characters, streaming as " +
                        device.resolvedStreamName);
        }
        device.endpointUrl = endpointUrl(d->options.streamHost, d->options.streamPort,
                                         device.resolvedStreamName);

        device.usb = d->readUsbAttributes(card.index);
        d->resolveFriendlyName(device);
        if (!device.mapped) {
            LOG_DEBUG("Card " + std::to_string(card.index) + " [" + card.id + "] is unmapped");
        }

        devices.push_back(device);
    }

    return devices;
}

bool CaptureEnumerator::isDenylisted(const std::string& cardId) const {
    for (const char* denied : SYSTEM_CARD_DENYLIST) {
        if (cardId == denied) {
            return true;
        }
    }
    return std::find(d->options.extraDenylist.begin(), d->options.extraDenylist.end(), cardId)
        != d->options.extraDenylist.end();
}

std::string CaptureEnumerator::sanitizeStreamName(const std::string& cardId) {
    std::string name;
    for (unsigned char c : cardId) {
        if (std::isalnum(c)) {
            name.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return name;
}

std::string CaptureEnumerator::endpointUrl(const std::string& host, int port,
                                           const std::string& streamName) {
    return std::string(STREAM_SCHEME) + "://" + host + ":" + std::to_string(port) + "/" + streamName;
}

}
