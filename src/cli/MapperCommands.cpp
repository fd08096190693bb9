#include "MapperCommands.hpp"
#include "../core/CaptureEnumerator.hpp"
#include "../core/Logger.hpp"
#include "../core/OutputParsers.hpp"
#include "../core/RuleStore.hpp"
#include "../core/SystemQuery.hpp"
#include "../core/TopologyResolver.hpp"
#include <usb-audio/Constants.hpp>
#include <usb-audio/Errors.hpp>
#include <QTextStream>

namespace usb_audio {

MapperCommands::MapperCommands(const MapperContext& context, QTextStream& out)
    : m_context(context)
    , m_out(out) {
}

int MapperCommands::createMapping(const MappingRequest& request) {
    if (request.deviceName.empty() || request.vendorId.empty() ||
        request.productId.empty() || request.friendlyName.empty()) {
        throw ValidationError("Device name, vendor ID, product ID, and friendly name must be "
                              "provided for non-interactive mode.");
    }

    LOG_INFO("Looking for device in current system...");
    std::optional<std::string> cardUsbPath;
    if (auto card = findCard(m_context.enumerator.readCardList(), request.deviceName)) {
        LOG_INFO("Found potential matching card: " + std::to_string(card->index) + " [" + card->id + "]");
        cardUsbPath = card->usbPath;
        if (cardUsbPath) {
            LOG_INFO("Found actual USB path: " + *cardUsbPath);
        }
    } else {
        LOG_INFO("No sound card named " + request.deviceName + " is present");
    }

    std::optional<std::string> port = request.usbPort;
    if (port && !RuleStore::normalizePortPattern(*port)) {
        LOG_WARNING("Provided USB port path '" + *port + "' appears invalid. Looking for alternatives.");
        port.reset();
    }
    if (!port && cardUsbPath) {
        port = cardUsbPath;
    }

    auto result = m_context.rules.addRule(request.vendorId, request.productId, port,
                                          request.matchMode, request.friendlyName,
                                          request.deviceName);

    m_out << "Rule written to " << QString::fromStdString(m_context.rules.rulesFile()) << "\n";
    m_out << QString::fromStdString(RuleStore::formatRuleLine(result.rule)) << "\n";
    m_out.flush();

    if (!reloadRules()) {
        return ExitCodes::FAILURE;
    }

    m_out << "Sound card mapping created successfully.\n"
          << "Remember to reboot for changes to take effect.\n";
    m_out.flush();
    return ExitCodes::OK;
}

int MapperCommands::runPortTest(const std::vector<UsbDeviceInfo>& devices) {
    LOG_INFO("Testing USB port detection...");
    if (devices.empty()) {
        LOG_WARNING("No USB devices found during test.");
        return ExitCodes::FAILURE;
    }

    int successCount = 0;
    int totalCount = 0;
    for (const auto& device : devices) {
        ++totalCount;
        QString label = QStringLiteral("Device on Bus %1 Device %2 (%3:%4)")
            .arg(device.busNumber)
            .arg(device.deviceNumber)
            .arg(QString::fromStdString(device.vendorId), QString::fromStdString(device.productId));

        auto identity = m_context.resolver.resolvePort(device.busNumber, device.deviceNumber);
        if (identity && identity->hasTopology()) {
            ++successCount;
            m_out << label << ": Port path = " << QString::fromStdString(identity->portPath)
                  << " [" << toString(identity->source) << "]\n";
        } else {
            m_out << label << ": Could not determine port path\n";
        }
    }

    m_out << "\nPort detection test results: " << successCount << " of " << totalCount
          << " devices mapped successfully.\n";
    m_out.flush();

    if (successCount == 0) {
        LOG_WARNING("Port detection test failed. No port paths could be determined.");
        return ExitCodes::FAILURE;
    }
    if (successCount < totalCount) {
        LOG_WARNING("Port detection partially successful. Some devices could not be mapped.");
        return ExitCodes::PARTIAL;
    }
    LOG_INFO("Port detection test successful! All device ports were mapped.");
    return ExitCodes::OK;
}

bool MapperCommands::reloadRules() {
    LOG_INFO("Reloading udev rules...");
    if (!m_context.query.execute(m_context.udevadmPath,
                                 {QStringLiteral("control"), QStringLiteral("--reload-rules")})) {
        LOG_ERROR("Failed to reload udev rules. The rule was written; reload manually.");
        return false;
    }
    LOG_INFO("Rules reloaded successfully.");
    return true;
}

std::optional<CardEntry> MapperCommands::findCard(const std::vector<CardEntry>& cards,
                                                  const std::string& deviceName) {
    if (deviceName.empty()) {
        return std::nullopt;
    }
    for (const auto& card : cards) {
        if (card.id == deviceName) {
            return card;
        }
    }
    for (const auto& card : cards) {
        if (card.id.find(deviceName) != std::string::npos) {
            return card;
        }
    }
    return std::nullopt;
}

}
