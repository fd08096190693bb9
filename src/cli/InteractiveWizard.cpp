#include "InteractiveWizard.hpp"
#include "../core/CaptureEnumerator.hpp"
#include "../core/Logger.hpp"
#include "../core/OutputParsers.hpp"
#include "../core/RuleStore.hpp"
#include "../core/TopologyResolver.hpp"
#include <usb-audio/Constants.hpp>
#include <usb-audio/Errors.hpp>
#include <QTextStream>
#include <algorithm>
#include <cctype>

namespace usb_audio {

InteractiveWizard::InteractiveWizard(const MapperContext& context, QTextStream& in, QTextStream& out)
    : m_context(context)
    , m_in(in)
    , m_out(out) {
}

QString InteractiveWizard::prompt(const QString& question) {
    if (!question.isEmpty()) {
        m_out << question << "\n";
    }
    m_out.flush();
    return m_in.readLine().trimmed();
}

int InteractiveWizard::promptNumber(const QString& question) {
    QString answer = prompt(question);
    auto number = parsers::parseDecimal(answer);
    if (!number) {
        throw ValidationError("Invalid input '" + answer.toStdString() + "'. Please enter a number.");
    }
    return *number;
}

void InteractiveWizard::showCards(const std::vector<CardEntry>& cards) {
    m_out << "Sound cards:\n";
    for (const auto& card : cards) {
        m_out << QStringLiteral("%1 [%2]: %3\n")
                     .arg(card.index, 2)
                     .arg(QString::fromStdString(card.id), -15)
                     .arg(QString::fromStdString(card.description));
        if (card.usbPath) {
            m_out << "     Path: " << QString::fromStdString(*card.usbPath) << "\n";
        }
    }
    m_out << "\n";
}

void InteractiveWizard::showUsbDevices(const std::vector<UsbDeviceInfo>& usbDevices) {
    int position = 1;
    for (const auto& device : usbDevices) {
        m_out << QStringLiteral("%1. Bus %2 Device %3: ID %4:%5 %6\n")
                     .arg(position++, 2)
                     .arg(device.busNumber, 3, 10, QLatin1Char('0'))
                     .arg(device.deviceNumber, 3, 10, QLatin1Char('0'))
                     .arg(QString::fromStdString(device.vendorId))
                     .arg(QString::fromStdString(device.productId))
                     .arg(QString::fromStdString(device.productName.value_or(std::string())));
    }
}

void InteractiveWizard::showExistingRules() {
    std::string contents = m_context.rules.rawContents();
    if (contents.empty()) {
        m_out << "No existing rules file found. A new one will be created.\n";
        return;
    }
    m_out << "Existing rules in " << QString::fromStdString(m_context.rules.rulesFile()) << ":\n"
          << QString::fromStdString(contents) << "\n";
}

int InteractiveWizard::run(const std::vector<UsbDeviceInfo>& usbDevices) {
    m_out << "===== USB Sound Card Mapper =====\n"
          << "This wizard will guide you through mapping your USB sound card to a consistent name.\n\n";

    const auto cards = m_context.enumerator.readCardList();
    if (cards.empty()) {
        throw ValidationError("No sound cards found.");
    }
    showCards(cards);

    const int cardNumber = promptNumber(QStringLiteral("Enter the number of the sound card you want to map:"));
    auto card = std::find_if(cards.begin(), cards.end(),
                             [cardNumber](const CardEntry& entry) { return entry.index == cardNumber; });
    if (card == cards.end()) {
        throw ValidationError("No sound card found with number " + std::to_string(cardNumber) + ".");
    }
    m_out << "Selected card: " << card->index << " - " << QString::fromStdString(card->id) << "\n";
    if (card->usbPath) {
        LOG_INFO("Found actual USB path from card info: " + *card->usbPath);
    }

    if (usbDevices.empty()) {
        throw ValidationError("No USB devices found.");
    }
    m_out << "\nSelect the USB device that corresponds to this sound card:\n";
    showUsbDevices(usbDevices);
    const int usbNumber = promptNumber(QString());
    if (usbNumber < 1 || usbNumber > static_cast<int>(usbDevices.size())) {
        throw ValidationError("No USB device found at position " + std::to_string(usbNumber) + ".");
    }
    const UsbDeviceInfo& usb = usbDevices[static_cast<size_t>(usbNumber - 1)];
    m_out << "Vendor ID: " << QString::fromStdString(usb.vendorId) << "\n"
          << "Product ID: " << QString::fromStdString(usb.productId) << "\n"
          << "Bus: " << usb.busNumber << ", Device: " << usb.deviceNumber << "\n";

    // The card's own USB path is what the kernel will match against, so it
    // wins over anything the resolver finds.
    std::optional<std::string> port;
    if (card->usbPath) {
        port = card->usbPath;
        m_out << "Using USB path from card info: " << QString::fromStdString(*port) << "\n";
    } else if (auto identity = m_context.resolver.resolvePort(usb.busNumber, usb.deviceNumber)) {
        if (identity->hasTopology()) {
            port = identity->portPath;
            m_out << "USB physical port: " << QString::fromStdString(*port) << "\n";
        } else {
            m_out << "Could not determine physical USB port (identifier "
                  << QString::fromStdString(identity->identifier())
                  << "). Using device ID only for mapping.\n";
        }
    }

    QString friendly = prompt(QStringLiteral(
        "\nEnter a friendly name for the sound card (lowercase letters, numbers, and hyphens only):"));
    std::string friendlyName = friendly.toStdString();
    if (friendlyName.empty()) {
        friendlyName = defaultFriendlyName(card->id);
        LOG_INFO("Using default name: " + friendlyName);
    }
    if (!RuleStore::isValidFriendlyName(friendlyName)) {
        throw ValidationError("Invalid friendly name. Use only lowercase letters, numbers, and hyphens.");
    }

    m_out << "\n";
    showExistingRules();

    const int ruleType = promptNumber(QStringLiteral(
        "\nReady to create udev rule. Choose rule type:\n"
        "1. Basic rule (by vendor and product ID only)\n"
        "2. Enhanced rule (by vendor, product ID, and USB port path) - RECOMMENDED\n"
        "3. Strict rule (require exact match of vendor, product, and port)"));

    MatchMode mode;
    switch (ruleType) {
        case 1: mode = MatchMode::Basic; break;
        case 2: mode = MatchMode::PortPattern; break;
        case 3: mode = MatchMode::ExactPort; break;
        default:
            throw ValidationError("Invalid rule type selection.");
    }
    if (mode == MatchMode::ExactPort && !port) {
        throw ValidationError("Cannot create strict rule without reliable port information.");
    }

    auto result = m_context.rules.addRule(usb.vendorId, usb.productId, port, mode,
                                          friendlyName, card->id);
    if (result.degraded) {
        m_out << "Requested rule type was not possible; created a "
              << toString(result.rule.matchMode) << " rule instead.\n";
    }
    m_out << QString::fromStdString(RuleStore::formatRuleLine(result.rule)) << "\n";
    m_out.flush();

    MapperCommands commands(m_context, m_out);
    if (!commands.reloadRules()) {
        return ExitCodes::FAILURE;
    }

    m_out << "Sound card mapping created successfully.\n"
          << "A reboot is recommended for the changes to take effect.\n";
    m_out.flush();
    return ExitCodes::OK;
}

std::string InteractiveWizard::defaultFriendlyName(const std::string& cardId) {
    std::string name;
    for (unsigned char c : cardId) {
        name.push_back(c == ' ' ? '-' : static_cast<char>(std::tolower(c)));
    }
    return name;
}

}
