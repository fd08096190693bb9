#pragma once
#include "MapperCommands.hpp"
#include <usb-audio/Types.hpp>
#include <QString>
#include <vector>

class QTextStream;

namespace usb_audio {

// Guided rule authoring: pick a card, pick its USB device, name it, choose
// how strictly the rule should match the port. Bad answers throw
// ValidationError.
class InteractiveWizard {
public:
    InteractiveWizard(const MapperContext& context, QTextStream& in, QTextStream& out);

    int run(const std::vector<UsbDeviceInfo>& usbDevices);

    static std::string defaultFriendlyName(const std::string& cardId);

private:
    QString prompt(const QString& question);
    int promptNumber(const QString& question);
    void showCards(const std::vector<CardEntry>& cards);
    void showUsbDevices(const std::vector<UsbDeviceInfo>& usbDevices);
    void showExistingRules();

    const MapperContext& m_context;
    QTextStream& m_in;
    QTextStream& m_out;
};

}
