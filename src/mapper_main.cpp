#include "cli/AppSetup.hpp"
#include "cli/InteractiveWizard.hpp"
#include "cli/MapperCommands.hpp"
#include "core/CaptureEnumerator.hpp"
#include "core/DeviceManager.hpp"
#include "core/Logger.hpp"
#include "core/RuleStore.hpp"
#include "core/SystemQuery.hpp"
#include "core/TopologyResolver.hpp"
#include "core/UsbDevice.hpp"
#include "security/PrivilegeCheck.hpp"
#include "utils/ConfigManager.hpp"
#include <usb-audio/Constants.hpp>
#include <usb-audio/Errors.hpp>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>
#include <algorithm>
#include <cstdio>

using namespace usb_audio;

namespace {

void setupCommandLineParser(QCommandLineParser& parser) {
    parser.setApplicationDescription("USB Sound Card Mapper - Create persistent names for USB sound devices");
    parser.addHelpOption();
    parser.addVersionOption();

    parser.addOption({{"i", "interactive"}, "Run in interactive mode (default)."});
    parser.addOption({{"n", "non-interactive"}, "Run in non-interactive mode (requires device, vendor, product and friendly name)."});
    parser.addOption({{"d", "device"}, "Sound card name as listed in /proc/asound/cards.", "name"});
    parser.addOption({{"v", "vendor"}, "Vendor ID (4-digit hex).", "id"});
    parser.addOption({{"p", "product"}, "Product ID (4-digit hex).", "id"});
    parser.addOption({{"u", "usb-port"}, "USB port path (recommended for multiple identical devices).", "port"});
    parser.addOption({{"f", "friendly"}, "Friendly name to assign.", "name"});
    parser.addOption({{"m", "match-mode"}, "Rule strictness: basic, pattern or exact.", "mode", "pattern"});
    parser.addOption({{"t", "test"}, "Test USB port detection on the current system."});
    parser.addOption({{"D", "debug"}, "Enable debug output."});
    parser.addOption({{"r", "rules-file"}, "Rules file to append to.", "file"});
    addCommonOptions(parser);
}

MatchMode parseMatchMode(const QString& text) {
    if (text == QLatin1String("basic")) return MatchMode::Basic;
    if (text == QLatin1String("pattern")) return MatchMode::PortPattern;
    if (text == QLatin1String("exact")) return MatchMode::ExactPort;
    throw ValidationError("Invalid match mode: " + text.toStdString() + ". Use basic, pattern or exact.");
}

std::vector<UsbDeviceInfo> enumerateUsbDevices() {
    DeviceManager manager;
    if (!manager.isAvailable()) {
        return {};
    }
    manager.pollDevices();

    std::vector<UsbDeviceInfo> devices;
    for (const auto& device : manager.getConnectedDevices()) {
        devices.push_back(device->info());
    }
    std::sort(devices.begin(), devices.end(), [](const UsbDeviceInfo& a, const UsbDeviceInfo& b) {
        return a.busNumber != b.busNumber ? a.busNumber < b.busNumber : a.deviceNumber < b.deviceNumber;
    });
    return devices;
}

std::string lowercase(const QString& text) {
    return text.trimmed().toLower().toStdString();
}

}

int main(int argc, char* argv[]) {
    try {
        QCoreApplication app(argc, argv);
        app.setApplicationName("usb-soundcard-mapper");
        app.setApplicationVersion("1.0.0");

        QCommandLineParser parser;
        setupCommandLineParser(parser);
        parser.process(app);

        Logger::instance().enableSourceInfo(false);
        Logger::instance().setSystemIdentity("usb-soundcard-mapper");

        ConfigManager config;
        if (!loadConfiguration(config, parser)) {
            return ExitCodes::FAILURE;
        }
        initializeLogger(parser, config, parser.isSet("debug"));
        LOG_DEBUG("Debug mode enabled");

        requireRoot("usb-soundcard-mapper");

        const std::string rulesFile = parser.isSet("rules-file")
            ? parser.value("rules-file").toStdString()
            : config.getString("rulesFile", DEFAULT_RULES_FILE);

        ProcessSystemQuery query;

        ResolverPaths paths;
        paths.sysfsUsbRoot = QString::fromStdString(config.getString("sysfsUsbRoot", DEFAULT_SYSFS_USB_ROOT));
        paths.udevadmPath = QString::fromStdString(config.getString("udevadmPath", "udevadm"));
        TopologyResolver resolver(paths, query);

        RuleStore rules(rulesFile);
        if (!rules.load()) {
            return ExitCodes::FAILURE;
        }

        EnumeratorOptions enumeratorOptions;
        enumeratorOptions.asoundRoot = QString::fromStdString(config.getString("asoundRoot", DEFAULT_ASOUND_ROOT));
        enumeratorOptions.arecordPath = QString::fromStdString(config.getString("arecordPath", "arecord"));
        CaptureEnumerator enumerator(enumeratorOptions, query, &rules, &resolver);

        MapperContext context{rules, query, resolver, enumerator, paths.udevadmPath};

        QTextStream out(stdout);
        if (parser.isSet("test")) {
            MapperCommands commands(context, out);
            return commands.runPortTest(enumerateUsbDevices());
        }

        if (parser.isSet("non-interactive")) {
            MappingRequest request;
            request.deviceName = parser.value("device").toStdString();
            request.vendorId = lowercase(parser.value("vendor"));
            request.productId = lowercase(parser.value("product"));
            if (parser.isSet("usb-port")) {
                request.usbPort = parser.value("usb-port").toStdString();
            }
            request.friendlyName = parser.value("friendly").toStdString();
            request.matchMode = parseMatchMode(parser.value("match-mode"));

            MapperCommands commands(context, out);
            return commands.createMapping(request);
        }

        QTextStream in(stdin);
        InteractiveWizard wizard(context, in, out);
        return wizard.run(enumerateUsbDevices());

    } catch (const std::exception& e) {
        LOG_CRITICAL(e.what());
        return ExitCodes::FAILURE;
    }
}
