#pragma once
#include <QString>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace usb_audio {

// One card from /proc/asound/cards:
//  1 [USBAudio       ]: USB-Audio - USB Audio Device
//                       Generic USB Audio Device at usb-0000:01:00.0-1.4, full speed
struct CardEntry {
    int index{0};
    std::string id;
    std::string driver;
    std::string description;
    std::string longName;
    std::optional<std::string> usbPath;
};

// One capture device from `arecord -l`:
// card 1: USBAudio [USB Audio Device], device 0: USB Audio [USB Audio]
struct CaptureEntry {
    int cardIndex{0};
    std::string cardId;
    std::string cardName;
    int deviceIndex{0};
};

namespace parsers {

std::vector<CardEntry> parseCardList(const QString& text);
std::vector<CaptureEntry> parseCaptureList(const QString& text);

// `udevadm info --query=property`: KEY=value per line.
std::map<std::string, std::string> parseUdevProperties(const QString& text);

// `udevadm info -q path`: first non-empty line.
std::optional<std::string> parseUdevPath(const QString& text);

// Trailing <bus>-<port>[.<port>]* segment of a path, e.g. ".../usb3/3-1/3-1.4" -> "3-1.4".
std::optional<std::string> trailingPortFragment(const QString& path);

// First <bus>-<port>[.<port>]* in text that is not part of a PCI address.
std::optional<std::string> findPortFragment(const QString& text);

// Leaf directory name when it contains a hyphen.
std::optional<std::string> hyphenatedLeafName(const QString& path);

// The usb-... token after " at " in a card long name.
std::optional<std::string> cardUsbPath(const QString& longName);

// Hub port chain of a card USB path: "usb-0000:01:00.0-1.4" -> "1.4",
// "usb-3f980000.usb-1.2" -> "1.2".
std::optional<std::string> cardPortChain(const QString& usbPath);

// "2e88:4610" -> {"2e88", "4610"}
std::optional<std::pair<std::string, std::string>> parseUsbId(const QString& text);

std::optional<int> parseDecimal(const QString& text);

// Index of a capture directory name: "pcm3c" -> 3.
std::optional<int> captureDirectoryIndex(const QString& name);

}

}
