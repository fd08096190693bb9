#pragma once

namespace usb_audio {

constexpr int MAX_STRING_LENGTH = 256;

constexpr int DEFAULT_STREAM_PORT = 8554;
constexpr int STAGGER_DELAY = 500;       // ms
constexpr int RESCAN_INTERVAL = 10000;   // ms
constexpr int HOTPLUG_SETTLE = 1500;     // ms
constexpr int STOP_TIMEOUT = 3000;       // ms
constexpr int SPAWN_TIMEOUT = 2000;      // ms
constexpr int HOTPLUG_PUMP_INTERVAL = 100; // ms
constexpr int POLLING_INTERVAL = 1000;   // ms

constexpr int SERIAL_TOKEN_LENGTH = 8;
constexpr int HASH_TOKEN_LENGTH = 8;
constexpr int UNIQUENESS_TAG_LENGTH = 6;

constexpr const char* DEFAULT_RULES_FILE = "/etc/udev/rules.d/99-usb-soundcards.rules";
constexpr const char* DEFAULT_SYSFS_USB_ROOT = "/sys/bus/usb/devices";
constexpr const char* DEFAULT_ASOUND_ROOT = "/proc/asound";
constexpr const char* DEFAULT_PROC_ROOT = "/proc";
constexpr const char* DEFAULT_STATUS_FILE = "/run/audio-rtsp/streams.json";
constexpr const char* STREAM_SCHEME = "rtsp";
constexpr const char* STREAM_PROGRAM = "ffmpeg";

// On-board audio that must never be streamed.
constexpr const char* SYSTEM_CARD_DENYLIST[] = {
    "bcm2835_headpho",
    "vc4-hdmi",
    "HDMI"
};

namespace ErrorCodes {
    constexpr int ACCESS_DENIED = -2;
    constexpr int INVALID_PARAM = -3;
    constexpr int IO_ERROR = -4;
}

namespace ExitCodes {
    constexpr int OK = 0;
    constexpr int FAILURE = 1;
    constexpr int PARTIAL = 2;
}

}
