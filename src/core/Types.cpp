#include <usb-audio/Types.hpp>

namespace usb_audio {

const char* toString(PortSource source) {
    switch (source) {
        case PortSource::Devpath:       return "devpath";
        case PortSource::CanonicalPath: return "canonical-path";
        case PortSource::NodeName:      return "node-name";
        case PortSource::DeviceManager: return "udevadm";
        case PortSource::Synthesized:   return "synthesized";
    }
    return "unknown";
}

const char* toString(MatchMode mode) {
    switch (mode) {
        case MatchMode::Basic:       return "basic";
        case MatchMode::PortPattern: return "pattern";
        case MatchMode::ExactPort:   return "exact";
    }
    return "unknown";
}

const char* toString(StreamState state) {
    switch (state) {
        case StreamState::Starting: return "starting";
        case StreamState::Running:  return "running";
        case StreamState::Stopping: return "stopping";
        case StreamState::Dead:     return "dead";
    }
    return "unknown";
}

}
