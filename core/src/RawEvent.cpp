#include "IEventSource.h"

namespace WatchBridge {

const char* rawEventKindName(RawEventKind kind) {
    switch (kind) {
        case RawEventKind::Created: return "Created";
        case RawEventKind::Modified: return "Modified";
        case RawEventKind::Removed: return "Removed";
        case RawEventKind::RenamedFrom: return "RenamedFrom";
        case RawEventKind::RenamedTo: return "RenamedTo";
        case RawEventKind::Overflow: return "Overflow";
        case RawEventKind::SubscriptionLost: return "SubscriptionLost";
        case RawEventKind::Unknown:
        default: return "Unknown";
    }
}

} // namespace WatchBridge
