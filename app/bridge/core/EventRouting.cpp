/**
 * @file EventRouting.cpp
 * @brief BridgeCore event source callbacks: raw events into registry and coalescer
 */

#include "BridgeCore.h"
#include "ErrorCodes.h"
#include "Logger.h"
#include "LoggerMacros.h"

namespace WatchBridge {

namespace {
    ChangeKind toChangeKind(RawEventKind kind) {
        switch (kind) {
            case RawEventKind::Created: return ChangeKind::Created;
            case RawEventKind::Modified: return ChangeKind::Modified;
            case RawEventKind::Removed: return ChangeKind::Removed;
            case RawEventKind::RenamedFrom: return ChangeKind::RenamedFrom;
            case RawEventKind::RenamedTo: return ChangeKind::RenamedTo;
            default: return ChangeKind::Unknown;
        }
    }
}

void BridgeCore::onRawEvent(const RawEvent& event) {
    switch (event.kind) {
        case RawEventKind::Overflow:
            LOG_WARN_COMP("Events were dropped, reporting every replica as changed", "BridgeCore");
            coalescer_.markAllChanged(event.timestamp);
            return;
        case RawEventKind::SubscriptionLost:
            registry_.onSubscriptionLost(event.handle);
            return;
        default:
            break;
    }

    const ChangeKind kind = toChangeKind(event.kind);

    for (const auto& target : registry_.resolve(event)) {
        // A nested directory's own removal is already reported by its parent
        if (event.isSelf && !target.isTopDirectory) {
            continue;
        }

        std::vector<std::string> discovered;
        bool rootLost = false;
        if (event.isDirectory) {
            switch (event.kind) {
                case RawEventKind::Created:
                case RawEventKind::RenamedTo:
                    if (!event.isSelf) {
                        discovered = registry_.onDirectoryAppeared(target.rootId, target.relativePath, event.path);
                    }
                    break;
                case RawEventKind::Removed:
                case RawEventKind::RenamedFrom:
                    rootLost = registry_.onDirectoryRemoved(target.rootId, target.relativePath);
                    break;
                default:
                    break;
            }
        }

        if (rootLost) {
            session_.failRoot(target.rootId, ErrorRegistry::createError(ErrorCode::WATCHED_DIRECTORY_REMOVED,
                                                                        target.rootId + " at " + event.path,
                                                                        "BridgeCore"));
            continue;
        }

        coalescer_.ingest(target.rootId, target.relativePath, kind, event.isDirectory, event.timestamp);

        // A renamed-in directory already covers its subtree
        if (event.kind == RawEventKind::Created) {
            for (const auto& path : discovered) {
                coalescer_.ingest(target.rootId, path, ChangeKind::Created, false, event.timestamp);
            }
        }
    }
}

void BridgeCore::onSourceFailure(const Error& error) {
    // Runs on the source's own thread: record and let run() tear down
    {
        std::lock_guard<std::mutex> lock(failureMutex_);
        sourceError_ = error;
    }
    sourceFailed_ = true;
    LOG_CRITICAL_COMP(error.toString(), "BridgeCore");
}

} // namespace WatchBridge
