#include "PendingChangeSet.h"
#include "PathUtils.h"

namespace WatchBridge {

const char* changeKindName(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::Created: return "Created";
        case ChangeKind::Modified: return "Modified";
        case ChangeKind::Removed: return "Removed";
        case ChangeKind::RenamedFrom: return "RenamedFrom";
        case ChangeKind::RenamedTo: return "RenamedTo";
        case ChangeKind::Unknown:
        default: return "Unknown";
    }
}

bool PendingChangeSet::isCovering(unsigned flags) {
    return (flags & DIRECTORY_FLAG) && (flags & COVERING_KINDS);
}

bool PendingChangeSet::isImplicit(unsigned flags) {
    return flags == (DIRECTORY_FLAG | static_cast<unsigned>(ChangeKind::Created));
}

void PendingChangeSet::add(const std::string& relativePath, ChangeKind kind, bool isDirectory) {
    if (coveredByAncestor(relativePath)) {
        return;
    }

    unsigned& flags = entries_[relativePath];
    flags |= static_cast<unsigned>(kind);
    if (isDirectory) {
        flags |= DIRECTORY_FLAG;
    }

    if (isCovering(flags)) {
        purgeBelow(relativePath);
    }
}

std::vector<std::string> PendingChangeSet::paths() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [path, flags] : entries_) {
        if (isImplicit(flags) && hasDescendant(path)) {
            continue;
        }
        result.push_back(path);
    }
    return result;
}

bool PendingChangeSet::contains(const std::string& relativePath) const {
    return entries_.find(relativePath) != entries_.end();
}

bool PendingChangeSet::coveredByAncestor(const std::string& relativePath) const {
    for (const auto& ancestor : PathUtils::ancestorsOf(relativePath)) {
        auto it = entries_.find(ancestor);
        if (it != entries_.end() && isCovering(it->second)) {
            return true;
        }
    }
    return false;
}

// Descendants of "a" are the contiguous key range starting at "a/".
bool PendingChangeSet::hasDescendant(const std::string& relativePath) const {
    if (relativePath.empty()) {
        return entries_.size() > 1 || (entries_.size() == 1 && !entries_.begin()->first.empty());
    }
    const std::string prefix = relativePath + "/";
    auto it = entries_.lower_bound(prefix);
    return it != entries_.end() && it->first.compare(0, prefix.size(), prefix) == 0;
}

void PendingChangeSet::purgeBelow(const std::string& relativePath) {
    if (relativePath.empty()) {
        auto root = entries_.find("");
        unsigned flags = root != entries_.end() ? root->second : 0;
        entries_.clear();
        entries_[""] = flags;
        return;
    }
    const std::string prefix = relativePath + "/";
    auto it = entries_.lower_bound(prefix);
    while (it != entries_.end() && it->first.compare(0, prefix.size(), prefix) == 0) {
        it = entries_.erase(it);
    }
}

} // namespace WatchBridge
