#pragma once

/**
 * @file PendingChangeSet.h
 * @brief Paths changed under one root since the last report
 *
 * Paths are relative to the replica root, '/'-joined, "" for the root itself.
 * Folding rules:
 * - repeated events for one path collapse into a single entry
 * - a removed or renamed directory covers its subtree: pending descendants
 *   are purged and later descendant events are absorbed
 * - a directory that was only created is implied by any pending descendant
 *   and is left out of the report in that case
 */

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace WatchBridge {

enum class ChangeKind : unsigned {
    Created = 1u << 0,
    Modified = 1u << 1,
    Removed = 1u << 2,
    RenamedFrom = 1u << 3,
    RenamedTo = 1u << 4,
    Unknown = 1u << 5
};

const char* changeKindName(ChangeKind kind);

class PendingChangeSet {
public:
    void add(const std::string& relativePath, ChangeKind kind, bool isDirectory);

    /// Paths to report, sorted
    std::vector<std::string> paths() const;

    bool contains(const std::string& relativePath) const;
    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }
    void clear() { entries_.clear(); }

    void swap(PendingChangeSet& other) noexcept { entries_.swap(other.entries_); }

private:
    static constexpr unsigned DIRECTORY_FLAG = 1u << 8;
    static constexpr unsigned COVERING_KINDS =
        static_cast<unsigned>(ChangeKind::Removed) |
        static_cast<unsigned>(ChangeKind::RenamedFrom) |
        static_cast<unsigned>(ChangeKind::RenamedTo) |
        static_cast<unsigned>(ChangeKind::Unknown);

    static bool isCovering(unsigned flags);
    static bool isImplicit(unsigned flags);

    bool coveredByAncestor(const std::string& relativePath) const;
    bool hasDescendant(const std::string& relativePath) const;
    void purgeBelow(const std::string& relativePath);

    std::map<std::string, unsigned> entries_;
};

} // namespace WatchBridge
