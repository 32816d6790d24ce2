#pragma once

#include <folio/middleware/project_state.h>

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace folio {

class Document;

// Associates editor version numbers with document snapshots.
class VersionCache {
public:
    virtual ~VersionCache() = default;

    virtual void track_version(const std::shared_ptr<const Document>& document,
                               int version) = 0;

    // Record document as the newest snapshot of its path, carrying over the
    // version of the newest tracked snapshot. No-op for an untracked path.
    virtual void mark_latest(const std::shared_ptr<const Document>& document) = 0;

    virtual std::optional<int>
    try_get_version(const std::shared_ptr<const Document>& document) const = 0;
};

// Keeps the last max_tracking_count versions per file path. Entries hold
// documents weakly, so the cache never keeps a stale snapshot alive. A path's
// history is dropped when the project reports the document closed.
//
// Must be owned by a std::shared_ptr before initialize() is called.
class DefaultVersionCache : public VersionCache,
                            public ProjectListener,
                            public std::enable_shared_from_this<DefaultVersionCache> {
public:
    static constexpr std::size_t max_tracking_count = 20;

    DefaultVersionCache() = default;

    DefaultVersionCache(const DefaultVersionCache&) = delete;
    DefaultVersionCache& operator=(const DefaultVersionCache&) = delete;

    void initialize(ProjectState& project);

    void track_version(const std::shared_ptr<const Document>& document,
                       int version) override;
    void mark_latest(const std::shared_ptr<const Document>& document) override;
    std::optional<int>
    try_get_version(const std::shared_ptr<const Document>& document) const override;

    void on_project_changed(const ProjectChange& change) override;

    std::vector<std::string> tracked_paths() const;
    std::size_t entry_count(const std::string& path) const;
    // Tracked versions for path, oldest first.
    std::vector<int> versions(const std::string& path) const;

private:
    struct Entry {
        std::weak_ptr<const Document> document;
        int version;
    };

    void track_locked(const std::string& path,
                      const std::shared_ptr<const Document>& document, int version);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::deque<Entry>> lookup_;
};

} // namespace folio
