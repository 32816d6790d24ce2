#include <folio/middleware/version_cache.h>
#include <folio/document.h>

#include <stdexcept>

namespace folio {

namespace {

const std::string& require_path(const std::shared_ptr<const Document>& document) {
    if (!document)
        throw std::invalid_argument("version cache: null document");
    if (!document->file_path())
        throw std::invalid_argument("version cache: document has no file path");
    return *document->file_path();
}

} // namespace

void DefaultVersionCache::initialize(ProjectState& project) {
    project.add_listener(shared_from_this());
}

void DefaultVersionCache::track_version(const std::shared_ptr<const Document>& document,
                                        int version) {
    const std::string& path = require_path(document);
    std::lock_guard<std::mutex> lock(mutex_);
    track_locked(path, document, version);
}

void DefaultVersionCache::mark_latest(const std::shared_ptr<const Document>& document) {
    const std::string& path = require_path(document);
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = lookup_.find(path);
    if (it == lookup_.end() || it->second.empty()) return;

    int latest = it->second.back().version;
    track_locked(path, document, latest);
}

std::optional<int>
DefaultVersionCache::try_get_version(const std::shared_ptr<const Document>& document) const {
    if (!document || !document->file_path()) return std::nullopt;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lookup_.find(*document->file_path());
    if (it == lookup_.end()) return std::nullopt;

    // Newest first: a snapshot re-tracked by mark_latest wins.
    for (auto entry = it->second.rbegin(); entry != it->second.rend(); ++entry) {
        if (entry->document.lock() == document) return entry->version;
    }
    return std::nullopt;
}

void DefaultVersionCache::on_project_changed(const ProjectChange& change) {
    if (change.kind != ProjectChangeKind::document_closed) return;

    std::lock_guard<std::mutex> lock(mutex_);
    lookup_.erase(change.document_path);
}

std::vector<std::string> DefaultVersionCache::tracked_paths() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> paths;
    paths.reserve(lookup_.size());
    for (const auto& [path, entries] : lookup_)
        paths.push_back(path);
    return paths;
}

std::size_t DefaultVersionCache::entry_count(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lookup_.find(path);
    return it == lookup_.end() ? 0 : it->second.size();
}

std::vector<int> DefaultVersionCache::versions(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int> result;
    auto it = lookup_.find(path);
    if (it == lookup_.end()) return result;
    for (const auto& entry : it->second)
        result.push_back(entry.version);
    return result;
}

void DefaultVersionCache::track_locked(const std::string& path,
                                       const std::shared_ptr<const Document>& document,
                                       int version) {
    auto& entries = lookup_[path];
    if (entries.size() == max_tracking_count) {
        entries.pop_front();
    }
    entries.push_back({document, version});
}

} // namespace folio
