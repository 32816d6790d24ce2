#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace folio {

enum class ProjectChangeKind : uint8_t {
    document_added,
    document_opened,
    document_closed,
    document_removed,
};

struct ProjectChange {
    ProjectChangeKind kind;
    std::string document_path;
};

class ProjectListener {
public:
    virtual ~ProjectListener() = default;
    virtual void on_project_changed(const ProjectChange& change) = 0;
};

// Tracks which documents of a project are open and forwards lifecycle
// events to listeners. Listeners are called after the open set is updated,
// outside the internal lock.
class ProjectState {
public:
    ProjectState() = default;

    ProjectState(const ProjectState&) = delete;
    ProjectState& operator=(const ProjectState&) = delete;

    void add_listener(std::shared_ptr<ProjectListener> listener);

    void document_added(const std::string& path);
    void document_opened(const std::string& path);
    void document_closed(const std::string& path);
    void document_removed(const std::string& path);

    bool is_document_open(const std::string& path) const;

private:
    void notify(ProjectChangeKind kind, const std::string& path);

    mutable std::mutex mutex_;
    std::unordered_set<std::string> open_documents_;
    std::vector<std::shared_ptr<ProjectListener>> listeners_;
};

} // namespace folio
