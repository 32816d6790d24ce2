#include <folio/middleware/project_state.h>

namespace folio {

void ProjectState::add_listener(std::shared_ptr<ProjectListener> listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void ProjectState::document_added(const std::string& path) {
    notify(ProjectChangeKind::document_added, path);
}

void ProjectState::document_opened(const std::string& path) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        open_documents_.insert(path);
    }
    notify(ProjectChangeKind::document_opened, path);
}

void ProjectState::document_closed(const std::string& path) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        open_documents_.erase(path);
    }
    notify(ProjectChangeKind::document_closed, path);
}

void ProjectState::document_removed(const std::string& path) {
    // A removed document stays open until its editor closes it.
    notify(ProjectChangeKind::document_removed, path);
}

bool ProjectState::is_document_open(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_documents_.count(path) > 0;
}

void ProjectState::notify(ProjectChangeKind kind, const std::string& path) {
    std::vector<std::shared_ptr<ProjectListener>> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = listeners_;
    }
    ProjectChange change{kind, path};
    for (auto& listener : listeners)
        listener->on_project_changed(change);
}

} // namespace folio
