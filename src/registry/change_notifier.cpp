#include <toolhost/registry/change_notifier.hpp>

#include <system_error>

namespace toolhost {

PollingChangeNotifier::PollingChangeNotifier(
    std::vector<std::filesystem::path> roots, std::string extension)
    : roots_(std::move(roots)), extension_(std::move(extension)) {}

PollingChangeNotifier::Snapshot PollingChangeNotifier::Scan() const {
    Snapshot snapshot;
    for (const auto& root : roots_) {
        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec)) {
            continue;
        }
        std::filesystem::recursive_directory_iterator it(
            root, std::filesystem::directory_options::skip_permission_denied, ec);
        for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            const auto& entry = *it;
            std::error_code file_ec;
            if (!entry.is_regular_file(file_ec) ||
                entry.path().extension() != extension_) {
                continue;
            }
            Stamp stamp;
            stamp.mtime = entry.last_write_time(file_ec);
            if (file_ec) continue;  // vanished between listing and stat
            stamp.size = entry.file_size(file_ec);
            if (file_ec) continue;
            snapshot.emplace(entry.path(), stamp);
        }
    }
    return snapshot;
}

std::vector<FileChange> PollingChangeNotifier::Poll() {
    auto current = Scan();
    std::vector<FileChange> changes;

    if (!primed_) {
        primed_ = true;
        last_ = std::move(current);
        return changes;
    }

    for (const auto& [path, stamp] : current) {
        auto it = last_.find(path);
        if (it == last_.end()) {
            changes.push_back({FileChange::Kind::Created, path});
        } else if (it->second != stamp) {
            changes.push_back({FileChange::Kind::Modified, path});
        }
    }
    for (const auto& [path, stamp] : last_) {
        if (current.count(path) == 0) {
            changes.push_back({FileChange::Kind::Deleted, path});
        }
    }

    last_ = std::move(current);
    return changes;
}

} // namespace toolhost
