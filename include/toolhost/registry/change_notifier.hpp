#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace toolhost {

struct FileChange {
    enum class Kind { Created, Modified, Deleted };

    Kind kind;
    std::filesystem::path path;
};

// ---------------------------------------------------------------------------
// IChangeNotifier: reports changes to watched files since the last call.
// ---------------------------------------------------------------------------
class IChangeNotifier {
public:
    virtual ~IChangeNotifier() = default;

    /// Changes observed since the previous call (the first call establishes
    /// the baseline and reports nothing).
    virtual std::vector<FileChange> Poll() = 0;
};

// ---------------------------------------------------------------------------
// PollingChangeNotifier: compares (mtime, size) of every file with the
// given extension under the roots against the previous poll.
// ---------------------------------------------------------------------------
class PollingChangeNotifier : public IChangeNotifier {
public:
    PollingChangeNotifier(std::vector<std::filesystem::path> roots,
                          std::string extension);

    std::vector<FileChange> Poll() override;

private:
    struct Stamp {
        std::filesystem::file_time_type mtime;
        std::uintmax_t size = 0;

        bool operator!=(const Stamp& other) const {
            return mtime != other.mtime || size != other.size;
        }
    };
    using Snapshot = std::map<std::filesystem::path, Stamp>;

    Snapshot Scan() const;

    std::vector<std::filesystem::path> roots_;
    std::string extension_;
    Snapshot last_;
    bool primed_ = false;
};

} // namespace toolhost
