#include "DropScanner.hpp"

#include "Errors.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

DropScanner::DropScanner(ScanOptions options) : m_options(options) {}

std::vector<DropItem> DropScanner::scan(const fs::path& root) const {
    std::error_code ec;
    if (!fs::exists(root, ec) || ec) {
        throw InvalidDirectory("Drop folder `" + root.string() + "` is not accessible: " +
                               (ec ? ec.message() : "path does not exist"));
    }
    if (!fs::is_directory(root, ec) || ec) {
        throw InvalidDirectory("Drop folder `" + root.string() + "` is not a directory.");
    }

    std::vector<DropItem> items;
    if (m_options.moveFoldersWhole) {
        scanTopLevel(root, items);
    } else {
        scanRecursive(root, items);
    }

    // stable order so collisions inside one cycle resolve the same way every time
    std::sort(items.begin(), items.end(), [](const DropItem& a, const DropItem& b) {
        return a.path < b.path;
    });
    return items;
}

void DropScanner::scanTopLevel(const fs::path& root, std::vector<DropItem>& out) const {
    std::error_code ec;
    fs::directory_iterator iter(root, ec);
    if (ec) {
        throw InvalidDirectory("Unable to enumerate `" + root.string() + "`: " + ec.message());
    }

    const fs::directory_iterator end;
    while (iter != end) {
        const fs::directory_entry& entry = *iter;
        const auto status = entry.symlink_status(ec);
        if (ec) {
            DS_LOG_WARN("Skipping `" << entry.path().string() << "`: " << ec.message());
            ec.clear();
        } else if (fs::is_regular_file(status)) {
            out.push_back({entry.path(), false});
        } else if (fs::is_directory(status)) {
            out.push_back({entry.path(), true});
        } else {
            DS_LOG_DEBUG("Skipping special entry `" << entry.path().string() << "`.");
        }

        iter.increment(ec);
        if (ec) {
            throw InvalidDirectory("Unable to enumerate `" + root.string() + "`: " + ec.message());
        }
    }
}

void DropScanner::scanRecursive(const fs::path& root, std::vector<DropItem>& out) const {
    std::error_code ec;
    fs::recursive_directory_iterator iter(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw InvalidDirectory("Unable to enumerate `" + root.string() + "`: " + ec.message());
    }

    const fs::recursive_directory_iterator end;
    while (iter != end) {
        const auto status = iter->symlink_status(ec);
        if (ec) {
            DS_LOG_WARN("Skipping `" << iter->path().string() << "`: " << ec.message());
            ec.clear();
        } else if (fs::is_regular_file(status)) {
            out.push_back({iter->path(), false});
        }

        iter.increment(ec);
        if (ec) {
            DS_LOG_WARN("Stopped enumerating `" << root.string() << "` early: " << ec.message());
            break;
        }
    }
}
