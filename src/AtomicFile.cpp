#include "AtomicFile.hpp"

#include "Errors.hpp"

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

void writeFileAtomically(const fs::path& path, const std::string& contents) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw ConfigWriteError("Cannot create `" + path.parent_path().string() + "`: " + ec.message());
        }
    }

    auto tmpPath = path;
    tmpPath += ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::out | std::ios::trunc);
        if (!out) {
            throw ConfigWriteError("Cannot open `" + tmpPath.string() + "` for writing.");
        }
        out << contents;
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmpPath, ec);
            throw ConfigWriteError("Cannot write `" + tmpPath.string() + "`.");
        }
    }

    fs::rename(tmpPath, path, ec);
    if (ec) {
        std::error_code removeErr;
        fs::remove(tmpPath, removeErr);
        throw ConfigWriteError("Cannot replace `" + path.string() + "`: " + ec.message());
    }
}
