#include "io/library_discovery.hpp"
#include "core/config.hpp"
#include "util/file_util.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/stat.h>

#include <tbb/blocked_range.h>
#include <tbb/combinable.h>
#include <tbb/parallel_for.h>

namespace kubuild {

static bool has_extension(const std::string& name,
                          const std::vector<std::string>& extensions) {
    for (const auto& ext : extensions) {
        if (name.size() >= ext.size() &&
            name.compare(name.size() - ext.size(), ext.size(), ext) == 0)
            return true;
    }
    return false;
}

namespace {

struct DirId {
    dev_t dev;
    ino_t ino;
    bool operator==(const DirId& o) const { return dev == o.dev && ino == o.ino; }
};

} // namespace

std::vector<std::string> find_files_with_extensions(
    const std::vector<std::string>& roots,
    const std::vector<std::string>& extensions,
    const Logger& logger) {
    namespace fs = std::filesystem;
    std::vector<std::string> found;

    const auto opts = fs::directory_options::follow_directory_symlink |
                      fs::directory_options::skip_permission_denied;

    for (const auto& root : roots) {
        std::error_code ec;
        if (!fs::is_directory(root, ec)) continue;

        struct stat st;
        if (::stat(root.c_str(), &st) != 0) continue;
        // Directories on the path from the root to the current entry;
        // ancestors[d] is the parent of an entry at depth d.
        std::vector<DirId> ancestors{{st.st_dev, st.st_ino}};

        fs::recursive_directory_iterator it(root, opts, ec), end;
        if (ec) {
            logger.warn("Cannot read %s: %s", root.c_str(), ec.message().c_str());
            continue;
        }
        while (it != end) {
            const auto& entry = *it;
            const std::string path = entry.path().string();
            ancestors.resize(static_cast<size_t>(it.depth()) + 1);

            // stat() follows links, so linked files and directories qualify
            if (::stat(path.c_str(), &st) == 0) {
                if (S_ISDIR(st.st_mode)) {
                    DirId id{st.st_dev, st.st_ino};
                    if (std::find(ancestors.begin(), ancestors.end(), id) != ancestors.end()) {
                        logger.warn("File system loop detected; '%s' is part of the same "
                                    "file system loop, not descending", path.c_str());
                        it.disable_recursion_pending();
                    } else {
                        ancestors.push_back(id);
                    }
                } else if (S_ISREG(st.st_mode) &&
                           has_extension(entry.path().filename().string(), extensions)) {
                    found.push_back(path);
                }
            }

            it.increment(ec);
            if (ec) {
                logger.warn("Stopped searching %s: %s", root.c_str(), ec.message().c_str());
                break;
            }
        }
    }

    std::sort(found.begin(), found.end());
    found.erase(std::unique(found.begin(), found.end()), found.end());
    return found;
}

std::vector<std::string> discover_library_files(
    const std::vector<std::string>& roots, const Logger& logger) {
    std::vector<std::string> exts(std::begin(LIBRARY_EXTENSIONS),
                                  std::end(LIBRARY_EXTENSIONS));
    return find_files_with_extensions(roots, exts, logger);
}

std::optional<LibraryManifest> read_manifest(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return std::nullopt;

    LibraryManifest manifest;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        manifest.files.push_back(line);
    }
    if (manifest.empty()) return std::nullopt;
    return manifest;
}

bool write_manifest(const std::string& path, const LibraryManifest& manifest) {
    std::ostringstream oss;
    for (const auto& f : manifest.files) oss << f << "\n";

    std::string tmp = path + ".tmp";
    if (!write_file_string(tmp, oss.str())) return false;
    return rename_file(tmp, path);
}

std::optional<LibraryManifest> load_or_discover_manifest(
    const std::string& manifest_path,
    const std::vector<std::string>& roots,
    const Logger& logger) {
    if (file_nonempty(manifest_path)) {
        auto cached = read_manifest(manifest_path);
        if (cached) {
            logger.debug("Using cached library file list %s", manifest_path.c_str());
            return cached;
        }
    }

    logger.info("Finding all library files");
    LibraryManifest manifest;
    manifest.files = discover_library_files(roots, logger);

    if (manifest.empty()) {
        std::string dirs;
        for (const auto& r : roots) {
            if (!dirs.empty()) dirs += " ";
            dirs += r;
        }
        logger.error("No fna, fa, or ffn files found in %s!", dirs.c_str());
        return std::nullopt;
    }

    if (!write_manifest(manifest_path, manifest)) {
        // The manifest is only a cache; the run can proceed without it.
        logger.warn("Cannot write library file list %s", manifest_path.c_str());
    }
    return manifest;
}

uint64_t total_library_bytes(const LibraryManifest& manifest) {
    tbb::combinable<uint64_t> partial([] { return uint64_t(0); });

    tbb::parallel_for(
        tbb::blocked_range<size_t>(0, manifest.files.size(), 64),
        [&](const tbb::blocked_range<size_t>& range) {
            uint64_t& sum = partial.local();
            for (size_t i = range.begin(); i < range.end(); i++)
                sum += file_size(manifest.files[i]);
        });

    return partial.combine([](uint64_t a, uint64_t b) { return a + b; });
}

} // namespace kubuild
