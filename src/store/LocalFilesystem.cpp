/**
 * klog - Local Filesystem
 *
 * Filesystem implementation on top of std::filesystem.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "Filesystem.hpp"
#include "PathScheme.hpp"
#include "StoreErrors.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

#include <spdlog/spdlog.h>

namespace klog {

namespace {

bool isHidden(const std::filesystem::path& path) {
    const std::string name = path.filename().string();
    return !name.empty() && name[0] == '.';
}

std::vector<std::filesystem::path> subdirectories(const std::filesystem::path& dir,
                                                  const std::filesystem::path& relative) {
    std::vector<std::filesystem::path> result;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec) && !isHidden(it->path())) {
            result.push_back(it->path());
        }
    }
    if (ec) {
        throw IOFailure(relative, "cannot list directory (" + ec.message() + ")");
    }
    return result;
}

bool escapesRoot(const std::filesystem::path& path) {
    auto normal = path.lexically_normal();
    return normal.has_root_path() || (!normal.empty() && *normal.begin() == "..");
}

} // anonymous namespace

class LocalFilesystem : public Filesystem {
public:
    explicit LocalFilesystem(const std::filesystem::path& root)
        : m_root(root) {
        spdlog::debug("Local filesystem rooted at: {}", m_root.string());
    }

    std::vector<std::filesystem::path> scan() const override {
        std::error_code ec;
        if (!std::filesystem::is_directory(m_root, ec)) {
            throw IOFailure(m_root, "store root is not a directory");
        }

        std::vector<std::filesystem::path> files;
        for (const auto& yearDir : subdirectories(m_root, ".")) {
            if (yearDir.filename() == PathScheme::MEDIA_DIR) {
                continue;
            }
            auto year = yearDir.filename();

            for (const auto& monthDir : subdirectories(yearDir, year)) {
                auto month = year / monthDir.filename();

                for (std::filesystem::directory_iterator it(monthDir, ec), end;
                     !ec && it != end; it.increment(ec)) {
                    if (it->is_regular_file(ec)) {
                        files.push_back(month / it->path().filename());
                    }
                }
                if (ec) {
                    throw IOFailure(month, "cannot list directory (" + ec.message() + ")");
                }
            }
        }

        spdlog::debug("Scanned {}: {} candidate files", m_root.string(), files.size());
        return files;
    }

    bool exists(const std::filesystem::path& path) const override {
        std::error_code ec;
        bool result = std::filesystem::exists(resolve(path), ec);
        if (ec) {
            throw IOFailure(path, "cannot stat (" + ec.message() + ")");
        }
        return result;
    }

    std::string readFile(const std::filesystem::path& path) const override {
        std::ifstream file(resolve(path), std::ios::binary);
        if (!file.is_open()) {
            throw IOFailure(path, "cannot open file for reading");
        }

        std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
        if (file.bad()) {
            throw IOFailure(path, "read error");
        }
        return content;
    }

    void writeFile(const std::filesystem::path& path, const std::string& data) override {
        auto target = resolve(path);

        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            throw IOFailure(path.parent_path(), "cannot create directory (" + ec.message() + ")");
        }

        std::ofstream file(target, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw IOFailure(path, "cannot open file for writing");
        }
        file.write(data.data(), static_cast<std::streamsize>(data.size()));
        file.close();
        if (file.fail()) {
            throw IOFailure(path, "write error");
        }

        spdlog::debug("Wrote {} bytes to {}", data.size(), path.generic_string());
    }

    void removeFile(const std::filesystem::path& path) override {
        std::error_code ec;
        if (std::filesystem::remove(resolve(path), ec)) {
            spdlog::debug("Removed {}", path.generic_string());
        }
        if (ec) {
            throw IOFailure(path, "cannot remove file (" + ec.message() + ")");
        }
    }

    void pruneEmptyDirectories(const std::filesystem::path& directory) override {
        resolve(directory);

        auto current = directory;
        while (!current.empty() && current != ".") {
            auto target = m_root / current;

            std::error_code ec;
            if (!std::filesystem::is_directory(target, ec) ||
                !std::filesystem::is_empty(target, ec)) {
                break;
            }
            std::filesystem::remove(target, ec);
            if (ec) {
                throw IOFailure(current, "cannot remove directory (" + ec.message() + ")");
            }
            spdlog::debug("Pruned empty directory {}", current.generic_string());

            current = current.parent_path();
        }
    }

private:
    /**
     * Absolute location of a store-relative path
     *
     * @throws IOFailure if the path points outside the store root
     */
    std::filesystem::path resolve(const std::filesystem::path& path) const {
        if (escapesRoot(path)) {
            throw IOFailure(path, "path outside the store root");
        }
        return m_root / path;
    }

    std::filesystem::path m_root;
};

std::unique_ptr<Filesystem> createLocalFilesystem(const std::filesystem::path& root) {
    return std::make_unique<LocalFilesystem>(root);
}

} // namespace klog
