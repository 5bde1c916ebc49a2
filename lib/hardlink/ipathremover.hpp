#ifndef IPATHREMOVER_HPP
#define IPATHREMOVER_HPP

#include <filesystem>
#include <string>
#include <system_error>

/**
 * @brief Removes one directory entry; the seam the delete executor uses
 */
class IPathRemover {
public:
    /** @return true on success, ec set otherwise */
    virtual bool remove(const std::string& path, std::error_code& ec) = 0;
    virtual ~IPathRemover() = default;
};

/**
 * @brief Unlinks files and symlinks, refuses directories
 */
class FilesystemRemover : public IPathRemover {
public:
    bool remove(const std::string& path, std::error_code& ec) override {
        ec.clear();
        auto status = std::filesystem::symlink_status(path, ec);
        if (ec) {
            return false;
        }
        if (std::filesystem::is_directory(status)) {
            ec = std::make_error_code(std::errc::is_a_directory);
            return false;
        }
        bool removed = std::filesystem::remove(path, ec);
        if (!removed && !ec) {
            ec = std::make_error_code(std::errc::no_such_file_or_directory);
        }
        return removed;
    }
};

#endif // IPATHREMOVER_HPP
