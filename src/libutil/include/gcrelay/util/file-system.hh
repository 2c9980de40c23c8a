#pragma once
/**
 * @file
 *
 * Utilities for working with the file system and file paths.
 */

#include "gcrelay/util/types.hh"
#include "gcrelay/util/error.hh"
#include "gcrelay/util/file-descriptor.hh"

#include <sys/stat.h>
#include <sys/types.h>

#include <filesystem>
#include <optional>

namespace gcrelay {

/**
 * @return true iff the given path is absolute
 */
bool isAbsolute(PathView path);

/**
 * @return An absolutized path, resolving paths relative to the
 * specified directory, or the current directory otherwise.  The path
 * is also canonicalised.
 */
Path absPath(PathView path, std::optional<PathView> dir = {}, bool resolveSymlinks = false);

/**
 * Canonicalise a path by removing all `.` or `..` components and
 * double or trailing slashes.  Optionally resolves all symlink
 * components such that each component of the resulting path is *not*
 * a symbolic link.
 */
Path canonPath(PathView path, bool resolveSymlinks = false);

/**
 * @return The directory part of the given canonical path, i.e.,
 * everything before the final `/`.  If the path is the root or an
 * immediate child thereof (e.g., `/foo`), this means `/`
 * is returned.
 */
Path dirOf(const PathView path);

/**
 * @return the base name of the given canonical path, i.e., everything
 * following the final `/` (trailing slashes are removed).
 */
std::string_view baseNameOf(std::string_view path);

/**
 * Get status of `path`.
 */
struct stat lstat(const Path & path);

/**
 * `lstat` the given path if it exists.
 * @return std::nullopt if the path doesn't exist, or an optional containing the result of `lstat` otherwise
 */
std::optional<struct stat> maybeLstat(const Path & path);

/**
 * @return true iff the given path exists.
 */
bool pathExists(const std::filesystem::path & path);

/**
 * Read the contents (target) of a symbolic link.  The result is not
 * in any way canonicalised.
 */
Path readLink(const Path & path);

/**
 * Read the contents of a file into a string.
 */
std::string readFile(const Path & path);

/**
 * Write a string to a file.
 */
void writeFile(const Path & path, std::string_view s, mode_t mode = 0666);

/**
 * Create a directory and all its parents, if necessary.
 */
void createDirs(const std::filesystem::path & path);

/**
 * Delete a path; i.e., in the case of a directory, it is deleted
 * recursively. It's not an error if the path does not exist.
 */
void deletePath(const std::filesystem::path & path);

/**
 * Create a symlink.
 */
void createSymlink(const Path & target, const Path & link);

/**
 * Atomically create or replace a symlink.
 */
void replaceSymlink(const std::filesystem::path & target, const std::filesystem::path & link);

/**
 * Atomically rename `oldName` to `newName`, replacing `newName` if it
 * exists.
 */
void renameFile(const Path & oldName, const Path & newName);

/**
 * Return `TMPDIR`, or the default temporary directory if unset or empty.
 */
Path defaultTempDir();

/**
 * Create a temporary directory.
 */
Path createTempDir(const Path & tmpRoot = "", const Path & prefix = "gcrelay", mode_t mode = 0755);

/**
 * Return temporary path constructed by appending a suffix to a root
 * path.
 */
Path makeTempPath(const Path & root, const Path & suffix = ".tmp");

/**
 * Automatic cleanup of resources.
 */
class AutoDelete
{
    std::filesystem::path _path;
    bool del;
    bool recursive;
public:
    AutoDelete();

    AutoDelete(const std::filesystem::path & p, bool recursive = true);
    AutoDelete(const AutoDelete &) = delete;
    AutoDelete(AutoDelete &&) = delete;
    AutoDelete & operator=(const AutoDelete &) = delete;
    AutoDelete & operator=(AutoDelete &&) = delete;
    ~AutoDelete();

    void reset(const std::filesystem::path & p, bool recursive = true);

    const std::filesystem::path & path() const
    {
        return _path;
    }

    operator const std::filesystem::path &() const
    {
        return _path;
    }

    operator PathView() const
    {
        return _path.native();
    }
};

/**
 * A directory iterator that converts `std::filesystem::filesystem_error`
 * into `SysError`.
 */
class DirectoryIterator
{
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = std::filesystem::directory_entry;
    using difference_type = std::ptrdiff_t;
    using pointer = const std::filesystem::directory_entry *;
    using reference = const std::filesystem::directory_entry &;

    // Default constructor (represents end iterator)
    DirectoryIterator() noexcept = default;

    explicit DirectoryIterator(const std::filesystem::path & p);

    reference operator*() const
    {
        return *it_;
    }

    pointer operator->() const
    {
        return &(*it_);
    }

    DirectoryIterator & operator++();

    friend bool operator==(const DirectoryIterator & a, const DirectoryIterator & b) noexcept
    {
        return a.it_ == b.it_;
    }

    friend bool operator!=(const DirectoryIterator & a, const DirectoryIterator & b) noexcept
    {
        return !(a == b);
    }

    // Allow direct use in range-based for loops if iterating over an instance
    DirectoryIterator begin() const
    {
        return *this;
    }

    DirectoryIterator end() const
    {
        return DirectoryIterator{};
    }

private:
    std::filesystem::directory_iterator it_;
};

} // namespace gcrelay
