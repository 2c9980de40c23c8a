#include "gcrelay/util/environment-variables.hh"
#include "gcrelay/util/file-system.hh"
#include "gcrelay/util/signals.hh"
#include "gcrelay/util/strings.hh"
#include "gcrelay/util/util.hh"

#include <atomic>
#include <cerrno>
#include <climits>
#include <random>

#include <fcntl.h>
#include <unistd.h>

namespace gcrelay {

DirectoryIterator::DirectoryIterator(const std::filesystem::path & p)
{
    try {
        it_ = std::filesystem::directory_iterator(p);
    } catch (const std::filesystem::filesystem_error & e) {
        throw SysError(e.code().value(), "cannot read directory %s", p);
    }
}

DirectoryIterator & DirectoryIterator::operator++()
{
    std::error_code ec;
    it_.increment(ec);
    if (ec)
        throw SysError(ec.value(), "cannot read directory");
    return *this;
}

bool isAbsolute(PathView path)
{
    return !path.empty() && path[0] == '/';
}

Path absPath(PathView path, std::optional<PathView> dir, bool resolveSymlinks)
{
    std::string scratch;

    if (!isAbsolute(path)) {
        if (!dir) {
            char buf[PATH_MAX];
            if (!getcwd(buf, sizeof(buf)))
                throw SysError("cannot get cwd");
            scratch = std::string(buf) + "/" + std::string(path);
        } else
            scratch = std::string(*dir) + "/" + std::string(path);
        path = scratch;
    }
    return canonPath(path, resolveSymlinks);
}

Path canonPath(PathView path, bool resolveSymlinks)
{
    assert(path != "");

    if (!isAbsolute(path))
        throw Error("not an absolute path: '%1%'", path);

    std::string s;
    s.reserve(256);

    /* This just exists because we cannot set the target of `remaining`
       directly to a newly-constructed string, since it is
       `std::string_view`. */
    std::string temp;

    /* Count the number of times we follow a symlink and stop at some
       arbitrary (but high) limit to prevent infinite loops. */
    unsigned int followCount = 0, maxFollow = 1024;

    std::string_view remaining = path;

    while (1) {

        /* Skip slashes. */
        while (!remaining.empty() && remaining[0] == '/')
            remaining.remove_prefix(1);

        if (remaining.empty())
            break;

        auto nextComp = ({
            auto nextPathSep = remaining.find('/');
            nextPathSep == remaining.npos ? remaining : remaining.substr(0, nextPathSep);
        });

        /* Ignore `.'. */
        if (nextComp == ".")
            remaining.remove_prefix(1);

        /* If `..', delete the last component. */
        else if (nextComp == "..") {
            if (!s.empty())
                s.erase(s.rfind('/'));
            remaining.remove_prefix(2);
        }

        /* Normal component; copy it. */
        else {
            s += '/';
            if (const auto slash = remaining.find('/'); slash == remaining.npos) {
                s += remaining;
                remaining = {};
            } else {
                s += remaining.substr(0, slash);
                remaining = remaining.substr(slash);
            }

            /* If s points to a symlink, resolve it and continue from there */
            if (resolveSymlinks && std::filesystem::is_symlink(s)) {
                if (++followCount >= maxFollow)
                    throw Error("infinite symlink recursion in path '%1%'", path);
                temp = readLink(s) + std::string(remaining);
                remaining = temp;
                if (isAbsolute(remaining)) {
                    /* restart for symlinks pointing to absolute path */
                    s.clear();
                } else {
                    s = dirOf(s);
                    if (s == "/") {
                        s.clear();
                    }
                }
            }
        }
    }

    return s.empty() ? "/" : std::move(s);
}

Path dirOf(const PathView path)
{
    Path::size_type pos = path.rfind('/');
    if (pos == path.npos)
        return ".";
    return pos == 0 ? "/" : Path(path, 0, pos);
}

std::string_view baseNameOf(std::string_view path)
{
    if (path.empty())
        return "";

    auto last = path.size() - 1;
    while (last > 0 && path[last] == '/')
        last -= 1;

    auto pos = path.rfind('/', last);
    if (pos == path.npos)
        pos = 0;
    else
        pos += 1;

    return path.substr(pos, last - pos + 1);
}

struct stat lstat(const Path & path)
{
    struct stat st;
    if (::lstat(path.c_str(), &st))
        throw SysError("getting status of '%1%'", path);
    return st;
}

std::optional<struct stat> maybeLstat(const Path & path)
{
    std::optional<struct stat> st{std::in_place};
    if (::lstat(path.c_str(), &*st)) {
        if (errno == ENOENT || errno == ENOTDIR)
            st.reset();
        else
            throw SysError("getting status of '%s'", path);
    }
    return st;
}

bool pathExists(const std::filesystem::path & path)
{
    return maybeLstat(path.string()).has_value();
}

Path readLink(const Path & path)
{
    checkInterrupt();
    std::error_code ec;
    auto target = std::filesystem::read_symlink(path, ec);
    if (ec)
        throw SysError(ec.value(), "reading symbolic link '%1%'", path);
    return target.string();
}

std::string readFile(const Path & path)
{
    AutoCloseFD fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (!fd)
        throw SysError("opening file '%1%'", path);
    return readFile(fd.get());
}

void writeFile(const Path & path, std::string_view s, mode_t mode)
{
    AutoCloseFD fd = open(path.c_str(), O_WRONLY | O_TRUNC | O_CREAT | O_CLOEXEC, mode);
    if (!fd)
        throw SysError("opening file '%1%'", path);
    try {
        writeFull(fd.get(), s);
    } catch (Error & e) {
        e.addTrace("writing file '%1%'", path);
        throw;
    }
    fd.close();
}

void createDirs(const std::filesystem::path & path)
{
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec)
        throw SysError(ec.value(), "creating directory '%1%'", path.string());
}

void deletePath(const std::filesystem::path & path)
{
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec)
        throw SysError(ec.value(), "deleting '%1%'", path.string());
}

//////////////////////////////////////////////////////////////////////

AutoDelete::AutoDelete()
    : del{false}
    , recursive{false}
{
}

AutoDelete::AutoDelete(const std::filesystem::path & p, bool recursive)
    : _path(p)
{
    del = true;
    this->recursive = recursive;
}

AutoDelete::~AutoDelete()
{
    try {
        if (del) {
            if (recursive)
                deletePath(_path);
            else {
                std::filesystem::remove(_path);
            }
        }
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void AutoDelete::reset(const std::filesystem::path & p, bool recursive)
{
    _path = p;
    this->recursive = recursive;
    del = true;
}

//////////////////////////////////////////////////////////////////////

Path defaultTempDir()
{
    return getEnvNonEmpty("TMPDIR").value_or("/tmp");
}

Path createTempDir(const Path & tmpRoot, const Path & prefix, mode_t mode)
{
    while (1) {
        checkInterrupt();
        Path tmpDir = makeTempPath(tmpRoot, prefix);
        if (mkdir(tmpDir.c_str(), mode) == 0)
            return tmpDir;
        if (errno != EEXIST)
            throw SysError("creating directory '%1%'", tmpDir);
    }
}

Path makeTempPath(const Path & root, const Path & suffix)
{
    // start the counter at a random value to minimize issues with preexisting temp paths
    static std::atomic<uint32_t> counter(std::random_device{}());
    auto tmpRoot = canonPath(root.empty() ? defaultTempDir() : root, true);
    return fmt("%1%/%2%-%3%-%4%", tmpRoot, suffix, getpid(), counter.fetch_add(1, std::memory_order_relaxed));
}

void createSymlink(const Path & target, const Path & link)
{
    if (symlink(target.c_str(), link.c_str()) == -1)
        throw SysError("creating symlink '%1%' -> '%2%'", link, target);
}

void replaceSymlink(const std::filesystem::path & target, const std::filesystem::path & link)
{
    for (unsigned int n = 0; true; n++) {
        auto tmp = link.parent_path() / std::filesystem::path{fmt(".%d_%s", n, link.filename().string())};
        tmp = tmp.lexically_normal();

        if (symlink(target.c_str(), tmp.c_str()) == -1) {
            if (errno == EEXIST)
                continue;
            throw SysError("creating symlink %1% -> %2%", tmp, target);
        }

        try {
            renameFile(tmp.string(), link.string());
        } catch (SysError &) {
            unlink(tmp.c_str());
            throw;
        }

        break;
    }
}

void renameFile(const Path & oldName, const Path & newName)
{
    if (rename(oldName.c_str(), newName.c_str()) == -1)
        throw SysError("renaming '%1%' to '%2%'", oldName, newName);
}

} // namespace gcrelay
