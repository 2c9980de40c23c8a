/**
 * @file
 *
 * Tracing of the guest's own GC roots. Every symlink below the roots
 * directory is followed until it reaches the store; the store paths so
 * found are the ones the guest wants the host to keep.
 */

#include "gcrelay/store/roots.hh"
#include "gcrelay/util/file-system.hh"
#include "gcrelay/util/logging.hh"
#include "gcrelay/util/signals.hh"

#include <boost/regex.hpp>

namespace gcrelay::roots {

static std::string quoteRegexChars(const std::string & raw)
{
    static auto specialRegex = boost::regex(R"([.^$\\*+?()\[\]{}|])");
    return boost::regex_replace(raw, specialRegex, R"(\\$&)");
}

static boost::regex makeStorePathRegex(const Path & storeDir)
{
    return boost::regex(
        "(" + quoteRegexChars(storeDir + "/") + R"((?!\.\.?(-|$))[0-9a-zA-Z\+\-\._\?=]+)(/.*)?)");
}

static bool isPermanentFailure(std::errc e)
{
    return e == std::errc::permission_denied || e == std::errc::no_such_file_or_directory
           || e == std::errc::not_a_directory || e == std::errc::too_many_symbolic_link_levels;
}

std::optional<StorePath>
followLinksToStorePath(const StoreDirConfig & store, const std::filesystem::path & link, unsigned int maxFollow)
{
    auto storePathRegex = makeStorePathRegex(store.storeDir);

    Path path = link.string();

    for (unsigned int followCount = 0; followCount <= maxFollow; ++followCount) {
        auto target = absPath(readLink(path), dirOf(path));

        boost::smatch match;
        if (boost::regex_match(target, match, storePathRegex)) {
            auto storePath = store.maybeParseStorePath(match[1].str());
            if (!storePath)
                debug("link '%s' points to invalid store path '%s'", link.string(), target);
            return storePath;
        }

        auto st = maybeLstat(target);
        if (!st) {
            debug("ignoring dangling link '%s'", link.string());
            return std::nullopt;
        }
        if (!S_ISLNK(st->st_mode))
            return std::nullopt;

        path = target;
    }

    debug("giving up on link '%s' after %d levels of indirection", link.string(), maxFollow);
    return std::nullopt;
}

void findRoots(const StoreDirConfig & store, const Path & path, std::filesystem::file_type type, Roots & roots)
{
    try {

        if (type == std::filesystem::file_type::unknown)
            type = std::filesystem::symlink_status(path).type();

        if (type == std::filesystem::file_type::directory) {
            for (auto & i : DirectoryIterator{path}) {
                checkInterrupt();
                findRoots(store, i.path().string(), i.symlink_status().type(), roots);
            }
        }

        else if (type == std::filesystem::file_type::symlink) {
            if (auto storePath = followLinksToStorePath(store, path))
                roots[*storePath].emplace(path);
        }

    }

    catch (std::filesystem::filesystem_error & e) {
        /* We only ignore permanent failures. */
        if (isPermanentFailure(static_cast<std::errc>(e.code().value())))
            printInfo("cannot read potential root '%1%'", path);
        else
            throw;
    }

    catch (SysError & e) {
        /* We only ignore permanent failures. */
        if (e.is(std::errc::permission_denied) || e.is(std::errc::no_such_file_or_directory)
            || e.is(std::errc::not_a_directory) || e.is(std::errc::too_many_symbolic_link_levels))
            printInfo("cannot read potential root '%1%'", path);
        else
            throw;
    }
}

Roots findRoots(const StoreDirConfig & store, const std::filesystem::path & gcrootsDir)
{
    Roots roots;
    findRoots(store, gcrootsDir.string(), std::filesystem::file_type::unknown, roots);
    return roots;
}

StorePathSet findRootPaths(const StoreDirConfig & store, const std::filesystem::path & gcrootsDir)
{
    StorePathSet paths;
    for (auto & [storePath, links] : findRoots(store, gcrootsDir))
        paths.insert(storePath);
    return paths;
}

} // namespace gcrelay::roots
