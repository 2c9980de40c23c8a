#pragma once
///@file

#include <list>
#include <set>
#include <string>
#include <map>
#include <vector>

namespace gcrelay {

typedef std::list<std::string> Strings;

/**
 * Ordered std::string -> std::string map with a transparent comparator,
 * so lookups by `std::string_view` do not allocate.
 */
using StringMap = std::map<std::string, std::string, std::less<>>;

/**
 * Ordered string set with a transparent comparator.
 *
 * @see StringMap
 */
using StringSet = std::set<std::string, std::less<>>;

/**
 * Paths are just strings.
 */
typedef std::string Path;
typedef std::string_view PathView;
typedef std::list<Path> Paths;
typedef std::set<Path> PathSet;

} // namespace gcrelay
