#include "gcrelay/relay/relay-settings.hh"
#include "gcrelay/util/config-impl.hh"
#include "gcrelay/util/environment-variables.hh"
#include "gcrelay/util/file-system.hh"

#include <nlohmann/json.hpp>

namespace gcrelay::relay {

NLOHMANN_JSON_SERIALIZE_ENUM(
    ListenMode,
    {
        {ListenMode::Auto, "auto"},
        {ListenMode::Activated, "activated"},
        {ListenMode::Bound, "bound"},
    });

} // namespace gcrelay::relay

namespace gcrelay {

using relay::ListenMode;

template<>
ListenMode BaseSetting<ListenMode>::parse(const std::string & str) const
{
    if (str == "auto")
        return ListenMode::Auto;
    else if (str == "activated")
        return ListenMode::Activated;
    else if (str == "bound")
        return ListenMode::Bound;
    else
        throw UsageError("option '%s' has invalid value '%s'", name, str);
}

template<>
std::string BaseSetting<ListenMode>::to_string() const
{
    if (value == ListenMode::Auto)
        return "auto";
    else if (value == ListenMode::Activated)
        return "activated";
    else if (value == ListenMode::Bound)
        return "bound";
    else
        unreachable();
}

template class BaseSetting<ListenMode>;

} // namespace gcrelay

namespace gcrelay::relay {

RelaySettings::RelaySettings() {}

RelaySettings relaySettings;

ClientSettings clientSettings;

Path getConfDir()
{
    return getEnvNonEmpty("GCROOT_RELAY_CONF_DIR").value_or("/etc/gcroot-relay");
}

void loadConfFile(AbstractConfig & config, std::string_view fileName)
{
    auto path = getConfDir() + "/" + std::string(fileName);
    try {
        std::string contents = readFile(path);
        config.applyConfig(contents, path);
    } catch (SysError & e) {
        if (!e.is(std::errc::no_such_file_or_directory))
            throw;
    }
}

} // namespace gcrelay::relay
