#pragma once
///@file

#include "gcrelay/util/configuration.hh"

#include <vector>

namespace gcrelay {

/**
 * The union of all `Config` objects registered with
 * `GlobalConfig::Register`. Configuration files and `--option` flags
 * are applied here, so each setting reaches whichever configuration
 * declares it.
 */
struct GlobalConfig : public AbstractConfig
{
    typedef std::vector<Config *> ConfigRegistrations;

    static ConfigRegistrations & configRegistrations()
    {
        static ConfigRegistrations configRegistrations;
        return configRegistrations;
    }

    bool set(const std::string & name, const std::string & value) override;

    void getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly = false) const override;

    void resetOverridden() override;

    nlohmann::json toJSON() override;

    std::string toKeyValue() override;

    struct Register
    {
        Register(Config * config);
    };
};

extern GlobalConfig globalConfig;

} // namespace gcrelay
