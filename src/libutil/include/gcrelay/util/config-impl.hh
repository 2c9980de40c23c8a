#pragma once
/**
 * @file
 *
 * Template implementations (as opposed to mere declarations).
 *
 * One only needs to include this when one is declaring a
 * `BaseClass<CustomType>` setting, or as derived class of such an
 * instantiation.
 */

#include <nlohmann/json.hpp>

#include "gcrelay/util/util.hh"
#include "gcrelay/util/configuration.hh"
#include "gcrelay/util/logging.hh"

namespace gcrelay {

template<>
struct BaseSetting<Strings>::trait
{
    static constexpr bool appendable = true;
};

template<>
struct BaseSetting<StringSet>::trait
{
    static constexpr bool appendable = true;
};

template<typename T>
struct BaseSetting<T>::trait
{
    static constexpr bool appendable = false;
};

template<typename T>
bool BaseSetting<T>::isAppendable()
{
    return trait::appendable;
}

template<>
void BaseSetting<Strings>::appendOrSet(Strings newValue, bool append);
template<>
void BaseSetting<StringSet>::appendOrSet(StringSet newValue, bool append);

template<typename T>
void BaseSetting<T>::appendOrSet(T newValue, bool append)
{
    static_assert(!trait::appendable, "using default `appendOrSet` implementation with an appendable type");
    assert(!append);

    value = std::move(newValue);
}

template<typename T>
void BaseSetting<T>::set(const std::string & str, bool append)
{
    appendOrSet(parse(str), append);
}

#define DECLARE_CONFIG_SERIALISER(TY)                         \
    template<>                                                \
    TY BaseSetting<TY>::parse(const std::string & str) const; \
    template<>                                                \
    std::string BaseSetting<TY>::to_string() const;

DECLARE_CONFIG_SERIALISER(std::string)
DECLARE_CONFIG_SERIALISER(std::optional<std::string>)
DECLARE_CONFIG_SERIALISER(bool)
DECLARE_CONFIG_SERIALISER(Strings)
DECLARE_CONFIG_SERIALISER(StringSet)

template<typename T>
T BaseSetting<T>::parse(const std::string & str) const
{
    static_assert(std::is_integral<T>::value, "Integer required.");

    try {
        return string2IntWithUnitPrefix<T>(str);
    } catch (...) {
        throw UsageError("setting '%s' has invalid value '%s'", name, str);
    }
}

template<typename T>
std::string BaseSetting<T>::to_string() const
{
    static_assert(std::is_integral<T>::value, "Integer required.");

    return std::to_string(value);
}

template<typename T>
nlohmann::json settingValueToJSON(const T & v)
{
    return v;
}

template<typename T>
nlohmann::json settingValueToJSON(const std::optional<T> & v)
{
    if (v)
        return *v;
    return nullptr;
}

template<typename T>
std::map<std::string, nlohmann::json> BaseSetting<T>::toJSONObject() const
{
    auto obj = AbstractSetting::toJSONObject();
    obj.emplace("value", settingValueToJSON(value));
    obj.emplace("defaultValue", settingValueToJSON(defaultValue));
    obj.emplace("documentDefault", documentDefault);
    return obj;
}

} // namespace gcrelay
