#pragma once
///@file

#include "gcrelay/util/types.hh"

namespace gcrelay {

enum class LogFormat {
    raw,
    json,
};

LogFormat parseLogFormat(const std::string & logFormatStr);

void setLogFormat(const std::string & logFormatStr);
void setLogFormat(const LogFormat & logFormat);

void createDefaultLogger();

} // namespace gcrelay
