#include "gcrelay/main/loggers.hh"
#include "gcrelay/util/file-descriptor.hh"
#include "gcrelay/util/logging.hh"

namespace gcrelay {

LogFormat defaultLogFormat = LogFormat::raw;

LogFormat parseLogFormat(const std::string & logFormatStr)
{
    if (logFormatStr == "raw")
        return LogFormat::raw;
    else if (logFormatStr == "json")
        return LogFormat::json;
    throw UsageError("option 'log-format' has an invalid value '%s'", logFormatStr);
}

static std::unique_ptr<Logger> makeDefaultLogger()
{
    switch (defaultLogFormat) {
    case LogFormat::raw:
        return makeSimpleLogger();
    case LogFormat::json:
        return makeJSONLogger(getStandardError());
    default:
        unreachable();
    }
}

void setLogFormat(const std::string & logFormatStr)
{
    setLogFormat(parseLogFormat(logFormatStr));
}

void setLogFormat(const LogFormat & logFormat)
{
    defaultLogFormat = logFormat;
    createDefaultLogger();
}

void createDefaultLogger()
{
    logger = makeDefaultLogger();
}

} // namespace gcrelay
