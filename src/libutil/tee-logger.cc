#include "gcrelay/util/logging.hh"

namespace gcrelay {

struct TeeLogger : Logger
{
    std::vector<std::unique_ptr<Logger>> loggers;

    TeeLogger(std::vector<std::unique_ptr<Logger>> && loggers)
        : loggers(std::move(loggers))
    {
    }

    void stop() override
    {
        for (auto & logger : loggers)
            logger->stop();
    };

    void log(Verbosity lvl, std::string_view s) override
    {
        for (auto & logger : loggers)
            logger->log(lvl, s);
    }

    void logEI(const ErrorInfo & ei) override
    {
        for (auto & logger : loggers)
            logger->logEI(ei);
    }

    void warn(const std::string & msg) override
    {
        for (auto & logger : loggers)
            logger->warn(msg);
    }

    void writeToStdout(std::string_view s) override
    {
        /* Let only the first logger write to stdout to avoid
           duplication. */
        if (!loggers.empty())
            loggers.front()->writeToStdout(s);
    }
};

std::unique_ptr<Logger>
makeTeeLogger(std::unique_ptr<Logger> mainLogger, std::vector<std::unique_ptr<Logger>> && extraLoggers)
{
    std::vector<std::unique_ptr<Logger>> allLoggers;
    allLoggers.push_back(std::move(mainLogger));
    for (auto & l : extraLoggers)
        allLoggers.push_back(std::move(l));
    return std::make_unique<TeeLogger>(std::move(allLoggers));
}

} // namespace gcrelay
