#include "gcrelay/util/logging.hh"
#include "gcrelay/util/config-global.hh"
#include "gcrelay/util/config-impl.hh"
#include "gcrelay/util/environment-variables.hh"
#include "gcrelay/util/file-descriptor.hh"
#include "gcrelay/util/sync.hh"
#include "gcrelay/util/unix-domain-socket.hh"
#include "gcrelay/util/util.hh"

#include <fcntl.h>
#include <unistd.h>

#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace gcrelay {

LoggerSettings loggerSettings;

static GlobalConfig::Register rLoggerSettings(&loggerSettings);

std::unique_ptr<Logger> logger = makeSimpleLogger();

void Logger::warn(const std::string & msg)
{
    log(lvlWarn, ANSI_WARNING "warning:" ANSI_NORMAL " " + msg);
}

void Logger::writeToStdout(std::string_view s)
{
    Descriptor standard_out = getStandardOutput();
    writeFull(standard_out, s);
    writeFull(standard_out, "\n");
}

class SimpleLogger : public Logger
{
public:

    bool systemd;

    SimpleLogger()
    {
        systemd = getEnv("IN_SYSTEMD") == "1";
    }

    void log(Verbosity lvl, std::string_view s) override
    {
        if (lvl > verbosity)
            return;

        std::string prefix;

        if (systemd) {
            char c;
            switch (lvl) {
            case lvlError:
                c = '3';
                break;
            case lvlWarn:
                c = '4';
                break;
            case lvlNotice:
            case lvlInfo:
                c = '5';
                break;
            case lvlTalkative:
            case lvlChatty:
                c = '6';
                break;
            case lvlDebug:
            case lvlVomit:
                c = '7';
                break;
            default:
                c = '7';
                break;
            }
            prefix = std::string("<") + c + ">";
        }

        writeToStderr(prefix + std::string(s) + "\n");
    }

    void logEI(const ErrorInfo & ei) override
    {
        std::ostringstream oss;
        showErrorInfo(oss, ei, loggerSettings.showTrace.get());

        log(ei.level, oss.str());
    }
};

Verbosity verbosity = lvlInfo;

void writeToStderr(std::string_view s)
{
    try {
        writeFull(getStandardError(), s, false);
    } catch (SystemError & e) {
        /* Ignore failing writes to stderr.  We need to ignore write
           errors to ensure that cleanup code that logs to stderr runs
           to completion if the other side of stderr has been closed
           unexpectedly. */
    }
}

std::unique_ptr<Logger> makeSimpleLogger()
{
    return std::make_unique<SimpleLogger>();
}

struct JSONLogger : Logger
{
    Descriptor fd;

    JSONLogger(Descriptor fd)
        : fd(fd)
    {
    }

    struct State
    {
        bool enabled = true;
    };

    Sync<State> _state;

    void write(const nlohmann::json & json)
    {
        auto line = json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

        /* Acquire a lock to prevent log messages from clobbering each
           other. */
        try {
            auto state(_state.lock());
            if (state->enabled)
                writeLine(fd, line);
        } catch (...) {
            bool enabled = false;
            std::swap(_state.lock()->enabled, enabled);
            if (enabled) {
                ignoreExceptionExceptInterrupt();
                logger->warn("disabling JSON logger due to write errors");
            }
        }
    }

    void log(Verbosity lvl, std::string_view s) override
    {
        if (lvl > verbosity)
            return;
        nlohmann::json json;
        json["action"] = "msg";
        json["level"] = lvl;
        json["msg"] = s;
        write(json);
    }

    void logEI(const ErrorInfo & ei) override
    {
        std::ostringstream oss;
        showErrorInfo(oss, ei, loggerSettings.showTrace.get());

        nlohmann::json json;
        json["action"] = "msg";
        json["level"] = ei.level;
        json["msg"] = oss.str();
        json["raw_msg"] = ei.msg.str();

        if (loggerSettings.showTrace.get() && !ei.traces.empty()) {
            nlohmann::json traces = nlohmann::json::array();
            for (auto iter = ei.traces.rbegin(); iter != ei.traces.rend(); ++iter) {
                nlohmann::json stackFrame;
                stackFrame["raw_msg"] = iter->hint.str();
                traces.push_back(stackFrame);
            }

            json["trace"] = traces;
        }

        write(json);
    }
};

std::unique_ptr<Logger> makeJSONLogger(Descriptor fd)
{
    return std::make_unique<JSONLogger>(fd);
}

std::unique_ptr<Logger> makeJSONLogger(const std::filesystem::path & path)
{
    struct JSONFileLogger : JSONLogger
    {
        AutoCloseFD fd;

        JSONFileLogger(AutoCloseFD && fd)
            : JSONLogger(fd.get())
            , fd(std::move(fd))
        {
        }
    };

    AutoCloseFD fd = std::filesystem::is_socket(path)
                         ? connect(path)
                         : AutoCloseFD(open(path.string().c_str(), O_CREAT | O_APPEND | O_WRONLY | O_CLOEXEC, 0644));
    if (!fd)
        throw SysError("opening log file %1%", path);

    return std::make_unique<JSONFileLogger>(std::move(fd));
}

void applyJSONLogger()
{
    auto & path = loggerSettings.jsonLogPath.get();
    if (path && !path->empty()) {
        try {
            std::vector<std::unique_ptr<Logger>> loggers;
            loggers.push_back(makeJSONLogger(std::filesystem::path(*path)));
            logger = makeTeeLogger(std::move(logger), std::move(loggers));
        } catch (...) {
            ignoreExceptionExceptInterrupt();
        }
    }
}

} // namespace gcrelay
