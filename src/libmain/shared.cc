#include "gcrelay/main/shared.hh"
#include "gcrelay/main/loggers.hh"
#include "gcrelay/util/ansicolor.hh"
#include "gcrelay/util/config-global.hh"
#include "gcrelay/util/file-system.hh"
#include "gcrelay/util/logging.hh"
#include "gcrelay/util/signals.hh"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>

#include <sys/stat.h>

namespace gcrelay {

Exit::~Exit() {}

std::string getArg(const std::string & opt, Strings::iterator & i, const Strings::iterator & end)
{
    ++i;
    if (i == end)
        throw UsageError("'%1%' requires an argument", opt);
    return *i;
}

void initRelayProcess()
{
    unix::startSignalHandlerThread();

    /* Root markers must be readable by the garbage collector. */
    umask(0022);
}

static void adjustVerbosity(int delta)
{
    verbosity = (Verbosity) std::clamp((int) verbosity + delta, (int) lvlError, (int) lvlVomit);
}

void parseCmdLine(int argc, char ** argv, ParseArg parseArg)
{
    Strings args;
    for (int n = 1; n < argc; ++n)
        args.push_back(argv[n]);
    parseCmdLine(std::string(baseNameOf(argv[0])), args, parseArg);
}

void parseCmdLine(const std::string & programName, const Strings & _args, ParseArg parseArg)
{
    Strings args(_args);
    bool showConfig = false;

    for (auto i = args.begin(); i != args.end(); ++i) {
        auto & arg = *i;

        /* Expand -vvv and -qq. */
        if (arg.size() > 1 && arg[0] == '-' && arg.find_first_not_of(arg[1], 1) == std::string::npos
            && (arg[1] == 'v' || arg[1] == 'q'))
            adjustVerbosity(arg[1] == 'v' ? (int) arg.size() - 1 : -((int) arg.size() - 1));
        else if (arg == "--verbose")
            adjustVerbosity(1);
        else if (arg == "--quiet")
            adjustVerbosity(-1);
        else if (arg == "--log-format")
            setLogFormat(getArg(arg, i, args.end()));
        else if (arg == "--option") {
            auto name = getArg(arg, i, args.end());
            auto value = getArg(arg, i, args.end());
            if (!globalConfig.set(name, value))
                throw UsageError("unknown setting '%s'", name);
        } else if (arg == "--show-config")
            showConfig = true;
        else if (arg == "--version")
            printVersion(programName);
        else if (!parseArg(i, args.end()))
            throw UsageError("unrecognised flag '%1%'", arg);
    }

    if (showConfig) {
        logger->cout("%s", globalConfig.toJSON().dump(2));
        throw Exit();
    }
}

void printVersion(const std::string & programName)
{
    std::cout << fmt("%1% (gcroot-relay) %2%", programName, GCRELAY_VERSION) << std::endl;
    throw Exit();
}

int handleExceptions(const std::string & programName, std::function<void()> fun)
{
    ErrorInfo::programName = baseNameOf(programName);

    std::string error = ANSI_RED "error:" ANSI_NORMAL " ";
    try {
        try {
            fun();
        } catch (...) {
            /* Make sure that a pending interrupt doesn't make the
               logging below throw. */
            setInterrupted(false);
            throw;
        }
    } catch (Exit & e) {
        return e.status;
    } catch (UsageError & e) {
        logError(e.info());
        printError("Try '%1% --help' for more information.", programName);
        return 1;
    } catch (BaseError & e) {
        logError(e.info());
        return e.info().status;
    } catch (std::bad_alloc & e) {
        printError(error + "out of memory");
        return 1;
    } catch (std::exception & e) {
        printError(error + e.what());
        return 1;
    }

    return 0;
}

} // namespace gcrelay
