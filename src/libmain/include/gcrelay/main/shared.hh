#pragma once
///@file

#include "gcrelay/util/types.hh"
#include "gcrelay/util/util.hh"

#include <exception>
#include <functional>

namespace gcrelay {

/**
 * Exit the program with a given exit code.
 */
class Exit : public std::exception
{
public:
    int status = 0;

    Exit() = default;

    explicit Exit(int status)
        : status(status)
    {
    }

    virtual ~Exit();
};

int handleExceptions(const std::string & programName, std::function<void()> fun);

/**
 * Process-wide initialisation: start the signal handler thread and
 * set the umask.
 */
void initRelayProcess();

typedef std::function<bool(Strings::iterator & arg, const Strings::iterator & end)> ParseArg;

/**
 * Parse the command line. The flags shared by all programs (`-v`,
 * `-q`, `--log-format`, `--option`, `--show-config`, `--version`)
 * are handled here; everything else is passed to `parseArg`, which
 * returns false for arguments it does not recognise.
 */
void parseCmdLine(int argc, char ** argv, ParseArg parseArg);

void parseCmdLine(const std::string & programName, const Strings & args, ParseArg parseArg);

void printVersion(const std::string & programName);

std::string getArg(const std::string & opt, Strings::iterator & i, const Strings::iterator & end);

} // namespace gcrelay
