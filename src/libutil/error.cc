#include "gcrelay/util/error.hh"
#include "gcrelay/util/logging.hh"

#include <iostream>
#include <optional>
#include <sstream>

namespace gcrelay {

void BaseError::addTrace(HintFmt hint)
{
    err.traces.push_front(Trace{.hint = hint});
    what_.reset();
}

// c++ std::exception descendants must have a 'const char* what()' function.
// This stringifies the error and caches it for use by what(), or similarly by msg().
const std::string & BaseError::calcWhat() const
{
    if (what_.has_value())
        return *what_;
    else {
        std::ostringstream oss;
        showErrorInfo(oss, err, loggerSettings.showTrace);
        what_ = oss.str();
        return *what_;
    }
}

std::optional<std::string> ErrorInfo::programName = std::nullopt;

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo, bool showTrace)
{
    std::string prefix;
    switch (einfo.level) {
    case Verbosity::lvlError: {
        prefix = ANSI_RED "error";
        break;
    }
    case Verbosity::lvlNotice: {
        prefix = ANSI_RED "note";
        break;
    }
    case Verbosity::lvlWarn: {
        prefix = ANSI_WARNING "warning";
        break;
    }
    case Verbosity::lvlInfo: {
        prefix = ANSI_GREEN "info";
        break;
    }
    case Verbosity::lvlTalkative: {
        prefix = ANSI_GREEN "talk";
        break;
    }
    case Verbosity::lvlChatty: {
        prefix = ANSI_GREEN "chat";
        break;
    }
    case Verbosity::lvlVomit: {
        prefix = ANSI_GREEN "vomit";
        break;
    }
    case Verbosity::lvlDebug: {
        prefix = ANSI_WARNING "debug";
        break;
    }
    default:
        assert(false);
    }

    prefix += ":" ANSI_NORMAL " ";

    std::ostringstream oss;

    /* Traces are printed outermost first. Without `show-trace`, only
       the few innermost are shown. */
    size_t count = 0;
    bool truncate = false;
    for (auto iter = einfo.traces.rbegin(); iter != einfo.traces.rend(); ++iter) {
        if (!showTrace && count > 3) {
            truncate = true;
            break;
        }
        oss << "\n" << "… " << iter->hint.str() << "\n";
        count++;
    }

    if (truncate)
        oss << "\n" << ANSI_WARNING "(stack trace truncated; use '--show-trace' to show the full trace)" ANSI_NORMAL
            << "\n";

    oss << "\n" << prefix;

    oss << einfo.msg << "\n";

    auto res = oss.str();

    /* Strip the leading newline of the first trace or of the message,
       and the trailing newline, so the result can be embedded. */
    auto start = res.find_first_not_of('\n');
    auto end = res.find_last_not_of('\n');
    if (start == res.npos)
        return out;
    out << res.substr(start, end - start + 1);

    return out;
}

void panic(std::string_view msg)
{
    writeToStderr("\n\n" ANSI_RED "terminating due to unexpected unrecoverable internal error: " ANSI_NORMAL);
    writeToStderr(msg);
    writeToStderr("\n");
    std::terminate();
}

void unreachable(std::source_location loc)
{
    panic(fmt("unexpected condition reached at %s:%d", loc.file_name(), loc.line()));
}

} // namespace gcrelay
