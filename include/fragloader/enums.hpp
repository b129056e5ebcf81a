#ifndef FRAGLOADER_ENUMS_HPP
#define FRAGLOADER_ENUMS_HPP

#define PARTEXT ".part"
#define RESUMEEXT ".fragdl"
#define FRAGEXT "-Frag"

namespace fragloader
{
    // Phases of one fragmented download session.
    enum class SessionState
    {
        kINIT,
        // A checkpoint and a partial output were found on disk.
        kRESUMED,
        // Nothing to resume, the output starts empty.
        kFRESH,
        kFETCHING_FRAGMENT,
        kRETRYING_FRAGMENT,
        kSKIPPING_FRAGMENT,
        kAPPENDING,
        kFINALIZING,
        kDONE,
        kABORTED,
    };

    enum class ProgressStatus
    {
        kDOWNLOADING,
        kFINISHED,
    };

    // Kinds of events a transport (or the orchestrator) feeds to the progress
    // aggregator.
    enum class TransferEvent
    {
        // Bytes were received for the in-flight fragment.
        kDOWNLOADING,
        // The in-flight fragment is complete.
        kFINISHED,
        // The in-flight attempt failed, its bytes must be forgotten.
        kRESET,
        // The fragment was given up on and will never be appended.
        kSKIPPED,
    };

    enum class ErrorCode
    {
        // everything is ok
        PD_OK,
        // bad function argument
        PD_BADFUNCARG,
        // cURL doesn't know the option. Too old curl version?
        PD_CURLSETOPT,
        // cURL error
        PD_CURL,
        // HTTP or FTP returned status code which do not represent success
        // (file doesn't exists, etc.)
        PD_BADSTATUS,
        // some error that should be temporary and next try could work
        // (HTTP status codes 500, 502-504, operation timeout, ...)
        PD_TEMPORARYERR,
        // input output error
        PD_IO,
        // Download was interrupted by a stop request.
        PD_INTERRUPTED,
        // The download wasn't or cannot be finished.
        PD_UNFINISHED,
        // File operation error (operation not permitted, filename too long, no memory available,
        // bad file descriptor, ...)
        PD_FILE,
        // A fragment could not be fetched within its retry budget.
        PD_FRAGMENTUNAVAILABLE,
        // The resume sidecar exists but cannot be read or parsed.
        PD_CORRUPTCHECKPOINT,
        // The partial output on disk doesn't agree with the resume checkpoint.
        PD_RESUMEMISMATCH,
        // (xx) unknown error - sentinel of error codes enum
        PD_UNKNOWNERROR,
    };

    enum ErrorLevel
    {
        INFO,
        SERIOUS,
        FATAL
    };
}

#endif
