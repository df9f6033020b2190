#ifndef EXITCODES_H
#define EXITCODES_H

/**
 * Process exit codes of the submux executable
 */
namespace ExitCode {
    constexpr int SUCCESS = 0;
    constexpr int FATAL_ERROR = 1;        // Bad arguments, unreadable directory, missing merge tool
    constexpr int PARTIAL_FAILURE = 2;    // Some pairs failed, some succeeded
    constexpr int COMPLETE_FAILURE = 3;   // Every attempted pair failed

    inline int fromCounts(int succeeded, int failed)
    {
        if (failed == 0) {
            return SUCCESS;
        }
        return succeeded > 0 ? PARTIAL_FAILURE : COMPLETE_FAILURE;
    }
}

#endif // EXITCODES_H
