#ifndef VITRINE_CORE_MONITORING_HPP
#define VITRINE_CORE_MONITORING_HPP

namespace vitrine {

// Long-running operations (mostly transfers) use callbacks to report progress
// or check in with their callers (which can, for example, terminate the
// operation). The following are the interface definitions for these
// callbacks and some utilities for constructing them.

// A progress reporter object gets called periodically with the progress of the
// operation (0 is just started, 1 is done).
struct progress_reporter_interface
{
    virtual void
    operator()(float)
        = 0;
};
// If you don't want to know about the progress, pass one of these.
struct null_progress_reporter : progress_reporter_interface
{
    void
    operator()(float)
    {
    }
};

// Operations call this to check in with the caller every few milliseconds.
// This can be used to abort the operation by throwing an exception.
struct check_in_interface
{
    virtual void
    operator()()
        = 0;
};
// If you don't need the operation to check in, pass one of these.
struct null_check_in : check_in_interface
{
    void
    operator()()
    {
    }
};

} // namespace vitrine

#endif
