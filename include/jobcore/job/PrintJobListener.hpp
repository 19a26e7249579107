#pragma once

namespace jobcore::job {

    class PrintJob;

/**
 * @brief Observer of print job lifecycle events. Handlers default to no-ops.
 *
 * Handlers run on whichever thread caused the transition. An exception escaping a
 * handler is logged by the job and never reaches the job or the other listeners.
 */
    class PrintJobListener {
    public:
        virtual ~PrintJobListener() = default;

        virtual void onJobStarted(PrintJob &job) {}

        virtual void onJobDone(PrintJob &job) {}

        virtual void onJobCancelled(PrintJob &job) {}

        virtual void onJobFailed(PrintJob &job) {}
    };

} // namespace jobcore::job
