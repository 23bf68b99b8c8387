#include "ReportChannel.h"

namespace masterdesk
{
    ReportChannel::~ReportChannel()
    {
        cancelPendingUpdate();
    }

    void ReportChannel::setListener(Listener newListener)
    {
        JUCE_ASSERT_MESSAGE_THREAD
        listener = std::move(newListener);
        if (listener)
        {
            const juce::ScopedLock sl(pendingLock);
            if (!pending.empty())
                triggerAsyncUpdate();
        }
    }

    void ReportChannel::push(WorkerReport report)
    {
        {
            const juce::ScopedLock sl(pendingLock);
            pending.push_back(std::move(report));
        }
        triggerAsyncUpdate();
    }

    std::vector<WorkerReport> ReportChannel::drain()
    {
        std::vector<WorkerReport> drained;
        const juce::ScopedLock sl(pendingLock);
        drained.reserve(pending.size());
        for (auto& report : pending)
            drained.push_back(std::move(report));
        pending.clear();
        return drained;
    }

    int ReportChannel::getNumPending() const
    {
        const juce::ScopedLock sl(pendingLock);
        return static_cast<int>(pending.size());
    }

    void ReportChannel::handleAsyncUpdate()
    {
        // Reports stay queued until someone is listening.
        if (!listener)
            return;

        const auto reports = drain();
        for (const auto& report : reports)
        {
            if (!listener)
                break;
            const auto deliver = listener;
            deliver(report);
        }
    }
}
