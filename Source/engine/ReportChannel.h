#pragma once

#include <JuceHeader.h>
#include <deque>
#include <functional>
#include <vector>
#include "WorkerReport.h"

namespace masterdesk
{
    // Carries worker reports from pool threads to the message thread.
    // push() may be called from any thread. The listener is only ever invoked on the
    // message thread, in push order.
    class ReportChannel final : private juce::AsyncUpdater
    {
    public:
        using Listener = std::function<void(const WorkerReport&)>;

        ReportChannel() = default;
        ~ReportChannel() override;

        // Message thread only. Pass an empty function to detach.
        void setListener(Listener newListener);

        void push(WorkerReport report);

        // Removes and returns everything queued so far.
        std::vector<WorkerReport> drain();
        int getNumPending() const;

    private:
        void handleAsyncUpdate() override;

        mutable juce::CriticalSection pendingLock;
        std::deque<WorkerReport> pending;
        Listener listener;

        JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ReportChannel)
    };
}
