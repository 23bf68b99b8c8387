#pragma once

#include <JuceHeader.h>
#include <functional>
#include <memory>
#include "MasteringJob.h"
#include "ReportChannel.h"
#include "ToolProcessRunner.h"

namespace masterdesk
{
    // Runs one job on the calling thread and describes what happens through the channel.
    // Every public entry point pushes exactly one Finished report, whatever the outcome.
    class MasteringWorker final
    {
    public:
        MasteringWorker(ToolLauncher launcherIn, ToolProcessRunner& runnerIn, ReportChannel& reportsIn);

        void runSingle(const SingleMasteringJob& job);
        void runBatch(const BatchMasteringJob& job);

        // The file list a batch job will process, or an error when there is nothing to do.
        static bool resolveBatchInputs(const BatchMasteringJob& job,
                                       juce::Array<juce::File>& outFiles,
                                       juce::String& outError);

        // Percentage reported when file number `index` (1-based) of `total` starts.
        static int batchProgressFor(int index, int total) noexcept;

        // Empty when the tool exited cleanly and left the expected output behind, otherwise the
        // text to show. A tool killed by a signal can look like a clean exit, so the file decides.
        static juce::String describeRunProblem(const ProcessOutcome& outcome, const juce::File& expectedOutput);

    private:
        void reportFailure(const juce::String& errorMessage);

        ToolLauncher launcher;
        ToolProcessRunner& runner;
        ReportChannel& reports;

        JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(MasteringWorker)
    };

    class MasteringPoolJob final : public juce::ThreadPoolJob
    {
    public:
        MasteringPoolJob(juce::String nameIn, std::function<void()> taskIn);

        JobStatus runJob() override;

    private:
        std::function<void()> task;
    };

    // Owns the threads jobs run on. Sized to the host's CPU count; each job is itself sequential.
    class MasteringWorkerPool final
    {
    public:
        MasteringWorkerPool(ToolLauncher launcherIn, std::shared_ptr<ToolProcessRunner> runnerIn);
        ~MasteringWorkerPool();

        void startSingle(SingleMasteringJob job, std::shared_ptr<ReportChannel> reports);
        void startBatch(BatchMasteringJob job, std::shared_ptr<ReportChannel> reports);

        int getCapacity() const;

        // Returns false if jobs are still running when the timeout expires. A negative timeout waits forever.
        bool waitUntilIdle(int timeoutMs) const;

    private:
        ToolLauncher launcher;
        std::shared_ptr<ToolProcessRunner> runner;
        juce::ThreadPool pool;

        JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(MasteringWorkerPool)
    };
}
