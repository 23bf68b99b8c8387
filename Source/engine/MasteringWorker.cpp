#include "MasteringWorker.h"
#include "AudioFileScanner.h"
#include <cmath>

namespace masterdesk
{
    MasteringWorker::MasteringWorker(ToolLauncher launcherIn, ToolProcessRunner& runnerIn, ReportChannel& reportsIn)
        : launcher(std::move(launcherIn)),
          runner(runnerIn),
          reports(reportsIn)
    {
    }

    void MasteringWorker::reportFailure(const juce::String& errorMessage)
    {
        reports.push(WorkerReport::error(errorMessage));
        reports.push(WorkerReport::status(statusText::failure));
    }

    int MasteringWorker::batchProgressFor(int index, int total) noexcept
    {
        if (total <= 0)
            return 0;
        const auto exact = 100.0 * static_cast<double>(index) / static_cast<double>(total);
        return juce::jlimit(0, 100, static_cast<int>(std::lround(exact)));
    }

    juce::String MasteringWorker::describeRunProblem(const ProcessOutcome& outcome, const juce::File& expectedOutput)
    {
        if (!outcome.succeeded())
            return outcome.describeFailure();

        if (!expectedOutput.existsAsFile())
        {
            juce::Logger::writeToLog("Tool reported success but no output exists at " + expectedOutput.getFullPathName());
            return "The mastering tool exited without writing " + expectedOutput.getFullPathName() + ".";
        }

        return {};
    }

    bool MasteringWorker::resolveBatchInputs(const BatchMasteringJob& job,
                                             juce::Array<juce::File>& outFiles,
                                             juce::String& outError)
    {
        outFiles.clear();
        outError.clear();

        if (!job.inputFiles.isEmpty())
        {
            juce::Logger::writeToLog("Processing " + juce::String(job.inputFiles.size()) + " selected files.");
            outFiles = job.inputFiles;
            return true;
        }

        if (job.inputDirectory != juce::File())
        {
            juce::Logger::writeToLog("Scanning directory: " + job.inputDirectory.getFullPathName());
            outFiles = AudioFileScanner::scanDirectory(job.inputDirectory);
            if (outFiles.isEmpty())
            {
                outError = "No audio files found in the input folder.";
                return false;
            }
            return true;
        }

        outError = "No input source provided.";
        return false;
    }

    void MasteringWorker::runSingle(const SingleMasteringJob& job)
    {
        try
        {
            reports.push(WorkerReport::status(statusText::processing));

            const auto command = launcher.buildCommand(job.bitDepth, job.target, job.reference, job.output);
            const auto problem = describeRunProblem(runner.run(command), job.output);
            if (problem.isEmpty())
                reports.push(WorkerReport::status(statusText::singleSuccess));
            else
                reportFailure("An error occurred:\n\n" + problem);
        }
        catch (const std::exception& e)
        {
            juce::Logger::writeToLog("An unexpected error occurred: " + juce::String(e.what()));
            reportFailure("An unexpected error occurred:\n\n" + juce::String(e.what()));
        }
        catch (...)
        {
            juce::Logger::writeToLog("An unexpected error occurred in the single mastering job.");
            reportFailure("An unexpected error occurred.");
        }

        reports.push(WorkerReport::finished());
    }

    void MasteringWorker::runBatch(const BatchMasteringJob& job)
    {
        try
        {
            juce::Array<juce::File> files;
            juce::String resolveError;
            if (!resolveBatchInputs(job, files, resolveError))
            {
                reportFailure(resolveError);
                reports.push(WorkerReport::finished());
                return;
            }

            const int total = files.size();
            juce::Logger::writeToLog("Found " + juce::String(total) + " files to process.");

            for (int i = 0; i < total; ++i)
            {
                const auto& input = files.getReference(i);
                const auto fileName = input.getFileName();
                const auto output = deriveMasteredOutputFile(input, job.outputDirectory);

                reports.push(WorkerReport::status(statusText::batchProgress(i + 1, total, fileName)));
                reports.push(WorkerReport::progress(batchProgressFor(i + 1, total)));

                const auto problem = describeRunProblem(runner.run(launcher.buildCommand(job.bitDepth, input, job.reference, output)),
                                                        output);
                if (problem.isNotEmpty())
                {
                    reportFailure("Failed on file: " + fileName + "\n\n" + problem);
                    reports.push(WorkerReport::finished());
                    return;
                }
            }

            reports.push(WorkerReport::status(statusText::batchComplete(total)));
        }
        catch (const std::exception& e)
        {
            juce::Logger::writeToLog("An unexpected error occurred: " + juce::String(e.what()));
            reportFailure("An error occurred:\n\n" + juce::String(e.what()));
        }
        catch (...)
        {
            juce::Logger::writeToLog("An unexpected error occurred in the batch mastering job.");
            reportFailure("An unexpected error occurred.");
        }

        reports.push(WorkerReport::finished());
    }

    MasteringPoolJob::MasteringPoolJob(juce::String nameIn, std::function<void()> taskIn)
        : juce::ThreadPoolJob(std::move(nameIn)),
          task(std::move(taskIn))
    {
    }

    juce::ThreadPoolJob::JobStatus MasteringPoolJob::runJob()
    {
        if (task)
            task();
        return jobHasFinished;
    }

    MasteringWorkerPool::MasteringWorkerPool(ToolLauncher launcherIn, std::shared_ptr<ToolProcessRunner> runnerIn)
        : launcher(std::move(launcherIn)),
          runner(std::move(runnerIn)),
          pool(juce::jmax(1, juce::SystemStats::getNumCpus()))
    {
        juce::Logger::writeToLog("Max threads: " + juce::String(pool.getNumThreads()));
    }

    MasteringWorkerPool::~MasteringWorkerPool()
    {
        // Jobs cannot be interrupted mid tool call, so shutdown waits for the running one.
        juce::ignoreUnused(pool.removeAllJobs(false, -1));
    }

    void MasteringWorkerPool::startSingle(SingleMasteringJob job, std::shared_ptr<ReportChannel> reports)
    {
        jassert(reports != nullptr);
        auto task = [launcherCopy = launcher, runnerRef = runner, channel = std::move(reports), jobCopy = std::move(job)]()
        {
            MasteringWorker worker(launcherCopy, *runnerRef, *channel);
            worker.runSingle(jobCopy);
        };
        pool.addJob(new MasteringPoolJob("Master single file", std::move(task)), true);
    }

    void MasteringWorkerPool::startBatch(BatchMasteringJob job, std::shared_ptr<ReportChannel> reports)
    {
        jassert(reports != nullptr);
        auto task = [launcherCopy = launcher, runnerRef = runner, channel = std::move(reports), jobCopy = std::move(job)]()
        {
            MasteringWorker worker(launcherCopy, *runnerRef, *channel);
            worker.runBatch(jobCopy);
        };
        pool.addJob(new MasteringPoolJob("Master batch", std::move(task)), true);
    }

    int MasteringWorkerPool::getCapacity() const
    {
        return pool.getNumThreads();
    }

    bool MasteringWorkerPool::waitUntilIdle(int timeoutMs) const
    {
        const auto start = juce::Time::getMillisecondCounter();
        while (pool.getNumJobs() > 0)
        {
            if (timeoutMs >= 0 && juce::Time::getMillisecondCounter() - start >= static_cast<juce::uint32>(timeoutMs))
                return false;
            juce::Thread::sleep(5);
        }
        return true;
    }
}
