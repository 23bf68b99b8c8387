#include <JuceHeader.h>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "SingleMasterTab.h"
#include "BatchMasterTab.h"
#include "WorkerReport.h"

using namespace masterdesk;

namespace
{
    void expect(bool condition, const std::string& message)
    {
        if (!condition)
            throw std::runtime_error(message);
    }

    const juce::File& scratchRoot()
    {
        static const juce::File root = juce::File::getSpecialLocation(juce::File::tempDirectory)
            .getNonexistentChildFile("masterdesk_tab_tests", {}, false);
        return root;
    }

    // Fails the call numbered failOnCall (1-based), if any; other calls create the output file.
    class ScriptedRunner final : public ToolProcessRunner
    {
    public:
        explicit ScriptedRunner(int failOnCallIn = 0) : failOnCall(failOnCallIn) {}

        ProcessOutcome run(const juce::StringArray& command) override
        {
            const juce::ScopedLock sl(lock);
            ++numCalls;

            ProcessOutcome outcome;
            outcome.launched = true;
            outcome.exitCode = numCalls == failOnCall ? 2 : 0;
            if (outcome.exitCode != 0)
                outcome.errorOutput = "reference too quiet";
            else
                juce::ignoreUnused(juce::File(command[command.size() - 1]).create());
            return outcome;
        }

        int getNumCalls() const
        {
            const juce::ScopedLock sl(lock);
            return numCalls;
        }

    private:
        int failOnCall = 0;
        int numCalls = 0;
        mutable juce::CriticalSection lock;
    };

    struct Warning
    {
        juce::String title;
        juce::String message;
    };

    ToolLauncher makeLauncher()
    {
        ToolLauncher launcher;
        launcher.prefix = { "python3", "/opt/matchering-cli/mg_cli.py" };
        return launcher;
    }

    bool pumpUntil(const std::function<bool()>& done, int timeoutMs = 10000)
    {
        const auto start = juce::Time::getMillisecondCounter();
        while (!done())
        {
            if (juce::Time::getMillisecondCounter() - start > static_cast<juce::uint32>(timeoutMs))
                return false;
            juce::MessageManager::getInstance()->runDispatchLoopUntil(20);
        }
        return true;
    }

    juce::File makeInputFolder(const juce::String& name, int numFiles)
    {
        const auto dir = scratchRoot().getChildFile(name);
        expect(dir.createDirectory().wasOk(), "Expected input folder");
        for (int i = 1; i <= numFiles; ++i)
            expect(dir.getChildFile("take" + juce::String(i) + ".wav").replaceWithText("fixture"), "Expected fixture write");
        return dir;
    }

    void runSingleTabRejectsIncompleteForm()
    {
        auto runner = std::make_shared<ScriptedRunner>();
        MasteringWorkerPool pool(makeLauncher(), runner);
        SingleMasterTab tab(pool, "24");

        std::vector<Warning> warnings;
        tab.onWarning = [&warnings](const juce::String& title, const juce::String& message) { warnings.push_back({ title, message }); };

        tab.setFormForTesting({}, "/music/song.wav", {}, "24");
        expect(tab.clickRunForTesting(), "Run button should be clickable before any job");
        expect(warnings.size() == 1 && warnings[0].title == "Missing Info", "Incomplete form should warn locally");
        expect(tab.isRunEnabledForTesting(), "Rejected form must leave the run button enabled");

        tab.setFormForTesting("/music/ref.wav", "/music/song.wav", "/music/out.flac", "20");
        expect(tab.clickRunForTesting(), "Run button should still be clickable");
        expect(warnings.size() == 2 && warnings[1].title == "Invalid Bit-depth", "Bad bit depth should warn locally");
        expect(tab.isRunEnabledForTesting(), "Rejected bit depth must leave the run button enabled");

        expect(pool.waitUntilIdle(1000), "Rejected forms should not start a job");
        expect(runner->getNumCalls() == 0, "Rejected forms must not run the tool");
    }

    void runSingleTabSuccess()
    {
        auto runner = std::make_shared<ScriptedRunner>();
        MasteringWorkerPool pool(makeLauncher(), runner);
        SingleMasterTab tab(pool, "24");

        std::vector<Warning> warnings;
        tab.onWarning = [&warnings](const juce::String& title, const juce::String& message) { warnings.push_back({ title, message }); };

        const auto output = scratchRoot().getChildFile("single/song (Mastered).flac");
        tab.setFormForTesting("/music/ref.wav", "/music/song.wav", output.getFullPathName(), "24");

        expect(tab.clickRunForTesting(), "Run button should start the job");
        expect(!tab.isRunEnabledForTesting(), "Run button should be disabled while the job is in flight");
        expect(tab.getStatusPanelForTesting().getState() == StatusPanel::State::InProgress, "Status should show work in progress");
        expect(!tab.clickRunForTesting(), "A disabled run button must not start a second job");

        expect(pumpUntil([&tab] { return tab.isRunEnabledForTesting(); }), "Run button should come back on Finished");
        expect(runner->getNumCalls() == 1, "Single job should run the tool once");
        expect(warnings.empty(), "Successful job should not warn");
        expect(tab.getStatusPanelForTesting().getText() == statusText::singleSuccess, "Status should show success text");
        expect(tab.getStatusPanelForTesting().getState() == StatusPanel::State::Success, "Success colour should follow the success text");
    }

    void runSingleTabFailure()
    {
        auto runner = std::make_shared<ScriptedRunner>(1);
        MasteringWorkerPool pool(makeLauncher(), runner);
        SingleMasterTab tab(pool, "24");

        std::vector<Warning> warnings;
        tab.onWarning = [&warnings](const juce::String& title, const juce::String& message) { warnings.push_back({ title, message }); };

        const auto output = scratchRoot().getChildFile("single/failed (Mastered).flac");
        tab.setFormForTesting("/music/ref.wav", "/music/failed.wav", output.getFullPathName(), "16");

        expect(tab.clickRunForTesting(), "Run button should start the job");
        expect(!tab.isRunEnabledForTesting(), "Run button should be disabled while the job is in flight");

        expect(pumpUntil([&tab] { return tab.isRunEnabledForTesting(); }), "Run button should come back after a failure");
        expect(warnings.size() == 1 && warnings[0].title == "Error", "Failure should raise one error dialog");
        expect(warnings[0].message.contains("reference too quiet"), "Error dialog should carry the diagnostic");
        expect(tab.getStatusPanelForTesting().getText() == statusText::failure, "Status should show the failure text");
        expect(tab.getStatusPanelForTesting().getState() == StatusPanel::State::Error, "Failure should keep the error colour");
    }

    void runBatchTabSuccess()
    {
        auto runner = std::make_shared<ScriptedRunner>();
        MasteringWorkerPool pool(makeLauncher(), runner);
        BatchMasterTab tab(pool, "24");

        std::vector<Warning> warnings;
        tab.onWarning = [&warnings](const juce::String& title, const juce::String& message) { warnings.push_back({ title, message }); };

        const auto input = makeInputFolder("batch_ok", 2);
        const auto outputDir = input.getChildFile("Mastered");
        tab.setFormForTesting("/music/ref.wav", input.getFullPathName(), outputDir.getFullPathName(), "24");

        expect(!tab.isProgressVisibleForTesting(), "Progress bar should start hidden");
        expect(tab.clickRunForTesting(), "Run button should start the batch");
        expect(outputDir.isDirectory(), "Output folder should be created before the batch starts");
        expect(!tab.isRunEnabledForTesting(), "Run button should be disabled while the batch is in flight");
        expect(tab.isProgressVisibleForTesting(), "Progress bar should be shown while the batch runs");
        expect(tab.getProgressForTesting() == 0.0, "Progress bar should start at zero");

        expect(pumpUntil([&tab] { return tab.isRunEnabledForTesting(); }), "Run button should come back on Finished");
        expect(runner->getNumCalls() == 2, "Batch should run the tool once per file");
        expect(warnings.empty(), "Successful batch should not warn");
        expect(!tab.isProgressVisibleForTesting(), "Progress bar should be hidden on Finished");
        expect(tab.getProgressForTesting() == 1.0, "Last progress report should reach 100");
        expect(tab.getStatusPanelForTesting().getText() == "Batch complete! 2 files mastered.", "Status should show completion");
        expect(tab.getStatusPanelForTesting().getState() == StatusPanel::State::Success, "Success colour should follow the completion text");
    }

    void runBatchTabFailure()
    {
        auto runner = std::make_shared<ScriptedRunner>(1);
        MasteringWorkerPool pool(makeLauncher(), runner);
        BatchMasterTab tab(pool, "24");

        std::vector<Warning> warnings;
        tab.onWarning = [&warnings](const juce::String& title, const juce::String& message) { warnings.push_back({ title, message }); };

        const auto input = makeInputFolder("batch_fail", 3);
        tab.setFormForTesting("/music/ref.wav", input.getFullPathName(), input.getChildFile("Mastered").getFullPathName(), "32");

        expect(tab.clickRunForTesting(), "Run button should start the batch");
        expect(!tab.isRunEnabledForTesting(), "Run button should be disabled while the batch is in flight");

        expect(pumpUntil([&tab] { return tab.isRunEnabledForTesting(); }), "Run button should come back after a failure");
        expect(runner->getNumCalls() == 1, "Batch should stop at the failing file");
        expect(warnings.size() == 1 && warnings[0].title == "Batch Error", "Failure should raise one batch error dialog");
        expect(warnings[0].message.startsWith("Failed on file: take"), "Batch error should name the failing file");
        expect(!tab.isProgressVisibleForTesting(), "Progress bar should be hidden after an error");
        expect(tab.getStatusPanelForTesting().getState() == StatusPanel::State::Error, "Failure should keep the error colour");
    }
}

int main()
{
    juce::ScopedJuceInitialiser_GUI juceInit;

    int result = 0;
    try
    {
        runSingleTabRejectsIncompleteForm();
        runSingleTabSuccess();
        runSingleTabFailure();
        runBatchTabSuccess();
        runBatchTabFailure();
        std::cout << "TabStaticTests: PASS" << std::endl;
    }
    catch (const std::exception& e)
    {
        std::cerr << "TabStaticTests: FAIL: " << e.what() << std::endl;
        result = 1;
    }

    juce::ignoreUnused(scratchRoot().deleteRecursively());
    return result;
}
