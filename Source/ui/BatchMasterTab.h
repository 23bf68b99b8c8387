#pragma once
#include <JuceHeader.h>
#include <functional>
#include <memory>
#include "FormRow.h"
#include "StatusPanel.h"
#include "MasteringWorker.h"

namespace masterdesk
{
    // "Batch Master" tab: one reference applied to a folder or a hand-picked list of files.
    class BatchMasterTab final : public juce::Component
    {
    public:
        BatchMasterTab(MasteringWorkerPool& pool, const juce::String& defaultBitDepth);
        ~BatchMasterTab() override;

        void paint(juce::Graphics& g) override;
        void resized() override;

        // Replaces the warning dialog when set.
        std::function<void(const juce::String& title, const juce::String& message)> onWarning;

        void setFormForTesting(const juce::String& reference,
                               const juce::String& input,
                               const juce::String& outputDirectory,
                               const juce::String& bitDepth);
        bool clickRunForTesting();
        bool isRunEnabledForTesting() const { return runButton.isEnabled(); }
        bool isProgressVisibleForTesting() const { return progressBar.isVisible(); }
        double getProgressForTesting() const noexcept { return progressValue; }
        const StatusPanel& getStatusPanelForTesting() const noexcept { return statusPanel; }

    private:
        void chooseReference();
        void chooseInputDirectory();
        void chooseInputFiles();
        void chooseOutputDirectory();
        void startMastering();
        void handleReport(const WorkerReport& report);
        void setProgressVisible(bool shouldBeVisible);
        void showWarning(const juce::String& title, const juce::String& message);

        MasteringWorkerPool& workerPool;
        std::shared_ptr<ReportChannel> reports;
        std::unique_ptr<juce::FileChooser> fileChooser;
        juce::StringArray selectedFiles;

        FormRow referenceRow { "Reference:", "Path to your reference track...", true };
        FormRow inputRow { "Input:", "Select an input directory OR multiple files...", true };
        FormRow outputRow { "Output Dir:", "Select a folder to save mastered files...", true };
        FormRow bitDepthRow { "Bit-depth (16, 24, 32):", {}, false, 50 };
        juce::TextButton runButton { "MASTER BATCH" };
        double progressValue = 0.0;
        juce::ProgressBar progressBar { progressValue };
        StatusPanel statusPanel;

        JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(BatchMasterTab)
    };
}
