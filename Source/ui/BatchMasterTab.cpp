#include "BatchMasterTab.h"
#include "AudioFileScanner.h"

namespace masterdesk
{
    BatchMasterTab::BatchMasterTab(MasteringWorkerPool& pool, const juce::String& defaultBitDepth)
        : workerPool(pool),
          reports(std::make_shared<ReportChannel>())
    {
        referenceRow.addButton("Browse...", [this] { chooseReference(); });
        inputRow.addButton("Select Directory...", [this] { chooseInputDirectory(); });
        inputRow.addButton("Select Files...", [this] { chooseInputFiles(); });
        outputRow.addButton("Browse...", [this] { chooseOutputDirectory(); });
        bitDepthRow.setCaptionWidth(170);
        bitDepthRow.setText(defaultBitDepth);

        addAndMakeVisible(referenceRow);
        addAndMakeVisible(inputRow);
        addAndMakeVisible(outputRow);
        addAndMakeVisible(bitDepthRow);

        runButton.onClick = [this] { startMastering(); };
        addAndMakeVisible(runButton);

        addChildComponent(progressBar);
        addAndMakeVisible(statusPanel);

        reports->setListener([this](const WorkerReport& report) { handleReport(report); });
    }

    BatchMasterTab::~BatchMasterTab()
    {
        reports->setListener({});
    }

    void BatchMasterTab::paint(juce::Graphics& g)
    {
        g.fillAll(theme::Colours::panel());
    }

    void BatchMasterTab::resized()
    {
        auto r = getLocalBounds().reduced(14);
        const auto row = [&r](juce::Component& c)
        {
            c.setBounds(r.removeFromTop(theme::Dimensions::rowHeight));
            r.removeFromTop(theme::Dimensions::rowGap);
        };

        row(referenceRow);
        row(inputRow);
        row(outputRow);
        row(bitDepthRow);

        statusPanel.setBounds(r.removeFromBottom(theme::Dimensions::statusHeight));
        r.removeFromBottom(theme::Dimensions::rowGap);
        progressBar.setBounds(r.removeFromBottom(22));
        r.removeFromBottom(theme::Dimensions::rowGap);
        runButton.setBounds(r.removeFromBottom(theme::Dimensions::runButtonHeight));
    }

    void BatchMasterTab::setProgressVisible(bool shouldBeVisible)
    {
        progressBar.setVisible(shouldBeVisible);
    }

    void BatchMasterTab::showWarning(const juce::String& title, const juce::String& message)
    {
        if (onWarning != nullptr)
            onWarning(title, message);
        else
            juce::AlertWindow::showMessageBoxAsync(juce::AlertWindow::WarningIcon, title, message);
    }

    void BatchMasterTab::setFormForTesting(const juce::String& reference,
                                           const juce::String& input,
                                           const juce::String& outputDirectory,
                                           const juce::String& bitDepth)
    {
        referenceRow.setText(reference);
        inputRow.setText(input);
        selectedFiles.clear();
        outputRow.setText(outputDirectory);
        bitDepthRow.setText(bitDepth);
    }

    bool BatchMasterTab::clickRunForTesting()
    {
        if (!runButton.isEnabled() || runButton.onClick == nullptr)
            return false;
        runButton.onClick();
        return true;
    }

    void BatchMasterTab::chooseReference()
    {
        fileChooser = std::make_unique<juce::FileChooser>("Select Reference File",
                                                          juce::File(),
                                                          AudioFileScanner::getFileChooserPattern());
        fileChooser->launchAsync(juce::FileBrowserComponent::openMode | juce::FileBrowserComponent::canSelectFiles,
                                 [this](const juce::FileChooser& chooser)
                                 {
                                     const auto file = chooser.getResult();
                                     if (file != juce::File())
                                         referenceRow.setText(file.getFullPathName());
                                 });
    }

    void BatchMasterTab::chooseInputDirectory()
    {
        fileChooser = std::make_unique<juce::FileChooser>("Select Input Folder");
        fileChooser->launchAsync(juce::FileBrowserComponent::openMode | juce::FileBrowserComponent::canSelectDirectories,
                                 [this](const juce::FileChooser& chooser)
                                 {
                                     const auto folder = chooser.getResult();
                                     if (folder == juce::File())
                                         return;

                                     inputRow.setText(folder.getFullPathName());
                                     selectedFiles.clear();
                                     outputRow.setText(suggestBatchOutputDirectory(folder).getFullPathName());
                                 });
    }

    void BatchMasterTab::chooseInputFiles()
    {
        fileChooser = std::make_unique<juce::FileChooser>("Select Input Files",
                                                          juce::File(),
                                                          AudioFileScanner::getFileChooserPattern());
        fileChooser->launchAsync(juce::FileBrowserComponent::openMode
                                     | juce::FileBrowserComponent::canSelectFiles
                                     | juce::FileBrowserComponent::canSelectMultipleItems,
                                 [this](const juce::FileChooser& chooser)
                                 {
                                     const auto files = chooser.getResults();
                                     if (files.isEmpty())
                                         return;

                                     selectedFiles.clear();
                                     for (const auto& file : files)
                                         selectedFiles.add(file.getFullPathName());

                                     inputRow.setText(juce::String(selectedFiles.size()) + " files selected");
                                     outputRow.setText(suggestBatchOutputDirectory(files.getFirst().getParentDirectory())
                                                           .getFullPathName());
                                 });
    }

    void BatchMasterTab::chooseOutputDirectory()
    {
        fileChooser = std::make_unique<juce::FileChooser>("Select Output Folder");
        fileChooser->launchAsync(juce::FileBrowserComponent::openMode | juce::FileBrowserComponent::canSelectDirectories,
                                 [this](const juce::FileChooser& chooser)
                                 {
                                     const auto folder = chooser.getResult();
                                     if (folder != juce::File())
                                         outputRow.setText(folder.getFullPathName());
                                 });
    }

    void BatchMasterTab::startMastering()
    {
        BatchFormFields fields;
        fields.referencePath = referenceRow.getText();
        fields.inputText = inputRow.getText();
        fields.selectedFiles = selectedFiles;
        fields.outputDirectoryPath = outputRow.getText();
        fields.bitDepthText = bitDepthRow.getText();

        BatchMasteringJob job;
        ValidationError validationError;
        if (!validateBatchForm(fields, job, validationError))
        {
            showWarning(validationError.title, validationError.message);
            return;
        }

        juce::Logger::writeToLog(job.inputFiles.isEmpty() ? "Using selected directory path."
                                                          : "Using selected files list.");

        juce::String directoryError;
        if (!ensureOutputDirectory(job.outputDirectory, directoryError))
        {
            showWarning("Error", directoryError);
            return;
        }

        runButton.setEnabled(false);
        progressValue = 0.0;
        setProgressVisible(true);
        statusPanel.setState(StatusPanel::State::InProgress);
        workerPool.startBatch(std::move(job), reports);
    }

    void BatchMasterTab::handleReport(const WorkerReport& report)
    {
        switch (report.type)
        {
            case WorkerReport::Type::Status:
                statusPanel.setText(report.text);
                break;

            case WorkerReport::Type::Progress:
                progressValue = static_cast<double>(report.percent) / 100.0;
                break;

            case WorkerReport::Type::Error:
                statusPanel.setState(StatusPanel::State::Error);
                setProgressVisible(false);
                showWarning("Batch Error", report.text);
                break;

            case WorkerReport::Type::Finished:
                runButton.setEnabled(true);
                setProgressVisible(false);
                if (statusText::isSuccess(statusPanel.getText()))
                    statusPanel.setState(StatusPanel::State::Success);
                break;

            default:
                break;
        }
    }
}
