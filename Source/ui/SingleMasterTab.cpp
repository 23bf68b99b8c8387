#include "SingleMasterTab.h"
#include "AudioFileScanner.h"

namespace masterdesk
{
    SingleMasterTab::SingleMasterTab(MasteringWorkerPool& pool, const juce::String& defaultBitDepth)
        : workerPool(pool),
          reports(std::make_shared<ReportChannel>())
    {
        referenceRow.addButton("Browse...", [this] { chooseReference(); });
        targetRow.addButton("Browse...", [this] { chooseTarget(); });
        outputRow.addButton("Save As...", [this] { chooseOutput(); });
        bitDepthRow.setCaptionWidth(170);
        bitDepthRow.setText(defaultBitDepth);

        addAndMakeVisible(referenceRow);
        addAndMakeVisible(targetRow);
        addAndMakeVisible(outputRow);
        addAndMakeVisible(bitDepthRow);

        runButton.onClick = [this] { startMastering(); };
        addAndMakeVisible(runButton);
        addAndMakeVisible(statusPanel);

        reports->setListener([this](const WorkerReport& report) { handleReport(report); });
    }

    SingleMasterTab::~SingleMasterTab()
    {
        // A job still in flight keeps the channel alive but must not reach this component.
        reports->setListener({});
    }

    void SingleMasterTab::paint(juce::Graphics& g)
    {
        g.fillAll(theme::Colours::panel());
    }

    void SingleMasterTab::resized()
    {
        auto r = getLocalBounds().reduced(14);
        const auto row = [&r](juce::Component& c)
        {
            c.setBounds(r.removeFromTop(theme::Dimensions::rowHeight));
            r.removeFromTop(theme::Dimensions::rowGap);
        };

        row(referenceRow);
        row(targetRow);
        row(outputRow);
        row(bitDepthRow);

        statusPanel.setBounds(r.removeFromBottom(theme::Dimensions::statusHeight));
        r.removeFromBottom(theme::Dimensions::rowGap);
        runButton.setBounds(r.removeFromBottom(theme::Dimensions::runButtonHeight));
    }

    void SingleMasterTab::chooseReference()
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

    void SingleMasterTab::chooseTarget()
    {
        fileChooser = std::make_unique<juce::FileChooser>("Select Target Song",
                                                          juce::File(),
                                                          AudioFileScanner::getFileChooserPattern());
        fileChooser->launchAsync(juce::FileBrowserComponent::openMode | juce::FileBrowserComponent::canSelectFiles,
                                 [this](const juce::FileChooser& chooser)
                                 {
                                     const auto file = chooser.getResult();
                                     if (file == juce::File())
                                         return;

                                     targetRow.setText(file.getFullPathName());
                                     outputRow.setText(suggestSingleOutputFile(file).getFullPathName());
                                 });
    }

    void SingleMasterTab::chooseOutput()
    {
        fileChooser = std::make_unique<juce::FileChooser>("Save Mastered File As...",
                                                          juce::File(),
                                                          "*.flac");
        fileChooser->launchAsync(juce::FileBrowserComponent::saveMode | juce::FileBrowserComponent::canSelectFiles,
                                 [this](const juce::FileChooser& chooser)
                                 {
                                     const auto file = chooser.getResult();
                                     if (file != juce::File())
                                         outputRow.setText(withFlacExtension(file.getFullPathName()));
                                 });
    }

    void SingleMasterTab::showWarning(const juce::String& title, const juce::String& message)
    {
        if (onWarning != nullptr)
            onWarning(title, message);
        else
            juce::AlertWindow::showMessageBoxAsync(juce::AlertWindow::WarningIcon, title, message);
    }

    void SingleMasterTab::setFormForTesting(const juce::String& reference,
                                            const juce::String& target,
                                            const juce::String& output,
                                            const juce::String& bitDepth)
    {
        referenceRow.setText(reference);
        targetRow.setText(target);
        outputRow.setText(output);
        bitDepthRow.setText(bitDepth);
    }

    bool SingleMasterTab::clickRunForTesting()
    {
        if (!runButton.isEnabled() || runButton.onClick == nullptr)
            return false;
        runButton.onClick();
        return true;
    }

    void SingleMasterTab::startMastering()
    {
        SingleFormFields fields;
        fields.referencePath = referenceRow.getText();
        fields.targetPath = targetRow.getText();
        fields.outputPath = outputRow.getText();
        fields.bitDepthText = bitDepthRow.getText();

        SingleMasteringJob job;
        ValidationError validationError;
        if (!validateSingleForm(fields, job, validationError))
        {
            showWarning(validationError.title, validationError.message);
            return;
        }

        runButton.setEnabled(false);
        statusPanel.setState(StatusPanel::State::InProgress);
        workerPool.startSingle(std::move(job), reports);
    }

    void SingleMasterTab::handleReport(const WorkerReport& report)
    {
        switch (report.type)
        {
            case WorkerReport::Type::Status:
                statusPanel.setText(report.text);
                break;

            case WorkerReport::Type::Error:
                statusPanel.setState(StatusPanel::State::Error);
                showWarning("Error", report.text);
                break;

            case WorkerReport::Type::Finished:
                runButton.setEnabled(true);
                if (statusText::isSuccess(statusPanel.getText()))
                    statusPanel.setState(StatusPanel::State::Success);
                break;

            case WorkerReport::Type::Progress:
            default:
                break;
        }
    }
}
