#include <JuceHeader.h>
#include "MainComponent.h"
#include "AppMetadata.h"
#include "AppSettings.h"
#include "ToolLocator.h"
#include <memory>

namespace
{
    static juce::String getCommandArgValue(const juce::StringArray& tokens, const juce::String& key)
    {
        const auto keyWithEquals = key + "=";
        for (int i = 0; i < tokens.size(); ++i)
        {
            auto token = tokens[i].trim();
            if (token.startsWithIgnoreCase(keyWithEquals))
                return token.fromFirstOccurrenceOf("=", false, false).trim().unquoted();
            if (token.equalsIgnoreCase(key) && i + 1 < tokens.size())
                return tokens[i + 1].trim().unquoted();
        }
        return {};
    }
}

namespace masterdesk
{
    class MasterDeskApplication final : public juce::JUCEApplication
    {
    public:
        MasterDeskApplication() = default;

        const juce::String getApplicationName() override       { return meta::productName; }
        const juce::String getApplicationVersion() override
        {
           #if defined (JUCE_APPLICATION_VERSION_STRING)
            return JUCE_APPLICATION_VERSION_STRING;
           #else
            return "1.0.0";
           #endif
        }
        bool moreThanOneInstanceAllowed() override             { return true; }

        void initialise (const juce::String& commandLine) override
        {
            const auto settingsFile = AppSettings::getDefaultSettingsFile();
            settings.loadFrom(settingsFile);
            if (!settings.saveTo(settingsFile))
                juce::Logger::writeToLog("Unable to write preferences to " + settingsFile.getFullPathName());

            if (settings.logToFile)
            {
                fileLogger.reset(juce::FileLogger::createDefaultAppLogger(meta::productName,
                                                                          meta::logFileName,
                                                                          getApplicationName() + " " + getApplicationVersion()));
                juce::Logger::setCurrentLogger(fileLogger.get());
            }

            const auto tokens = juce::StringArray::fromTokens(commandLine, true);
            const auto toolLocation = locateMasteringTool(settings, getCommandArgValue(tokens, "--tool"));

            juce::Logger::writeToLog("Checking for mastering tool at: " + toolLocation.toolFile.getFullPathName());
            if (!toolLocation.isAvailable())
            {
                showFatalToolMissing(toolLocation.toolFile);
                return;
            }

            juce::Logger::writeToLog("Mastering tool found. Starting application...");
            mainWindow = std::make_unique<MainWindow> (meta::windowTitle, toolLocation, settings);
        }

        void shutdown() override
        {
            mainWindow.reset();
            juce::Logger::setCurrentLogger(nullptr);
            fileLogger.reset();
        }

        void systemRequestedQuit() override
        {
            quit();
        }

        void anotherInstanceStarted (const juce::String&) override {}

    private:
        void showFatalToolMissing(const juce::File& toolFile)
        {
            juce::Logger::writeToLog("Mastering tool missing: " + toolFile.getFullPathName());
            setApplicationReturnValue(1);
            juce::AlertWindow::showMessageBoxAsync(juce::AlertWindow::WarningIcon,
                                                   "Fatal Error",
                                                   "Could not find the Matchering CLI script at:\n"
                                                       + toolFile.getFullPathName()
                                                       + "\n\nPlease make sure the 'matchering-cli' folder is in the same "
                                                         "directory as this application, or set mastering_tool_path in:\n"
                                                       + AppSettings::getDefaultSettingsFile().getFullPathName(),
                                                   "Quit",
                                                   nullptr,
                                                   juce::ModalCallbackFunction::create([](int)
                                                   {
                                                       juce::JUCEApplication::quit();
                                                   }));
        }

        class MainWindow final : public juce::DocumentWindow
        {
        public:
            MainWindow (juce::String name, const MasteringToolLocation& toolLocation, const AppSettings& settings)
                : DocumentWindow (std::move (name),
                                  juce::Desktop::getInstance().getDefaultLookAndFeel()
                                      .findColour (juce::ResizableWindow::backgroundColourId),
                                  DocumentWindow::allButtons)
            {
                setUsingNativeTitleBar (true);
                setContentOwned (new MainComponent(toolLocation, settings), true);
                centreWithSize (getWidth(), getHeight());
                setResizable (true, true);
                setResizeLimits (600, 350, 1600, 1000);
                setVisible (true);
            }

            void closeButtonPressed() override
            {
                juce::JUCEApplication::getInstance()->systemRequestedQuit();
            }
        };

        AppSettings settings;
        std::unique_ptr<juce::FileLogger> fileLogger;
        std::unique_ptr<MainWindow> mainWindow;

        JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (MasterDeskApplication)
    };
} // namespace masterdesk

START_JUCE_APPLICATION (masterdesk::MasterDeskApplication)
