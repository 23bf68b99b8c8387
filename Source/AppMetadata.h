#pragma once
#include <JuceHeader.h>

namespace masterdesk::meta
{
    // Centralized branding. The settings folder and log file are named after these.
    static constexpr const char* companyName  = "MasterDesk";
    static constexpr const char* productName  = "MasterDesk";
    static constexpr const char* windowTitle  = "MasterDesk - Reference Mastering";

    static constexpr const char* settingsFileName = "settings.txt";
    static constexpr const char* logFileName      = "MasterDesk.log";
} // namespace masterdesk::meta
