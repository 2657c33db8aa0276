#include <iostream>
#include <string>

#include "app/CoverSyncApp.hpp"
#include "infrastructure/PathUtils.hpp"

int main(int argc, char** argv) {
    std::string settingsPath;
    if (argc > 1) {
        settingsPath = argv[1];
    } else {
        settingsPath = coversync::infrastructure::PathUtils::GetSettingsFile().string();
    }

    std::cout << "CoverSync - comic cover ingestion service" << std::endl;
    coversync::app::CoverSyncApp app(settingsPath);
    return app.Run();
}
