// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace coversync::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    /** Per-user data directory of CoverSync (ledger, series registry). Created on demand. */
    static std::filesystem::path GetDataDir();
    /** Default location of settings.json. */
    static std::filesystem::path GetSettingsFile();
};

} // namespace coversync::infrastructure
