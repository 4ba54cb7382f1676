#pragma once

namespace Porter {
namespace Core {

struct Constants {
    static constexpr const char* VERSION      = "0.1.0";
    static constexpr const char* PROGRAM_NAME = "porter";

    static constexpr const char* BROWSER_NAME     = "BrowserOS";
    static constexpr const char* BROWSER_VERSION  = "0.39.0.3";
    static constexpr const char* RELEASE_BASE_URL = "http://cdn.browseros.com/releases";

    static constexpr const char* INSTALL_DIR_NAME = ".browseros";
    static constexpr const char* DOWNLOADS_DIR    = "downloads";
    static constexpr const char* MOUNT_DIR        = "mount";
    static constexpr const char* BIN_DIR          = "bin";
    static constexpr const char* APP_BUNDLE       = "BrowserOS.app";

    static constexpr const char* EXECUTABLE_ENV_VAR = "AGENT_BROWSER_EXECUTABLE_PATH";
    static constexpr const char* WINDOWS_DEFAULT_EXECUTABLE =
        "C:\\Program Files\\BrowserOS\\BrowserOS.exe";

    static constexpr int DEFAULT_DOWNLOAD_RETRIES = 3;

    static constexpr int EXIT_CODE_OK      = 0;
    static constexpr int EXIT_CODE_FAILURE = 1;
};

}  // namespace Core
}  // namespace Porter
