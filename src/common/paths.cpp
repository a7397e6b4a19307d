#include "consolebar/common/paths.hpp"
#include "consolebar/common/constants.hpp"
#include <unistd.h>
#include <pwd.h>
#include <cstdlib>

namespace consolebar {
namespace common {

PathManager& PathManager::instance() {
    static PathManager instance;
    return instance;
}

std::vector<std::string> PathManager::getConfigSearchPaths() const {
    std::vector<std::string> paths;
    
    if (const char* env = std::getenv(constants::system::CONFIG_ENV)) {
        if (*env) {
            paths.push_back(env);
        }
    }
    
    paths.push_back(getConfigFile());
    
    return paths;
}

std::string PathManager::getConfigDir() const {
    return getXdgConfigHome() + "/consolebar";
}

std::string PathManager::getLogDir() const {
    return getXdgStateHome() + "/consolebar";
}

std::string PathManager::getConfigFile() const {
    return getConfigDir() + "/" + constants::system::CONFIG_FILE_NAME;
}

std::string PathManager::getLogFile() const {
    return getLogDir() + "/" + constants::system::LOG_FILE_NAME;
}

std::string PathManager::getHome() const {
    if (const char* home = std::getenv("HOME")) {
        if (*home) {
            return home;
        }
    }
    
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return pw->pw_dir;
    }
    return ".";
}

std::string PathManager::getXdgConfigHome() const {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return xdg;
    }
    return getHome() + "/.config";
}

std::string PathManager::getXdgStateHome() const {
    const char* xdg = std::getenv("XDG_STATE_HOME");
    if (xdg && *xdg) {
        return xdg;
    }
    return getHome() + "/.local/state";
}

}}
