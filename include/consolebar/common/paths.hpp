#pragma once

#include <string>
#include <vector>

namespace consolebar {
namespace common {

class PathManager {
public:
    static PathManager& instance();
    
    std::string getConfigDir() const;
    std::string getLogDir() const;
    std::string getConfigFile() const;
    std::string getLogFile() const;
    
    std::vector<std::string> getConfigSearchPaths() const;

private:
    PathManager() = default;
    
    std::string getHome() const;
    std::string getXdgConfigHome() const;
    std::string getXdgStateHome() const;
};

}}
