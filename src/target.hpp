#pragma once

#include <string>
#include <vector>

// One URL to fetch, identified by the file name it will be stored under.
struct Target {
    std::string url;
    std::string display_name;
};

Target make_target(const std::string& url);
std::vector<Target> make_targets(const std::vector<std::string>& urls);
