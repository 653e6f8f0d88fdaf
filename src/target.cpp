#include "target.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <unordered_set>

Target make_target(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));

    // Drop "scheme://authority" so a bare host is not taken as a file name
    if (const auto scheme = path.find("://"); scheme != std::string::npos) {
        const auto path_start = path.find('/', scheme + 3);
        path = (path_start == std::string::npos) ? std::string() : path.substr(path_start);
    }

    const auto slash = path.find_last_of('/');
    std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
    if (name.empty() || name == "." || name == "..") {
        throw RdlException(string_format("error.url_without_filename", url));
    }
    return Target{url, std::move(name)};
}

std::vector<Target> make_targets(const std::vector<std::string>& urls) {
    std::vector<Target> targets;
    targets.reserve(urls.size());
    std::unordered_set<std::string> seen;
    for (const auto& url : urls) {
        Target target = make_target(url);
        if (!seen.insert(target.display_name).second) {
            throw RdlException(string_format("error.duplicate_target", target.display_name, url));
        }
        targets.push_back(std::move(target));
    }
    return targets;
}
