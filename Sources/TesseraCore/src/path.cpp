#include "tessera/path.hpp"
#include <filesystem>

namespace tessera {

std::string resolve_path(const std::string& name, const std::string& working_directory) {
    // "file::memory:" may carry its own query string (e.g. "?cache=shared")
    if (name == ":memory:" || name.rfind("file::memory:", 0) == 0) {
        return name;
    }

    std::string path;
    if (name.rfind("/", 0) == 0 || name.rfind("file:", 0) == 0) {
        path = name;
    } else if (!working_directory.empty() && working_directory.back() == '/') {
        path = working_directory + name;
    } else {
        path = working_directory + "/" + name;
    }

    auto query = path.find('?');
    auto location = path.substr(0, query);
    if (location.find(database_extension) != std::string::npos) {
        return path;
    }

    if (query == std::string::npos) {
        return path + database_extension;
    }
    return location + database_extension + path.substr(query);
}

std::string resolve_path(const std::string& name) {
    return resolve_path(name, std::filesystem::current_path().string());
}

bool is_shared_memory_name(const std::string& name) {
    auto memory = name.find("mode=memory");
    auto shared = name.find("cache=shared");
    return memory != std::string::npos && memory > 0 &&
           shared != std::string::npos && shared > 0;
}

} // namespace tessera
