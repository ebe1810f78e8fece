#pragma once

#include <cstdio>
#include <string>

namespace rv::util {

// Filesystem/container-safe project id from a project file stem.
inline std::string sanitizeProjectName(std::string name) {
    const auto replaceAll = [&name](const std::string& from) {
        for (size_t pos = name.find(from); pos != std::string::npos; pos = name.find(from, pos + 1))
            name.replace(pos, from.size(), "_");
    };

    for (const auto* s : {" ", "/", "\\", "..", ":", "*", "?", "\"", "<", ">", "|"}) replaceAll(s);

    if (name.size() > 100) name.resize(100);
    return name;
}

inline std::string versionDirName(const int number) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "v%03d", number);
    return {buf};
}

}
