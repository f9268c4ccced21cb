#pragma once

#include <cstdint>
#include <ctime>
#include <string>

namespace sm::remote::model {

struct Entry {
    std::string name;  // final path segment
    std::string path;  // absolute remote path
    bool is_dir{false};
    uint64_t size{0};
    std::time_t mtime{0};
};

}
