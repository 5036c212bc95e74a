#pragma once

#include <string>

namespace courtplan::core::util {

// Writes to "<path>.tmp" and renames over the target, so readers never see a partial file.
class AtomicFileWriter {
public:
    static bool Write(const std::string& path, const std::string& contents, std::string* error = nullptr);
};

}  // namespace courtplan::core::util
