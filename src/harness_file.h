#pragma once

#include <string>

namespace scriptbox {

// Owns one harness source file on disk for the duration of an execution.
// The file gets a collision-resistant name (time + random suffix, O_EXCL)
// and is removed when the owner goes out of scope, whatever the outcome.
class HarnessFile {
public:
    // Writes contents to a new file in directory (created if missing).
    // Throws std::runtime_error if the file cannot be created or written.
    HarnessFile(const std::string& directory, const std::string& contents);
    ~HarnessFile();

    HarnessFile(const HarnessFile&) = delete;
    HarnessFile& operator=(const HarnessFile&) = delete;

    const std::string& path() const { return path_; }
    std::string filename() const;

    // Delete now; safe to call more than once. Errors are logged only.
    void remove() noexcept;

private:
    std::string path_;
    bool removed_ = false;
};

} // namespace scriptbox
