#include "harness_file.h"
#include "crypto_utils.h"
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace scriptbox {

namespace fs = std::filesystem;

namespace {

constexpr int MAX_CREATE_ATTEMPTS = 4;

std::string unique_name() {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "harness_" + std::to_string(micros) + "_" + CryptoUtils::random_hex(8) + ".py";
}

bool write_all(int fd, const std::string& data) {
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = write(fd, data.data() + offset, data.size() - offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        offset += static_cast<size_t>(n);
    }
    return true;
}

} // namespace

HarnessFile::HarnessFile(const std::string& directory, const std::string& contents) {
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw std::runtime_error("Failed to create script directory " + directory +
                                 ": " + ec.message());
    }

    int fd = -1;
    for (int attempt = 0; attempt < MAX_CREATE_ATTEMPTS && fd < 0; ++attempt) {
        path_ = (fs::path(directory) / unique_name()).string();
        fd = open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd < 0 && errno != EEXIST) {
            break;
        }
    }
    if (fd < 0) {
        std::string reason = std::strerror(errno);
        removed_ = true;
        throw std::runtime_error("Failed to create harness file in " + directory + ": " + reason);
    }

    // umask may have narrowed the mode; the jailed interpreter needs to read it
    if (fchmod(fd, 0644) != 0) {
        std::cerr << "[Cleanup] Could not set mode on " << path_ << ": "
                  << std::strerror(errno) << std::endl;
    }

    bool written = write_all(fd, contents);
    int saved_errno = errno;
    if (close(fd) != 0 && written) {
        written = false;
        saved_errno = errno;
    }
    if (!written) {
        remove();
        throw std::runtime_error("Failed to write harness file " + path_ + ": " +
                                 std::strerror(saved_errno));
    }
}

HarnessFile::~HarnessFile() {
    remove();
}

std::string HarnessFile::filename() const {
    return fs::path(path_).filename().string();
}

void HarnessFile::remove() noexcept {
    if (removed_) return;
    removed_ = true;

    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        std::cerr << "[Cleanup] Failed to remove harness file " << path_
                  << ": " << ec.message() << std::endl;
    }
}

} // namespace scriptbox
