#include "qapp/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace qapp {

namespace fs = std::filesystem;

namespace {

bool fsync_fd(int fd) {
    return fsync(fd) == 0;
}

// fsync a directory by path
bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY | O_DIRECTORY);
    if (dir_fd < 0) return false;

    bool result = fsync_fd(dir_fd);
    close(dir_fd);
    return result;
}

// Temp file lives beside the target so the rename stays on one filesystem
std::string make_temp_filename(const std::string& base) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    const char* hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[static_cast<size_t>(dis(gen))];
    }

    std::string dir = get_parent_directory(base);
    std::string name = "." + get_filename(base) + ".tmp." + suffix;
    return dir.empty() ? name : dir + "/" + name;
}

bool write_all(int fd, const char* data, size_t size) {
    while (size > 0) {
        ssize_t n = write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
    return true;
}

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path,
                                    const std::string& content,
                                    unsigned int mode) {
    AtomicWriteResult result;

    std::string dir_path = get_parent_directory(path);
    if (!dir_path.empty() && !is_directory(dir_path)) {
        auto dir_result = atomic_create_directory(dir_path);
        if (!dir_result.ok) {
            result.error = "failed to create directory " + dir_path + ": " + dir_result.error;
            return result;
        }
    }

    std::string temp_path = make_temp_filename(path);

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                  static_cast<mode_t>(mode));
    if (fd < 0) {
        result.error = "failed to create temp file: " + std::string(strerror(errno));
        return result;
    }

    if (!write_all(fd, content.data(), content.size())) {
        result.error = "failed to write content: " + std::string(strerror(errno));
        close(fd);
        unlink(temp_path.c_str());
        return result;
    }

    // umask may have narrowed the mode given to open()
    if (fchmod(fd, static_cast<mode_t>(mode)) != 0) {
        result.error = "failed to set mode: " + std::string(strerror(errno));
        close(fd);
        unlink(temp_path.c_str());
        return result;
    }

    if (!fsync_fd(fd)) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to fsync temp file";
        return result;
    }

    close(fd);

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        result.error = "failed to rename temp file: " + std::string(strerror(errno));
        unlink(temp_path.c_str());
        return result;
    }

    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    result.ok = true;
    return result;
}

AtomicWriteResult atomic_remove_file(const std::string& path) {
    AtomicWriteResult result;

    if (unlink(path.c_str()) != 0 && errno != ENOENT) {
        result.error = "failed to remove " + path + ": " + std::string(strerror(errno));
        return result;
    }

    std::string parent = get_parent_directory(path);
    if (!parent.empty() && is_directory(parent)) {
        fsync_directory(parent);
    }

    result.ok = true;
    return result;
}

AtomicWriteResult atomic_create_directory(const std::string& path) {
    AtomicWriteResult result;

    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        result.error = ec.message();
        return result;
    }

    std::string parent = get_parent_directory(path);
    if (!parent.empty()) {
        fsync_directory(parent);
    }

    result.ok = true;
    return result;
}

std::vector<std::string> remove_empty_directories(const std::string& dir,
                                                  const std::string& stop_dir) {
    std::vector<std::string> removed;
    if (dir.empty() || stop_dir.empty()) return removed;

    fs::path stop = fs::path(stop_dir).lexically_normal();
    fs::path current = fs::path(dir).lexically_normal();

    auto rel = current.lexically_relative(stop).generic_string();
    if (rel.empty() || rel == "." || rel == ".." || rel.rfind("../", 0) == 0) {
        return removed;
    }

    while (current != stop && current.has_parent_path()) {
        // rmdir only succeeds on an empty directory
        if (rmdir(current.c_str()) != 0) break;
        removed.push_back(current.string());
        current = current.parent_path();
    }

    if (!removed.empty()) {
        fsync_directory(current.string());
    }
    return removed;
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string get_filename(const std::string& path) {
    fs::path p(path);
    return p.filename().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    if (base.empty()) return rel;
    if (rel.empty()) return base;
    if (base.back() == '/') return base + rel;
    return base + "/" + rel;
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::vector<std::string> list_directory(const std::string& path) {
    std::vector<std::string> entries;

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(path, ec)) {
        entries.push_back(entry.path().filename().string());
    }

    std::sort(entries.begin(), entries.end());
    return entries;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

} // namespace qapp
