#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace qapp {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Mode given to every deployed file (owner rw, group/other r)
constexpr unsigned int DEFAULT_FILE_MODE = 0644;

// Write content atomically using temp file + fsync + rename + fsync(dir).
// Parent directories are created when missing. The final path never holds
// a partially written file.
AtomicWriteResult atomic_write_file(const std::string& path,
                                    const std::string& content,
                                    unsigned int mode = DEFAULT_FILE_MODE);

// Remove a file and fsync its parent directory. Missing files are not an error.
AtomicWriteResult atomic_remove_file(const std::string& path);

// Create a directory (and parents) and fsync the parent
AtomicWriteResult atomic_create_directory(const std::string& path);

// Remove `dir` and its parents while they are empty, stopping below
// `stop_dir`. Nothing happens unless `dir` lies inside `stop_dir`.
// Returns the directories removed, deepest first.
std::vector<std::string> remove_empty_directories(const std::string& dir,
                                                  const std::string& stop_dir);

// ============================================================================
// Path Utilities
// ============================================================================

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Get the filename from a path
std::string get_filename(const std::string& path);

// Join path components with a forward slash
std::string join_path(const std::string& base, const std::string& rel);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);

// List directory entry names (not full paths), sorted
std::vector<std::string> list_directory(const std::string& path);

// Read a whole file
std::optional<std::string> read_file(const std::string& path);

// ============================================================================
// Advisory Lock
// ============================================================================

/**
 * Exclusive advisory lock on a lock file (flock).
 *
 * Held for the lifetime of the object. Two processes deploying the same
 * application block on each other; different applications use different
 * lock files.
 */
class FileLock {
public:
    FileLock() = default;
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;

    // Blocks until the lock is acquired. Returns nullopt and sets error on failure.
    static std::optional<FileLock> acquire(const std::string& path, std::string& error);

    bool held() const { return fd_ >= 0; }
    const std::string& path() const { return path_; }

    void release();

private:
    FileLock(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}

    int fd_ = -1;
    std::string path_;
};

// ============================================================================
// Process Execution
// ============================================================================

struct ProcessResult {
    bool ok = false;          // process was spawned and reaped
    bool timed_out = false;   // killed after exceeding the timeout
    int exit_code = -1;
    std::string output;       // stdout
    std::string error_output; // stderr
    std::string error;        // spawn / wait failure description
};

// Run argv[0] (looked up in PATH) with the given arguments, capturing
// stdout and stderr. A process still running after `timeout` is killed
// with SIGKILL and reported with timed_out = true.
ProcessResult run_process(const std::vector<std::string>& argv,
                          std::chrono::seconds timeout);

// ============================================================================
// Misc
// ============================================================================

// Current timestamp as RFC3339 string
std::string get_current_timestamp();


} // namespace qapp
