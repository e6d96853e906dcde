#include "utils.hpp"

#include "localization.hpp"

#include <sys/file.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace fs = std::filesystem;

namespace {
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;

    void check_tty() {
        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }
    }

    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);
        check_tty();

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Network: return "network";
        case ErrorKind::NotFound: return "not-found";
        case ErrorKind::Integrity: return "integrity";
        case ErrorKind::Structural: return "structural";
        case ErrorKind::Provisioning: return "provisioning";
        case ErrorKind::Hook: return "hook";
        case ErrorKind::NotInstalled: return "not-installed";
        case ErrorKind::Activation: return "activation";
        case ErrorKind::Config: return "config";
        case ErrorKind::Locked: return "locked";
        case ErrorKind::Io: return "io";
    }
    return "unknown";
}

void log_info(std::string_view msg) {
    log_internal(get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

void log_progress(const std::string& msg, double percentage, int bar_width) {
    std::lock_guard<std::mutex> lock(log_mutex);
    check_tty();
    if (!is_stdout_tty) {
        return;
    }

    int pos = static_cast<int>(bar_width * percentage / 100.0);

    std::cout << "\r" << COLOR_GREEN << "==> " << COLOR_WHITE << msg << " [";
    for (int i = 0; i < bar_width; ++i) {
        if (i < pos) std::cout << "#";
        else if (i == pos) std::cout << ">";
        else std::cout << "-";
    }
    std::cout << "] " << std::fixed << std::setprecision(1) << percentage << "%" << COLOR_RESET << std::flush;
}

void log_output(std::string_view source, std::string_view output) {
    std::istringstream stream{std::string(output)};
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        log_info(std::string("[") + std::string(source) + "] " + line);
    }
}

InstallLock::InstallLock(const fs::path& lock_file, LockMode mode) {
    ensure_dir_exists(lock_file.parent_path());
    lock_fd = open(lock_file.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (lock_fd < 0) {
        throw VpkgException(ErrorKind::Io, string_format("error.create_file_failed", lock_file.string()) + ": " + strerror(errno));
    }

    int flags = LOCK_EX;
    if (mode == LockMode::NoWait) flags |= LOCK_NB;

    int rc;
    do {
        rc = flock(lock_fd, flags);
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        int err = errno;
        close(lock_fd);
        lock_fd = -1;
        if (err == EWOULDBLOCK) {
            throw VpkgException(ErrorKind::Locked, string_format("error.install_locked", lock_file.string()));
        }
        throw VpkgException(ErrorKind::Io, string_format("error.lock_failed", lock_file.string()) + ": " + strerror(err));
    }
}

InstallLock::~InstallLock() {
    if (lock_fd != -1) {
        flock(lock_fd, LOCK_UN);
        close(lock_fd);
        lock_fd = -1;
    }
}

void ensure_dir_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec) && ec) {
            throw VpkgException(ErrorKind::Io, string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
        }
    }
    else if (!fs::is_directory(path)) {
        throw VpkgException(ErrorKind::Io, string_format("error.path_not_dir", path.string()));
    }
}

std::string read_text_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw VpkgException(ErrorKind::Io, string_format("error.open_file_failed", path.string()));
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

void write_file_atomic(const fs::path& path, std::string_view content) {
    fs::path tmp_path = path.string() + ".tmp";
    int fd = open(tmp_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw VpkgException(ErrorKind::Io, string_format("error.create_file_failed", tmp_path.string()) + ": " + strerror(errno));
    }
    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            close(fd);
            unlink(tmp_path.c_str());
            throw VpkgException(ErrorKind::Io, string_format("error.write_file_failed", tmp_path.string()) + ": " + strerror(err));
        }
        written += static_cast<size_t>(n);
    }
    fsync(fd);
    close(fd);

    if (rename(tmp_path.c_str(), path.c_str()) != 0) {
        int err = errno;
        unlink(tmp_path.c_str());
        throw VpkgException(ErrorKind::Io, string_format("error.rename_failed", tmp_path.string(), path.string()) + ": " + strerror(err));
    }
}

fs::path validate_path(const fs::path& path, const fs::path& root) {
    if (path.is_absolute()) {
        throw VpkgException(ErrorKind::Integrity, "Security Violation: Path must be relative: " + path.string());
    }

    fs::path normalized = path.lexically_normal();
    for (const auto& component : normalized) {
        if (component == "..") {
            throw VpkgException(ErrorKind::Integrity, "Security Violation: Path traversal detected: " + path.string());
        }
    }
    return root / normalized;
}

std::string trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(first, last - first + 1));
}
