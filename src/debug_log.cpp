#include "debug_log.hpp"
#include "tree_config.hpp"
#include <atomic>
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace searchtree {

static std::ofstream debug_log;
static std::mutex debug_mutex;
static std::atomic<bool> debug_enabled(false);
static std::atomic<bool> debug_initialized(false);

// Caller holds debug_mutex
static void openLocked(const std::string& path) {
    if (debug_log.is_open()) debug_log.close();
    debug_enabled.store(false, std::memory_order_relaxed);
    if (path.empty()) return;

    debug_log.open(path, std::ios::out | std::ios::trunc);
    if (!debug_log.is_open()) {
        throw std::runtime_error("cannot open debug log '" + path + "'");
    }
    debug_log << "=== pysearchtree debug log ===" << std::endl;
    debug_enabled.store(true, std::memory_order_relaxed);
}

// Opens the configured log on first use. A path that cannot be opened
// leaves logging off.
static void init_debug_log() {
    if (debug_initialized.load(std::memory_order_acquire)) return;
    std::string path = currentConfig().debugLogPath;
    std::lock_guard<std::mutex> lock(debug_mutex);
    if (debug_initialized.load(std::memory_order_relaxed)) return;
    if (!path.empty()) {
        debug_log.open(path, std::ios::out | std::ios::trunc);
        if (debug_log.is_open()) {
            debug_log << "=== pysearchtree debug log ===" << std::endl;
            debug_enabled.store(true, std::memory_order_relaxed);
        }
    }
    debug_initialized.store(true, std::memory_order_release);
}

bool debugLogEnabled() {
    init_debug_log();
    return debug_enabled.load(std::memory_order_relaxed);
}

void openDebugLog(const std::string& path) {
    std::lock_guard<std::mutex> lock(debug_mutex);
    // An explicit open wins over the configuration
    debug_initialized.store(true, std::memory_order_release);
    openLocked(path);
}

void resetDebugLog() {
    std::lock_guard<std::mutex> lock(debug_mutex);
    if (debug_log.is_open()) debug_log.close();
    debug_enabled.store(false, std::memory_order_relaxed);
    debug_initialized.store(false, std::memory_order_release);
}

void closeDebugLog() {
    openDebugLog(std::string());
}

void writeDebugLog(const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(debug_mutex);
    if (!debug_log.is_open()) return;
    debug_log << "[" << component << "] " << message << std::endl;
}

}  // namespace searchtree
