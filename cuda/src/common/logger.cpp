#include "logger.hpp"

#include <spdlog/common.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace {

const char* kLoggerName = "ptyrecon";

std::atomic_bool log_active{false};
std::mutex log_mutex;
std::shared_ptr<spdlog::logger> log_instance;
string log_tag;

string LogPattern() { return "%^[%H:%M:%S:%f] [%l] [thread %t]" + log_tag + "%$ %v"; }

}  // namespace

void pty_log_start(const char* level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_active) {
        log_instance->warn("Log already started. Ignoring start.");
        return;
    }

    log_instance = spdlog::get(kLoggerName);
    if (!log_instance) log_instance = spdlog::stderr_color_mt(kLoggerName);
    log_instance->set_pattern(LogPattern());
    log_instance->set_level(spdlog::level::from_str(level));

    log_active = true;
}

void pty_log_stop() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (!log_active) {
        spdlog::warn("Log not started. Ignoring stop.");
        return;
    }
    log_active = false;
    log_instance->flush();
    log_instance.reset();
    spdlog::drop(kLoggerName);
}

void pty_log_rank(int rank, int size) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_tag = size > 1 ? format(" [rank {}/{}]", rank, size) : string();
    if (log_active) log_instance->set_pattern(LogPattern());
}

bool pty_log_enabled(const char* level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    return log_active && log_instance->should_log(spdlog::level::from_str(level));
}

void ptyWarning(const string& msg) {
    if (!log_active) return;
    if (auto logger = spdlog::get(kLoggerName)) logger->warn(msg);
}

void ptyError(const string& msg) {
    if (!log_active) return;
    if (auto logger = spdlog::get(kLoggerName)) logger->error(msg);
}

void ptyInfo(const string& msg) {
    if (!log_active) return;
    if (auto logger = spdlog::get(kLoggerName)) logger->info(msg);
}

void ptyDebug(const string& msg) {
    if (!log_active) return;
    if (auto logger = spdlog::get(kLoggerName)) logger->debug(msg);
}

const char* cufftGetErrorString(cufftResult s) {
    switch (s) {
        case CUFFT_SUCCESS:
            return "Success";
        case CUFFT_INVALID_PLAN:
            return "Invalid plan handle";
        case CUFFT_ALLOC_FAILED:
            return "Alloc failed";
        case CUFFT_INVALID_TYPE:
            return "Invalid type";
        case CUFFT_INVALID_VALUE:
            return "Invalid value (bad pointer)";
        case CUFFT_INTERNAL_ERROR:
            return "Internal driver error";
        case CUFFT_EXEC_FAILED:
            return "Failed to execute an FFT";
        case CUFFT_SETUP_FAILED:
            return "Failed to initialize";
        case CUFFT_INVALID_SIZE:
            return "Invalid FFT size";
        default:
            return "Unknown error";
    }
}

void _ptyAssert(bool assertion,
        const std::string& log_msg,
        const char *file, const int line) {
    if (!assertion) {
        string msg = format("{} ({}): *** assertion error: {}", file, line, log_msg);
        ptyError(msg);
        throw PtyException(msg);
    }
}

void _ptyCufftCheck(cufftResult fftres,
        const char *file, const int line) {
    if (fftres != CUFFT_SUCCESS) {
        string msg = format("{} ({}) => *** cufftError: {}",
                file, line, cufftGetErrorString(fftres));
        ptyError(msg);
        throw PtyException(msg);
    }
}

void _ptyCudaCheck(cudaError_t cudares,
        const char *file, const int line) {
    if (cudares != cudaSuccess) {
        string msg = format("{} ({}) => *** cudaError: {}",
                file, line, cudaGetErrorString(cudares));
        ptyError(msg);
        throw PtyException(msg);
    }
}
