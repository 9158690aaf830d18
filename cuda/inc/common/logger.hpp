#ifndef _LOGGER_H
#define _LOGGER_H

#include <stdexcept>
#include <string>
#include <cuda.h>
#include <cuda_runtime.h>
#include <cufft.h>
#include <spdlog/fmt/fmt.h>

using std::string;
using fmt::format;

extern "C" {
void pty_log_start(const char* level);
void pty_log_stop();
}

/**
 * Tags every following message with the MPI rank when size > 1.
 * */
void pty_log_rank(int rank, int size);
bool pty_log_enabled(const char* level);

/**
 * Raised by every failed check. Device resources held by RAII objects are released while it unwinds.
 * */
class PtyException : public std::runtime_error {
public:
    explicit PtyException(const string& msg) : std::runtime_error(msg) {}
};

void ptyWarning(const string& msg);
void ptyError(const string& msg);
void ptyInfo(const string& msg);
void ptyDebug(const string& msg);

void _ptyAssert(bool assertion,
        const std::string& log_msg = "",
        const char *file = __FILE__,
        const int line = __LINE__);
void _ptyCufftCheck(cufftResult_t fftres,
        const char *file = __FILE__,
        const int line = __LINE__);
void _ptyCudaCheck(cudaError_t cudares,
        const char *file = __FILE__,
        const int line = __LINE__);


#define ptyAssert(assertion, log_msg) _ptyAssert(assertion, log_msg, __FILE__, __LINE__)
#define ptyCudaCheck(res) _ptyCudaCheck(res, __FILE__, __LINE__)
#define ptyCufftCheck(res) _ptyCufftCheck(res, __FILE__, __LINE__)

#endif //_LOGGER_H
