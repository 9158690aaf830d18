#ifndef _UTILS_H
#define _UTILS_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cuda_runtime_api.h>
#include <driver_types.h>
#include <cuda_runtime.h>

#include "logger.hpp"

using pty_timepoint = std::chrono::time_point<std::chrono::system_clock>;

inline pty_timepoint ptyTime() {
    return std::chrono::system_clock::now();
}

inline float ptyDiffTime(pty_timepoint t0, pty_timepoint t1) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
}

inline size_t ptyGpuAvailableMem() {
    size_t free_mem, total_mem;
    ptyCudaCheck(cudaMemGetInfo(&free_mem, &total_mem));
    return free_mem;
}

/**
 * Next highest power of 2 of a 32-bit integer.
 * */
inline uint32_t NextPowerTwo(uint32_t v) {
    v--;
    v |= v >> 1;
    v |= v >> 2;
    v |= v >> 4;
    v |= v >> 8;
    v |= v >> 16;
    return v + 1;
}

/**
 * Max threads per block of the current device.
 * */
inline int ptyMaxThreadsPerBlock() {
    int device, value;
    ptyCudaCheck(cudaGetDevice(&device));
    ptyCudaCheck(cudaDeviceGetAttribute(&value, cudaDevAttrMaxThreadsPerBlock, device));
    return value;
}

inline int ptyDeviceCount() {
    int count = 0;
    if (cudaGetDeviceCount(&count) != cudaSuccess) {
        cudaGetLastError();
        return 0;
    }
    return count;
}

#endif // _UTILS_H
