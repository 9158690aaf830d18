#ifndef _OPERATIONS_H
#define _OPERATIONS_H

/** @file */

#include <cstddef>
#include <cuda_runtime.h>

#include "complex.hpp"

__hevice float Abs2(float x) { return x * x; }
__hevice float Abs2(const complex& c) { return c.abs2(); }

__hevice float Conj(float x) { return x; }
__hevice complex Conj(const complex& c) { return c.conj(); }

/**
 * atomicAdd is only defined for scalars, complex adds are done per component.
 * */
__device__ inline void AtomicAdd(complex* addr, const complex& val) {
    atomicAdd(&addr->x, val.x);
    atomicAdd(&addr->y, val.y);
}

__device__ inline void AtomicAdd(float* addr, float val) { atomicAdd(addr, val); }

/**
 * Elementwise kernels used by Image<Type>. Array-array versions broadcast the second operand cyclically
 * (b[idx % size2]), so a single frame can be applied to a stack of frames.
 * */
namespace BasicOps {

template <typename Type1, typename Type2>
__global__ void KB_Add(Type1* a, const Type2* b, size_t size, size_t size2) {
    const size_t idx = blockIdx.x * size_t(blockDim.x) + threadIdx.x;
    if (idx >= size) return;
    a[idx] += b[idx % size2];
}

template <typename Type1, typename Type2>
__global__ void KB_Sub(Type1* a, const Type2* b, size_t size, size_t size2) {
    const size_t idx = blockIdx.x * size_t(blockDim.x) + threadIdx.x;
    if (idx >= size) return;
    a[idx] -= b[idx % size2];
}

template <typename Type1, typename Type2>
__global__ void KB_Mul(Type1* a, const Type2* b, size_t size, size_t size2) {
    const size_t idx = blockIdx.x * size_t(blockDim.x) + threadIdx.x;
    if (idx >= size) return;
    a[idx] *= b[idx % size2];
}

template <typename Type1, typename Type2>
__global__ void KB_Div(Type1* a, const Type2* b, size_t size, size_t size2) {
    const size_t idx = blockIdx.x * size_t(blockDim.x) + threadIdx.x;
    if (idx >= size) return;
    a[idx] /= b[idx % size2];
}

template <typename Type1, typename Type2>
__global__ void KB_Add(Type1* a, Type2 n, size_t size) {
    const size_t idx = blockIdx.x * size_t(blockDim.x) + threadIdx.x;
    if (idx >= size) return;
    a[idx] += n;
}

template <typename Type1, typename Type2>
__global__ void KB_Sub(Type1* a, Type2 n, size_t size) {
    const size_t idx = blockIdx.x * size_t(blockDim.x) + threadIdx.x;
    if (idx >= size) return;
    a[idx] -= n;
}

template <typename Type1, typename Type2>
__global__ void KB_Mul(Type1* a, Type2 n, size_t size) {
    const size_t idx = blockIdx.x * size_t(blockDim.x) + threadIdx.x;
    if (idx >= size) return;
    a[idx] *= n;
}

template <typename Type1, typename Type2>
__global__ void KB_Div(Type1* a, Type2 n, size_t size) {
    const size_t idx = blockIdx.x * size_t(blockDim.x) + threadIdx.x;
    if (idx >= size) return;
    a[idx] /= n;
}

template <typename Type>
__global__ void KB_Conj(Type* a, size_t size) {
    const size_t idx = blockIdx.x * size_t(blockDim.x) + threadIdx.x;
    if (idx >= size) return;
    a[idx] = Conj(a[idx]);
}

}  // namespace BasicOps

#endif  // _OPERATIONS_H
