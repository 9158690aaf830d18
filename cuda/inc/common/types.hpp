// File contains implementations for single and multigpu memory management, along with some commom operations.

/** @file */

#ifndef _TYPES_H
#define _TYPES_H

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include <cuda.h>
#include <cuda_runtime_api.h>
#include <driver_types.h>

#include <thrust/device_ptr.h>
#include <thrust/execution_policy.h>
#include <thrust/functional.h>
#include <thrust/inner_product.h>
#include <thrust/transform_reduce.h>

#ifdef __CUDACC__
#define restrict __restrict__
#else
#define restrict
#endif

#include "complex.hpp"
#include "operations.hpp"
#include "logger.hpp"

#ifndef __hevice
#define __hevice __host__ __device__ inline
#endif

/**
 * Type of allocation to be passed for each Array.
 * */
enum MemoryType {
    ENoAlloc = 0,          //!< Dont allocated memory, useful for wrapping an existent pointer.
    EAllocGPU = 1,         //!< GPU-Only allocation
    EAllocCPU = 2,         //!< CPU-Only allocation.
    EAllocCPUGPU = 3,      //!< Standard, allocate both im GPU and CPU.
    EAllocManaged = 4,     //!< Use CUDA's mamaged memory system, in this case cpuptr==gpuptr.
};

namespace _AuxReduction {
template <typename T>
struct variable_norm2 {
    __hevice double operator()(const T& x) const { return double(Abs2(x)); }
};

/**
 * Conjugated product conj(x1)*x2 accumulated in double precision.
 * */
template <typename T>
struct vdotstruct {
    __hevice double operator()(const T& x1, const T& x2) const { return double(x1 * x2); }
};
template <>
struct vdotstruct<complex> {
    __hevice double operator()(const complex& c1, const complex& c2) const {
        return double(c1.x) * c2.x + double(c1.y) * c2.y;
    }
};
}  // namespace _AuxReduction

/**
 * Base class for single GPU basic operations and memory management.
 * */
template <typename Type>
struct Image {
    MemoryType memorytype;

    bool bIsManaged() const { return memorytype == MemoryType::EAllocManaged; }
    bool bHasAllocCPU() const { return (memorytype & MemoryType::EAllocCPU) == MemoryType::EAllocCPU; }
    bool bHasAllocGPU() const { return (memorytype & MemoryType::EAllocGPU) == MemoryType::EAllocGPU; }

    /**
     * Constructor
     */
    Image(size_t _sizex, size_t _sizey, size_t _sizez = 1, MemoryType memtype = MemoryType::EAllocCPUGPU)
        : memorytype(memtype),
          sizex(_sizex),
          sizey(_sizey),
          sizez(_sizez),
          size(_sizex * _sizey * _sizez),
          capacity(_sizex * _sizey * _sizez),
          gpuptr(nullptr),
          cpuptr(nullptr) {
        ptyDebug(format("Creating Image of size: {} {} {} ({})", sizex, sizey, sizez, sizeof(Type)));
        AllocManaged();
        AllocGPU();
        AllocCPU();
        if (bHasAllocGPU() || bIsManaged()) SetGPUToZero();
    }
    /**
     * Makes a copy from a given host pointer during construction.
     * */
    Image(const Type* newdata, size_t _sizex, size_t _sizey, size_t _sizez = 1,
            MemoryType memtype = MemoryType::EAllocCPUGPU)
        : Image<Type>(_sizex, _sizey, _sizez, memtype) {
        if (bHasAllocGPU() || bIsManaged()) this->CopyFrom(newdata);
        if (bHasAllocCPU() && !bIsManaged()) memcpy(cpuptr, newdata, sizeof(Type) * GetSize());
    }
    /**
     * Makes a copy of given array.
     */
    explicit Image(const Image<Type>& other)
        : Image(other.sizex, other.sizey, other.sizez,
                  (other.memorytype != MemoryType::ENoAlloc) ? other.memorytype : MemoryType::EAllocCPUGPU) {
        CopyFrom(other);
    }
    /**
     * Constructor
     */
    Image(const dim3& dim, MemoryType memtype = MemoryType::EAllocCPUGPU) : Image(dim.x, dim.y, dim.z, memtype){};

    Image<Type>& operator=(const Image<Type>&) = delete;

    /**
     * Destructor. Never throws: failures are only logged.
     */
    virtual ~Image() {
        ptyDebug(format("Dealloc Image of pointer {}", (void*)gpuptr));

        DeallocManaged();
        DeallocGPU();
        DeallocCPU();

        cudaError_t err = cudaGetLastError();
        if (err != cudaSuccess)
            ptyError(format("Error while releasing Image: {}", cudaGetErrorString(err)));
    }

    size_t sizex = 0;
    size_t sizey = 0;
    size_t sizez = 1;

    size_t size = 0;  //!< sizex*sizey*sizez

    size_t capacity = 0;  //!< true allocated size, any resize should be < capacity

    Type* gpuptr = nullptr;  //!< Pointer in GPU Memory.
    Type* cpuptr = nullptr;  //!< Pointer in CPU Memory.

    /**
     * Zero-fill.
     * */
    void SetGPUToZero() {
        if (size == 0) return;
        ptyCudaCheck(cudaMemset(gpuptr, 0, size * sizeof(Type)));
    }
    /**
     * Stream zero-fill.
     * */
    void SetGPUToZero(cudaStream_t stream) {
        if (size == 0) return;
        ptyCudaCheck(cudaMemsetAsync(gpuptr, 0, size * sizeof(Type), stream));
    }

    static const size_t blocksize = 64;  //!< Default number of threads per block.

    dim3 Shape() const { return dim3(sizex, sizey, sizez); };
    size_t FrameSize() const { return sizex * sizey; }

    /**
     * Get a dim3() object for kernel launch with one thread per element.
     * */
    dim3 LinearThread() const {
        return dim3(size < blocksize ? ((size + 31) / 32) * 32 : blocksize, 1, 1);
    };
    dim3 LinearBlock() const {
        return dim3((size + blocksize - 1) / blocksize, 1, 1);
    };

    void Resize(size_t x, size_t y, size_t z) {
        size_t s = x * y * z;
        ptyAssert(s <= capacity, format("Image of capacity {} cant be resized to {} {} {}.", capacity, x, y, z));
        size = s;
        sizex = x;
        sizey = y;
        sizez = z;
    }

    void AllocGPU() {
        if (!gpuptr && bHasAllocGPU() && size > 0) ptyCudaCheck(cudaMalloc((void**)&gpuptr, sizeof(Type) * size));
    }
    void DeallocGPU() {
        if (gpuptr && bHasAllocGPU()) cudaFree(gpuptr);
        gpuptr = nullptr;
    }
    void AllocCPU() {
        if (!cpuptr && bHasAllocCPU() && size > 0) {
            cpuptr = new Type[size];
        }
    }
    void DeallocCPU() {
        if (cpuptr && bHasAllocCPU()) {
            delete[] cpuptr;
        }
        cpuptr = nullptr;
    }
    void AllocManaged() {
        if (bIsManaged() && size > 0) {
            ptyCudaCheck(cudaMallocManaged((void**)&gpuptr, sizeof(Type) * size));
            cpuptr = gpuptr;
        }
    }
    void DeallocManaged() {
        if (gpuptr && bIsManaged()) {
            cudaFree(gpuptr);
            cpuptr = gpuptr = nullptr;
        }
    }

    template <typename Type2 = Type>
    Image<Type>& operator+=(const Image<Type2>& other) {
        ptyAssert(other.size > 0 && this->size % other.size == 0,
                format("Incompatible GPU shape for addition: {} and {}.", this->size, other.size));
        if (this->size) BasicOps::KB_Add<Type, Type2>
            <<<LinearBlock(), LinearThread()>>>(this->gpuptr, (const Type2*)other.gpuptr, this->size, other.size);
        return *this;
    }
    template <typename Type2 = Type>
    Image<Type>& operator-=(const Image<Type2>& other) {
        ptyAssert(other.size > 0 && this->size % other.size == 0,
                format("Incompatible GPU shape for subtraction: {} and {}.", this->size, other.size));
        if (this->size) BasicOps::KB_Sub<Type, Type2>
            <<<LinearBlock(), LinearThread()>>>(this->gpuptr, (const Type2*)other.gpuptr, this->size, other.size);
        return *this;
    }
    template <typename Type2 = Type>
    Image<Type>& operator*=(const Image<Type2>& other) {
        ptyAssert(other.size > 0 && this->size % other.size == 0,
                format("Incompatible GPU shape for multiplication: {} and {}.", this->size, other.size));
        if (this->size) BasicOps::KB_Mul<Type, Type2>
            <<<LinearBlock(), LinearThread()>>>(this->gpuptr, (const Type2*)other.gpuptr, this->size, other.size);
        return *this;
    }
    template <typename Type2 = Type>
    Image<Type>& operator/=(const Image<Type2>& other) {
        ptyAssert(other.size > 0 && this->size % other.size == 0,
                format("Incompatible GPU shape for division: {} and {}.", this->size, other.size));
        if (this->size) BasicOps::KB_Div<Type, Type2>
            <<<LinearBlock(), LinearThread()>>>(this->gpuptr, (const Type2*)other.gpuptr, this->size, other.size);
        return *this;
    }

    template <typename Type2 = Type>
    Image<Type>& operator+=(Type2 other) {
        if (size) BasicOps::KB_Add<Type, Type2><<<LinearBlock(), LinearThread()>>>(this->gpuptr, other, this->size);
        return *this;
    }
    template <typename Type2 = Type>
    Image<Type>& operator-=(Type2 other) {
        if (size) BasicOps::KB_Sub<Type, Type2><<<LinearBlock(), LinearThread()>>>(this->gpuptr, other, this->size);
        return *this;
    }
    template <typename Type2 = Type>
    Image<Type>& operator*=(Type2 other) {
        if (size) BasicOps::KB_Mul<Type, Type2><<<LinearBlock(), LinearThread()>>>(this->gpuptr, other, this->size);
        return *this;
    }
    template <typename Type2 = Type>
    Image<Type>& operator/=(Type2 other) {
        if (size) BasicOps::KB_Div<Type, Type2><<<LinearBlock(), LinearThread()>>>(this->gpuptr, other, this->size);
        return *this;
    }

    /**
     * Copies memory from given pointer. Cpysize == -1 -> Cpysize = this->size
     * */
    void CopyFrom(const Type* other, cudaStream_t stream = 0, int64_t cpysize = -1) {
        if (cpysize == -1) cpysize = this->size;

        ptyAssert(other != nullptr || cpysize == 0, "Syncing from empty pointer!");
        ptyAssert(cpysize <= (int64_t)this->size, "Not enough space for sync.!");
        if (cpysize == 0) return;
        ptyAssert(gpuptr || cpuptr, "CopyFrom needs cpuptr or gpuptr to be able to copy.");

        void* outptr = gpuptr != nullptr ? gpuptr : cpuptr;
        if (stream == 0)
            ptyCudaCheck(cudaMemcpy(outptr, other, cpysize * sizeof(Type), cudaMemcpyDefault));
        else
            ptyCudaCheck(cudaMemcpyAsync(outptr, other, cpysize * sizeof(Type), cudaMemcpyDefault, stream));
    }

    /**
     * Copies memory to given pointer. Cpysize == -1 -> Cpysize = this->size
     * */
    void CopyTo(Type* outptr, cudaStream_t stream = 0, int64_t cpysize = -1) const {
        if (cpysize < 0) cpysize = size;
        if (cpysize == 0) return;
        ptyAssert(gpuptr || cpuptr, "Copy to needs cpuptr or gpuptr to be able to copy.");

        const void* inptr = gpuptr != nullptr ? gpuptr : cpuptr;
        if (stream == 0)
            ptyCudaCheck(cudaMemcpy((void*)outptr, inptr, cpysize * sizeof(Type), cudaMemcpyDefault));
        else
            ptyCudaCheck(cudaMemcpyAsync((void*)outptr, inptr, cpysize * sizeof(Type), cudaMemcpyDefault, stream));
    }

    /**
     * Copies from given array.
     */
    void CopyFrom(const Image<Type>& other, cudaStream_t stream = 0, int64_t cpysize = -1) {
        ptyAssert(other.gpuptr || other.cpuptr || other.size == 0, "CopyFrom: gpuptr or cpuptr must be available.");

        if (other.gpuptr != nullptr) {
            CopyFrom(other.gpuptr, stream, cpysize < 0 ? other.size : cpysize);
        } else if (other.cpuptr != nullptr) {
            CopyFrom(other.cpuptr, stream, cpysize < 0 ? other.size : cpysize);
        }
    }

    void Conj() {
        if (size) BasicOps::KB_Conj<Type><<<LinearBlock(), LinearThread()>>>(this->gpuptr, this->size);
    }

    /**
     * Computes sum(|.|^2)
     */
    double Norm2() const {
        return thrust::transform_reduce(thrust::device, gpuptr, gpuptr + size, _AuxReduction::variable_norm2<Type>(),
                                        0.0, thrust::plus<double>());
    }

    /**
     * Real part of the conjugated scalar product, Re(sum(conj(this) * other)).
     * */
    double vdot(const Image<Type>& other) const {
        ptyAssert(other.size == size, format("vdot of arrays with sizes {} and {}.", size, other.size));
        return thrust::inner_product(thrust::device, gpuptr, gpuptr + size, other.gpuptr, 0.0,
                                     thrust::plus<double>(), _AuxReduction::vdotstruct<Type>());
    }

    /**
     * Returns reference array containing the Z-index specified
     * */
    Image<Type>* SliceZ(size_t index, size_t count = 1) const {
        Image<Type>* slice = new Image<Type>(sizex, sizey, count, MemoryType::ENoAlloc);
        slice->gpuptr = gpuptr + sizex * sizey * index;
        return slice;
    };
};

typedef Image<float> rImage;
typedef Image<complex> cImage;

#define MGPULOOP(execcode)                 \
    {                                      \
        for (int g = 0; g < GetN(); g++) { \
            Set(g);                        \
            execcode;                      \
        }                                  \
    }

/**
 * Base class for multigpu arrays.
 * */
struct MultiGPU {
    MultiGPU(const std::vector<int>& gpus) : ngpus(gpus.size()), gpuindices(gpus){};

    const int ngpus = 1;
    const std::vector<int> gpuindices;

    void Set(int g) const { ptyCudaCheck(cudaSetDevice(this->gpuindices[g])); }
    int GetN() const { return this->ngpus; }
};

/**
 * Array class for multigpu basic operations and memory management. Either every gpu holds a replica of the same
 * array (bBroadcast) or every gpu holds its own chunk, whose shape may differ from gpu to gpu.
 * */
template <typename Type>
struct MImage : public MultiGPU {
    MemoryType memorytype;

    std::vector<Image<Type>*> arrays;

    bool bBroadcast = false;

    Image<Type>& operator[](int n) { return *(arrays[n]); };
    const Image<Type>& operator[](int n) const { return *(arrays[n]); };

    /**
     * Constructor. If broadcast = true, makes each gpu have a full copy of the array. Otherwise, each gpu gets a chunk
     * of the z slices.
     * */
    MImage(size_t _sizex, size_t _sizey, size_t _sizez, bool _bBroadcast, const std::vector<int>& gpus,
           MemoryType memtype = MemoryType::EAllocCPUGPU)
        : MultiGPU(gpus),
          memorytype(memtype),
          bBroadcast(_bBroadcast) {
        ptyAssert(gpus.size() > 0, "MImage needs at least one gpu.");
        ptyDebug(format("Creating MImage of size: {} {} {} ({})", _sizex, _sizey, _sizez, sizeof(Type)));

        size_t zstep = bBroadcast ? 0 : (_sizez + gpus.size() - 1) / gpus.size();

        for (int g = 0; g < this->ngpus; g++) {
            size_t zdistrib = _sizez;
            if (!bBroadcast) {
                size_t zbegin = std::min(zstep * g, _sizez);
                zdistrib = std::min(zstep, _sizez - zbegin);
            }
            Set(g);
            arrays.push_back(new Image<Type>(_sizex, _sizey, zdistrib, memtype));
        }
    }
    /**
     * Constructor. Each gpu g gets an array of shape dims[g].
     * */
    MImage(const std::vector<dim3>& dims, const std::vector<int>& gpus, MemoryType memtype = MemoryType::EAllocCPUGPU)
        : MultiGPU(gpus), memorytype(memtype), bBroadcast(false) {
        ptyAssert(dims.size() == gpus.size(),
                format("MImage got {} shapes for {} gpus.", dims.size(), gpus.size()));
        for (int g = 0; g < this->ngpus; g++) {
            Set(g);
            arrays.push_back(new Image<Type>(dims[g], memtype));
        }
    }
    /**
     * Constructor. Replicates a host or device array on every gpu.
     * */
    MImage(const Type* newdata, size_t _sizex, size_t _sizey, size_t _sizez, const std::vector<int>& gpus,
           MemoryType memtype = MemoryType::EAllocCPUGPU)
        : MImage<Type>(_sizex, _sizey, _sizez, true, gpus, memtype) {
        MGPULOOP(arrays[g]->CopyFrom(newdata););
    }

    MImage(const MImage<Type>&) = delete;
    MImage<Type>& operator=(const MImage<Type>&) = delete;

    virtual ~MImage() {
        for (int g = 0; g < GetN(); g++) {
            cudaSetDevice(gpuindices[g]);
            delete arrays[g];
            arrays[g] = nullptr;
        }
    }

    dim3 Shape(int g = 0) const { return arrays[g]->Shape(); };

    void SetGPUToZero() { MGPULOOP(arrays[g]->SetGPUToZero();); };

    template <typename Type2 = Type>
    MImage<Type>& operator+=(const MImage<Type2>& other) {
        MGPULOOP(*(arrays[g]) += *(other.arrays[g]););
        return *this;
    }
    template <typename Type2 = Type>
    MImage<Type>& operator*=(Type2 other) {
        MGPULOOP(*(arrays[g]) *= other;);
        return *this;
    }

    /**
     * Copies a host array into every replica.
     * */
    void CopyFrom(const Type* other) { MGPULOOP(arrays[g]->CopyFrom(other);); }
    /**
     * Copies the replica of gpu 0 to a host array.
     * */
    void CopyTo(Type* other) const {
        Set(0);
        arrays[0]->CopyTo(other);
    }

    /**
     * Makes a sum of the array elements in the "gpu dimension". Stores the result in gpu[0].
     * */
    void ReduceSync() {
        if (ngpus < 2) return;
        for (int g = 1; g < ngpus; g++)
            ptyAssert(arrays[g]->size == arrays[0]->size, "ReduceSync needs the same shape on every gpu.");

        for (int s = 1; s < ngpus; s *= 2) {
            for (int g = 0; g < ngpus; g += 2 * s)
                if (g + s < ngpus) {
                    Set(g + s);
                    ptyCudaCheck(cudaDeviceSynchronize());
                    Set(g);
                    ptyCudaCheck(cudaDeviceSynchronize());

                    Image<Type> staging(arrays[g]->Shape(), MemoryType::EAllocGPU);
                    ptyCudaCheck(cudaMemcpyPeer(staging.gpuptr, gpuindices[g], arrays[g + s]->gpuptr,
                                                gpuindices[g + s], sizeof(Type) * arrays[g]->size));
                    arrays[g][0] += staging;
                    ptyCudaCheck(cudaDeviceSynchronize());
                }
        }
        Set(0);
        ptyCudaCheck(cudaDeviceSynchronize());
    }

    /**
     * Broadcasts the contents of gpu[root] to all other gpus. To be used, e.g., after ReduceSync().
     * */
    void BroadcastSync(int root = 0) {
        if (ngpus < 2) return;

        Set(root);
        ptyCudaCheck(cudaDeviceSynchronize());

        for (int g = 0; g < ngpus; g++) {
            if (g == root) continue;
            ptyAssert(arrays[g]->size == arrays[root]->size, "BroadcastSync needs the same shape on every gpu.");
            Set(g);
            ptyCudaCheck(cudaMemcpyPeer(arrays[g]->gpuptr, gpuindices[g], arrays[root]->gpuptr, gpuindices[root],
                                        sizeof(Type) * arrays[root]->size));
        }

        MGPULOOP(ptyCudaCheck(cudaDeviceSynchronize()););
    }
};

typedef MImage<float> rMImage;
typedef MImage<complex> cMImage;


#endif
