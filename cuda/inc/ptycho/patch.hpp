#ifndef _PATCH_H
#define _PATCH_H

#include <memory>

#include <common/complex.hpp>
#include <common/types.hpp>

#include "engines_common.hpp"

/** @file */

/**
 * Extracts (zero-padded) patches from images at float positions and scatters them back.
 *
 * images    : (ntheta, nz, n)
 * positions : (ntheta, nscan) minimum corners of the patches in the image grid
 * patches   : (ntheta, nscan * nrepeat, padded, padded) for Fwd
 *             (ntheta, K, padded, padded) for Adj, (nscan * nrepeat) % K == 0 and K >= nrepeat
 *
 * Values are bilinearly interpolated; a patch pixel whose interpolation stencil leaves the image is zero. Adj is the
 * exact adjoint of Fwd: overlapping contributions are summed.
 * */
class Patch {
public:
    Patch();
    ~Patch() = default;

    /**
     * Allocates zeroed (ntheta, nscan * nrepeat, patch_width, patch_width) patches and extracts into them.
     * */
    std::unique_ptr<cImage> Fwd(const cImage& images, const PositionArray& positions,
            size_t patch_width, size_t nrepeat = 1) const;

    /**
     * Extracts into the central patch_width region of the given patches. patch_width == 0 uses the full width.
     * */
    void Fwd(cImage& patches, const cImage& images, const PositionArray& positions,
            size_t patch_width = 0, size_t nrepeat = 1) const;

    /**
     * Allocates zeroed (ntheta, height, width) images and scatters into them.
     * */
    std::unique_ptr<cImage> Adj(const PositionArray& positions, const cImage& patches,
            size_t height, size_t width, size_t patch_width = 0, size_t nrepeat = 1) const;

    /**
     * Adds the central patch_width region of the patches to images.
     * */
    void Adj(cImage& images, const PositionArray& positions, const cImage& patches,
            size_t patch_width = 0, size_t nrepeat = 1) const;

private:
    int max_threads;  //!< Block size bound of the current device.

    dim3 Threads(size_t patch_width) const;
};

extern "C" {
__global__ void KFwdPatch(const complex* images, complex* patches, const Position* positions,
        int nimage, int nz, int n, int nscan, int nrepeat, int patch_width, int padded_width);

__global__ void KAdjPatch(complex* images, const complex* patches, const Position* positions,
        int nimage, int nz, int n, int nscan, int nrepeat, int patch_width, int padded_width, int K);
}

#endif  // _PATCH_H
