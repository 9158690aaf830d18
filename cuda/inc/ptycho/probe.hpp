#ifndef _PROBE_H
#define _PROBE_H

#include <cstddef>
#include <memory>

#include <common/communicator.hpp>
#include <common/complex.hpp>
#include <common/types.hpp>

#include "engines_common.hpp"

/** @file */

/*
 * Probes are a shared component, equal for all positions, plus an optional varying component stored sparsely as
 * eigen probes and weights:
 *
 *   shared  : (nmode, pw, pw)
 *   eigen   : (neigen - 1, nvary, pw, pw), only the first nvary <= nmode modes vary
 *   weights : (npos, neigen, nmode) float, weights[p, 0, m] multiplies the shared mode m
 *
 * varying_probe[p, m] = weights[p, 0, m] * shared[m] + sum_c weights[p, c, m] * eigen[c - 1, m]
 * */

/**
 * Eigen probes and weights of one set of positions. Members are null when absent.
 * */
struct EigenProbes {
    std::unique_ptr<cImage> eigen_probe;
    std::unique_ptr<rImage> weights;
};

/**
 * Per position probe, (npos * nmode, pw, pw). eigen_probe may be null.
 * */
void GetVaryingProbe(cImage& varying, const cImage& shared, const cImage* eigen_probe, const rImage& weights);

/**
 * Initializes the varying component of a probe for npos positions. Weights of the eigen probes start random,
 * zero-mean and tiny, the shared weights are one, weights of the modes that do not vary are zero. Eigen probes are
 * random with unit mean magnitude. Returns null members when num_eigen_probes < 1 and no eigen probes when it is 1.
 * */
EigenProbes InitVaryingProbe(size_t npos, const cImage& shared, size_t num_eigen_probes,
                             size_t probes_with_modes = 1, unsigned seed = 0);

/**
 * Returns a probe of nmodes modes. Modes beyond the given ones are the first mode times random linear phase ramps.
 * */
std::unique_ptr<cImage> AddModesRandomPhase(const cImage& probe, size_t nmodes, unsigned seed = 0);

/**
 * Orthogonalizes every group of nmodes consecutive frames of x with the eigenvectors of their Gram matrix. The
 * modes come out in descending order of energy and the total energy is preserved.
 * */
void OrthogonalizeEig(cImage& x, size_t nmodes);

/**
 * Gram-Schmidt orthogonalization (without normalization) of nvectors vectors made of x.sizez / nvectors
 * consecutive frames each.
 * */
void OrthogonalizeGS(cImage& x, size_t nvectors);

/**
 * Orthogonalizes the eigen probes of every worker and clips the magnitude of every (eigen, mode) weight column at
 * 1.5 times its 95th percentile over the positions of the node, keeping the sign. eigen_probe may be null.
 * */
void ConstrainVariableProbe(const Communicator& comm, cMImage* eigen_probe, rMImage& weights);

/**
 * Zeros the int((1 - f) * pw * pw) pixels of least smoothed intensity in every mode. f == 1 leaves the probe as is.
 * */
void ConstrainProbeSparsity(cImage& probe, float f);

/**
 * Circularly shifts all modes so that the peak of the smoothed intensity is at the center of the grid.
 * */
void ConstrainCenterPeak(cImage& probe);

/**
 * Updates eigen probe c - 1 of mode m and its weights from the residual probe updates of every position.
 *
 * R, patches, diff : (npos, pw, pw) per worker
 * eigen_probe      : replicated on every worker
 * weights          : (npos, neigen, nmode) per worker
 *
 * Throws when the weights of the eigen probe are zero at every position of a worker (a worker without positions
 * included), or when the update is not finite.
 * */
void UpdateEigenProbe(const Communicator& comm, const cMImage& R, cMImage& eigen_probe, rMImage& weights,
                      const cMImage& patches, const cMImage& diff, float beta = 0.1f, int c = 1, int m = 0);

/**
 * sqrt(mean(|x|^2)) of a frame.
 * */
float MeanNorm(const cImage& x);

/**
 * out[p] = mean over the pixels of Re(conj(a[p]) * b[p]). A single frame b is used for every p.
 * */
void FrameMeanRealDot(rImage& out, const cImage& a, const cImage& b);

bool AllFinite(const cImage& x);

extern "C" {
__global__ void KVaryingProbe(complex* varying, const complex* shared, const complex* eigen, const float* weights,
                              size_t npos, int nmode, int neigen, int nvary, size_t npixels);

__global__ void KGaussianFilter1D(float* out, const float* in, const float* taps, int radius, int width, int height,
                                  bool bAlongY);
}

#endif  // _PROBE_H
