#ifndef _DIVIDED_H
#define _DIVIDED_H

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include <common/communicator.hpp>
#include <common/types.hpp>

#include "engines_common.hpp"
#include "options.hpp"
#include "ptycho.hpp"

/** @file */

/**
 * Measurements and scan positions split over the workers of a communicator. Worker g receives positions
 * [ranges[g].first, ranges[g].second) of every view.
 * */
struct ScanSplit {
    size_t ntheta = 1;
    std::vector<std::pair<size_t, size_t>> ranges;

    std::unique_ptr<MImage<Position>> scan;  //!< (ntheta, nscan_g) per worker
    std::unique_ptr<rMImage> data;           //!< (ntheta * nscan_g, d, d) per worker

    size_t nscan(int g) const { return ranges[g].second - ranges[g].first; }
};

/**
 * Distributes the (ntheta, nscan) positions and (ntheta * nscan, d, d) measurements of the host over the workers.
 * */
ScanSplit SplitScan(const Communicator& comm, const Position* scan, const float* data, size_t ntheta, size_t nscan,
                    size_t detector_shape);

/**
 * Costs of one call of the divided solver. Subproblems that did not run are zero.
 * */
struct DividedCosts {
    float farplane = 0;
    float object = 0;
    float probe = 0;
    float cost = 0;  //!< Cost of the last subproblem that ran.
};

/**
 * Solves the farfield and nearfield problems of ptychography separately: the farplane phase with the noise model,
 * then object and probe by least squares on the nearplane. One PtychoOperator per worker; psi and probe are
 * replicated, farplanes are split as the scan.
 *
 * Supports probe modes but not fly scans. Position correction is not available.
 * */
struct Divided {
    Divided(const Communicator& comm, const ScanSplit& split, size_t detector_shape, size_t probe_shape, size_t nz,
            size_t n, size_t nmode, const DividedOptions& options);

    Divided(const Divided&) = delete;
    Divided& operator=(const Divided&) = delete;

    const Communicator& comm;
    DividedOptions options;
    DeviceProbeOptions probe_options;  //!< Probe options with the adaptive moments, when used.

    std::vector<std::unique_ptr<PtychoOperator>> ops;  //!< Operator of every worker.

    std::unique_ptr<cMImage> farplane;   //!< Farplane of the last call, (ntheta * nscan_g * nmode, d, d).
    std::unique_ptr<cMImage> nearplane;  //!< Nearplane of the last call.

    const float eps = 1e-16f;  //!< Denominator guard of the least squares steps.
};

/**
 * One outer iteration. Mutates psi, probe and the solver farplane, logs and returns the costs.
 * */
DividedCosts DividedRun(Divided& solver, const ScanSplit& split, cMImage& psi, cMImage& probe);

/**
 * Conjugate gradient on the farplane phases, every worker on its own positions. Returns the noise model cost over
 * all positions.
 * */
float UpdatePhase(Divided& solver, const ScanSplit& split);

/**
 * Conjugate gradient on ||probe * patches(psi) - nearplane||^2 over psi. Returns that squared norm.
 * */
float UpdateObject(Divided& solver, const ScanSplit& split, cMImage& psi, const cMImage& probe);

/**
 * Conjugate gradient on ||probe * patches(psi) - nearplane||^2 over the shared probe. Returns that squared norm.
 * */
float UpdateProbe(Divided& solver, const ScanSplit& split, const cMImage& psi, cMImage& probe);

/**
 * Smooths the increment probe - previous with adaptive moments (worker 0 only), keeping its mean magnitude.
 * */
void ApplyAdaptiveMoment(Divided& solver, cImage& probe, const cImage& previous);

/**
 * Orthogonality, centering and sparsity constraints of the shared probe, as enabled in the probe options.
 * */
void ConstrainProbe(const ProbeOptions& options, cImage& probe);

extern "C" {
/**
 * out[k] = |probe[k % nprobe]|^2 * coefficients[k] (1 when null), as complex.
 * */
__global__ void KWeightedIntensity(complex* out, const complex* probe, const float* coefficients, size_t nframes,
                                   size_t nprobe, size_t npixels);

/**
 * out[j] = sum over k with k % nout == j of in[k].
 * */
__global__ void KSumPositions(complex* out, const complex* in, size_t nframes, size_t nout, size_t npixels);

__global__ void KAdam(complex* g, complex* m, float* v, float mdecay, float vdecay, float eps, size_t size);
}

#endif  // _DIVIDED_H
