#ifndef _OPTIONS_H
#define _OPTIONS_H

#include <memory>
#include <vector>

#include <common/complex.hpp>
#include <common/types.hpp>

#include "objective.hpp"

/** @file */

/**
 * Settings of the probe correction.
 * */
struct ProbeOptions {
    bool orthogonality_constraint = true;         //!< Forces the shared probe modes to be orthogonal each iteration.
    bool centered_intensity_constraint = false;   //!< Forces the probe intensity to be centered.
    float sparsity_constraint = 1.0f;             //!< Maximum proportion of nonzero probe pixels.
    bool use_adaptive_moment = false;             //!< Smooths the probe increments with adaptive moments.
    float vdecay = 0.999f;                        //!< Proportion of the second moment that is previous second moments.
    float mdecay = 0.9f;                          //!< Proportion of the first moment that is previous first moments.
};

/**
 * Probe options with their adaptive moments on the host. Empty moments are absent.
 * */
struct HostProbeOptions {
    ProbeOptions options;

    dim3 moment_shape = dim3(0, 0, 0);  //!< Shape of the probe the moments belong to.
    std::vector<complex> m;             //!< First moment.
    std::vector<float> v;               //!< Second moment.

    bool HasMoments() const { return !m.empty() && !v.empty(); }
};

/**
 * Probe options with their adaptive moments replicated on every worker. Null moments are absent.
 * */
struct DeviceProbeOptions {
    ProbeOptions options;

    std::unique_ptr<cMImage> m;  //!< First moment.
    std::unique_ptr<rMImage> v;  //!< Second moment.

    bool HasMoments() const { return m != nullptr && v != nullptr; }
};

DeviceProbeOptions ToDevice(const HostProbeOptions& host, const std::vector<int>& gpus);
HostProbeOptions ToHost(const DeviceProbeOptions& device);

/**
 * Settings of one call of the divided solver.
 * */
struct DividedOptions {
    bool recover_psi = true;
    bool recover_probe = false;
    bool recover_positions = false;  //!< Position correction is not available, the flag is ignored.
    int cg_iter = 4;                 //!< Iterations of every subproblem.
    NoiseModel model = NoiseModel::Gaussian;
    ProbeOptions probe_options;
};

#endif  // _OPTIONS_H
