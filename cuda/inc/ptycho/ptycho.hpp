#ifndef _PTYCHO_H
#define _PTYCHO_H

#include <cstddef>
#include <memory>

#include <common/complex.hpp>
#include <common/types.hpp>

#include "engines_common.hpp"
#include "objective.hpp"
#include "patch.hpp"
#include <propagator.hpp>

/** @file */

/**
 * Ptychography forward model on one device: patches of the object at the scan positions are multiplied by the probe
 * and propagated to the detector.
 *
 * psi      : (ntheta, nz, n) object
 * scan     : (ntheta, nscan * fly) minimum corners of the probe in the object grid, fly positions are consecutive
 * probe    : (nmode, pw, pw) shared probe or (ntheta * nscan * fly * nmode, pw, pw) probe per position
 * farplane : (ntheta * nscan * fly * nmode, d, d), mode is the fastest axis
 * data     : (ntheta * nscan, d, d)
 *
 * The probe grid is centered in the detector grid (pad = (d - pw) / 2). Construction reserves the fft plans and the
 * scratch buffers of one batch, so every method requires arrays of exactly the constructed shape.
 * */
class PtychoOperator {
public:
    PtychoOperator(size_t detector_shape, size_t probe_shape, size_t nscan, size_t nz, size_t n, size_t ntheta = 1,
                   NoiseModel model = NoiseModel::Gaussian, size_t nmode = 1, size_t fly = 1);
    ~PtychoOperator() = default;

    PtychoOperator(const PtychoOperator&) = delete;
    PtychoOperator& operator=(const PtychoOperator&) = delete;

    const FrameShape shape;
    const size_t detector_shape;
    const size_t probe_shape;
    const size_t nz, n;
    const size_t pad;  //!< Offset of the probe grid in the detector grid.

    Patch patch;
    Fraunhoffer propagation;

    void Fwd(cImage& farplane, const cImage& probe, const PositionArray& scan, const cImage& psi);
    /**
     * Object space adjoint of Fwd. Overwrites psi.
     * */
    void Adj(cImage& psi, const cImage& farplane, const cImage& probe, const PositionArray& scan);
    /**
     * Probe space adjoint of Fwd. A probe of nmode frames receives the sum over positions, a probe of one frame per
     * wave receives every position separately. Overwrites probe.
     * */
    void AdjProbe(cImage& probe, const cImage& farplane, const PositionArray& scan, const cImage& psi);

    float Cost(const rImage& data, const cImage& psi, const PositionArray& scan, const cImage& probe);
    void Grad(cImage& grad, const rImage& data, const cImage& psi, const PositionArray& scan, const cImage& probe);
    void GradProbe(cImage& grad, const rImage& data, const cImage& psi, const PositionArray& scan,
                   const cImage& probe);

    /**
     * Exit waves before propagation, probe * patches(psi), zero outside the probe grid.
     * */
    void NearplaneFwd(cImage& nearplane, const cImage& probe, const PositionArray& scan, const cImage& psi);
    /**
     * Adds the object space adjoint of NearplaneFwd to psi.
     * */
    void NearplaneAdj(cImage& psi, const cImage& nearplane, const cImage& probe, const PositionArray& scan);
    /**
     * Writes the probe space adjoint of NearplaneFwd to probe.
     * */
    void NearplaneAdjProbe(cImage& probe, const cImage& nearplane, const PositionArray& scan, const cImage& psi);

    /**
     * Object patches of every wave, (ntheta * nscan * fly * nmode, pw, pw).
     * */
    cImage& Patches(const PositionArray& scan, const cImage& psi);

    void CheckProbe(const cImage& probe) const;
    void CheckScan(const PositionArray& scan) const;
    void CheckPsi(const cImage& psi) const;
    void CheckWaves(const cImage& waves, size_t width, const char* name) const;
    void CheckData(const rImage& data) const;

private:
    cImage farplane;  //!< Scratch, one frame per wave.
    cImage patches;   //!< Scratch, one probe sized frame per wave.
    cImage weighted;  //!< Scratch, one probe sized frame per wave.
};

extern "C" {
/**
 * nearplane[k] (probe grid) *= probe[k % nprobe], or conj(probe) if bConj. Pixels outside the probe grid are zeroed.
 * */
__global__ void KApplyProbe(complex* nearplane, const complex* probe, size_t nframes, size_t nprobe, int probe_width,
                            int detector_width, bool bConj);

/**
 * probe[j] = sum over the waves k with k % nprobe == j of nearplane[k] (probe grid) * conj(patches[k]).
 * */
__global__ void KAdjProbe(complex* probe, const complex* nearplane, const complex* patches, size_t nframes,
                          size_t nprobe, int probe_width, int detector_width);

__global__ void KCropProbeGrid(complex* out, const complex* nearplane, size_t nframes, int probe_width,
                               int detector_width);
}

#endif  // _PTYCHO_H
