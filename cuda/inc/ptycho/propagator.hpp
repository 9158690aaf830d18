#ifndef _PROPAGATOR_H
#define _PROPAGATOR_H

#include <cufft.h>

#include <driver_types.h>
#include <memory>
#include <unordered_map>

#include <common/types.hpp>

#include "objective.hpp"

/** @file */

/**
 * Base propagator interface. Maps nearplane waves to farplane waves and evaluates the noise model of the farplane
 * against measured intensities.
 *
 * nearplane, farplane : (npatterns * nwaves, d, d), the nwaves waves of one pattern are consecutive.
 * data                : (npatterns, d, d)
 *
 * The noise model is resolved once, at construction, into a dispatch table.
 * */
class Propagator {
public:
    virtual ~Propagator() {};

    /**
     * Propagates nearplane to farplane. farplane may alias nearplane.
     * */
    virtual void Fwd(cImage& farplane, const cImage& nearplane) = 0;
    /**
     * Adjoint of Fwd. nearplane may alias farplane.
     * */
    virtual void Adj(cImage& nearplane, const cImage& farplane) = 0;

    float Cost(const rImage& data, const cImage& farplane);
    /**
     * Gradient of Cost with respect to the conjugate farplane, up to the 2/N factor of the mean.
     * */
    void Grad(cImage& grad, const rImage& data, const cImage& farplane);
    void CostEachPattern(rImage& costs, const rImage& data, const cImage& farplane);

    NoiseModel Model() const { return objective.model; }

    const size_t nwaves;          //!< Number of incoherent waves per pattern.
    const size_t detector_shape;  //!< Width of the square detector.

protected:
    Propagator(size_t nwaves, size_t detector_shape, NoiseModel model);

    const Objective& objective;

    std::unique_ptr<rImage> intensity;  //!< Scratch for the pattern intensities, grows on demand.

    /**
     * Sums the farplane waves of each pattern into the scratch intensity.
     * */
    rImage& Intensity(const rImage& data, const cImage& farplane);
};

/**
 * Implements the fraunhoffer propagator as a unitary 2D-FFT: the forward transform is scaled by 1/d, so Adj (the
 * scaled inverse transform) is its exact adjoint. Plans are bound to the device active at construction.
 * */
class Fraunhoffer : public Propagator {
public:
    Fraunhoffer(size_t nwaves, size_t detector_shape, NoiseModel model = NoiseModel::Gaussian);
    ~Fraunhoffer() override;

    Fraunhoffer(const Fraunhoffer&) = delete;
    Fraunhoffer& operator=(const Fraunhoffer&) = delete;

    virtual void Fwd(cImage& farplane, const cImage& nearplane) override;
    virtual void Adj(cImage& nearplane, const cImage& farplane) override;

private:
    std::unordered_map<size_t, cufftHandle> plans;  //!< Batched plans by number of frames.

    /**
     * Makes a plan of nframes transforms available.
     * */
    cufftHandle Append(size_t nframes);
    void Execute(cImage& out, const cImage& in, int direction);
};

#endif  // _PROPAGATOR_H
