#ifndef _OBJECTIVE_H
#define _OBJECTIVE_H

#include <string>

#include <common/complex.hpp>
#include <common/types.hpp>

/** @file */

/*
 * Noise model cost functions and gradients.
 *
 * data, intensity : (npatterns, d, d) float
 * farplane, grad  : (npatterns * nwaves, d, d) complex, the nwaves incoherent waves of a pattern are consecutive.
 *
 * Costs are means, not sums, so that values are comparable between batches of different sizes.
 */

/**
 * Noise model to use in the maximum likelihood optimization.
 * */
enum class NoiseModel { Gaussian, Poisson };

NoiseModel NoiseModelFromString(const std::string& name);
const char* NoiseModelName(NoiseModel model);

/**
 * intensity = sum over the waves of a pattern of |farplane|^2.
 * */
void FarplaneIntensity(rImage& intensity, const cImage& farplane);

/**
 * mean(|sqrt(intensity) - sqrt(data)|^2)
 * */
float GaussianCost(const rImage& data, const rImage& intensity);
/**
 * farplane * (1 - sqrt(data) / (sqrt(intensity) + 1e-9)). grad may alias farplane.
 * */
void GaussianGrad(cImage& grad, const rImage& data, const cImage& farplane, const rImage& intensity);
/**
 * Gaussian cost of every pattern, reduced over the detector pixels only.
 * */
void GaussianEachPattern(rImage& costs, const rImage& data, const rImage& intensity);

/**
 * mean(intensity - data * log(intensity + 1e-9))
 * */
float PoissonCost(const rImage& data, const rImage& intensity);
/**
 * farplane * (1 - data / (intensity + 1e-9)). grad may alias farplane.
 * */
void PoissonGrad(cImage& grad, const rImage& data, const cImage& farplane, const rImage& intensity);
void PoissonEachPattern(rImage& costs, const rImage& data, const rImage& intensity);

/**
 * Dispatch table of one noise model.
 * */
struct Objective {
    typedef float (*CostFunction)(const rImage& data, const rImage& intensity);
    typedef void (*GradFunction)(cImage& grad, const rImage& data, const cImage& farplane, const rImage& intensity);
    typedef void (*EachPatternFunction)(rImage& costs, const rImage& data, const rImage& intensity);

    NoiseModel model;
    CostFunction cost;
    GradFunction grad;
    EachPatternFunction each_pattern;
};

const Objective& GetObjective(NoiseModel model);

#endif  // _OBJECTIVE_H
