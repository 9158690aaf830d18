#ifndef _OPT_H
#define _OPT_H

#include <common/complex.hpp>
#include <common/logger.hpp>
#include <common/types.hpp>

/** @file */

/**
 * y += a * x
 * */
void Axpy(cImage& y, const cImage& x, float a);

/**
 * Dai-Yuan conjugate direction from the scalars of a (possibly distributed) gradient:
 *   dir = -grad1 + dir * norm2 / (denominator + 1e-32)
 * where norm2 = |grad1|^2 and denominator = Re(sum(conj(dir) * (grad1 - grad0))).
 * */
void DirectionDY(cImage& dir, const cImage& grad1, double norm2, double denominator);
void DirectionDY(cImage& dir, const cImage& grad0, const cImage& grad1);

/**
 * Backtracking line search: shrinks the step until the cost does not increase. xsd receives x + step * d and fxsd its
 * cost. A step under 1e-32 is a failure: a warning is logged, fxsd = fx and the returned step is zero.
 * */
template <typename CostFunction>
float LineSearch(CostFunction f, const cImage& x, const cImage& d, cImage& xsd, float fx, float& fxsd,
                 float step_length = 1.0f, float step_shrink = 0.5f) {
    ptyAssert(step_shrink > 0 && step_shrink < 1, format("Invalid step shrink {}.", step_shrink));

    while (true) {
        xsd.CopyFrom(x);
        Axpy(xsd, d, step_length);
        fxsd = f(xsd);
        if (fxsd <= fx) break;

        step_length *= step_shrink;
        if (step_length < 1e-32f) {
            ptyWarning("Line search failed for conjugate gradient.");
            fxsd = fx;
            return 0;
        }
    }
    return step_length;
}

/**
 * Minimizes cost_function from x with num_iter conjugate gradient steps, x is updated in place.
 *
 * cost_function : float(const cImage& x)
 * grad          : void(cImage& out, const cImage& x)
 *
 * Returns the cost at the final x.
 * */
template <typename CostFunction, typename GradFunction>
float ConjugateGradient(cImage& x, CostFunction cost_function, GradFunction grad, int num_iter = 1) {
    cImage grad0(x.Shape(), MemoryType::EAllocGPU);
    cImage grad1(x.Shape(), MemoryType::EAllocGPU);
    cImage dir(x.Shape(), MemoryType::EAllocGPU);
    cImage xsd(x.Shape(), MemoryType::EAllocGPU);

    float cost = cost_function(x);
    for (int i = 0; i < num_iter; i++) {
        grad(grad1, x);
        if (i == 0) {
            dir.CopyFrom(grad1);
            dir *= -1.0f;
        } else {
            DirectionDY(dir, grad0, grad1);
        }
        grad0.CopyFrom(grad1);

        float new_cost;
        const float gamma = LineSearch(cost_function, x, dir, xsd, cost, new_cost);
        if (gamma > 0) x.CopyFrom(xsd);
        cost = new_cost;
    }
    return cost;
}

#endif  // _OPT_H
