#ifndef _COMPLEX_H
#define _COMPLEX_H

/** @file */

#include <cmath>
#include <math.h>
#include <cuda_runtime.h>

#ifndef __hevice
#define __hevice __host__ __device__ inline
#endif

/**
 * Single precision complex number. A float2, so complex arrays go to cufft as cufftComplex.
 * */
struct complex : public float2 {
    complex() = default;
    __hevice complex(float re, float im = 0.0f) {
        x = re;
        y = im;
    }
    __hevice complex(const float2& f) : float2(f) {}

    __hevice float abs2() const { return x * x + y * y; }
    __hevice float abs() const { return sqrtf(x * x + y * y); }
    __hevice complex conj() const { return complex(x, -y); }
    __hevice float real() const { return x; }
    __hevice float imag() const { return y; }

    __hevice complex operator-() const { return complex(-x, -y); }

    __hevice complex operator+(const complex& o) const { return complex(x + o.x, y + o.y); }
    __hevice complex operator-(const complex& o) const { return complex(x - o.x, y - o.y); }
    __hevice complex operator*(const complex& o) const {
        return complex(x * o.x - y * o.y, x * o.y + y * o.x);
    }
    __hevice complex operator/(const complex& o) const {
        float d = o.abs2();
        return complex((x * o.x + y * o.y) / d, (y * o.x - x * o.y) / d);
    }

    __hevice complex operator+(float s) const { return complex(x + s, y); }
    __hevice complex operator-(float s) const { return complex(x - s, y); }
    __hevice complex operator*(float s) const { return complex(x * s, y * s); }
    __hevice complex operator/(float s) const { return complex(x / s, y / s); }

    __hevice complex& operator+=(const complex& o) { x += o.x; y += o.y; return *this; }
    __hevice complex& operator-=(const complex& o) { x -= o.x; y -= o.y; return *this; }
    __hevice complex& operator*=(const complex& o) { *this = *this * o; return *this; }
    __hevice complex& operator/=(const complex& o) { *this = *this / o; return *this; }
    __hevice complex& operator*=(float s) { x *= s; y *= s; return *this; }
    __hevice complex& operator/=(float s) { x /= s; y /= s; return *this; }
    __hevice complex& operator+=(float s) { x += s; return *this; }
    __hevice complex& operator-=(float s) { x -= s; return *this; }

    __hevice bool operator==(const complex& o) const { return x == o.x && y == o.y; }
    __hevice bool operator!=(const complex& o) const { return !(*this == o); }
};

__hevice complex operator*(float s, const complex& c) { return c * s; }
__hevice complex operator+(float s, const complex& c) { return c + s; }

/**
 * Computes exp(i*phase).
 * */
__hevice complex exp1j(float phase) { return complex(cosf(phase), sinf(phase)); }

__hevice bool IsFinite(const complex& c) { return isfinite(c.x) && isfinite(c.y); }

#endif  // _COMPLEX_H
