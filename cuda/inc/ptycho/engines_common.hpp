#ifndef _ENGINES_COMMON_H
#define _ENGINES_COMMON_H

#include <cstddef>
#include <string>

#include <common/complex.hpp>
#include <common/types.hpp>

/** @file */

__hevice float sq(float x) { return x * x; }

/**
 * Scan position of one measurement.
 * */
struct Position {
    float x, y;     //!< x,y coordinates in pixels of the minimum corner of the probe grid in the object grid.
};

typedef Image<Position> PositionArray;

/**
 * Named leading dimensions of a stack of 2D frames: angular views, scan positions per view, fly-scan positions per
 * measurement and probe modes. A frame stack with this shape has count() frames, mode being the fastest axis.
 * */
struct FrameShape {
    size_t ntheta = 1;
    size_t nscan = 1;
    size_t fly = 1;
    size_t nmode = 1;

    size_t patterns() const { return ntheta * nscan; }
    size_t waves() const { return fly * nmode; }
    size_t count() const { return ntheta * nscan * fly * nmode; }

    std::string str() const {
        return format("(ntheta={}, nscan={}, fly={}, nmode={})", ntheta, nscan, fly, nmode);
    }
};

inline std::string ShapeStr(const dim3& d) { return format("({}, {}, {})", d.z, d.y, d.x); }

/**
 * Checks that img is a stack of nframes frames of height x width.
 * */
template <typename Type>
void CheckFrames(const Image<Type>& img, size_t nframes, size_t height, size_t width, const char* name) {
    ptyAssert(img.sizez == nframes && img.sizey == height && img.sizex == width,
            format("{} has shape {}, expected ({}, {}, {}).", name, ShapeStr(img.Shape()), nframes, height, width));
}

#endif  // _ENGINES_COMMON_H
