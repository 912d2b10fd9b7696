#pragma once
/// @file decimate.h
/// @brief Min/max envelope decimation for time-stamped series

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>

namespace kvscope {

/// Upper bound on decimate_minmax() output for `n` inputs.
inline size_t decimate_capacity(size_t n, size_t factor) {
    if (factor <= 1)
        return 0;
    return 3 * ((n + factor - 1) / factor);
}

/// Min/max envelope decimation of (t, v) pairs. For every group of `factor`
/// samples, emit the min and the max in chronological order. NaN values are
/// gaps: a group holding one emits a NaN point after its envelope (or only
/// the NaN point when the whole group is NaN) so the line stays broken.
/// Returns number of output points written.
/// Caller must ensure out_t and out_v have capacity >= decimate_capacity(n, factor).
inline size_t decimate_minmax(const double *t, const double *v, size_t n, size_t factor,
                              double *out_t, double *out_v) {
    if (factor <= 1)
        return 0;
    const double nan = std::numeric_limits<double>::quiet_NaN();
    size_t out_idx = 0;
    for (size_t i = 0; i < n; i += factor) {
        size_t end = std::min(i + factor, n);
        size_t imin = end, imax = end, igap = end;
        for (size_t j = i; j < end; j++) {
            if (std::isnan(v[j])) {
                if (igap == end)
                    igap = j;
                continue;
            }
            if (imin == end || v[j] < v[imin])
                imin = j;
            if (imax == end || v[j] > v[imax])
                imax = j;
        }
        if (imin != end) {
            size_t first = std::min(imin, imax);
            size_t second = std::max(imin, imax);
            out_t[out_idx] = t[first];
            out_v[out_idx] = v[first];
            out_idx++;
            if (second != first) {
                out_t[out_idx] = t[second];
                out_v[out_idx] = v[second];
                out_idx++;
            }
        }
        if (igap != end) {
            out_t[out_idx] = t[igap];
            out_v[out_idx] = nan;
            out_idx++;
        }
    }
    return out_idx;
}

} // namespace kvscope
