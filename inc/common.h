#ifndef _BK_COMMON_H
#define _BK_COMMON_H

#include <complex>

#include <eigen3/Eigen/Dense>

#ifndef M_PI
#define M_PI 3.141592653589793238462643383279
#endif

// Every image handled by the core carries exactly four channels (R, G, B, A)
#define BK_CHANNELS 4

// Upper bound of an 8-bit channel; decoded output is clamped to [0, BK_CHANNEL_MAX]
#define BK_CHANNEL_MAX 255.0

using Eigen::Vector4cd;
using Eigen::Vector4d;

using complex_t = std::complex<double>;

#endif
