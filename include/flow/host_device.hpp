#pragma once
// -----------------------------------------------------------------------------
// host_device.hpp
//
// FLOW_HD marks functions that run on both sides of the interop boundary:
// inside the CUDA strand kernel and in plain host code (CPU writer, tests).
// Under nvcc it expands to __host__ __device__, elsewhere to nothing.
// -----------------------------------------------------------------------------

#if defined(__CUDACC__)
#define FLOW_HD __host__ __device__
#else
#define FLOW_HD
#endif
