#pragma once
// -----------------------------------------------------------------------------
// strand_grid.hpp
//
// Maps the 2D grid of strand workers onto the flat instance buffer.
//
// Worker (x, y) owns strand index i = y * width + x and writes exactly
// segmentsPerStrand records starting at i * segmentsPerStrand. The mapping is
// a bijection onto disjoint contiguous ranges, which is the only
// synchronization the compute stage needs: no two workers address the same
// record.
//
// Buffer sizing is checked once, at allocation time, against the static size
// formula below. Writers never bounds-check individual records.
// -----------------------------------------------------------------------------

#include <cstddef>
#include <string>

#include <glm/glm.hpp>

#include "flow/host_device.hpp"
#include "flow/layout.hpp"
#include "flow/noise_field.hpp"

namespace flow {

struct StrandGrid {
    int width;
    int height;
    int segmentsPerStrand;

    // Exact for any grid that passes checkGridSize().
    FLOW_HD size_t strands() const {
        return static_cast<size_t>(width) * static_cast<size_t>(height);
    }
    FLOW_HD size_t segments() const {
        return strands() * static_cast<size_t>(segmentsPerStrand);
    }
};

// Upper bound on records per frame: the instance count of one draw call is a
// GLsizei.
constexpr long long kMaxInstances = 2147483647LL;

// Where strand seeds sit: a square of side `extent` on the plane z = `plane`,
// plus an optional deterministic per-strand jitter of length `jitter`.
struct SeedLayout {
    float extent;
    float plane;
    float jitter;
};

// Salt for the seed jitter hash, keeps it independent of the noise lattice.
constexpr int kSeedSalt = 7919;

FLOW_HD inline size_t strandIndex(int x, int y, const StrandGrid& grid) {
    return static_cast<size_t>(y) * static_cast<size_t>(grid.width) + static_cast<size_t>(x);
}

FLOW_HD inline size_t strandOffset(size_t strand, const StrandGrid& grid) {
    return static_cast<size_t>(strand) * static_cast<size_t>(grid.segmentsPerStrand);
}

// -----------------------------------------------------------------------------
// seedPosition(x, y, grid, layout)
// Cell-centred seed for worker (x, y). Deterministic, so a strand is
// reproducible from its grid coordinate alone.
// -----------------------------------------------------------------------------
FLOW_HD inline glm::vec3 seedPosition(int x, int y, const StrandGrid& grid, const SeedLayout& layout) {
    const float u = (static_cast<float>(x) + 0.5f) / static_cast<float>(grid.width) - 0.5f;
    const float v = (static_cast<float>(y) + 0.5f) / static_cast<float>(grid.height) - 0.5f;
    glm::vec3 seed(u * layout.extent, v * layout.extent, layout.plane);
    if (layout.jitter != 0.0f) {
        seed += layout.jitter * latticeGradient(glm::ivec3(x, y, kSeedSalt));
    }
    return seed;
}

// Segments per strand for which a compute variant is compiled.
constexpr int kSupportedSegmentCounts[] = {8, 16, 32, 64, 128};

bool isSupportedSegmentCount(int segmentsPerStrand);

// -----------------------------------------------------------------------------
// checkGridSize(grid, error)
// Fails for an empty grid, or one whose record count exceeds kMaxInstances
// (and with it the byte size the capacity formula can express). Every other
// size function assumes a grid that passed this check.
// -----------------------------------------------------------------------------
bool checkGridSize(const StrandGrid& grid, std::string& error);

// Bytes the instance buffer needs for `grid`.
size_t requiredBufferBytes(const StrandGrid& grid);

// -----------------------------------------------------------------------------
// checkBufferCapacity(grid, capacityBytes, error)
// Fails when the grid fails checkGridSize() or the buffer cannot hold every
// record the grid will write.
// -----------------------------------------------------------------------------
bool checkBufferCapacity(const StrandGrid& grid, size_t capacityBytes, std::string& error);

// Most blocks a launch allows in y.
constexpr int kMaxBlocksY = 65535;

// 2D launch shape: blocks of threadsX * threadsY workers.
struct DispatchSize {
    int blocksX;
    int blocksY;
    int threadsX;
    int threadsY;
};

DispatchSize computeDispatch(const StrandGrid& grid, int threadsPerSide = 16);

// -----------------------------------------------------------------------------
// checkDispatchCoverage(grid, dispatch, error)
// Fails when the dispatch leaves strands without a worker, or needs more
// blocks than a launch allows. Extra workers past the grid edge are allowed;
// the kernel skips them.
// -----------------------------------------------------------------------------
bool checkDispatchCoverage(const StrandGrid& grid, const DispatchSize& dispatch, std::string& error);

}  // namespace flow
