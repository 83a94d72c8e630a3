#include "flow/strand_grid.hpp"

#include <limits>
#include <sstream>

namespace flow {

bool isSupportedSegmentCount(int segmentsPerStrand) {
    for (int count : kSupportedSegmentCounts) {
        if (count == segmentsPerStrand) return true;
    }
    return false;
}

size_t requiredBufferBytes(const StrandGrid& grid) {
    return grid.segments() * sizeof(Segment);
}

bool checkGridSize(const StrandGrid& grid, std::string& error) {
    if (grid.width <= 0 || grid.height <= 0 || grid.segmentsPerStrand <= 0) {
        std::ostringstream msg;
        msg << "Strand grid " << grid.width << "x" << grid.height
            << " with " << grid.segmentsPerStrand << " segments per strand is empty";
        error = msg.str();
        return false;
    }

    // Widths and heights are ints, so the strand count fits in 64 bits
    const unsigned long long strands =
        static_cast<unsigned long long>(grid.width) * static_cast<unsigned long long>(grid.height);
    const unsigned long long limit = static_cast<unsigned long long>(kMaxInstances);
    const unsigned long long byteLimit = std::numeric_limits<size_t>::max() / sizeof(Segment);
    const unsigned long long perStrand = static_cast<unsigned long long>(grid.segmentsPerStrand);

    if (strands > limit / perStrand || strands * perStrand > byteLimit) {
        std::ostringstream msg;
        msg << "Strand grid " << grid.width << "x" << grid.height << " with "
            << grid.segmentsPerStrand << " segments per strand exceeds " << kMaxInstances
            << " instances per frame";
        error = msg.str();
        return false;
    }
    return true;
}

bool checkBufferCapacity(const StrandGrid& grid, size_t capacityBytes, std::string& error) {
    if (!checkGridSize(grid, error)) return false;

    const size_t required = requiredBufferBytes(grid);
    if (capacityBytes < required) {
        std::ostringstream msg;
        msg << "Instance buffer too small: " << capacityBytes << " bytes allocated, "
            << required << " bytes required (" << grid.strands() << " strands x "
            << grid.segmentsPerStrand << " segments x " << sizeof(Segment) << " bytes)";
        error = msg.str();
        return false;
    }
    return true;
}

DispatchSize computeDispatch(const StrandGrid& grid, int threadsPerSide) {
    DispatchSize d;
    d.threadsX = threadsPerSide;
    d.threadsY = threadsPerSide;
    d.blocksX = static_cast<int>((static_cast<long long>(grid.width) + threadsPerSide - 1) / threadsPerSide);
    d.blocksY = static_cast<int>((static_cast<long long>(grid.height) + threadsPerSide - 1) / threadsPerSide);
    return d;
}

bool checkDispatchCoverage(const StrandGrid& grid, const DispatchSize& dispatch, std::string& error) {
    const long long coveredX = static_cast<long long>(dispatch.blocksX) * dispatch.threadsX;
    const long long coveredY = static_cast<long long>(dispatch.blocksY) * dispatch.threadsY;
    if (dispatch.threadsX <= 0 || dispatch.threadsY <= 0 ||
        coveredX < grid.width || coveredY < grid.height) {
        std::ostringstream msg;
        msg << "Dispatch " << dispatch.blocksX << "x" << dispatch.blocksY << " blocks of "
            << dispatch.threadsX << "x" << dispatch.threadsY << " threads does not cover the "
            << grid.width << "x" << grid.height << " strand grid";
        error = msg.str();
        return false;
    }
    if (dispatch.blocksY > kMaxBlocksY) {
        std::ostringstream msg;
        msg << "Dispatch needs " << dispatch.blocksY << " blocks in y, a launch allows " << kMaxBlocksY;
        error = msg.str();
        return false;
    }
    return true;
}

}  // namespace flow
