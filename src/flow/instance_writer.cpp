#include "flow/instance_writer.hpp"

#include <algorithm>
#include <functional>
#include <iostream>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace flow {

namespace {

void writeRange(Segment* buffer, const FrameUniforms& u, size_t first, size_t last) {
    const size_t width = static_cast<size_t>(u.strandGrid.x);
    const int segments = u.strandGrid.z;
    for (size_t strand = first; strand < last; ++strand) {
        writeStrand(buffer, static_cast<int>(strand % width), static_cast<int>(strand / width), u, segments);
    }
}

}  // namespace

CpuStrandWriter::CpuStrandWriter(int threads) : m_threads(threads) {
    if (m_threads <= 0) {
        m_threads = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    }
}

bool CpuStrandWriter::write(Segment* buffer, const FrameUniforms& uniforms) {
    const StrandGrid grid = strandGrid(uniforms);
    std::string error;
    if (buffer == nullptr) return false;
    if (!checkGridSize(grid, error)) {
        std::cerr << "CpuStrandWriter: " << error << std::endl;
        return false;
    }

    const size_t strands = grid.strands();
    const size_t workers = std::min(static_cast<size_t>(m_threads), strands);
    if (workers == 1) {
        writeRange(buffer, uniforms, 0, strands);
        return true;
    }

    // Strand ranges [first, last) are disjoint, so are their record ranges.
    const size_t perWorker = (strands + workers - 1) / workers;
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        const size_t first = w * perWorker;
        const size_t last = std::min(strands, first + perWorker);
        if (first >= last) break;
        try {
            pool.push_back(startWorker([buffer, &uniforms, first, last]() {
                writeRange(buffer, uniforms, first, last);
            }));
        } catch (const std::system_error& e) {
            // Started workers still own their ranges; wait for them, drop the frame
            std::cerr << "CpuStrandWriter: could not start worker " << w << ": " << e.what() << std::endl;
            for (std::thread& t : pool) t.join();
            return false;
        }
    }
    for (std::thread& t : pool) t.join();
    return true;
}

std::thread CpuStrandWriter::startWorker(std::function<void()> work) {
    return std::thread(std::move(work));
}

}  // namespace flow
