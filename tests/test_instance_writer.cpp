// tests/test_instance_writer.cpp
// -----------------------------------------------------------------------------
// CPU strand writer over a full frame: record count, buffer bounds, seeds,
// thread-count independence, and the doubled-segments scenario.
// -----------------------------------------------------------------------------

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <cstring>
#include <functional>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "flow/config.hpp"
#include "flow/frame_uniforms.hpp"
#include "flow/instance_writer.hpp"

using namespace flow;

namespace {

const unsigned char kSentinel = 0xCD;
const size_t kGuardRecords = 16;

AppConfig scenarioConfig(int segmentsPerStrand) {
    AppConfig config;
    config.grid = StrandGrid{16, 16, segmentsPerStrand};
    config.noiseScale = 0.5f;
    config.stepSize = 0.05f;
    config.radius = 0.02f;
    return config;
}

// Buffer of exactly the required size followed by a guard region, all
// filled with a sentinel byte.
std::vector<Segment> guardedBuffer(const StrandGrid& grid) {
    std::vector<Segment> buffer(grid.segments() + kGuardRecords);
    std::memset(static_cast<void*>(buffer.data()), kSentinel, buffer.size() * sizeof(Segment));
    return buffer;
}

bool untouched(const Segment& s) {
    const unsigned char* bytes = reinterpret_cast<const unsigned char*>(&s);
    for (size_t i = 0; i < sizeof(Segment); ++i) {
        if (bytes[i] != kSentinel) return false;
    }
    return true;
}

std::vector<Segment> writeFrame(const AppConfig& config, int threads, float time = 0.0f) {
    const FrameUniforms u = makeFrameUniforms(config, time, 16.0f / 9.0f);
    std::vector<Segment> buffer(config.grid.segments());
    CpuStrandWriter writer(threads);
    REQUIRE(writer.write(buffer.data(), u));
    return buffer;
}

// Starts `allowed` workers, then fails like an exhausted thread limit.
class LimitedThreadWriter : public CpuStrandWriter {
public:
    LimitedThreadWriter(int threads, int allowed) : CpuStrandWriter(threads), allowed(allowed) {}

    int started = 0;

protected:
    std::thread startWorker(std::function<void()> work) override {
        if (started == allowed) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        }
        ++started;
        return CpuStrandWriter::startWorker(std::move(work));
    }

private:
    int allowed;
};

}  // namespace

TEST_CASE("16x16 grid of 32-segment strands writes exactly 8192 records", "[writer]") {
    const AppConfig config = scenarioConfig(32);
    const FrameUniforms u = makeFrameUniforms(config, 0.0f, 16.0f / 9.0f);

    std::vector<Segment> buffer = guardedBuffer(config.grid);
    CpuStrandWriter writer(4);
    REQUIRE(writer.write(buffer.data(), u));

    size_t written = 0;
    for (size_t i = 0; i < config.grid.segments(); ++i) {
        if (!untouched(buffer[i])) ++written;
        REQUIRE(buffer[i].radius == config.radius);
    }
    REQUIRE(written == 8192);

    SECTION("nothing past the required size is touched") {
        for (size_t i = config.grid.segments(); i < buffer.size(); ++i) {
            REQUIRE(untouched(buffer[i]));
        }
    }

    SECTION("first strand starts at its seed") {
        const glm::vec3 seed = seedPosition(0, 0, config.grid, config.seeds);
        REQUIRE(buffer[0].startPosition == glm::vec4(seed, 1.0f));
    }

    SECTION("every strand starts at its own seed and is continuous") {
        const int segments = config.grid.segmentsPerStrand;
        for (int y = 0; y < config.grid.height; ++y) {
            for (int x = 0; x < config.grid.width; ++x) {
                const size_t first = strandOffset(strandIndex(x, y, config.grid), config.grid);
                const glm::vec3 seed = seedPosition(x, y, config.grid, config.seeds);
                REQUIRE(buffer[first].startPosition == glm::vec4(seed, 1.0f));
                for (int k = 0; k + 1 < segments; ++k) {
                    REQUIRE(buffer[first + k].endPosition == buffer[first + k + 1].startPosition);
                }
            }
        }
    }
}

TEST_CASE("CPU writer output does not depend on the thread count", "[writer]") {
    const AppConfig config = scenarioConfig(32);
    const std::vector<Segment> single = writeFrame(config, 1);

    for (int threads : {2, 3, 7, 64}) {
        const std::vector<Segment> multi = writeFrame(config, threads);
        INFO("threads = " << threads);
        REQUIRE(std::memcmp(single.data(), multi.data(), single.size() * sizeof(Segment)) == 0);
    }
}

TEST_CASE("Doubling segments per strand doubles the records and keeps the prefix", "[writer]") {
    const AppConfig base = scenarioConfig(32);
    const AppConfig doubled = scenarioConfig(64);

    const std::vector<Segment> a = writeFrame(base, 4);
    const std::vector<Segment> b = writeFrame(doubled, 4);
    REQUIRE(b.size() == 2 * a.size());
    REQUIRE(b.size() == 16384);

    for (size_t strand = 0; strand < base.grid.strands(); ++strand) {
        const Segment* shortRun = &a[strandOffset(strand, base.grid)];
        const Segment* longRun = &b[strandOffset(strand, doubled.grid)];
        REQUIRE(std::memcmp(shortRun, longRun, 32 * sizeof(Segment)) == 0);
    }
}

TEST_CASE("A frame is a pure function of configuration and time", "[writer]") {
    const AppConfig config = scenarioConfig(16);

    const std::vector<Segment> first = writeFrame(config, 4, 1.5f);
    const std::vector<Segment> again = writeFrame(config, 4, 1.5f);
    REQUIRE(std::memcmp(first.data(), again.data(), first.size() * sizeof(Segment)) == 0);

    SECTION("a later time moves the strands") {
        const std::vector<Segment> later = writeFrame(config, 4, 2.5f);
        REQUIRE(later[1].startPosition != first[1].startPosition);
        // Seeds do not move with time
        REQUIRE(later[0].startPosition == first[0].startPosition);
    }
}

TEST_CASE("CPU writer rejects a null buffer", "[writer]") {
    const AppConfig config = scenarioConfig(8);
    CpuStrandWriter writer(2);
    REQUIRE(writer.threads() == 2);
    REQUIRE_FALSE(writer.write(nullptr, makeFrameUniforms(config, 0.0f, 1.0f)));
    REQUIRE_FALSE(writer.writesDeviceMemory());
}

TEST_CASE("CPU writer drops the frame when a worker cannot start", "[writer]") {
    const AppConfig config = scenarioConfig(32);
    const FrameUniforms u = makeFrameUniforms(config, 0.0f, 1.0f);
    std::vector<Segment> buffer = guardedBuffer(config.grid);

    // 256 strands over 4 workers, 64 strands each; the third start fails
    LimitedThreadWriter writer(4, 2);
    REQUIRE_FALSE(writer.write(buffer.data(), u));
    REQUIRE(writer.started == 2);

    const size_t joined = 128 * 32;
    for (size_t i = 0; i < joined; ++i) REQUIRE_FALSE(untouched(buffer[i]));
    for (size_t i = joined; i < buffer.size(); ++i) REQUIRE(untouched(buffer[i]));

    SECTION("no worker at all") {
        std::vector<Segment> fresh = guardedBuffer(config.grid);
        LimitedThreadWriter none(4, 0);
        REQUIRE_FALSE(none.write(fresh.data(), u));
        for (const Segment& s : fresh) REQUIRE(untouched(s));
    }
}

TEST_CASE("CPU writer refuses a grid past the instance limit", "[writer]") {
    AppConfig config = scenarioConfig(32);
    config.grid = StrandGrid{65536, 65536, 32};
    const FrameUniforms u = makeFrameUniforms(config, 0.0f, 1.0f);

    Segment one;
    CpuStrandWriter writer(4);
    REQUIRE_FALSE(writer.write(&one, u));
}

TEST_CASE("Frame uniforms carry the configuration", "[writer][uniforms]") {
    AppConfig config = scenarioConfig(64);
    config.drift = glm::vec3(0.0f, 0.0f, 0.2f);
    config.ringSides = 12;
    const FrameUniforms u = makeFrameUniforms(config, 2.0f, 1.5f);

    const StrandGrid grid = strandGrid(u);
    REQUIRE(grid.width == 16);
    REQUIRE(grid.height == 16);
    REQUIRE(grid.segmentsPerStrand == 64);
    REQUIRE(u.strandGrid.w == 12);
    REQUIRE(u.timeOffset == glm::vec4(0.0f, 0.0f, 0.4f, 2.0f));
    REQUIRE(fieldParams(u).scale == 0.5f);
    REQUIRE(segmentStyle(u).radius == config.radius);
    REQUIRE(std::fabs(glm::length(glm::vec3(u.lightDirection)) - 1.0f) < 1e-6f);
}
