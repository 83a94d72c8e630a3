// src/main.cpp
// -----------------------------------------------------------------------------
// Entry point for the curl-noise strand viewer.
// Creates an OpenGL window, detects what the machine can do, and every frame
// regenerates all strands from the current time and draws them as lit tubes.
// -----------------------------------------------------------------------------

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <Windows.h>

// -----------------------------------------------------------------------------
// GPU selection exports
// Force laptops with hybrid GPUs (Optimus / AMD switchable graphics) to launch
// the program on the high-performance GPU.
// -----------------------------------------------------------------------------
extern "C" {
    __declspec(dllexport) DWORD NvOptimusEnablement = 0x00000001;
    __declspec(dllexport) DWORD AmdPowerXpressRequestHighPerformance = 0x00000001;
}
#endif

#include <chrono>
#include <cstdio>
#include <iostream>
#include <string>
#include <glad/gl.h>     // Modern OpenGL function loader
#include <GLFW/glfw3.h>  // Window + context + input

#include "flow/config.hpp"
#include "flow/frame_uniforms.hpp"
#include "gl/capabilities.hpp"
#include "gl/pipeline.hpp"

// -----------------------------------------------------------------------------
// Initializes a GLFW window and an OpenGL 4.3 core context.
// Also loads OpenGL function pointers using GLAD.
// -----------------------------------------------------------------------------
GLFWwindow* initWindow(int width, int height) {
    if (!glfwInit()) {
        std::cerr << "Failed to initialize GLFW\n";
        return nullptr;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    GLFWwindow* window = glfwCreateWindow(width, height, "CurlFlow", nullptr, nullptr);
    if (!window) {
        std::cerr << "Failed to create GLFW window\n";
        glfwTerminate();
        return nullptr;
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(0);

    // Load OpenGL function pointers through GLAD
    if (!gladLoaderLoadGL()) {
        std::cerr << "Failed to initialize GLAD\n";
        glfwDestroyWindow(window);
        glfwTerminate();
        return nullptr;
    }

    return window;
}

// Resize notifications only change the color target size and aspect ratio.
static void onFramebufferResize(GLFWwindow* window, int width, int height) {
    auto* pipeline = static_cast<gl::StrandPipeline*>(glfwGetWindowUserPointer(window));
    if (pipeline) pipeline->resize(width, height);
}

static std::string formatTitle(int fps, const gl::StrandPipeline& pipeline, float computeMs, float drawMs) {
    char buffer[160];
    if (computeMs >= 0.0f && drawMs >= 0.0f) {
        std::snprintf(buffer, sizeof(buffer), "CurlFlow [%s] - FPS: %d - strands %.2f ms, tubes %.2f ms",
                      pipeline.writerName(), fps, computeMs, drawMs);
    } else if (computeMs >= 0.0f) {
        std::snprintf(buffer, sizeof(buffer), "CurlFlow [%s] - FPS: %d - strands %.2f ms",
                      pipeline.writerName(), fps, computeMs);
    } else {
        std::snprintf(buffer, sizeof(buffer), "CurlFlow [%s] - FPS: %d", pipeline.writerName(), fps);
    }
    return buffer;
}

// -----------------------------------------------------------------------------
// MAIN
// Usage: curlflow [--key=value ...]   (see --help)
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {

    // ---------------------------------------------------------
    // Configuration: defaults + command-line overrides
    // ---------------------------------------------------------
    flow::AppConfig config;
    std::string error;
    if (!flow::parseArgs(argc, argv, config, error)) {
        std::cerr << error << std::endl;
        flow::printUsage(std::cerr, argv[0]);
        return 1;
    }
    if (config.showHelp) {
        flow::printUsage(std::cout, argv[0]);
        return 0;
    }
    if (!flow::validateConfig(config, error)) {
        std::cerr << "Invalid configuration: " << error << std::endl;
        return 1;
    }

    // ---------------------------------------------------------
    // Initialize OpenGL window
    // ---------------------------------------------------------
    GLFWwindow* window = initWindow(config.width, config.height);
    if (!window) return -1;

    // ---------------------------------------------------------
    // Capabilities: GL 4.3 is required, CUDA and timers are optional
    // ---------------------------------------------------------
    const gl::Capabilities caps = gl::detectCapabilities(!config.forceCpu);
    gl::reportCapabilities(caps);
    if (!gl::checkRequirements(caps, error)) {
        std::cerr << error << std::endl;
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }

    // Create the pipeline: sets up
    // - the instance buffer (CUDA-registered when a device exists)
    // - the strand writer (CUDA kernel or CPU threads)
    // - ring mesh, uniform block, offscreen target & tube shaders
    int exitCode = 0;
    {
        gl::StrandPipeline pipeline(config, caps);
        if (!pipeline.init(error)) {
            std::cerr << "Setup failed: " << error << std::endl;
            exitCode = 1;
        } else {
            glfwSetWindowUserPointer(window, &pipeline);
            glfwSetFramebufferSizeCallback(window, onFramebufferResize);

            int fbWidth = config.width, fbHeight = config.height;
            glfwGetFramebufferSize(window, &fbWidth, &fbHeight);
            pipeline.resize(fbWidth, fbHeight);

            // ---------------------------------------------------------
            // FPS measurement setup
            // ---------------------------------------------------------
            int framesThisSecond = 0;
            int framesTotal = 0;
            const auto startTime = std::chrono::high_resolution_clock::now();
            auto lastTime = startTime;

            // -----------------------------------------------------------------
            // MAIN RENDER LOOP
            // -----------------------------------------------------------------
            while (!glfwWindowShouldClose(window)) {
                auto currentTime = std::chrono::high_resolution_clock::now();
                framesThisSecond++;

                // Every second: update window title with FPS and stage timings
                float delta = std::chrono::duration<float>(currentTime - lastTime).count();
                if (delta >= 1.0f) {
                    const std::string title = formatTitle(framesThisSecond, pipeline,
                                                          pipeline.lastComputeMs(), pipeline.lastDrawMs());
                    glfwSetWindowTitle(window, title.c_str());
                    framesThisSecond = 0;
                    lastTime = currentTime;
                }

                // -------------------------------------------------------------
                // Everything the frame depends on: configuration and time
                // -------------------------------------------------------------
                const float seconds = std::chrono::duration<float>(currentTime - startTime).count();
                const flow::FrameUniforms uniforms = flow::makeFrameUniforms(config, seconds, pipeline.aspect());

                // -------------------------------------------------------------
                // Compute strands, draw tubes. A dropped frame leaves the
                // previous image on screen; the next frame starts fresh.
                // -------------------------------------------------------------
                gl::ColorTarget target;
                if (pipeline.renderFrame(uniforms, target)) {
                    glfwGetFramebufferSize(window, &fbWidth, &fbHeight);
                    pipeline.present(fbWidth, fbHeight);
                }

                // Swap buffers and poll events
                glfwSwapBuffers(window);
                glfwPollEvents();

                if (config.frames > 0 && ++framesTotal >= config.frames) break;
            }

            glfwSetWindowUserPointer(window, nullptr);
        }

        // ---------------------------------------------------------------------
        // Clean shutdown (GL objects before the context goes away)
        // ---------------------------------------------------------------------
        pipeline.cleanup();
    }

    glfwDestroyWindow(window);
    glfwTerminate();
    return exitCode;
}
