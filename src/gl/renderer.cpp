#include "gl/renderer.hpp"
#include "gl/gl_utils.hpp"

#include <iostream>
#include <sstream>
#include <vector>

#include "cuda/cuda_utils.cuh"
#include "flow/ring_mesh.hpp"
#include "flow/shader_schema.hpp"

namespace gl {

namespace {

const GLuint kFrameUniformsBinding = 0;

}  // namespace

Renderer::Renderer(int width, int height, int ringSides, size_t instanceCapacity,
                   const std::string& shaderDir, bool cudaInterop, bool gpuTiming)
    : width(width), height(height), instanceCapacity(instanceCapacity),
      glProgram(0), vao(0), ringVbo(0), ringIbo(0), ringIndexCount(0),
      instanceVbo(0), ubo(0), fbo(0), colorTex(0), depthRbo(0),
      timerQuery(0), timerPending(false), cudaInstances(nullptr) {
    initGLResources(ringSides, shaderDir, cudaInterop);
    if (gpuTiming) {
        glGenQueries(1, &timerQuery);
    }
}

Renderer::~Renderer() {
    cleanup();
}

void Renderer::initGLResources(int ringSides, const std::string& shaderDir, bool cudaInterop) {
    // -----------------------------
    // Shader program, with the shared layout declarations injected
    // -----------------------------
    const std::string block = flow::glslUniformBlock();
    glProgram = createProgram(shaderDir + "/tube.vert", shaderDir + "/tube.frag",
                              block + flow::glslInstanceInputs(), block);
    if (!glProgram) {
        std::cerr << "Failed to create tube shader program from " << shaderDir << std::endl;
        return;
    }

    const GLuint blockIndex = glGetUniformBlockIndex(glProgram, "FrameUniforms");
    if (blockIndex != GL_INVALID_INDEX) {
        glUniformBlockBinding(glProgram, blockIndex, kFrameUniformsBinding);
    }

    glGenBuffers(1, &ubo);
    glBindBuffer(GL_UNIFORM_BUFFER, ubo);
    glBufferData(GL_UNIFORM_BUFFER, sizeof(flow::FrameUniforms), nullptr, GL_DYNAMIC_DRAW);
    glBindBuffer(GL_UNIFORM_BUFFER, 0);

    // -----------------------------
    // Shared ring mesh
    // -----------------------------
    const flow::RingMesh ring = flow::buildRingMesh(ringSides);
    ringIndexCount = static_cast<GLsizei>(ring.indices.size());

    glGenVertexArrays(1, &vao);
    glBindVertexArray(vao);

    glGenBuffers(1, &ringVbo);
    glBindBuffer(GL_ARRAY_BUFFER, ringVbo);
    glBufferData(GL_ARRAY_BUFFER, ring.vertices.size() * sizeof(glm::vec3),
                 ring.vertices.data(), GL_STATIC_DRAW);
    glEnableVertexAttribArray(flow::kProfileLocation);
    glVertexAttribPointer(flow::kProfileLocation, 3, GL_FLOAT, GL_FALSE, sizeof(glm::vec3), nullptr);

    glGenBuffers(1, &ringIbo);
    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, ringIbo);
    glBufferData(GL_ELEMENT_ARRAY_BUFFER, ring.indices.size() * sizeof(uint32_t),
                 ring.indices.data(), GL_STATIC_DRAW);

    // -----------------------------
    // Instance buffer: one Segment per instance, attributes advance per instance
    // -----------------------------
    glGenBuffers(1, &instanceVbo);
    glBindBuffer(GL_ARRAY_BUFFER, instanceVbo);
    glBufferData(GL_ARRAY_BUFFER, instanceCapacity * sizeof(flow::Segment), nullptr, GL_DYNAMIC_DRAW);

    GLuint location = flow::kFirstInstanceLocation;
    for (const flow::InstanceAttribute& attr : flow::segmentAttributeSchema()) {
        glEnableVertexAttribArray(location);
        glVertexAttribPointer(location, attr.components, GL_FLOAT, GL_FALSE, sizeof(flow::Segment),
                              reinterpret_cast<const void*>(attr.offset));
        glVertexAttribDivisor(location, 1);
        ++location;
    }

    glBindVertexArray(0);
    glBindBuffer(GL_ARRAY_BUFFER, 0);

    // -----------------------------
    // Register instance buffer with CUDA
    // -----------------------------
    if (cudaInterop) {
        if (!FLOW_CUDA_CHECK(cudaGraphicsGLRegisterBuffer(&cudaInstances, instanceVbo,
                                                          cudaGraphicsMapFlagsWriteDiscard))) {
            cudaInstances = nullptr;
        }
    }

    // -----------------------------
    // Offscreen color target
    // -----------------------------
    createTarget();
}

bool Renderer::createTarget() {
    glGenTextures(1, &colorTex);
    glBindTexture(GL_TEXTURE_2D, colorTex);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, width, height, 0, GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glBindTexture(GL_TEXTURE_2D, 0);

    glGenRenderbuffers(1, &depthRbo);
    glBindRenderbuffer(GL_RENDERBUFFER, depthRbo);
    glRenderbufferStorage(GL_RENDERBUFFER, GL_DEPTH_COMPONENT24, width, height);
    glBindRenderbuffer(GL_RENDERBUFFER, 0);

    glGenFramebuffers(1, &fbo);
    glBindFramebuffer(GL_FRAMEBUFFER, fbo);
    glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, colorTex, 0);
    glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_DEPTH_ATTACHMENT, GL_RENDERBUFFER, depthRbo);
    const GLenum status = glCheckFramebufferStatus(GL_FRAMEBUFFER);
    glBindFramebuffer(GL_FRAMEBUFFER, 0);

    if (status != GL_FRAMEBUFFER_COMPLETE) {
        std::cerr << "Color target incomplete (status 0x" << std::hex << status << std::dec
                  << ") at " << width << "x" << height << std::endl;
        destroyTarget();
        return false;
    }
    return true;
}

void Renderer::destroyTarget() {
    if (fbo) {
        glDeleteFramebuffers(1, &fbo);
        fbo = 0;
    }
    if (colorTex) {
        glDeleteTextures(1, &colorTex);
        colorTex = 0;
    }
    if (depthRbo) {
        glDeleteRenderbuffers(1, &depthRbo);
        depthRbo = 0;
    }
}

bool Renderer::valid() const {
    return glProgram && vao && instanceVbo && ubo && fbo && ringIndexCount > 0;
}

size_t Renderer::instanceBufferBytes() const {
    if (!instanceVbo) return 0;
    GLint64 size = 0;
    glBindBuffer(GL_ARRAY_BUFFER, instanceVbo);
    glGetBufferParameteri64v(GL_ARRAY_BUFFER, GL_BUFFER_SIZE, &size);
    glBindBuffer(GL_ARRAY_BUFFER, 0);
    return size > 0 ? static_cast<size_t>(size) : 0;
}

bool Renderer::validateLayout(std::string& error) const {
    const GLuint blockIndex = glGetUniformBlockIndex(glProgram, "FrameUniforms");
    if (blockIndex == GL_INVALID_INDEX) {
        error = "Shader program has no FrameUniforms block";
        return false;
    }

    GLint blockSize = 0;
    glGetActiveUniformBlockiv(glProgram, blockIndex, GL_UNIFORM_BLOCK_DATA_SIZE, &blockSize);
    if (blockSize != static_cast<GLint>(sizeof(flow::FrameUniforms))) {
        std::ostringstream msg;
        msg << "FrameUniforms is " << blockSize << " bytes in GLSL, "
            << sizeof(flow::FrameUniforms) << " bytes in C++";
        error = msg.str();
        return false;
    }

    for (const flow::UniformField& field : flow::frameUniformSchema()) {
        const GLchar* name = field.name;
        GLuint index = GL_INVALID_INDEX;
        glGetUniformIndices(glProgram, 1, &name, &index);
        if (index == GL_INVALID_INDEX) {
            error = std::string("FrameUniforms member missing from program: ") + field.name;
            return false;
        }

        GLint offset = -1;
        glGetActiveUniformsiv(glProgram, 1, &index, GL_UNIFORM_OFFSET, &offset);
        if (offset != static_cast<GLint>(field.offset)) {
            std::ostringstream msg;
            msg << "FrameUniforms." << field.name << " is at offset " << offset
                << " in GLSL, " << field.offset << " in C++";
            error = msg.str();
            return false;
        }
    }
    return true;
}

flow::Segment* Renderer::mapCudaResource() {
    if (!cudaInstances) return nullptr;

    if (!FLOW_CUDA_CHECK(cudaGraphicsMapResources(1, &cudaInstances, 0))) return nullptr;

    flow::Segment* dptr = nullptr;
    size_t size = 0;
    if (!FLOW_CUDA_CHECK(cudaGraphicsResourceGetMappedPointer(reinterpret_cast<void**>(&dptr),
                                                              &size, cudaInstances))) {
        cudaGraphicsUnmapResources(1, &cudaInstances, 0);
        return nullptr;
    }
    return dptr;
}

bool Renderer::unmapCudaResource() {
    if (!cudaInstances) return false;
    return FLOW_CUDA_CHECK(cudaGraphicsUnmapResources(1, &cudaInstances, 0));
}

bool Renderer::uploadInstances(const flow::Segment* records, size_t count) {
    if (count > instanceCapacity) {
        std::cerr << "uploadInstances: " << count << " records exceed capacity "
                  << instanceCapacity << std::endl;
        return false;
    }
    glBindBuffer(GL_ARRAY_BUFFER, instanceVbo);
    glBufferSubData(GL_ARRAY_BUFFER, 0, count * sizeof(flow::Segment), records);
    glBindBuffer(GL_ARRAY_BUFFER, 0);
    return true;
}

ColorTarget Renderer::draw(const flow::FrameUniforms& uniforms, size_t instanceCount) {
    // Without a target the draw would land in the default framebuffer
    if (!fbo) return ColorTarget();

    // -----------------------------
    // Per-frame uniform block
    // -----------------------------
    glBindBuffer(GL_UNIFORM_BUFFER, ubo);
    glBufferSubData(GL_UNIFORM_BUFFER, 0, sizeof(flow::FrameUniforms), &uniforms);
    glBindBuffer(GL_UNIFORM_BUFFER, 0);
    glBindBufferBase(GL_UNIFORM_BUFFER, kFrameUniformsBinding, ubo);

    // -----------------------------
    // Draw every tube instance into the offscreen target
    // -----------------------------
    glBindFramebuffer(GL_FRAMEBUFFER, fbo);
    glViewport(0, 0, width, height);
    glClearColor(0.05f, 0.05f, 0.07f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

    glEnable(GL_DEPTH_TEST);
    glDisable(GL_CULL_FACE);

    const bool timed = timerQuery && !timerPending;
    if (timed) glBeginQuery(GL_TIME_ELAPSED, timerQuery);

    glUseProgram(glProgram);
    glBindVertexArray(vao);
    glDrawElementsInstanced(GL_TRIANGLES, ringIndexCount, GL_UNSIGNED_INT, nullptr,
                            static_cast<GLsizei>(instanceCount));

    if (timed) {
        glEndQuery(GL_TIME_ELAPSED);
        timerPending = true;
    }

    // Cleanup bindings
    glBindVertexArray(0);
    glUseProgram(0);
    glDisable(GL_DEPTH_TEST);
    glBindFramebuffer(GL_FRAMEBUFFER, 0);

    ColorTarget target;
    target.texture = colorTex;
    target.width = width;
    target.height = height;
    return target;
}

void Renderer::present(int windowWidth, int windowHeight) const {
    glBindFramebuffer(GL_READ_FRAMEBUFFER, fbo);
    glBindFramebuffer(GL_DRAW_FRAMEBUFFER, 0);
    glBlitFramebuffer(0, 0, width, height, 0, 0, windowWidth, windowHeight,
                      GL_COLOR_BUFFER_BIT, GL_LINEAR);
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
}

void Renderer::resize(int newWidth, int newHeight) {
    if (newWidth <= 0 || newHeight <= 0) return;
    if (fbo && newWidth == width && newHeight == height) return;

    width = newWidth;
    height = newHeight;
    destroyTarget();
    createTarget();
}

float Renderer::lastDrawMs() {
    if (!timerQuery || !timerPending) return -1.0f;

    GLint available = 0;
    glGetQueryObjectiv(timerQuery, GL_QUERY_RESULT_AVAILABLE, &available);
    if (!available) return -1.0f;

    GLuint64 ns = 0;
    glGetQueryObjectui64v(timerQuery, GL_QUERY_RESULT, &ns);
    timerPending = false;
    return static_cast<float>(ns) * 1e-6f;
}

void Renderer::cleanup() {
    // -----------------------------
    // Unregister CUDA resource
    // -----------------------------
    if (cudaInstances) {
        cudaGraphicsUnregisterResource(cudaInstances);
        cudaInstances = nullptr;
    }

    // -----------------------------
    // Delete OpenGL buffers/textures/programs
    // -----------------------------
    destroyTarget();
    if (instanceVbo) {
        glDeleteBuffers(1, &instanceVbo);
        instanceVbo = 0;
    }
    if (ringVbo) {
        glDeleteBuffers(1, &ringVbo);
        ringVbo = 0;
    }
    if (ringIbo) {
        glDeleteBuffers(1, &ringIbo);
        ringIbo = 0;
    }
    if (ubo) {
        glDeleteBuffers(1, &ubo);
        ubo = 0;
    }
    if (vao) {
        glDeleteVertexArrays(1, &vao);
        vao = 0;
    }
    if (glProgram) {
        glDeleteProgram(glProgram);
        glProgram = 0;
    }
    if (timerQuery) {
        glDeleteQueries(1, &timerQuery);
        timerQuery = 0;
    }
}

}  // namespace gl
