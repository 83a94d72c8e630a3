#pragma once
// -----------------------------------------------------------------------------
// gl_utils.hpp
//
// A small collection of helper functions for loading, compiling, and linking
// OpenGL shaders. The tube renderer uses them to build its program, with the
// shared layout declarations injected ahead of the hand-written GLSL.
// -----------------------------------------------------------------------------

#include <string>
#include <glad/gl.h>

// -----------------------------------------------------------------------------
// loadShaderSource(path)
// Reads a text file from disk and returns its contents as a std::string.
// Returns an empty string (and prints the path) when the file cannot be read.
// -----------------------------------------------------------------------------
std::string loadShaderSource(const std::string& path);

// -----------------------------------------------------------------------------
// compileShader(type, source)
// Compiles a GLSL shader of a given type (GL_VERTEX_SHADER or
// GL_FRAGMENT_SHADER) from a source string.
//
// Returns:
//     - GLuint shader handle (non-zero) on success
//     - 0 on compilation failure (errors printed to console)
// -----------------------------------------------------------------------------
GLuint compileShader(GLenum type, const std::string& source);

// -----------------------------------------------------------------------------
// createProgram(vertexPath, fragmentPath, vertexPrelude, fragmentPrelude)
// Loads two shader files, inserts each prelude right after the #version line
// of its stage, compiles them, links the program, and returns it.
//
// Example:
//     GLuint program = createProgram(dir + "/tube.vert", dir + "/tube.frag",
//                                    flow::glslUniformBlock() + flow::glslInstanceInputs(),
//                                    flow::glslUniformBlock());
//
// Returns:
//     - Linked program ID on success
//     - 0 on failure
// -----------------------------------------------------------------------------
GLuint createProgram(const std::string& vertexPath, const std::string& fragmentPath,
                     const std::string& vertexPrelude, const std::string& fragmentPrelude);
