#include "gl/gl_utils.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

#include "flow/shader_schema.hpp"


std::string loadShaderSource(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Failed to load shader file: " << path << std::endl;
        return "";
    }

    std::stringstream buffer;
    buffer << file.rdbuf(); // Read all file contents into string
    return buffer.str();
}

GLuint compileShader(GLenum type, const std::string& source) {
    GLuint shader = glCreateShader(type);

    const char* src = source.c_str();
    glShaderSource(shader, 1, &src, nullptr);
    glCompileShader(shader);

    // Check if compilation succeeded
    GLint compiled = 0;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &compiled);
    if (!compiled) {
        GLint len = 0;
        glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &len);
        std::string log(len > 0 ? len : 1, ' ');
        glGetShaderInfoLog(shader, len, nullptr, &log[0]);
        std::cerr << "Shader compile error ("
                  << (type == GL_VERTEX_SHADER ? "vertex" : "fragment") << "):\n"
                  << log << std::endl;

        glDeleteShader(shader);
        return 0;
    }

    return shader;
}

GLuint createProgram(const std::string& vertexPath, const std::string& fragmentPath,
                     const std::string& vertexPrelude, const std::string& fragmentPrelude) {
    std::string vertSrc = loadShaderSource(vertexPath);
    std::string fragSrc = loadShaderSource(fragmentPath);
    if (vertSrc.empty() || fragSrc.empty()) return 0;

    // Generated declarations go right after #version
    vertSrc = flow::injectPrelude(vertSrc, vertexPrelude);
    fragSrc = flow::injectPrelude(fragSrc, fragmentPrelude);

    GLuint vertShader = compileShader(GL_VERTEX_SHADER, vertSrc);
    GLuint fragShader = compileShader(GL_FRAGMENT_SHADER, fragSrc);
    if (!vertShader || !fragShader) {
        if (vertShader) glDeleteShader(vertShader);
        if (fragShader) glDeleteShader(fragShader);
        return 0;
    }

    GLuint program = glCreateProgram();
    glAttachShader(program, vertShader);
    glAttachShader(program, fragShader);
    glLinkProgram(program);

    GLint linked = 0;
    glGetProgramiv(program, GL_LINK_STATUS, &linked);
    if (!linked) {
        GLint len = 0;
        glGetProgramiv(program, GL_INFO_LOG_LENGTH, &len);
        std::string log(len > 0 ? len : 1, ' ');
        glGetProgramInfoLog(program, len, nullptr, &log[0]);
        std::cerr << "Program link error:\n" << log << std::endl;

        glDeleteProgram(program);
        program = 0;
    }

    // Shaders are no longer needed once the program is linked
    glDeleteShader(vertShader);
    glDeleteShader(fragShader);

    return program;
}
