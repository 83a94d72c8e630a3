#include "flow/shader_schema.hpp"

#include <sstream>

#include "flow/layout.hpp"

namespace flow {

#define FLOW_UNIFORM(field, type) UniformField{#field, type, offsetof(FrameUniforms, field)}
#define FLOW_ATTRIBUTE(name, field, n) InstanceAttribute{name, n, offsetof(Segment, field)}

const std::vector<UniformField>& frameUniformSchema() {
    static const std::vector<UniformField> schema = {
        FLOW_UNIFORM(view, "mat4"),
        FLOW_UNIFORM(projection, "mat4"),
        FLOW_UNIFORM(cameraPosition, "vec4"),
        FLOW_UNIFORM(lightDirection, "vec4"),
        FLOW_UNIFORM(lightColor, "vec4"),
        FLOW_UNIFORM(ambientColor, "vec4"),
        FLOW_UNIFORM(baseColor, "vec4"),
        FLOW_UNIFORM(timeOffset, "vec4"),
        FLOW_UNIFORM(noiseScale, "float"),
        FLOW_UNIFORM(stepSize, "float"),
        FLOW_UNIFORM(tubeRadius, "float"),
        FLOW_UNIFORM(colorTint, "float"),
        FLOW_UNIFORM(strandGrid, "ivec4"),
        FLOW_UNIFORM(seedLayout, "vec4"),
    };
    return schema;
}

const std::vector<InstanceAttribute>& segmentAttributeSchema() {
    static const std::vector<InstanceAttribute> schema = {
        FLOW_ATTRIBUTE("iStartPosition", startPosition, 4),
        FLOW_ATTRIBUTE("iStartNormal", startNormal, 4),
        FLOW_ATTRIBUTE("iStartBitangent", startBitangent, 4),
        FLOW_ATTRIBUTE("iEndPosition", endPosition, 4),
        FLOW_ATTRIBUTE("iEndNormal", endNormal, 4),
        FLOW_ATTRIBUTE("iEndBitangent", endBitangent, 4),
        FLOW_ATTRIBUTE("iColor", color, 4),
        FLOW_ATTRIBUTE("iRadius", radius, 1),
    };
    return schema;
}

#undef FLOW_UNIFORM
#undef FLOW_ATTRIBUTE

std::string glslUniformBlock() {
    std::ostringstream out;
    out << "layout(std140) uniform FrameUniforms {\n";
    for (const UniformField& field : frameUniformSchema()) {
        out << "    " << field.glslType << " " << field.name << ";  // offset " << field.offset << "\n";
    }
    out << "};\n";
    return out.str();
}

std::string glslInstanceInputs() {
    std::ostringstream out;
    int location = kFirstInstanceLocation;
    for (const InstanceAttribute& attr : segmentAttributeSchema()) {
        out << "layout(location = " << location++ << ") in "
            << (attr.components == 1 ? "float" : "vec" + std::to_string(attr.components))
            << " " << attr.name << ";\n";
    }
    return out.str();
}

std::string injectPrelude(const std::string& source, const std::string& prelude) {
    if (source.compare(0, 8, "#version") != 0) {
        return prelude + source;
    }
    const size_t eol = source.find('\n');
    if (eol == std::string::npos) {
        return source + "\n" + prelude;
    }
    return source.substr(0, eol + 1) + prelude + source.substr(eol + 1);
}

}  // namespace flow
