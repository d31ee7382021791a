#ifndef ACC_GRAPHICS_ASSIMP_CONVERT_H
#define ACC_GRAPHICS_ASSIMP_CONVERT_H

#include <assimp/matrix4x4.h>
#include <assimp/vector3.h>
#include <glm/glm.hpp>

namespace ACC {
namespace Graphics {

// aiMatrix4x4 is row-major, glm column-major
inline glm::mat4 toGlm(const aiMatrix4x4& m) {
    return glm::mat4(m.a1, m.b1, m.c1, m.d1,
                     m.a2, m.b2, m.c2, m.d2,
                     m.a3, m.b3, m.c3, m.d3,
                     m.a4, m.b4, m.c4, m.d4);
}

inline aiMatrix4x4 toAssimp(const glm::mat4& m) {
    return aiMatrix4x4(m[0][0], m[1][0], m[2][0], m[3][0],
                       m[0][1], m[1][1], m[2][1], m[3][1],
                       m[0][2], m[1][2], m[2][2], m[3][2],
                       m[0][3], m[1][3], m[2][3], m[3][3]);
}

inline glm::vec3 toGlm(const aiVector3D& v) {
    return glm::vec3(v.x, v.y, v.z);
}

inline aiVector3D toAssimp(const glm::vec3& v) {
    return aiVector3D(v.x, v.y, v.z);
}

} // namespace Graphics
} // namespace ACC

#endif // ACC_GRAPHICS_ASSIMP_CONVERT_H
