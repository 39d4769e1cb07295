// Shader binding numbers shared by C++ and GLSL
// C++:  #include "shaders/bindings.h"
// GLSL: #include "bindings.h"

#ifndef DRAW2D_BINDINGS_H
#define DRAW2D_BINDINGS_H

// =============================================================================
// Frame Descriptor Set (Set 0)
// =============================================================================

#define BINDING_FRAME_UBO       0   // FrameUniforms - global projection
#define BINDING_TEXTURES        1   // Texture atlas, one combined image sampler per slot

#define DRAW2D_MAX_TEXTURES     64

#endif // DRAW2D_BINDINGS_H
