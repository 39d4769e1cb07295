#pragma once

#include "draw2d/Vertex2d.h"
#include "draw2d/atlas/TextureHandle.h"

#include <vector>

namespace draw2d {

// Triangle-list vertices drawn with one texture.
struct Batch {
    TextureHandle texture;
    std::vector<Vertex2d> vertices;
};

} // namespace draw2d
