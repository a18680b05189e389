#pragma once  

#include "camera.hpp"  
#include "render.hpp"
#include "world.hpp"

// Progressive preview: one sample per pixel per frame until the window closes.
// Returns false if SDL couldn't be initialised.
bool render_live(const World& world, const Camera& cam, int width, int height, Options options);
