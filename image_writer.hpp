#pragma once

#include <iosfwd>
#include <string>

#include "framebuffer.hpp"

// Plain-text P3 PPM: "P3", "width height", "255", then one "R G B" line per pixel.
bool save_ppm(const Framebuffer& framebuffer, std::ostream& out);
bool save_ppm(const Framebuffer& framebuffer, const std::string& file_path);

bool save_png(const Framebuffer& framebuffer, const std::string& filename);
