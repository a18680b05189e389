#include "image_writer.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

bool save_ppm(const Framebuffer& framebuffer, std::ostream& out) {
    out << "P3\n"
        << framebuffer.width() << " " << framebuffer.height() << "\n"
        << 255 << "\n";

    for (int row = 0; row < framebuffer.height(); row++) {
        for (int column = 0; column < framebuffer.width(); column++) {
            const ColorU8& color = framebuffer.at(row, column);
            out << static_cast<int>(color.r) << " "
                << static_cast<int>(color.g) << " "
                << static_cast<int>(color.b) << "\n";
        }
    }

    return static_cast<bool>(out);
}

static void ensure_parent_directory(const std::string& filename) {
    std::filesystem::path dir = std::filesystem::path(filename).parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir)) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            std::cerr << "Failed to create " << dir.string() << ": " << ec.message() << std::endl;
        }
    }
}

bool save_ppm(const Framebuffer& framebuffer, const std::string& file_path) {
    ensure_parent_directory(file_path);

    std::ofstream file(file_path);
    if (!file) {
        std::cerr << "Failed to open " << file_path << " for writing. Please check path and permissions." << std::endl;
        return false;
    }

    if (!save_ppm(framebuffer, file)) {
        std::cerr << "Failed to write " << file_path << std::endl;
        return false;
    }
    return true;
}

bool save_png(const Framebuffer& framebuffer, const std::string& filename) {
    ensure_parent_directory(filename);

    // ColorU8 is tightly packed RGBA, row 0 is the top of the image.
    const int stride = framebuffer.width() * 4;
    const int ok = stbi_write_png(filename.c_str(), framebuffer.width(), framebuffer.height(), 4,
                                  framebuffer.pixels().data(), stride);
    if (!ok) {
        std::cerr << "Failed to write " << filename << std::endl;
        return false;
    }
    return true;
}
