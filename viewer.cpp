#include "viewer.hpp"

#include <SDL2/SDL.h>
#include <glm/glm.hpp>
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "framebuffer.hpp"
#include "image_writer.hpp"
#include "random.hpp"
#include "render.hpp"

// Call this once at program start:
static bool init_sdl() {
    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        std::cerr << "SDL_Init Error: " << SDL_GetError() << "\n";
        return false;
    }
    return true;
}

// Call this at program end:
static void shutdown_sdl() {
    SDL_Quit();
}

// Creates an SDL window + renderer + texture for live-viewing.
// Returns true on success, and fills out the handles.
static bool create_view_window(int width, int height,
                               SDL_Window *&outWindow,
                               SDL_Renderer *&outRenderer,
                               SDL_Texture *&outTexture) {
    outWindow = SDL_CreateWindow("Live View",
                                 SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                 width, height,
                                 SDL_WINDOW_SHOWN);
    if (!outWindow) {
        std::cerr << "SDL_CreateWindow Error: " << SDL_GetError() << "\n";
        return false;
    }

    outRenderer = SDL_CreateRenderer(outWindow, -1, SDL_RENDERER_ACCELERATED);
    if (!outRenderer) {
        std::cerr << "SDL_CreateRenderer Error: " << SDL_GetError() << "\n";
        return false;
    }

    // Byte order R, G, B, A regardless of endianness, same as ColorU8
    outTexture = SDL_CreateTexture(outRenderer,
                                   SDL_PIXELFORMAT_RGBA32,
                                   SDL_TEXTUREACCESS_STREAMING,
                                   width, height);
    if (!outTexture) {
        std::cerr << "SDL_CreateTexture Error: " << SDL_GetError() << "\n";
        return false;
    }

    return true;
}

static void destroy_view_window(SDL_Window *window, SDL_Renderer *renderer, SDL_Texture *texture) {
    if (texture) SDL_DestroyTexture(texture);
    if (renderer) SDL_DestroyRenderer(renderer);
    if (window) SDL_DestroyWindow(window);
}

// Call once per frame after the framebuffer is resolved:
static void update_and_present(SDL_Renderer *renderer, SDL_Texture *texture, const Framebuffer &framebuffer) {
    SDL_UpdateTexture(texture, nullptr, framebuffer.pixels().data(), framebuffer.width() * 4);

    SDL_RenderClear(renderer);
    SDL_RenderCopy(renderer, texture, nullptr, nullptr);
    SDL_RenderPresent(renderer);
}

static std::string get_frame_filename(int i) {
    std::ostringstream oss;
    oss << "live_frame" << std::setfill('0') << std::setw(4) << i << ".png";
    return oss.str();
}

bool render_live(const World &world, const Camera &cam, int width, int height, Options options) {
    if (!init_sdl()) return false;

    SDL_Window *window = nullptr;
    SDL_Renderer *renderer = nullptr;
    SDL_Texture *texture = nullptr;
    if (!create_view_window(width, height, window, renderer, texture)) {
        destroy_view_window(window, renderer, texture);
        shutdown_sdl();
        return false;
    }

    Random rng = options.seed ? Random(*options.seed) : Random();

    std::vector<glm::vec3> accumulated(static_cast<size_t>(width) * height, glm::vec3(0.0f));
    Framebuffer framebuffer(width, height);
    int frame = 0;

    bool running = true;
    SDL_Event e;

    std::clog << "=======================================================" << "\r\n";

    while (running) {
        while (SDL_PollEvent(&e)) {
            if (e.type == SDL_QUIT) {
                running = false;
            }

            if (e.type == SDL_KEYDOWN) {
                switch (e.key.keysym.sym) {
                    case SDLK_ESCAPE:
                        running = false;
                        break;
                    case SDLK_r:
                        std::fill(accumulated.begin(), accumulated.end(), glm::vec3(0.0f));
                        frame = 0;
                        break;
                    case SDLK_RETURN:
                    case SDLK_KP_ENTER: {
                        auto filename = get_frame_filename(frame);
                        if (save_png(framebuffer, filename)) {
                            std::clog << "\nSaved " << filename << std::endl;
                        }
                        break;
                    }
                    default: break;
                }
            }
        }

        auto render_start = std::chrono::high_resolution_clock::now();

        for (int row = 0; row < height; row++) {
            const int target_row = options.positive_is_up ? height - row - 1 : row;
            for (int column = 0; column < width; column++) {
                glm::vec3& sum = accumulated[static_cast<size_t>(target_row) * width + column];
                sum += trace_pixel(world, cam, column, row, width, height, 1, options.max_ray_bounces, rng);
                framebuffer.at(target_row, column) = resolve_color(sum, frame + 1);
            }
        }
        frame++;

        auto render_stop = std::chrono::high_resolution_clock::now();
        auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(render_stop - render_start).count();

        std::clog << "Frame " << frame
                  << " | Time: " << duration_ms << " ms"
                  << " | Bounces: " << options.max_ray_bounces
                  << "\r" << std::flush;

        update_and_present(renderer, texture, framebuffer);
    }

    std::clog << std::endl;

    // Clean up
    destroy_view_window(window, renderer, texture);
    shutdown_sdl();
    return true;
}
