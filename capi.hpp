#pragma once

#include <stddef.h>
#include <stdint.h>

// C entry points for embedding the renderer. Includable from C and C++.
//
// Ownership contract: PtFramebuffer is a borrowed view. The caller allocates
// width * height PtColor pixels, keeps them alive for the duration of the call
// and keeps ownership afterwards; nothing is retained by the library.
// World handles are owned by the library until passed to pt_free_world.

#ifdef __cplusplus
extern "C" {
#endif

typedef struct PtColor {
	uint8_t r;
	uint8_t g;
	uint8_t b;
	uint8_t a;
} PtColor;

typedef struct PtFramebuffer {
	size_t width;
	size_t height;
	PtColor* pixels;
} PtFramebuffer;

typedef struct PtWorldHandle PtWorldHandle;

enum PtStatus {
	PT_OK = 0,
	PT_NULL_ARGUMENT = 1,
	PT_INVALID_SIZE = 2,
	PT_RENDER_FAILED = 3
};

// Parses a scene description. Returns NULL (and logs why) on failure.
PtWorldHandle* pt_load_world(const char* source);

// Renders into the caller's buffer, row 0 is the top of the image.
int pt_render(PtFramebuffer framebuffer, const PtWorldHandle* handle);

void pt_free_world(PtWorldHandle* handle);

#ifdef __cplusplus
}
#endif
