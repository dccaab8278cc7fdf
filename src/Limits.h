#pragma once

#include <cstddef>

namespace Kiseki {

/**
 * Hard limits for the editable grid, the view and input validation.
 */
namespace Limits {

// Grid dimension limits (imports above this are rejected)
constexpr int MAX_GRID_DIMENSION = 320;
constexpr int MIN_GRID_DIMENSION = 1;
constexpr int DEFAULT_GRID_DIMENSION = 16;

// Zoom is pixels-per-cell
constexpr float MIN_ZOOM = 1.0f;
constexpr float MAX_ZOOM = 100.0f;
constexpr float DEFAULT_ZOOM = 30.0f;  // Displayed as 100%

// Brush edge length in cells
constexpr int MIN_BRUSH_SIZE = 1;
constexpr int MAX_BRUSH_SIZE = 16;

// Snapshots kept for undo (oldest evicted first)
constexpr size_t MAX_HISTORY = 50;

// Fit-to-viewport margins, in viewport pixels
constexpr float DEFAULT_FIT_PADDING = 100.0f;
constexpr float MIN_FIT_AVAILABLE = 10.0f;

// Viewports at or below this size are ignored by the resize handler
constexpr float MIN_USABLE_VIEWPORT = 50.0f;

// Largest side of the CPU display surface / GPU texture, in pixels.
// Past this the surface keeps a smaller per-cell scale and the GPU
// magnifies it with nearest sampling.
constexpr int MAX_SURFACE_DIMENSION = 4096;

// Maximum image file size read for import (16 MB)
constexpr size_t MAX_IMPORT_FILE_SIZE = 16 * 1024 * 1024;

}  // namespace Limits
}  // namespace Kiseki
