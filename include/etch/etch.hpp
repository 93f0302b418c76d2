#pragma once

/**
 * Etch - an immediate-mode 2D graphics context over a pluggable canvas
 *
 * Usage:
 *
 *   #include <etch/etch.hpp>
 *   etch::Graphics g(800, 600);
 *   g.setColor({255, 0, 0, 255});
 *   g.fillRect(10, 10, 100, 100);
 *   auto recording = g.surface()->takeRecording();
 *
 *   // Drawing onto another backend
 *   std::shared_ptr<etch::Canvas> canvas = ...;
 *   etch::Graphics g2(canvas);
 */

// Version
#include "etch/version.hpp"

// Core types
#include "etch/types.hpp"
#include "etch/errors.hpp"
#include "etch/log.hpp"

// User-space geometry
#include "etch/geometry.hpp"
#include "etch/affine_transform.hpp"
#include "etch/shape.hpp"
#include "etch/area.hpp"

// Backend interface
#include "etch/matrix.hpp"
#include "etch/path.hpp"
#include "etch/paint.hpp"
#include "etch/typeface.hpp"
#include "etch/image.hpp"
#include "etch/canvas.hpp"
#include "etch/backend_factory.hpp"

// Recording backend
#include "etch/recording.hpp"
#include "etch/draw_op_visitor.hpp"
#include "etch/recording_canvas.hpp"
#include "etch/canvas_player.hpp"
#include "etch/surface.hpp"

// Graphics context
#include "etch/path_builder.hpp"
#include "etch/graphics.hpp"
