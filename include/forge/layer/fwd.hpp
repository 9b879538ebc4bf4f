#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for forge_layer module

#include <cstdint>

namespace forge_layer {

struct LayerId;
enum class LayerKind : std::uint8_t;
enum class BlendMode : std::uint8_t;
enum class SurfaceOwner : std::uint8_t;
struct Point;
struct LayerTransform;

class Layer;
class LayerStack;

enum class DropZone : std::uint8_t;
enum class DragState : std::uint8_t;
class LayerOrderingEngine;

} // namespace forge_layer
