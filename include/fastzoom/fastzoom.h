// Copyright 2025 Jonas Teuwen. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef AIFO_FASTZOOM_INCLUDE_FASTZOOM_FASTZOOM_H_
#define AIFO_FASTZOOM_INCLUDE_FASTZOOM_FASTZOOM_H_

/**
 * @file fastzoom.h
 * @brief Main header for the FastZoom library
 *
 * FastZoom turns a multi-resolution image into a Deep Zoom tile pyramid:
 * - **Core**: Pure layout math (pyramid plan, tile-to-region mapping, errors)
 * - **Pixels**: Compositing onto a background and area resampling
 * - **Descriptor**: The .dzi XML document
 * - **Sources**: The SlideSource interface and an in-memory implementation
 *
 * @see fastzoom/deepzoom_generator.h for the entry point
 */

// ============================================================================
// Core Domain Models
// ============================================================================

#include "fastzoom/core/errors.h"
#include "fastzoom/core/pyramid_plan.h"
#include "fastzoom/core/size.h"
#include "fastzoom/core/source_descriptor.h"
#include "fastzoom/core/tile_mapper.h"

// ============================================================================
// Pixel Operations
// ============================================================================

#include "fastzoom/compositor/tile_compositor.h"
#include "fastzoom/resample/area.h"

// ============================================================================
// Descriptor
// ============================================================================

#include "fastzoom/descriptor/dzi.h"

// ============================================================================
// Public API
// ============================================================================

#include "fastzoom/deepzoom_generator.h"
#include "fastzoom/deepzoom_options.h"
#include "fastzoom/image.h"
#include "fastzoom/slide_source.h"
#include "fastzoom/sources/memory_slide_source.h"
#include "fastzoom/utilities/colors.h"

#endif  // AIFO_FASTZOOM_INCLUDE_FASTZOOM_FASTZOOM_H_
