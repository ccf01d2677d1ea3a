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

#ifndef SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_SLIDEBRIDGE_H_
#define SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_SLIDEBRIDGE_H_

/**
 * @file slidebridge.h
 * @brief Main header for the slidebridge library
 *
 * slidebridge is a checked C++ interface to the OpenSlide C library:
 * - **Native**: the OpenSlide function table, the error bridge and the RAII
 *   handle
 * - **Slide**: open/close and guarded accessors for geometry, regions,
 *   properties and associated images
 *
 * @see slidebridge/native/ for the native boundary
 */

// ============================================================================
// Native Boundary
// ============================================================================

#include "slidebridge/native/error_bridge.h"
#include "slidebridge/native/native_api.h"
#include "slidebridge/native/slide_handle.h"

// ============================================================================
// Public API
// ============================================================================

#include "slidebridge/associated_image.h"
#include "slidebridge/errors.h"
#include "slidebridge/geometry.h"
#include "slidebridge/image.h"
#include "slidebridge/properties.h"
#include "slidebridge/slide.h"
#include "slidebridge/slide_options.h"

#endif  // SLIDEBRIDGE_INCLUDE_SLIDEBRIDGE_SLIDEBRIDGE_H_
