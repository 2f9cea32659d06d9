#pragma once

/**
 * @file PixKit.h
 * @brief Main header file for PixKit library
 *
 * PixKit decodes JPEG/PNG bytes, runs deterministic filter kernels
 * (tone, blur, artistic effects, geometry, compositing) and re-encodes,
 * optionally trying an external accelerator first.
 *
 * @version 0.1.0
 */

// Configuration and export macros
#include <PixKit/PixKitConfig.h>
#include <PixKit/Core/Export.h>

// Core types and utilities
#include <PixKit/Core/Types.h>
#include <PixKit/Core/Constants.h>
#include <PixKit/Core/Exception.h>
#include <PixKit/Core/PixelBuffer.h>

// Platform
#include <PixKit/Platform/Log.h>
#include <PixKit/Platform/Thread.h>

// Kernels
#include <PixKit/IO/ImageCodec.h>
#include <PixKit/Color/ColorConvert.h>
#include <PixKit/Filter/Filter.h>
#include <PixKit/Transform/Geometry.h>
#include <PixKit/Compose/Compose.h>
#include <PixKit/Detection/DetectedObject.h>
#include <PixKit/Detection/ObjectDetector.h>

// Orchestration
#include <PixKit/Accel/Accelerator.h>
#include <PixKit/Accel/FallbackController.h>
#include <PixKit/Pipeline/FilterRequest.h>
#include <PixKit/Pipeline/FilterPipeline.h>
#include <PixKit/Api/ProcessingOptions.h>
#include <PixKit/Api/ImageProcessor.h>

namespace Pix::Kit {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return PIXKIT_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = PIXKIT_VERSION_MAJOR;
    minor = PIXKIT_VERSION_MINOR;
    patch = PIXKIT_VERSION_PATCH;
}

} // namespace Pix::Kit
