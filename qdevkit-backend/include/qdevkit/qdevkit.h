#pragma once

// Main header file for the QDevKit backend
// Include this to get access to every developer tool

#define QDEVKIT_VERSION_MAJOR 1
#define QDEVKIT_VERSION_MINOR 2
#define QDEVKIT_VERSION_PATCH 0

// API export macros
#include "api_export.h"

// Error taxonomy shared by all tools
#include "tool_error.h"

// Identifiers
#include "uuid_generator.h"

// Codecs (Base64, URL percent-encoding, digests)
#include "base64_codec.h"
#include "url_codec.h"
#include "hash_generator.h"

// Structured text (JSON, JWT, timestamps, JSONPath)
#include "json_formatter.h"
#include "jwt_decoder.h"
#include "timestamp_converter.h"
#include "json_path.h"
#include "expression_history.h"

namespace qdevkit {

// Initialize the backend
QDEVKIT_API bool Initialize();

// Shutdown the backend
QDEVKIT_API void Shutdown();

// Get version string
QDEVKIT_API const char* GetVersionString();

} // namespace qdevkit
