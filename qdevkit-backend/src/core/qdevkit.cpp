#include "qdevkit/qdevkit.h"
#include <openssl/opensslv.h>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <string>

namespace qdevkit {

static bool g_initialized = false;

bool Initialize() {
    if (g_initialized) {
        spdlog::warn("QDevKit backend already initialized");
        return true;
    }

    spdlog::info("Initializing QDevKit Backend v{}.{}.{}",
                 QDEVKIT_VERSION_MAJOR,
                 QDEVKIT_VERSION_MINOR,
                 QDEVKIT_VERSION_PATCH);
    spdlog::debug("Digest provider: {}", OPENSSL_VERSION_TEXT);

    g_initialized = true;
    return true;
}

void Shutdown() {
    if (!g_initialized) {
        return;
    }

    spdlog::info("Shutting down QDevKit Backend");
    g_initialized = false;
}

const char* GetVersionString() {
    static const std::string version = fmt::format("{}.{}.{}",
        QDEVKIT_VERSION_MAJOR, QDEVKIT_VERSION_MINOR, QDEVKIT_VERSION_PATCH);
    return version.c_str();
}

const char* ToolErrorName(ToolErrorKind kind) {
    switch (kind) {
        case ToolErrorKind::None:                 return "None";
        case ToolErrorKind::InvalidEncoding:      return "InvalidEncoding";
        case ToolErrorKind::ParseError:           return "ParseError";
        case ToolErrorKind::MalformedToken:       return "MalformedToken";
        case ToolErrorKind::InvalidTimestamp:     return "InvalidTimestamp";
        case ToolErrorKind::UnsupportedAlgorithm: return "UnsupportedAlgorithm";
        case ToolErrorKind::InvalidExpression:    return "InvalidExpression";
        case ToolErrorKind::InvalidArgument:      return "InvalidArgument";
        default:                                  return "Unknown";
    }
}

} // namespace qdevkit
