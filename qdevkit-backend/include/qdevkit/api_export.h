#pragma once

// This header includes the CMake-generated export header
// and provides the QDEVKIT_API macro used on every public symbol

#include "qdevkit/qdevkit_export.h"

#ifndef QDEVKIT_API
    #define QDEVKIT_API QDEVKIT_EXPORT
#endif
