#pragma once

#define QUANTUM_VERSION_MAJOR 0
#define QUANTUM_VERSION_MINOR 3
#define QUANTUM_VERSION_PATCH 0

#define QUANTUM_VERSION_CODE \
  ((QUANTUM_VERSION_MAJOR << 16) | (QUANTUM_VERSION_MINOR << 8) | (QUANTUM_VERSION_PATCH))

#define QUANTUM_VERSION_STRING "0.3.0"

namespace quantum {
struct version {
  static constexpr int major = QUANTUM_VERSION_MAJOR;
  static constexpr int minor = QUANTUM_VERSION_MINOR;
  static constexpr int patch = QUANTUM_VERSION_PATCH;
  static constexpr const char* string = QUANTUM_VERSION_STRING;
};
}
