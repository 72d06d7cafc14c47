/**
 * @file exception.h
 * @brief Exception types thrown by the geometry engine and the exporters
 */

#ifndef CYCLODRIVE_EXCEPTION_H
#define CYCLODRIVE_EXCEPTION_H

#include <stdexcept>
#include <string>

namespace cyclodrive {

// Derive a named exception type that forwards both message constructors.
#define CYCLODRIVE_DERIVE_EXCEPTION(DERIVED_EXCEPTION, PARENT_EXCEPTION) \
    class DERIVED_EXCEPTION : public PARENT_EXCEPTION { \
    public: \
        DERIVED_EXCEPTION(const char* message) : PARENT_EXCEPTION(message) {} \
        DERIVED_EXCEPTION(const std::string& message) : PARENT_EXCEPTION(message) {} \
    }

CYCLODRIVE_DERIVE_EXCEPTION(RuntimeError, std::runtime_error);
CYCLODRIVE_DERIVE_EXCEPTION(LogicError, std::logic_error);
// Parameter outside of its domain (rejected when a ParameterSet is built).
CYCLODRIVE_DERIVE_EXCEPTION(InvalidArgument, LogicError);
// Geometry that cannot be evaluated: zero-length derivative on the disk
// profile, non-positive eccentric shaft radius, fewer than two lobes.
CYCLODRIVE_DERIVE_EXCEPTION(DegenerateGeometryError, RuntimeError);
// Requested export format or format capability is not available.
CYCLODRIVE_DERIVE_EXCEPTION(ExportUnavailableError, RuntimeError);
CYCLODRIVE_DERIVE_EXCEPTION(IOError, RuntimeError);
CYCLODRIVE_DERIVE_EXCEPTION(FileIOError, IOError);
CYCLODRIVE_DERIVE_EXCEPTION(ConfigError, RuntimeError);

} // namespace cyclodrive

#endif // CYCLODRIVE_EXCEPTION_H
