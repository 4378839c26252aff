#include "GachaErrors.h"

namespace Gacha {

    const char* errorKindName(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::CONFIGURATION: return "ConfigurationError";
            case ErrorKind::VALIDATION:    return "ValidationError";
            case ErrorKind::COMPUTE:       return "ComputeError";
        }
        return "GachaError";
    }

    GachaError::GachaError(ErrorKind kind, const std::string& field, const std::string& message)
        : std::runtime_error(message), m_kind(kind), m_field(field) {}

} // namespace Gacha
