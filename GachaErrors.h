#ifndef GACHA_ERRORS_H
#define GACHA_ERRORS_H

#include <stdexcept>
#include <string>

namespace Gacha {

    enum class ErrorKind {
        CONFIGURATION,
        VALIDATION,
        COMPUTE
    };

    const char* errorKindName(ErrorKind kind);

    // Base of every failure the engine reports. field() names the offending
    // request or config field when there is one.
    class GachaError : public std::runtime_error {
    public:
        GachaError(ErrorKind kind, const std::string& field, const std::string& message);

        ErrorKind kind() const { return m_kind; }
        const std::string& field() const { return m_field; }

    private:
        ErrorKind m_kind;
        std::string m_field;
    };

    class ConfigurationError : public GachaError {
    public:
        explicit ConfigurationError(const std::string& message, const std::string& field = "")
            : GachaError(ErrorKind::CONFIGURATION, field, message) {}
    };

    class ValidationError : public GachaError {
    public:
        ValidationError(const std::string& field, const std::string& message)
            : GachaError(ErrorKind::VALIDATION, field, message) {}
    };

    class ComputeError : public GachaError {
    public:
        explicit ComputeError(const std::string& message)
            : GachaError(ErrorKind::COMPUTE, "", message) {}
    };

} // namespace Gacha

#endif // GACHA_ERRORS_H
