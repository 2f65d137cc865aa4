#pragma once

#include <stdexcept>
#include <string>

namespace tracecheck
{
    // The log or model argument is not one of the supported representations.
    class InputShapeError : public std::runtime_error
    {
    public:
        explicit InputShapeError(const std::string &what) : std::runtime_error(what) {}
    };

    // A required column or event attribute is missing or has the wrong type.
    class SchemaError : public std::runtime_error
    {
    public:
        SchemaError(const std::string &what, std::string field)
            : std::runtime_error(what), m_field(std::move(field))
        {
        }

        const std::string &field() const noexcept { return m_field; }

    private:
        std::string m_field;
    };

    // The model could not be classified, converted, or handled by the selected engine.
    class UnsupportedModelError : public std::runtime_error
    {
    public:
        explicit UnsupportedModelError(const std::string &what) : std::runtime_error(what) {}
    };
}
