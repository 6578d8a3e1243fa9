#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace verity {

    enum class ErrorKind {
        Configuration,
        Connectivity,
        Storage,
        Extraction,
        Embedding,
        Index,
        Generation,
        Validation,
        Ingestion
    };

    inline const char* kind_name(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::Configuration: return "configuration";
            case ErrorKind::Connectivity:  return "connectivity";
            case ErrorKind::Storage:       return "storage";
            case ErrorKind::Extraction:    return "extraction";
            case ErrorKind::Embedding:     return "embedding";
            case ErrorKind::Index:         return "index";
            case ErrorKind::Generation:    return "generation";
            case ErrorKind::Validation:    return "validation";
            case ErrorKind::Ingestion:     return "ingestion";
        }
        return "unknown";
    }

    /**
     * @brief Error thrown by collaborators and carried by Result.
     *
     * The kind decides what a caller does with it: Configuration and
     * Connectivity at startup abort the boot, the operation-scoped kinds
     * are wrapped with the document or query they failed on.
     */
    class Error : public std::runtime_error {
    public:
        Error(ErrorKind kind, const std::string& message)
            : std::runtime_error(message), m_kind(kind) {}

        ErrorKind kind() const { return m_kind; }

        /**
         * @brief Returns a copy with a new kind and "context: message" text.
         */
        Error wrap(ErrorKind kind, const std::string& context) const {
            return Error(kind, context + ": " + what());
        }

    private:
        ErrorKind m_kind;
    };

    /**
     * @brief Either a value or an Error. Orchestrators return this instead of
     * throwing so that call sites decide explicitly whether to continue.
     */
    template <typename T>
    class Result {
    public:
        Result(T value) : m_value(std::move(value)) {}
        Result(Error error) : m_error(std::move(error)) {}

        bool ok() const { return m_value.has_value(); }
        explicit operator bool() const { return ok(); }

        const T& value() const {
            if (!m_value) throw *m_error;
            return *m_value;
        }

        T& value() {
            if (!m_value) throw *m_error;
            return *m_value;
        }

        const Error& error() const {
            if (!m_error) throw std::logic_error("Result holds a value, not an error");
            return *m_error;
        }

    private:
        std::optional<T> m_value;
        std::optional<Error> m_error;
    };

}
