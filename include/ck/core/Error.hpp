#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ck::core {

class Error : public std::runtime_error {
public:
    explicit Error(std::string message);
    virtual ~Error() = default;
};

inline Error::Error(std::string message)
    : std::runtime_error(std::move(message)) {}

/**
 * @brief A required path (input file, output directory, path-valued field) is missing.
 */
class NotFoundError : public Error {
public:
    NotFoundError(std::string_view what, std::string path);

    std::string_view subject() const noexcept { return m_subject; }
    std::string_view path() const noexcept { return m_path; }

private:
    static std::string BuildMessage(std::string_view what, const std::string& path);

    std::string m_subject;
    std::string m_path;
};

inline std::string NotFoundError::BuildMessage(std::string_view what, const std::string& path) {
    std::string message;
    message.reserve(what.size() + path.size() + 24);
    message.append(what);
    if (path.empty()) {
        message.append(": empty path");
    } else {
        message.append(" '");
        message.append(path);
        message.append("' does not exist");
    }
    return message;
}

inline NotFoundError::NotFoundError(std::string_view what, std::string path)
    : Error(BuildMessage(what, path)),
      m_subject(what),
      m_path(std::move(path)) {}

class ParseError : public Error {
public:
    ParseError(std::string source, std::string details);

    std::string_view source() const noexcept { return m_source; }
    std::string_view details() const noexcept { return m_details; }

private:
    std::string m_source;
    std::string m_details;
};

inline ParseError::ParseError(std::string source, std::string details)
    : Error("Parse error in '" + source + "': " + details),
      m_source(std::move(source)),
      m_details(std::move(details)) {}

/**
 * @brief A value matched none of the shapes its field accepts.
 *
 * Carries the field path (e.g. `object_list[1].obj_id`, empty when the check ran
 * outside any field), the offending raw value rendered as JSON text, the names of
 * the expected shapes and the per-shape reasons.
 */
class TypeMismatchError : public Error {
public:
    TypeMismatchError(std::string field,
                      std::string rawValue,
                      std::vector<std::string> expected,
                      std::string details = {});

    std::string_view field() const noexcept { return m_field; }
    std::string_view rawValue() const noexcept { return m_rawValue; }
    const std::vector<std::string>& expected() const noexcept { return m_expected; }
    std::string_view details() const noexcept { return m_details; }

private:
    static std::string BuildMessage(const std::string& field,
                                    const std::string& rawValue,
                                    const std::vector<std::string>& expected,
                                    const std::string& details);

    std::string m_field;
    std::string m_rawValue;
    std::vector<std::string> m_expected;
    std::string m_details;
};

inline std::string TypeMismatchError::BuildMessage(const std::string& field,
                                                   const std::string& rawValue,
                                                   const std::vector<std::string>& expected,
                                                   const std::string& details) {
    std::string message;
    if (!field.empty()) {
        message.append("Field '");
        message.append(field);
        message.append("': ");
    }
    message.append(rawValue);
    message.append(expected.size() > 1 ? " should be one of [" : " should be [");
    for (std::size_t i = 0; i < expected.size(); ++i) {
        if (i > 0) {
            message.append(", ");
        }
        message.append(expected[i]);
    }
    message.append("]");
    if (!details.empty()) {
        message.append(" (");
        message.append(details);
        message.append(")");
    }
    return message;
}

inline TypeMismatchError::TypeMismatchError(std::string field,
                                            std::string rawValue,
                                            std::vector<std::string> expected,
                                            std::string details)
    : Error(BuildMessage(field, rawValue, expected, details)),
      m_field(std::move(field)),
      m_rawValue(std::move(rawValue)),
      m_expected(std::move(expected)),
      m_details(std::move(details)) {}

class InvariantViolationError : public Error {
public:
    InvariantViolationError(std::string_view operation, std::string details);

    std::string_view operation() const noexcept { return m_operation; }
    std::string_view details() const noexcept { return m_details; }

private:
    std::string m_operation;
    std::string m_details;
};

inline InvariantViolationError::InvariantViolationError(std::string_view operation, std::string details)
    : Error("Invariant violated during " + std::string(operation) + ": " + details),
      m_operation(operation),
      m_details(std::move(details)) {}

class IoError : public Error {
public:
    IoError(std::string_view operation, std::string path);

    std::string_view operation() const noexcept { return m_operation; }
    std::string_view path() const noexcept { return m_path; }

private:
    std::string m_operation;
    std::string m_path;
};

inline IoError::IoError(std::string_view operation, std::string path)
    : Error("Failed to " + std::string(operation) + " '" + path + "'"),
      m_operation(operation),
      m_path(std::move(path)) {}

} // namespace ck::core
