#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mo::core {

class Error : public std::runtime_error {
public:
    explicit Error(std::string message);
    virtual ~Error() = default;
};

inline Error::Error(std::string message)
    : std::runtime_error(std::move(message)) {}

namespace detail {

inline std::string JoinList(const std::vector<std::string>& items, std::string_view separator) {
    std::string joined;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            joined.append(separator);
        }
        joined.append(items[i]);
    }
    return joined;
}

} // namespace detail

// ---------------------------------------------------------------------------
// Registration errors. Fatal at startup: a broken type catalog aborts bootstrap.
// ---------------------------------------------------------------------------

class RegistrationError : public Error {
public:
    RegistrationError(std::string_view qualifiedName, std::string details);

    std::string_view qualifiedName() const noexcept { return m_qualifiedName; }
    std::string_view details() const noexcept { return m_details; }

private:
    static std::string BuildMessage(std::string_view qualifiedName, const std::string& details);

    std::string m_qualifiedName;
    std::string m_details;
};

inline std::string RegistrationError::BuildMessage(std::string_view qualifiedName,
                                                   const std::string& details) {
    std::string message;
    message.reserve(qualifiedName.size() + details.size() + 24);
    message.append("Registration error [");
    message.append(qualifiedName);
    message.append("]");
    if (!details.empty()) {
        message.append(": ");
        message.append(details);
    }
    return message;
}

inline RegistrationError::RegistrationError(std::string_view qualifiedName, std::string details)
    : Error(BuildMessage(qualifiedName, details)),
      m_qualifiedName(qualifiedName),
      m_details(std::move(details)) {}

class DuplicateTypeError : public RegistrationError {
public:
    DuplicateTypeError(std::string_view qualifiedName,
                       std::string existingProvider,
                       std::string newProvider)
        : RegistrationError(qualifiedName,
                            "type already registered with a different definition (existing provider '" +
                                existingProvider + "', new provider '" + newProvider + "')"),
          m_existingProvider(std::move(existingProvider)),
          m_newProvider(std::move(newProvider)) {}

    std::string_view existingProvider() const noexcept { return m_existingProvider; }
    std::string_view newProvider() const noexcept { return m_newProvider; }

private:
    std::string m_existingProvider;
    std::string m_newProvider;
};

class UnknownParentError : public RegistrationError {
public:
    UnknownParentError(std::string_view qualifiedName, std::string parentQualifiedName)
        : RegistrationError(qualifiedName,
                            "inherits from unregistered type '" + parentQualifiedName + "'"),
          m_parentQualifiedName(std::move(parentQualifiedName)) {}

    std::string_view parentQualifiedName() const noexcept { return m_parentQualifiedName; }

private:
    std::string m_parentQualifiedName;
};

// Raised for inheritance cycles between type definitions. The cycle lists every
// member and repeats the first one at the end.
class CircularReferenceError : public RegistrationError {
public:
    explicit CircularReferenceError(std::vector<std::string> cycle)
        : RegistrationError(cycle.empty() ? std::string_view{} : std::string_view{cycle.front()},
                            "circular reference: " + detail::JoinList(cycle, " -> ")),
          m_cycle(std::move(cycle)) {}

    const std::vector<std::string>& cycle() const noexcept { return m_cycle; }

private:
    std::vector<std::string> m_cycle;
};

class MalformedConstraintError : public RegistrationError {
public:
    MalformedConstraintError(std::string_view attributeName, std::string details)
        : RegistrationError(attributeName, "malformed constraint: " + details) {}
};

class ProviderError : public RegistrationError {
public:
    ProviderError(std::string_view providerId, std::string details)
        : RegistrationError(providerId, "type provider failed: " + details) {}
};

// ---------------------------------------------------------------------------
// Structural errors raised while the node tree is built.
// ---------------------------------------------------------------------------

class StructureError : public Error {
public:
    StructureError(std::string_view path, std::string details);

    std::string_view path() const noexcept { return m_path; }
    std::string_view details() const noexcept { return m_details; }

private:
    static std::string BuildMessage(std::string_view path, const std::string& details);

    std::string m_path;
    std::string m_details;
};

inline std::string StructureError::BuildMessage(std::string_view path, const std::string& details) {
    std::string message;
    message.reserve(path.size() + details.size() + 24);
    message.append("Metadata structure error at ");
    message.append(path.empty() ? std::string_view{"<detached>"} : path);
    if (!details.empty()) {
        message.append(": ");
        message.append(details);
    }
    return message;
}

inline StructureError::StructureError(std::string_view path, std::string details)
    : Error(BuildMessage(path, details)),
      m_path(path),
      m_details(std::move(details)) {}

class PlacementViolationError : public StructureError {
public:
    PlacementViolationError(std::string_view parentPath,
                            std::string childShape,
                            std::vector<std::string> legalShapes)
        : StructureError(parentPath,
                         "child " + childShape + " is not permitted; legal children: " +
                             (legalShapes.empty() ? std::string("<none>")
                                                  : detail::JoinList(legalShapes, ", "))),
          m_childShape(std::move(childShape)),
          m_legalShapes(std::move(legalShapes)) {}

    std::string_view childShape() const noexcept { return m_childShape; }
    const std::vector<std::string>& legalShapes() const noexcept { return m_legalShapes; }

private:
    std::string m_childShape;
    std::vector<std::string> m_legalShapes;
};

class DuplicateChildNameError : public StructureError {
public:
    DuplicateChildNameError(std::string_view parentPath, std::string childType, std::string childName)
        : StructureError(parentPath,
                         "a child of type '" + childType + "' named '" + childName + "' already exists"),
          m_childType(std::move(childType)),
          m_childName(std::move(childName)) {}

    std::string_view childType() const noexcept { return m_childType; }
    std::string_view childName() const noexcept { return m_childName; }

private:
    std::string m_childType;
    std::string m_childName;
};

// Super-node chain that would lead back to the node itself. The cycle lists
// node paths and repeats the first one at the end.
class SuperNodeCycleError : public StructureError {
public:
    explicit SuperNodeCycleError(std::vector<std::string> cycle)
        : StructureError(cycle.empty() ? std::string_view{} : std::string_view{cycle.front()},
                         "super node cycle: " + detail::JoinList(cycle, " -> ")),
          m_cycle(std::move(cycle)) {}

    const std::vector<std::string>& cycle() const noexcept { return m_cycle; }

private:
    std::vector<std::string> m_cycle;
};

class IncompleteMetadataError : public StructureError {
public:
    IncompleteMetadataError(std::string_view rootPath, std::vector<std::string> missing)
        : StructureError(rootPath,
                         std::to_string(missing.size()) + " required child(ren) missing: " +
                             detail::JoinList(missing, "; ")),
          m_missing(std::move(missing)) {}

    const std::vector<std::string>& missing() const noexcept { return m_missing; }

private:
    std::vector<std::string> m_missing;
};

// ---------------------------------------------------------------------------
// Attribute value violations.
// ---------------------------------------------------------------------------

class ValueConstraintViolationError : public Error {
public:
    ValueConstraintViolationError(std::string_view path,
                                  std::string attributeName,
                                  std::string rule,
                                  std::string value,
                                  std::string details,
                                  std::vector<std::string> allowedValues = {});

    std::string_view path() const noexcept { return m_path; }
    std::string_view attributeName() const noexcept { return m_attributeName; }
    std::string_view rule() const noexcept { return m_rule; }
    std::string_view value() const noexcept { return m_value; }
    const std::vector<std::string>& allowedValues() const noexcept { return m_allowedValues; }

private:
    static std::string BuildMessage(std::string_view path,
                                    const std::string& attributeName,
                                    const std::string& rule,
                                    const std::string& value,
                                    const std::string& details,
                                    const std::vector<std::string>& allowedValues);

    std::string m_path;
    std::string m_attributeName;
    std::string m_rule;
    std::string m_value;
    std::vector<std::string> m_allowedValues;
};

inline std::string ValueConstraintViolationError::BuildMessage(std::string_view path,
                                                               const std::string& attributeName,
                                                               const std::string& rule,
                                                               const std::string& value,
                                                               const std::string& details,
                                                               const std::vector<std::string>& allowedValues) {
    std::string message = "Value " + value + " for attribute '" + attributeName + "' on ";
    message.append(path.empty() ? std::string_view{"<detached>"} : path);
    message.append(" violates ");
    message.append(rule);
    message.append(" rule");
    if (!details.empty()) {
        message.append(": ");
        message.append(details);
    }
    if (!allowedValues.empty()) {
        message.append("; allowed values: [");
        message.append(detail::JoinList(allowedValues, ", "));
        message.append("]");
    }
    return message;
}

inline ValueConstraintViolationError::ValueConstraintViolationError(std::string_view path,
                                                                    std::string attributeName,
                                                                    std::string rule,
                                                                    std::string value,
                                                                    std::string details,
                                                                    std::vector<std::string> allowedValues)
    : Error(BuildMessage(path, attributeName, rule, value, details, allowedValues)),
      m_path(path),
      m_attributeName(std::move(attributeName)),
      m_rule(std::move(rule)),
      m_value(std::move(value)),
      m_allowedValues(std::move(allowedValues)) {}

// ---------------------------------------------------------------------------
// Lookup failures. Only the throwing ("require"/"get") forms raise these.
// ---------------------------------------------------------------------------

class NotFoundError : public Error {
public:
    NotFoundError(std::string_view what,
                  std::string identifier,
                  std::string_view path = {},
                  std::vector<std::string> alternatives = {});

    std::string_view identifier() const noexcept { return m_identifier; }
    std::string_view path() const noexcept { return m_path; }
    const std::vector<std::string>& alternatives() const noexcept { return m_alternatives; }

private:
    static std::string BuildMessage(std::string_view what,
                                    const std::string& identifier,
                                    std::string_view path,
                                    const std::vector<std::string>& alternatives);

    std::string m_identifier;
    std::string m_path;
    std::vector<std::string> m_alternatives;
};

inline std::string NotFoundError::BuildMessage(std::string_view what,
                                               const std::string& identifier,
                                               std::string_view path,
                                               const std::vector<std::string>& alternatives) {
    std::string message;
    message.append(what);
    message.append(" '");
    message.append(identifier);
    message.append("' not found");
    if (!path.empty()) {
        message.append(" in ");
        message.append(path);
    }
    if (!alternatives.empty()) {
        message.append("; available: ");
        message.append(detail::JoinList(alternatives, ", "));
    }
    return message;
}

inline NotFoundError::NotFoundError(std::string_view what,
                                    std::string identifier,
                                    std::string_view path,
                                    std::vector<std::string> alternatives)
    : Error(BuildMessage(what, identifier, path, alternatives)),
      m_identifier(std::move(identifier)),
      m_path(path),
      m_alternatives(std::move(alternatives)) {}

// ---------------------------------------------------------------------------
// Lifecycle misuse: mutating a sealed node, using a closed registry.
// ---------------------------------------------------------------------------

class StateError : public Error {
public:
    StateError(std::string_view operation, std::string_view state, std::string_view subject = {})
        : Error(BuildMessage(operation, state, subject)) {}

private:
    static std::string BuildMessage(std::string_view operation,
                                    std::string_view state,
                                    std::string_view subject) {
        std::string message = "Cannot ";
        message.append(operation);
        if (!subject.empty()) {
            message.append(" on ");
            message.append(subject);
        }
        message.append(" in state ");
        message.append(state);
        return message;
    }
};

} // namespace mo::core
