#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace mo::constraint {

enum class ValueKind {
    String,
    Int,
    Long,
    Double,
    Boolean
};

enum class Cardinality {
    Single,
    Array
};

std::string_view ToString(ValueKind kind);
std::string_view ToString(Cardinality cardinality);

/// Attribute subtype for a kind and cardinality: "string", "intarray", ...
std::string AttributeSubType(ValueKind kind, Cardinality cardinality);

/// Narrowest kind describing a scalar json value. Integers that fit 32 bits are Int.
std::optional<ValueKind> InferKind(const nlohmann::json& value);

bool KindAccepts(ValueKind kind, const nlohmann::json& value);

/// Attribute subtype for an unconstrained value. Arrays take the widest element
/// kind; an empty array is a string array. nullopt for null, objects and mixed arrays.
std::optional<std::string> InferAttributeSubType(const nlohmann::json& value);

/// Strings unquoted, everything else as compact json.
std::string RenderValue(const nlohmann::json& value);

/**
 * @brief Declared shape of one attribute: kind, cardinality and refinements.
 *
 * Instances only come out of the staged builder:
 * @code
 * auto generation = ValidationConstraint::ForAttribute("generation")
 *                       .OfString()
 *                       .Single()
 *                       .OneOf({"increment", "uuid", "assigned"})
 *                       .Build();
 * @endcode
 */
class ValidationConstraint {
public:
    class KindStage;
    class CardinalityStage;
    class RefinementStage;

    struct Violation {
        std::string rule;
        std::string details;
        std::vector<std::string> allowedValues;
    };

    static KindStage ForAttribute(std::string attributeName);

    [[nodiscard]] const std::string& AttributeName() const { return m_attributeName; }
    [[nodiscard]] ValueKind Kind() const { return m_kind; }
    [[nodiscard]] Cardinality GetCardinality() const { return m_cardinality; }
    [[nodiscard]] bool IsRequired() const { return m_required; }
    [[nodiscard]] const std::string& Description() const { return m_description; }
    [[nodiscard]] const std::vector<nlohmann::json>& AllowedValues() const { return m_allowedValues; }
    [[nodiscard]] const std::optional<std::string>& Pattern() const { return m_pattern; }
    [[nodiscard]] const std::optional<double>& Minimum() const { return m_minimum; }
    [[nodiscard]] const std::optional<double>& Maximum() const { return m_maximum; }
    [[nodiscard]] const std::optional<std::size_t>& MinLength() const { return m_minLength; }
    [[nodiscard]] const std::optional<std::size_t>& MaxLength() const { return m_maxLength; }

    /// Attribute subtype a value of this constraint is stored under.
    [[nodiscard]] std::string AttributeSubType() const;

    /// First violated rule for the value, or nullopt when it conforms.
    [[nodiscard]] std::optional<Violation> Check(const nlohmann::json& value) const;
    [[nodiscard]] bool Accepts(const nlohmann::json& value) const { return !Check(value).has_value(); }

    /// Throws ValueConstraintViolationError for the first violated rule.
    void Validate(std::string_view nodePath, const nlohmann::json& value) const;

    [[nodiscard]] std::string Describe() const;

    bool operator==(const ValidationConstraint& other) const;

private:
    ValidationConstraint() = default;

    std::optional<Violation> CheckElement(const nlohmann::json& element) const;

    std::string m_attributeName;
    ValueKind m_kind = ValueKind::String;
    Cardinality m_cardinality = Cardinality::Single;
    bool m_required = false;
    std::string m_description;
    std::vector<nlohmann::json> m_allowedValues;
    std::optional<std::string> m_pattern;
    std::shared_ptr<const std::regex> m_regex;
    std::optional<double> m_minimum;
    std::optional<double> m_maximum;
    std::optional<std::size_t> m_minLength;
    std::optional<std::size_t> m_maxLength;
};

class ValidationConstraint::KindStage {
public:
    CardinalityStage OfString() const;
    CardinalityStage OfInt() const;
    CardinalityStage OfLong() const;
    CardinalityStage OfDouble() const;
    CardinalityStage OfBoolean() const;
    CardinalityStage Of(ValueKind kind) const;

private:
    friend class ValidationConstraint;
    explicit KindStage(std::string attributeName) : m_attributeName(std::move(attributeName)) {}

    std::string m_attributeName;
};

class ValidationConstraint::CardinalityStage {
public:
    RefinementStage Single() const;
    RefinementStage Array() const;

private:
    friend class KindStage;
    CardinalityStage(std::string attributeName, ValueKind kind)
        : m_attributeName(std::move(attributeName)), m_kind(kind) {}

    std::string m_attributeName;
    ValueKind m_kind;
};

class ValidationConstraint::RefinementStage {
public:
    RefinementStage& OneOf(std::vector<nlohmann::json> values);
    RefinementStage& Matching(std::string pattern);
    RefinementStage& Within(double minimum, double maximum);
    RefinementStage& AtLeast(double minimum);
    RefinementStage& AtMost(double maximum);
    RefinementStage& WithLength(std::size_t minLength, std::size_t maxLength);
    RefinementStage& Required(bool required = true);
    RefinementStage& Describe(std::string description);

    /// Throws MalformedConstraintError when the declaration is inconsistent.
    [[nodiscard]] ValidationConstraint Build() const;

private:
    friend class CardinalityStage;
    RefinementStage(std::string attributeName, ValueKind kind, Cardinality cardinality);

    ValidationConstraint m_constraint;
    bool m_enumDeclared = false;
};

} // namespace mo::constraint
