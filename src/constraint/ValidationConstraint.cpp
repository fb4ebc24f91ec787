#include "mo/constraint/ValidationConstraint.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <utility>

#include <fmt/format.h>

#include "mo/core/Error.hpp"

namespace mo::constraint {

namespace {

bool FitsInt(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max());
    }
    if (value.is_number_integer()) {
        const auto v = value.get<std::int64_t>();
        return v >= std::numeric_limits<std::int32_t>::min() && v <= std::numeric_limits<std::int32_t>::max();
    }
    return false;
}

std::vector<std::string> RenderAll(const std::vector<nlohmann::json>& values) {
    std::vector<std::string> rendered;
    rendered.reserve(values.size());
    for (const auto& value : values) {
        rendered.push_back(RenderValue(value));
    }
    return rendered;
}

std::string FormatBound(const std::optional<double>& bound) {
    return bound ? fmt::format("{}", *bound) : std::string("*");
}

} // namespace

std::string_view ToString(ValueKind kind) {
    switch (kind) {
        case ValueKind::String:  return "string";
        case ValueKind::Int:     return "int";
        case ValueKind::Long:    return "long";
        case ValueKind::Double:  return "double";
        case ValueKind::Boolean: return "boolean";
    }
    return "unknown";
}

std::string_view ToString(Cardinality cardinality) {
    return cardinality == Cardinality::Array ? "array" : "single";
}

std::string AttributeSubType(ValueKind kind, Cardinality cardinality) {
    std::string subType(ToString(kind));
    if (cardinality == Cardinality::Array) {
        subType += "array";
    }
    return subType;
}

std::optional<ValueKind> InferKind(const nlohmann::json& value) {
    if (value.is_string()) {
        return ValueKind::String;
    }
    if (value.is_boolean()) {
        return ValueKind::Boolean;
    }
    if (value.is_number_integer()) {
        return FitsInt(value) ? ValueKind::Int : ValueKind::Long;
    }
    if (value.is_number_float()) {
        return ValueKind::Double;
    }
    return std::nullopt;
}

bool KindAccepts(ValueKind kind, const nlohmann::json& value) {
    switch (kind) {
        case ValueKind::String:  return value.is_string();
        case ValueKind::Int:     return FitsInt(value);
        case ValueKind::Long:    return value.is_number_integer();
        case ValueKind::Double:  return value.is_number();
        case ValueKind::Boolean: return value.is_boolean();
    }
    return false;
}

std::optional<std::string> InferAttributeSubType(const nlohmann::json& value) {
    if (!value.is_array()) {
        auto kind = InferKind(value);
        if (!kind) {
            return std::nullopt;
        }
        return AttributeSubType(*kind, Cardinality::Single);
    }
    if (value.empty()) {
        return AttributeSubType(ValueKind::String, Cardinality::Array);
    }

    std::optional<ValueKind> widest;
    for (const auto& element : value) {
        auto kind = InferKind(element);
        if (!kind) {
            return std::nullopt;
        }
        if (!widest || *widest == *kind) {
            widest = kind;
            continue;
        }
        const bool bothNumeric = *widest != ValueKind::String && *widest != ValueKind::Boolean &&
                                 *kind != ValueKind::String && *kind != ValueKind::Boolean;
        if (!bothNumeric) {
            return std::nullopt;
        }
        // Int < Long < Double
        widest = std::max(*widest, *kind, [](ValueKind a, ValueKind b) {
            auto rank = [](ValueKind k) { return k == ValueKind::Int ? 0 : (k == ValueKind::Long ? 1 : 2); };
            return rank(a) < rank(b);
        });
    }
    return AttributeSubType(*widest, Cardinality::Array);
}

std::string RenderValue(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

// ---------------------------------------------------------------------------
// Builder stages
// ---------------------------------------------------------------------------

ValidationConstraint::KindStage ValidationConstraint::ForAttribute(std::string attributeName) {
    return KindStage(std::move(attributeName));
}

ValidationConstraint::CardinalityStage ValidationConstraint::KindStage::Of(ValueKind kind) const {
    return CardinalityStage(m_attributeName, kind);
}

ValidationConstraint::CardinalityStage ValidationConstraint::KindStage::OfString() const { return Of(ValueKind::String); }
ValidationConstraint::CardinalityStage ValidationConstraint::KindStage::OfInt() const { return Of(ValueKind::Int); }
ValidationConstraint::CardinalityStage ValidationConstraint::KindStage::OfLong() const { return Of(ValueKind::Long); }
ValidationConstraint::CardinalityStage ValidationConstraint::KindStage::OfDouble() const { return Of(ValueKind::Double); }
ValidationConstraint::CardinalityStage ValidationConstraint::KindStage::OfBoolean() const { return Of(ValueKind::Boolean); }

ValidationConstraint::RefinementStage ValidationConstraint::CardinalityStage::Single() const {
    return RefinementStage(m_attributeName, m_kind, Cardinality::Single);
}

ValidationConstraint::RefinementStage ValidationConstraint::CardinalityStage::Array() const {
    return RefinementStage(m_attributeName, m_kind, Cardinality::Array);
}

ValidationConstraint::RefinementStage::RefinementStage(std::string attributeName,
                                                       ValueKind kind,
                                                       Cardinality cardinality) {
    m_constraint.m_attributeName = std::move(attributeName);
    m_constraint.m_kind = kind;
    m_constraint.m_cardinality = cardinality;
}

ValidationConstraint::RefinementStage& ValidationConstraint::RefinementStage::OneOf(std::vector<nlohmann::json> values) {
    m_constraint.m_allowedValues = std::move(values);
    m_enumDeclared = true;
    return *this;
}

ValidationConstraint::RefinementStage& ValidationConstraint::RefinementStage::Matching(std::string pattern) {
    m_constraint.m_pattern = std::move(pattern);
    return *this;
}

ValidationConstraint::RefinementStage& ValidationConstraint::RefinementStage::Within(double minimum, double maximum) {
    m_constraint.m_minimum = minimum;
    m_constraint.m_maximum = maximum;
    return *this;
}

ValidationConstraint::RefinementStage& ValidationConstraint::RefinementStage::AtLeast(double minimum) {
    m_constraint.m_minimum = minimum;
    return *this;
}

ValidationConstraint::RefinementStage& ValidationConstraint::RefinementStage::AtMost(double maximum) {
    m_constraint.m_maximum = maximum;
    return *this;
}

ValidationConstraint::RefinementStage& ValidationConstraint::RefinementStage::WithLength(std::size_t minLength,
                                                                                         std::size_t maxLength) {
    m_constraint.m_minLength = minLength;
    m_constraint.m_maxLength = maxLength;
    return *this;
}

ValidationConstraint::RefinementStage& ValidationConstraint::RefinementStage::Required(bool required) {
    m_constraint.m_required = required;
    return *this;
}

ValidationConstraint::RefinementStage& ValidationConstraint::RefinementStage::Describe(std::string description) {
    m_constraint.m_description = std::move(description);
    return *this;
}

ValidationConstraint ValidationConstraint::RefinementStage::Build() const {
    ValidationConstraint built = m_constraint;
    const std::string& name = built.m_attributeName;

    if (name.empty()) {
        throw core::MalformedConstraintError("<unnamed>", "attribute name must not be empty");
    }

    if (m_enumDeclared) {
        if (built.m_allowedValues.empty()) {
            throw core::MalformedConstraintError(name, "enumerated value set is empty");
        }
        for (const auto& allowed : built.m_allowedValues) {
            if (!KindAccepts(built.m_kind, allowed)) {
                throw core::MalformedConstraintError(
                    name, fmt::format("enumerated value {} is not of kind {}", allowed.dump(), ToString(built.m_kind)));
            }
        }
    }

    if (built.m_pattern) {
        if (built.m_kind != ValueKind::String) {
            throw core::MalformedConstraintError(
                name, fmt::format("pattern requires kind string, declared {}", ToString(built.m_kind)));
        }
        try {
            built.m_regex = std::make_shared<const std::regex>(*built.m_pattern, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            throw core::MalformedConstraintError(
                name, fmt::format("invalid pattern '{}': {}", *built.m_pattern, e.what()));
        }
    }

    if (built.m_minimum || built.m_maximum) {
        if (built.m_kind == ValueKind::String || built.m_kind == ValueKind::Boolean) {
            throw core::MalformedConstraintError(
                name, fmt::format("numeric range requires a numeric kind, declared {}", ToString(built.m_kind)));
        }
        if (built.m_minimum && built.m_maximum && *built.m_minimum > *built.m_maximum) {
            throw core::MalformedConstraintError(
                name, fmt::format("range minimum {} exceeds maximum {}", *built.m_minimum, *built.m_maximum));
        }
    }

    if (built.m_minLength || built.m_maxLength) {
        if (built.m_kind != ValueKind::String) {
            throw core::MalformedConstraintError(
                name, fmt::format("length requires kind string, declared {}", ToString(built.m_kind)));
        }
        if (*built.m_minLength > *built.m_maxLength) {
            throw core::MalformedConstraintError(
                name, fmt::format("length minimum {} exceeds maximum {}", *built.m_minLength, *built.m_maxLength));
        }
    }

    return built;
}

// ---------------------------------------------------------------------------
// Checking
// ---------------------------------------------------------------------------

std::string ValidationConstraint::AttributeSubType() const {
    return constraint::AttributeSubType(m_kind, m_cardinality);
}

std::optional<ValidationConstraint::Violation> ValidationConstraint::Check(const nlohmann::json& value) const {
    if (m_cardinality == Cardinality::Array) {
        if (!value.is_array()) {
            return Violation{"cardinality", fmt::format("expected an array of {}", ToString(m_kind)), {}};
        }
        for (std::size_t i = 0; i < value.size(); ++i) {
            if (auto violation = CheckElement(value[i])) {
                violation->details = fmt::format("element [{}]: {}", i, violation->details);
                return violation;
            }
        }
        return std::nullopt;
    }

    if (value.is_array()) {
        return Violation{"cardinality", fmt::format("expected a single {} value", ToString(m_kind)), {}};
    }
    return CheckElement(value);
}

std::optional<ValidationConstraint::Violation> ValidationConstraint::CheckElement(const nlohmann::json& element) const {
    if (!KindAccepts(m_kind, element)) {
        return Violation{"kind", fmt::format("expected {}", ToString(m_kind)), {}};
    }

    if (!m_allowedValues.empty()) {
        bool found = false;
        for (const auto& allowed : m_allowedValues) {
            if (allowed == element) {
                found = true;
                break;
            }
        }
        if (!found) {
            return Violation{"enum", "value is not in the enumerated set", RenderAll(m_allowedValues)};
        }
    }

    if (m_regex && !std::regex_match(element.get<std::string>(), *m_regex)) {
        return Violation{"pattern", fmt::format("does not match /{}/", *m_pattern), {}};
    }

    if (m_minimum || m_maximum) {
        const double number = element.get<double>();
        if ((m_minimum && number < *m_minimum) || (m_maximum && number > *m_maximum)) {
            return Violation{"range",
                             fmt::format("must be within [{}, {}]", FormatBound(m_minimum), FormatBound(m_maximum)),
                             {}};
        }
    }

    if (m_minLength || m_maxLength) {
        const std::size_t length = element.get_ref<const std::string&>().size();
        if ((m_minLength && length < *m_minLength) || (m_maxLength && length > *m_maxLength)) {
            return Violation{"length",
                             fmt::format("length {} must be within [{}, {}]", length,
                                         m_minLength.value_or(0), m_maxLength.value_or(0)),
                             {}};
        }
    }

    return std::nullopt;
}

void ValidationConstraint::Validate(std::string_view nodePath, const nlohmann::json& value) const {
    if (auto violation = Check(value)) {
        throw core::ValueConstraintViolationError(nodePath,
                                                  m_attributeName,
                                                  violation->rule,
                                                  value.dump(),
                                                  violation->details,
                                                  std::move(violation->allowedValues));
    }
}

std::string ValidationConstraint::Describe() const {
    std::string text = fmt::format("{} {} {}", m_required ? "required" : "optional",
                                   AttributeSubType(), m_attributeName);
    if (!m_allowedValues.empty()) {
        text += " one of [";
        const auto rendered = RenderAll(m_allowedValues);
        for (std::size_t i = 0; i < rendered.size(); ++i) {
            text += (i == 0 ? "" : ", ") + rendered[i];
        }
        text += "]";
    }
    if (m_pattern) {
        text += fmt::format(" matching /{}/", *m_pattern);
    }
    if (m_minimum || m_maximum) {
        text += fmt::format(" within [{}, {}]", FormatBound(m_minimum), FormatBound(m_maximum));
    }
    if (m_minLength || m_maxLength) {
        text += fmt::format(" length [{}, {}]", m_minLength.value_or(0), m_maxLength.value_or(0));
    }
    return text;
}

bool ValidationConstraint::operator==(const ValidationConstraint& other) const {
    return m_attributeName == other.m_attributeName &&
           m_kind == other.m_kind &&
           m_cardinality == other.m_cardinality &&
           m_required == other.m_required &&
           m_description == other.m_description &&
           m_allowedValues == other.m_allowedValues &&
           m_pattern == other.m_pattern &&
           m_minimum == other.m_minimum &&
           m_maximum == other.m_maximum &&
           m_minLength == other.m_minLength &&
           m_maxLength == other.m_maxLength;
}

} // namespace mo::constraint
