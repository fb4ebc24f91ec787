#include "mo/metadata/MetaAttribute.hpp"

#include <utility>

#include <fmt/format.h>

#include "mo/constraint/ConstraintEngine.hpp"
#include "mo/constraint/ValidationConstraint.hpp"
#include "mo/core/Error.hpp"

namespace mo::metadata {

MetaAttribute::MetaAttribute(const constraint::ConstraintEngine& engine,
                             std::string_view subType,
                             std::string name,
                             nlohmann::json value)
    : MetaDataNode(engine, kType, subType, std::move(name)),
      m_value(std::move(value)) {}

std::unique_ptr<MetaAttribute> MetaAttribute::Create(const constraint::ConstraintEngine& engine,
                                                     std::string name,
                                                     nlohmann::json value) {
    auto subType = constraint::InferAttributeSubType(value);
    if (!subType) {
        throw core::ValueConstraintViolationError({}, std::move(name), "kind", value.dump(),
                                                  "attribute values must be scalars or homogeneous arrays");
    }
    return std::make_unique<MetaAttribute>(engine, *subType, std::move(name), std::move(value));
}

nlohmann::json MetaAttribute::Value() const {
    auto lock = ReadLock();
    return m_value;
}

void MetaAttribute::SetValue(nlohmann::json value) {
    EnsureMutable("set attribute value");

    std::string subType;
    if (const MetaDataNode* owner = Parent()) {
        Engine().ValidateAttributeValue(*owner, Name(), value);
        subType = Engine().ResolveAttributeSubType(*owner, Name(), value);
    } else if (auto inferred = constraint::InferAttributeSubType(value)) {
        subType = *inferred;
    } else {
        throw core::ValueConstraintViolationError(Path(), Name(), "kind", value.dump(),
                                                  "attribute values must be scalars or homogeneous arrays");
    }

    if (subType != SubType()) {
        throw core::ValueConstraintViolationError(
            Path(), Name(), "kind", value.dump(),
            fmt::format("attribute is stored as '{}' but the value is '{}'", SubType(), subType));
    }

    AssignValue(std::move(value));
    if (const MetaDataNode* owner = Parent()) {
        owner->InvalidateDerived();
    }
}

void MetaAttribute::AssignValue(nlohmann::json value) {
    std::unique_lock lock(m_mutex);
    EnsureMutable("set attribute value");
    m_value = std::move(value);
    MarkUnderConstruction();
}

std::unique_ptr<MetaDataNode> MetaAttribute::CloneSelf() const {
    return std::make_unique<MetaAttribute>(Engine(), SubType(), Name(), Value());
}

} // namespace mo::metadata
