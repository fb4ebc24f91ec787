#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "mo/metadata/MetaDataNode.hpp"

namespace mo::metadata {

/**
 * @brief Attribute node: type "attr", subtype from the value kind ("string", "intarray", ...).
 */
class MetaAttribute : public MetaDataNode {
public:
    static constexpr std::string_view kType = "attr";

    MetaAttribute(const constraint::ConstraintEngine& engine,
                  std::string_view subType,
                  std::string name,
                  nlohmann::json value);

    /// Infers the subtype from the value. Throws ValueConstraintViolationError for unsupported values.
    static std::unique_ptr<MetaAttribute> Create(const constraint::ConstraintEngine& engine,
                                                 std::string name,
                                                 nlohmann::json value);

    [[nodiscard]] bool IsAttribute() const override { return true; }

    [[nodiscard]] nlohmann::json Value() const;

    /// Validated against the owning node's constraint when attached.
    void SetValue(nlohmann::json value);

    /// Names starting with '_' are local to the declaring node.
    [[nodiscard]] bool IsInheritable() const { return Name().empty() || Name().front() != '_'; }

protected:
    std::unique_ptr<MetaDataNode> CloneSelf() const override;

private:
    friend class MetaDataNode;

    void AssignValue(nlohmann::json value);

    nlohmann::json m_value;
};

} // namespace mo::metadata
