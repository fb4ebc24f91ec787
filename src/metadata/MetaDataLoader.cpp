#include "mo/metadata/MetaDataLoader.hpp"

#include <utility>
#include <vector>

#include <fmt/format.h>

#include "mo/constraint/ConstraintEngine.hpp"
#include "mo/core/Error.hpp"
#include "mo/core/Logger.hpp"
#include "mo/registry/TypeRegistry.hpp"

namespace mo::metadata {

namespace {

constexpr std::string_view kObjectType = "object";

} // namespace

std::string_view ToString(LoadingState state) {
    switch (state) {
        case LoadingState::Uninitialized: return "Uninitialized";
        case LoadingState::Initializing:  return "Initializing";
        case LoadingState::Initialized:   return "Initialized";
        case LoadingState::Destroyed:     return "Destroyed";
    }
    return "Unknown";
}

MetaDataLoader::MetaDataLoader(const constraint::ConstraintEngine& engine, std::string name)
    : MetaDataNode(engine, kType, kSubType, std::move(name)) {}

void MetaDataLoader::BeginLoading() {
    LoadingState expected = LoadingState::Uninitialized;
    if (!m_loadingState.compare_exchange_strong(expected, LoadingState::Initializing, std::memory_order_acq_rel)) {
        throw core::StateError("begin loading", metadata::ToString(expected), Path());
    }
    MarkUnderConstruction();
    core::Logger::Info("[MetaDataLoader] Loading '{}'", Name());
}

void MetaDataLoader::FinishLoading() {
    EnsureLoading("finish loading");

    Engine().ValidateCompleteness(*this);
    if (!Engine().Registry().IsSealed()) {
        core::Logger::Warning("[MetaDataLoader] '{}' finished while the type registry is still open", Name());
    }

    Seal();
    m_loadingState.store(LoadingState::Initialized, std::memory_order_release);
    core::Logger::Info("[MetaDataLoader] Loaded '{}' with {} object(s)", Name(), GetMetaObjects()->size());
}

void MetaDataLoader::Destroy() {
    MetaDataNode::Destroy();
    m_loadingState.store(LoadingState::Destroyed, std::memory_order_release);
    core::Logger::Debug("[MetaDataLoader] Destroyed '{}'", Name());
}

void MetaDataLoader::EnsureLoading(std::string_view operation) const {
    const LoadingState state = GetLoadingState();
    if (state != LoadingState::Initializing) {
        throw core::StateError(operation, metadata::ToString(state), Path());
    }
}

MetaDataNode& MetaDataLoader::AddObject(std::unique_ptr<MetaDataNode> object) {
    EnsureLoading("add object");
    if (object && object->Type() != kObjectType) {
        throw core::StructureError(Path(), fmt::format("expected an object node, got {}", object->Path()));
    }
    return AddChild(std::move(object));
}

const MetaDataNode* MetaDataLoader::FindMetaObjectByName(std::string_view name) const {
    return FindChild(name, kObjectType, false);
}

const MetaDataNode& MetaDataLoader::GetMetaObjectByName(std::string_view name) const {
    if (const MetaDataNode* object = FindMetaObjectByName(name)) {
        return *object;
    }
    std::vector<std::string> alternatives;
    for (const MetaDataNode* object : *GetMetaObjects()) {
        alternatives.push_back(object->Name());
    }
    throw core::NotFoundError("MetaObject", std::string(name), Path(), std::move(alternatives));
}

MetaDataNode::NodeListPtr MetaDataLoader::GetMetaObjects() const {
    return GetChildrenOfType(kObjectType, false);
}

std::unique_ptr<MetaDataNode> MetaDataLoader::CloneSelf() const {
    return std::make_unique<MetaDataLoader>(Engine(), Name());
}

} // namespace mo::metadata
