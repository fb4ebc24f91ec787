#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <string_view>

#include "mo/metadata/MetaDataNode.hpp"

namespace mo::metadata {

enum class LoadingState {
    Uninitialized,
    Initializing,
    Initialized,
    Destroyed
};

std::string_view ToString(LoadingState state);

/**
 * @brief Root of a metadata tree (type "loader", subtype "simple").
 *
 * Objects are attached between BeginLoading() and FinishLoading(). Finishing
 * checks completeness of the whole tree and seals it; afterwards the loader
 * only answers lookups.
 */
class MetaDataLoader : public MetaDataNode {
public:
    static constexpr std::string_view kType = "loader";
    static constexpr std::string_view kSubType = "simple";

    MetaDataLoader(const constraint::ConstraintEngine& engine, std::string name);

    void BeginLoading();
    void FinishLoading();
    void Destroy() override;

    [[nodiscard]] LoadingState GetLoadingState() const { return m_loadingState.load(std::memory_order_acquire); }
    [[nodiscard]] bool IsLoaded() const { return GetLoadingState() == LoadingState::Initialized; }

    /// Attaches an object node. Only allowed while loading.
    MetaDataNode& AddObject(std::unique_ptr<MetaDataNode> object);

    [[nodiscard]] const MetaDataNode* FindMetaObjectByName(std::string_view name) const;
    const MetaDataNode& GetMetaObjectByName(std::string_view name) const;
    [[nodiscard]] NodeListPtr GetMetaObjects() const;

protected:
    std::unique_ptr<MetaDataNode> CloneSelf() const override;

private:
    void EnsureLoading(std::string_view operation) const;

    std::atomic<LoadingState> m_loadingState{LoadingState::Uninitialized};
};

} // namespace mo::metadata
