#pragma once

// Convenience umbrella header for embedding applications.

#include "mo/core/Error.hpp"
#include "mo/core/Logger.hpp"
#include "mo/utils/Config.hpp"

#include "mo/cache/DualCache.hpp"

#include "mo/registry/ChildRequirement.hpp"
#include "mo/registry/CoreTypeProvider.hpp"
#include "mo/registry/RegistryBootstrap.hpp"
#include "mo/registry/RegistryHealthReport.hpp"
#include "mo/registry/TypeDefinition.hpp"
#include "mo/registry/TypeId.hpp"
#include "mo/registry/TypeProvider.hpp"
#include "mo/registry/TypeRegistry.hpp"

#include "mo/constraint/ConstraintEngine.hpp"
#include "mo/constraint/PlacementConstraint.hpp"
#include "mo/constraint/ValidationConstraint.hpp"

#include "mo/metadata/MetaAttribute.hpp"
#include "mo/metadata/MetaDataLoader.hpp"
#include "mo/metadata/MetaDataNode.hpp"
