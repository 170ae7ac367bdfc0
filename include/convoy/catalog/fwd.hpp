#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for convoy_catalog

namespace convoy_catalog {

struct TurretMount;
struct VehicleDef;
struct ItemDef;
struct BarricadeDef;
struct StructureDef;

class ICatalog;
class DefinitionCatalog;

} // namespace convoy_catalog
