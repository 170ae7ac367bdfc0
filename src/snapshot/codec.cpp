/// @file codec.cpp
/// @brief JSON encoding and validated decoding of vehicle snapshots

#include <convoy/snapshot/codec.hpp>
#include <convoy/core/log.hpp>

#include <nlohmann/json.hpp>

#include <limits>

namespace convoy_snapshot::codec {

using convoy_core::CodecError;
using convoy_core::Error;
using convoy_core::Result;
using nlohmann::json;

// =============================================================================
// Encoding
// =============================================================================

namespace {

json encode_vec3(const convoy_math::Vec3& v) {
    return json::array({v.x, v.y, v.z});
}

json encode_quat(const convoy_math::Quat& q) {
    return json::array({q.w, q.x, q.y, q.z});
}

json encode_barricade(const BarricadeSnapshot& b) {
    return json{
        {"id", b.id},
        {"guid", b.guid.to_string()},
        {"health", b.health},
        {"owner", b.owner},
        {"group", b.group},
        {"state", convoy_core::base64_encode(b.state)},
        {"position", encode_vec3(b.position)},
        {"rotation", encode_quat(b.rotation)},
    };
}

json encode_structure(const StructureSnapshot& s) {
    return json{
        {"id", s.id},
        {"guid", s.guid.to_string()},
        {"health", s.health},
        {"owner", s.owner},
        {"group", s.group},
        {"position", encode_vec3(s.position)},
        {"rotation", encode_quat(s.rotation)},
    };
}

json encode_cargo(const CargoSnapshot& cargo) {
    json items = json::array();
    for (const auto& jar : cargo.items) {
        items.push_back(json{
            {"x", jar.x},
            {"y", jar.y},
            {"rotation", jar.rotation},
            {"id", jar.item.id},
            {"amount", jar.item.amount},
            {"quality", jar.item.quality},
            {"state", convoy_core::base64_encode(jar.item.state)},
        });
    }
    return json{{"width", cargo.width}, {"height", cargo.height}, {"items", std::move(items)}};
}

} // anonymous namespace

json encode(const VehicleSnapshot& snapshot) {
    json turrets = json::array();
    for (const auto& state : snapshot.turret_states) {
        turrets.push_back(state ? json(convoy_core::base64_encode(*state)) : json(nullptr));
    }

    json barricades = json::array();
    for (const auto& b : snapshot.barricades) {
        barricades.push_back(encode_barricade(b));
    }

    json structures = json::array();
    for (const auto& s : snapshot.structures) {
        structures.push_back(encode_structure(s));
    }

    json tires = json::array();
    for (bool alive : snapshot.tires) {
        tires.push_back(alive);
    }

    auto paint = snapshot.paint_bytes();

    return json{
        {"format_version", FORMAT_VERSION},
        {"definition_id", snapshot.definition_id},
        {"definition_guid", snapshot.definition_guid.to_string()},
        {"instance_id", snapshot.instance_id},
        {"skin_variant", snapshot.skin_variant},
        {"mythic_variant", snapshot.mythic_variant},
        {"placement_offset", snapshot.placement_offset},
        {"integrity", snapshot.integrity},
        {"fuel_level", snapshot.fuel_level},
        {"auxiliary_charge", snapshot.auxiliary_charge},
        {"owner", snapshot.owner},
        {"group", snapshot.group},
        {"tires", std::move(tires)},
        {"turrets", std::move(turrets)},
        {"cargo", encode_cargo(snapshot.cargo)},
        {"barricades", std::move(barricades)},
        {"structures", std::move(structures)},
        {"position", encode_vec3(snapshot.position)},
        {"rotation", encode_quat(snapshot.rotation)},
        {"paint", json::array({paint[0], paint[1], paint[2], paint[3]})},
    };
}

// =============================================================================
// Decoding
// =============================================================================

namespace {

/// Field reader that reports errors with the full field path
class Reader {
public:
    Reader(const json& object, std::string path)
        : m_object(object), m_path(std::move(path)) {}

    [[nodiscard]] std::string path_of(const char* field) const {
        return m_path.empty() ? std::string(field) : m_path + "." + field;
    }

    [[nodiscard]] Result<const json*> require(const char* field) const {
        if (!m_object.is_object()) {
            return Error(CodecError::invalid_field(m_path.empty() ? "<root>" : m_path, "expected an object"));
        }
        auto it = m_object.find(field);
        if (it == m_object.end()) {
            return Error(CodecError::missing_field(path_of(field)));
        }
        return convoy_core::Ok(&*it);
    }

    [[nodiscard]] bool has(const char* field) const {
        return m_object.is_object() && m_object.contains(field);
    }

    template<typename T>
    [[nodiscard]] Result<T> uint(const char* field) const {
        auto node = require(field);
        if (!node) return node.error();
        return as_uint<T>(**node, path_of(field));
    }

    [[nodiscard]] Result<float> number(const char* field) const {
        auto node = require(field);
        if (!node) return node.error();
        if (!(*node)->is_number()) {
            return Error(CodecError::invalid_field(path_of(field), "expected a number"));
        }
        return convoy_core::Ok((*node)->get<float>());
    }

    [[nodiscard]] Result<convoy_core::Guid> guid(const char* field) const {
        auto node = require(field);
        if (!node) return node.error();
        if (!(*node)->is_string()) {
            return Error(CodecError::invalid_field(path_of(field), "expected a string"));
        }
        auto text = (*node)->get<std::string>();
        auto parsed = convoy_core::Guid::parse(text);
        if (!parsed) {
            return Error(CodecError::invalid_guid(path_of(field), text));
        }
        return convoy_core::Ok(*parsed);
    }

    [[nodiscard]] Result<convoy_core::Blob> blob(const char* field) const {
        auto node = require(field);
        if (!node) return node.error();
        return as_blob(**node, path_of(field));
    }

    [[nodiscard]] Result<const json*> array(const char* field) const {
        auto node = require(field);
        if (!node) return node;
        if (!(*node)->is_array()) {
            return Error(CodecError::invalid_field(path_of(field), "expected an array"));
        }
        return node;
    }

    template<typename T>
    [[nodiscard]] static Result<T> as_uint(const json& node, const std::string& path) {
        if (!node.is_number_unsigned() && !(node.is_number_integer() && node.get<std::int64_t>() >= 0)) {
            return Error(CodecError::invalid_field(path, "expected a non-negative integer"));
        }
        auto raw = node.get<std::uint64_t>();
        if (raw > std::numeric_limits<T>::max()) {
            return Error(CodecError::invalid_field(path, "value " + std::to_string(raw) + " out of range"));
        }
        return convoy_core::Ok(static_cast<T>(raw));
    }

    [[nodiscard]] static Result<convoy_core::Blob> as_blob(const json& node, const std::string& path) {
        if (!node.is_string()) {
            return Error(CodecError::invalid_field(path, "expected a base64 string"));
        }
        auto decoded = convoy_core::base64_decode(node.get<std::string>());
        if (!decoded) {
            return Error(CodecError::invalid_encoding(path));
        }
        return convoy_core::Ok(std::move(*decoded));
    }

private:
    const json& m_object;
    std::string m_path;
};

/// Read a fixed-length float array
template<std::size_t N>
Result<std::array<float, N>> read_floats(const Reader& reader, const char* field) {
    auto node = reader.array(field);
    if (!node) return node.error();
    const json& arr = **node;
    if (arr.size() != N) {
        return Error(CodecError::invalid_field(reader.path_of(field),
            "expected " + std::to_string(N) + " numbers, got " + std::to_string(arr.size())));
    }
    std::array<float, N> out{};
    for (std::size_t i = 0; i < N; ++i) {
        if (!arr[i].is_number()) {
            return Error(CodecError::invalid_field(reader.path_of(field), "expected numbers"));
        }
        out[i] = arr[i].get<float>();
    }
    return convoy_core::Ok(out);
}

Result<convoy_math::Vec3> read_vec3(const Reader& reader, const char* field) {
    auto v = read_floats<3>(reader, field);
    if (!v) return v.error();
    return convoy_math::Vec3((*v)[0], (*v)[1], (*v)[2]);
}

Result<convoy_math::Quat> read_quat(const Reader& reader, const char* field) {
    auto q = read_floats<4>(reader, field);
    if (!q) return q.error();
    return convoy_math::Quat((*q)[0], (*q)[1], (*q)[2], (*q)[3]);
}

/// Shorthand: assign a Result's value or return its error
#define CONVOY_TRY_ASSIGN(target, expr)        \
    do {                                       \
        auto _res = (expr);                    \
        if (!_res) return _res.error();        \
        (target) = std::move(*_res);           \
    } while (0)

Result<BarricadeSnapshot> decode_barricade(const json& node, const std::string& path) {
    Reader r(node, path);
    BarricadeSnapshot b;
    CONVOY_TRY_ASSIGN(b.id, r.uint<std::uint16_t>("id"));
    CONVOY_TRY_ASSIGN(b.guid, r.guid("guid"));
    CONVOY_TRY_ASSIGN(b.health, r.uint<std::uint16_t>("health"));
    CONVOY_TRY_ASSIGN(b.owner, r.uint<std::uint64_t>("owner"));
    CONVOY_TRY_ASSIGN(b.group, r.uint<std::uint64_t>("group"));
    CONVOY_TRY_ASSIGN(b.state, r.blob("state"));
    CONVOY_TRY_ASSIGN(b.position, read_vec3(r, "position"));
    CONVOY_TRY_ASSIGN(b.rotation, read_quat(r, "rotation"));
    return convoy_core::Ok(std::move(b));
}

Result<StructureSnapshot> decode_structure(const json& node, const std::string& path) {
    Reader r(node, path);
    StructureSnapshot s;
    CONVOY_TRY_ASSIGN(s.id, r.uint<std::uint16_t>("id"));
    CONVOY_TRY_ASSIGN(s.guid, r.guid("guid"));
    CONVOY_TRY_ASSIGN(s.health, r.uint<std::uint16_t>("health"));
    CONVOY_TRY_ASSIGN(s.owner, r.uint<std::uint64_t>("owner"));
    CONVOY_TRY_ASSIGN(s.group, r.uint<std::uint64_t>("group"));
    CONVOY_TRY_ASSIGN(s.position, read_vec3(r, "position"));
    CONVOY_TRY_ASSIGN(s.rotation, read_quat(r, "rotation"));
    return convoy_core::Ok(std::move(s));
}

Result<CargoSnapshot> decode_cargo(const json& node, const std::string& path) {
    Reader r(node, path);
    CargoSnapshot cargo;
    CONVOY_TRY_ASSIGN(cargo.width, r.uint<std::uint8_t>("width"));
    CONVOY_TRY_ASSIGN(cargo.height, r.uint<std::uint8_t>("height"));

    const json* items = nullptr;
    CONVOY_TRY_ASSIGN(items, r.array("items"));
    for (std::size_t i = 0; i < items->size(); ++i) {
        Reader jr((*items)[i], path + ".items[" + std::to_string(i) + "]");
        ItemJarSnapshot jar;
        CONVOY_TRY_ASSIGN(jar.x, jr.uint<std::uint8_t>("x"));
        CONVOY_TRY_ASSIGN(jar.y, jr.uint<std::uint8_t>("y"));
        CONVOY_TRY_ASSIGN(jar.rotation, jr.uint<std::uint8_t>("rotation"));
        CONVOY_TRY_ASSIGN(jar.item.id, jr.uint<std::uint16_t>("id"));
        CONVOY_TRY_ASSIGN(jar.item.amount, jr.uint<std::uint8_t>("amount"));
        CONVOY_TRY_ASSIGN(jar.item.quality, jr.uint<std::uint8_t>("quality"));
        CONVOY_TRY_ASSIGN(jar.item.state, jr.blob("state"));
        cargo.items.push_back(std::move(jar));
    }
    return convoy_core::Ok(std::move(cargo));
}

Result<VehicleSnapshot> decode_document(const json& document) {
    Reader r(document, "");
    VehicleSnapshot snap;

    std::int64_t version = 0;
    {
        auto node = r.require("format_version");
        if (!node) return node.error();
        if (!(*node)->is_number_integer()) {
            return Error(CodecError::invalid_field("format_version", "expected an integer"));
        }
        version = (*node)->get<std::int64_t>();
    }
    if (version != FORMAT_VERSION) {
        return Error(CodecError::unsupported_version(version));
    }

    CONVOY_TRY_ASSIGN(snap.definition_id, r.uint<std::uint16_t>("definition_id"));
    CONVOY_TRY_ASSIGN(snap.definition_guid, r.guid("definition_guid"));
    CONVOY_TRY_ASSIGN(snap.instance_id, r.uint<std::uint32_t>("instance_id"));
    CONVOY_TRY_ASSIGN(snap.skin_variant, r.uint<std::uint16_t>("skin_variant"));
    CONVOY_TRY_ASSIGN(snap.mythic_variant, r.uint<std::uint16_t>("mythic_variant"));
    CONVOY_TRY_ASSIGN(snap.placement_offset, r.number("placement_offset"));
    CONVOY_TRY_ASSIGN(snap.integrity, r.uint<std::uint16_t>("integrity"));
    CONVOY_TRY_ASSIGN(snap.fuel_level, r.uint<std::uint16_t>("fuel_level"));
    CONVOY_TRY_ASSIGN(snap.auxiliary_charge, r.uint<std::uint16_t>("auxiliary_charge"));
    CONVOY_TRY_ASSIGN(snap.owner, r.uint<std::uint64_t>("owner"));
    CONVOY_TRY_ASSIGN(snap.group, r.uint<std::uint64_t>("group"));
    CONVOY_TRY_ASSIGN(snap.position, read_vec3(r, "position"));
    CONVOY_TRY_ASSIGN(snap.rotation, read_quat(r, "rotation"));

    // Tires
    const json* tires = nullptr;
    CONVOY_TRY_ASSIGN(tires, r.array("tires"));
    for (const auto& tire : *tires) {
        if (!tire.is_boolean()) {
            return Error(CodecError::invalid_field("tires", "expected booleans"));
        }
        snap.tires.push_back(tire.get<bool>());
    }

    // Turrets: null entries mean "nothing recorded"
    const json* turrets = nullptr;
    CONVOY_TRY_ASSIGN(turrets, r.array("turrets"));
    for (std::size_t i = 0; i < turrets->size(); ++i) {
        const json& entry = (*turrets)[i];
        if (entry.is_null()) {
            snap.turret_states.emplace_back(std::nullopt);
            continue;
        }
        auto blob = Reader::as_blob(entry, "turrets[" + std::to_string(i) + "]");
        if (!blob) return blob.error();
        snap.turret_states.emplace_back(std::move(*blob));
    }

    // Cargo and children may be omitted by hand-written documents
    if (r.has("cargo")) {
        CONVOY_TRY_ASSIGN(snap.cargo, decode_cargo(document["cargo"], "cargo"));
    }

    if (r.has("barricades")) {
        const json* arr = nullptr;
        CONVOY_TRY_ASSIGN(arr, r.array("barricades"));
        for (std::size_t i = 0; i < arr->size(); ++i) {
            auto b = decode_barricade((*arr)[i], "barricades[" + std::to_string(i) + "]");
            if (!b) return b.error();
            snap.barricades.push_back(std::move(*b));
        }
    }

    if (r.has("structures")) {
        const json* arr = nullptr;
        CONVOY_TRY_ASSIGN(arr, r.array("structures"));
        for (std::size_t i = 0; i < arr->size(); ++i) {
            auto s = decode_structure((*arr)[i], "structures[" + std::to_string(i) + "]");
            if (!s) return s.error();
            snap.structures.push_back(std::move(*s));
        }
    }

    // Paint: exactly 4 bytes on the wire; absent means no paint
    if (r.has("paint")) {
        const json* paint = nullptr;
        CONVOY_TRY_ASSIGN(paint, r.array("paint"));
        if (paint->size() != 4) {
            return Error(CodecError::invalid_field("paint",
                "expected 4 bytes, got " + std::to_string(paint->size())));
        }
        PaintBytes bytes{};
        for (std::size_t i = 0; i < 4; ++i) {
            CONVOY_TRY_ASSIGN(bytes[i], Reader::as_uint<std::uint8_t>((*paint)[i], "paint[" + std::to_string(i) + "]"));
        }
        snap.set_paint_bytes(bytes);
    }

    return convoy_core::Ok(std::move(snap));
}

#undef CONVOY_TRY_ASSIGN

} // anonymous namespace

Result<VehicleSnapshot> decode(const json& document) {
    if (!document.is_object()) {
        Error error = CodecError::invalid_field("<root>", "expected an object");
        convoy_core::debug::record_error(error);
        return error;
    }

    auto result = decode_document(document);
    if (!result) {
        convoy_core::debug::record_error(result.error());
        convoy_core::snapshot_logger()->warn("Snapshot decode failed: {}", result.error().message());
    }
    return result;
}

std::string to_string(const VehicleSnapshot& snapshot, int indent) {
    return encode(snapshot).dump(indent);
}

Result<VehicleSnapshot> from_string(std::string_view text) {
    json document = json::parse(text.begin(), text.end(), nullptr, false);
    if (document.is_discarded()) {
        Error error(convoy_core::ErrorCode::ParseError, "Malformed snapshot JSON");
        convoy_core::debug::record_error(error);
        return error;
    }
    return decode(document);
}

} // namespace convoy_snapshot::codec
