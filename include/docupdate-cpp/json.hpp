/// @file json.hpp
/// @brief nlohmann/json interoperability for docupdate-cpp.
///
/// Provides ADL serialization (to_json/from_json) for Value, parsing of
/// MongoDB-style update documents into an UpdateSpec, and reading
/// UpdateOptions from a configuration object.

#pragma once

#include <docupdate-cpp/options.hpp>
#include <docupdate-cpp/update_applier.hpp>
#include <docupdate-cpp/value.hpp>

#include <nlohmann/json.hpp>

namespace docupdate_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Value --------------------------------------------------------------------
//
// Objects become Documents (field order is kept with ordered_json), arrays
// become Arrays. Integers that fit in 32 bits become int32, other integers
// int64, floating point numbers double. The MongoDB Extended JSON wrappers
// {"$numberInt": "1"}, {"$numberLong": "1"} and {"$numberDouble": "NaN"}
// select a type explicitly; to_json emits $numberLong for every int64 and
// $numberDouble for non-finite doubles so types survive a round trip.

void to_json(nlohmann::json& j, const Value& v);
void to_json(nlohmann::ordered_json& j, const Value& v);
void from_json(const nlohmann::json& j, Value& v);
void from_json(const nlohmann::ordered_json& j, Value& v);

// -- UpdateResult -------------------------------------------------------------

/// Serialized as {"n": <matched>, "nModified": <modified_count>}, the shape
/// of a MongoDB update reply.
void to_json(nlohmann::json& j, const UpdateResult& r);

// -- UpdateOptions ------------------------------------------------------------

/// Reads {"max_array_padding": <n>, "protect_id": <bool>}; absent keys keep
/// their defaults.
void from_json(const nlohmann::json& j, UpdateOptions& options);
void to_json(nlohmann::json& j, const UpdateOptions& options);

// =============================================================================
// Update documents
// =============================================================================

/// Parse an update document into modifications, in document order.
///
/// @code
/// auto spec = parse_update(nlohmann::ordered_json::parse(
///     R"({"$set": {"v.foo": 1}, "$pop": {"v.array": -1}})"));
/// @endcode
/// @throws Error (failed_to_parse) if the update is not an object, is empty,
///   or an operator's argument is not a non-empty object.
auto parse_update(const nlohmann::ordered_json& update) -> UpdateSpec;

/// Parse `update` and apply it to `document`.
/// @throws Error
auto apply_update(const UpdateApplier& applier, Value& document,
                  const nlohmann::ordered_json& update) -> UpdateResult;

}  // namespace docupdate_cpp
