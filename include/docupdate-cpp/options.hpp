/// @file options.hpp
/// @brief UpdateOptions: construction-time configuration of the engine.

#pragma once

#include <cstddef>

namespace docupdate_cpp {

/// Tunables for an UpdateApplier.
///
/// @code
/// auto applier = UpdateApplier{UpdateOptions{.max_array_padding = 1000}};
/// @endcode
struct UpdateOptions {
    /// Most nulls an update may insert to reach an index past the end of an
    /// array. Setting index i of an array of size n inserts i - n nulls.
    std::size_t max_array_padding = 1500000;

    /// Reject updates that change the value of the '_id' field.
    bool protect_id = true;

    auto operator==(const UpdateOptions&) const -> bool = default;
};

}  // namespace docupdate_cpp
