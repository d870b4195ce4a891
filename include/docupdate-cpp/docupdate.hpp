/// @file docupdate.hpp
/// @brief Umbrella header for the docupdate-cpp library.
///
/// Include this single header for access to all public types:
/// Value, Document, Array, FieldPath, PathResolver functions, the update
/// operators, UpdateApplier and Error. JSON interop lives in json.hpp.

#pragma once

#include <docupdate-cpp/error.hpp>
#include <docupdate-cpp/field_path.hpp>
#include <docupdate-cpp/operators.hpp>
#include <docupdate-cpp/options.hpp>
#include <docupdate-cpp/path_resolver.hpp>
#include <docupdate-cpp/update_applier.hpp>
#include <docupdate-cpp/update_operator.hpp>
#include <docupdate-cpp/value.hpp>
