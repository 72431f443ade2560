/// @file fieldpath.hpp
/// @brief Umbrella header for the fieldpath-cpp library.
///
/// Include this single header for access to all public types:
/// Json, PathExpression, Match, Engine, Record, and the error taxonomy.

#pragma once

#include <fieldpath-cpp/codec.hpp>
#include <fieldpath-cpp/engine.hpp>
#include <fieldpath-cpp/error.hpp>
#include <fieldpath-cpp/mutate.hpp>
#include <fieldpath-cpp/path.hpp>
#include <fieldpath-cpp/path_cache.hpp>
#include <fieldpath-cpp/query.hpp>
#include <fieldpath-cpp/record.hpp>
#include <fieldpath-cpp/value.hpp>
