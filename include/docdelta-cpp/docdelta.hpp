/// @file docdelta.hpp
/// @brief Umbrella header for the docdelta-cpp library.
///
/// Include this single header for access to all public types:
/// Document, Section, Paragraph, Table, DiffEngine, Operation,
/// Replayer, the JSON serializer, and Error.

#pragma once

#include <docdelta-cpp/diff_engine.hpp>
#include <docdelta-cpp/error.hpp>
#include <docdelta-cpp/json.hpp>
#include <docdelta-cpp/logging.hpp>
#include <docdelta-cpp/model.hpp>
#include <docdelta-cpp/operation.hpp>
#include <docdelta-cpp/replay.hpp>
#include <docdelta-cpp/sequence_diff.hpp>
#include <docdelta-cpp/style.hpp>
#include <docdelta-cpp/utf16.hpp>
