/// @file json.hpp
/// @brief nlohmann/json serialization of operations into API requests.
///
/// Each Operation maps to exactly one batch-update request object. Ranges
/// and locations carry segmentId/tabId when the operation addresses a
/// non-body segment or a non-default tab.

#pragma once

#include <docdelta-cpp/operation.hpp>
#include <docdelta-cpp/style.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace docdelta_cpp {

// =============================================================================
// ADL serialization: to_json
// =============================================================================

// -- Addressing ---------------------------------------------------------------

void to_json(nlohmann::json& j, const Range& r);
void to_json(nlohmann::json& j, const Location& l);

// -- Style payloads -----------------------------------------------------------

/// Only set fields are written; a masked field that is absent resets it.
/// Colours must be "#RRGGBB" (DiffError{input_malformation} otherwise).
void to_json(nlohmann::json& j, const TextStyle& s);
void to_json(nlohmann::json& j, const ParagraphStyle& s);

// -- Requests -----------------------------------------------------------------

/// Keys carrying the placeholder id of a created segment, beside the
/// request body: {"createFootnote": {...}, "_placeholderFootnoteId": "fn1"}.
/// The batch coordinator strips them and maps each create reply to the id.
inline constexpr std::string_view placeholder_footnote_key = "_placeholderFootnoteId";
inline constexpr std::string_view placeholder_header_key = "_placeholderHeaderId";
inline constexpr std::string_view placeholder_footer_key = "_placeholderFooterId";

/// One request object, e.g. {"insertText": {"location": {...}, "text": "..."}}.
/// Throws DiffError{unknown_operation} for a payload-less operation.
void to_json(nlohmann::json& j, const Operation& op);

// =============================================================================
// Batches
// =============================================================================

/// Comma-joined API field mask ("bold,italic").
auto field_mask(const std::vector<TextField>& fields) -> std::string;
auto field_mask(const std::vector<ParagraphField>& fields) -> std::string;

/// JSON array with one request per operation, in order.
auto to_requests(const std::vector<Operation>& ops) -> nlohmann::json;

/// {"requests": [...]}
auto to_batch_update(const std::vector<Operation>& ops) -> nlohmann::json;

}  // namespace docdelta_cpp
