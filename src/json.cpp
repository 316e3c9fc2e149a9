#include <docdelta-cpp/json.hpp>

#include <docdelta-cpp/error.hpp>
#include <docdelta-cpp/model.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace docdelta_cpp {

// =============================================================================
// Shared helpers
// =============================================================================

namespace {

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// "#RRGGBB" -> {"color": {"rgbColor": {"red": r, "green": g, "blue": b}}}
auto color_json(std::string_view hex) -> nlohmann::json {
    if (hex.size() != 7 || hex[0] != '#') {
        throw DiffError{ErrorKind::input_malformation, "invalid colour '" + std::string{hex} + "'"};
    }
    double channels[3] = {};
    for (std::size_t c = 0; c < 3; ++c) {
        const auto hi = hex_value(hex[1 + c * 2]);
        const auto lo = hex_value(hex[2 + c * 2]);
        if (hi < 0 || lo < 0) {
            throw DiffError{ErrorKind::input_malformation, "invalid colour '" + std::string{hex} + "'"};
        }
        channels[c] = static_cast<double>(hi * 16 + lo) / 255.0;
    }
    return nlohmann::json{{"color", {{"rgbColor", {{"red", channels[0]},
                                                   {"green", channels[1]},
                                                   {"blue", channels[2]}}}}}};
}

auto dimension_json(double points) -> nlohmann::json {
    return nlohmann::json{{"magnitude", points}, {"unit", "PT"}};
}

template <typename Field>
auto join_fields(const std::vector<Field>& fields) -> std::string {
    auto mask = std::string{};
    for (auto field : fields) {
        if (!mask.empty()) mask += ',';
        mask += to_string_view(field);
    }
    return mask;
}

}  // anonymous namespace

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, const Range& r) {
    j = nlohmann::json{{"startIndex", r.start_index}, {"endIndex", r.end_index}};
}

void to_json(nlohmann::json& j, const Location& l) {
    j = nlohmann::json{{"index", l.index}};
}

void to_json(nlohmann::json& j, const TextStyle& s) {
    j = nlohmann::json::object();
    if (s.bold) j["bold"] = *s.bold;
    if (s.italic) j["italic"] = *s.italic;
    if (s.underline) j["underline"] = *s.underline;
    if (s.strikethrough) j["strikethrough"] = *s.strikethrough;
    if (s.small_caps) j["smallCaps"] = *s.small_caps;
    if (s.baseline_offset) j["baselineOffset"] = std::string{to_string_view(*s.baseline_offset)};
    if (s.link) j["link"] = nlohmann::json{{"url", *s.link}};
    if (s.foreground_color) j["foregroundColor"] = color_json(*s.foreground_color);
    if (s.background_color) j["backgroundColor"] = color_json(*s.background_color);
    if (s.font_family) j["weightedFontFamily"] = nlohmann::json{{"fontFamily", *s.font_family}};
    if (s.font_size) j["fontSize"] = dimension_json(*s.font_size);
}

void to_json(nlohmann::json& j, const ParagraphStyle& s) {
    j = nlohmann::json::object();
    if (s.named_style) j["namedStyleType"] = std::string{to_string_view(*s.named_style)};
    if (s.alignment) j["alignment"] = std::string{to_string_view(*s.alignment)};
    if (s.indent_start) j["indentStart"] = dimension_json(*s.indent_start);
    if (s.indent_first_line) j["indentFirstLine"] = dimension_json(*s.indent_first_line);
}

void to_json(nlohmann::json& j, const Operation& op) {
    if (op.action.valueless_by_exception()) {
        throw DiffError{ErrorKind::unknown_operation, "operation has no payload"};
    }

    // Range/location objects carry the segment and tab they address.
    auto addressed = [&op](nlohmann::json target) {
        if (!op.segment.id.empty()) target["segmentId"] = op.segment.id;
        if (op.tab_id) target["tabId"] = *op.tab_id;
        return target;
    };
    auto request = nlohmann::json::object();
    // Creates name their segment by a placeholder id that later requests
    // address; it sits beside the request and is stripped before sending.
    auto placeholder = std::pair<std::string_view, std::string>{};

    std::visit(overload{
        [&](const DeleteContentRange& a) {
            request["range"] = addressed(a.range);
        },
        [&](const InsertText& a) {
            request["location"] = addressed(a.location);
            request["text"] = a.text;
        },
        [&](const UpdateTextStyle& a) {
            request["range"] = addressed(a.range);
            request["textStyle"] = a.text_style;
            request["fields"] = field_mask(a.fields);
        },
        [&](const UpdateParagraphStyle& a) {
            request["range"] = addressed(a.range);
            request["paragraphStyle"] = a.paragraph_style;
            request["fields"] = field_mask(a.fields);
        },
        [&](const CreateParagraphBullets& a) {
            request["range"] = addressed(a.range);
            request["bulletPreset"] = std::string{bullet_preset(a.bullet)};
        },
        [&](const DeleteParagraphBullets& a) {
            request["range"] = addressed(a.range);
        },
        [&](const InsertTable& a) {
            request["rows"] = a.rows;
            request["columns"] = a.columns;
            request["location"] = addressed(a.location);
        },
        [&](const InsertPageBreak& a) {
            request["location"] = addressed(a.location);
        },
        [&](const InsertSectionBreak& a) {
            request["sectionType"] = std::string{to_string_view(a.type)};
            request["location"] = addressed(a.location);
        },
        [&](const CreateFootnote& a) {
            request["location"] = addressed(a.location);
            placeholder = {placeholder_footnote_key, a.provisional_id};
        },
        [&](const CreateHeader& a) {
            request["type"] = std::string{to_string_view(a.type)};
            placeholder = {placeholder_header_key, a.provisional_id};
        },
        [&](const CreateFooter& a) {
            request["type"] = std::string{to_string_view(a.type)};
            placeholder = {placeholder_footer_key, a.provisional_id};
        },
        [&](const DeleteHeader& a) {
            request["headerId"] = a.header_id;
            if (op.tab_id) request["tabId"] = *op.tab_id;
        },
        [&](const DeleteFooter& a) {
            request["footerId"] = a.footer_id;
            if (op.tab_id) request["tabId"] = *op.tab_id;
        },
    }, op.action);

    j = nlohmann::json{{std::string{to_string_view(op.kind())}, std::move(request)}};
    if (!placeholder.first.empty()) j[std::string{placeholder.first}] = std::move(placeholder.second);
}

// =============================================================================
// Batches
// =============================================================================

auto field_mask(const std::vector<TextField>& fields) -> std::string {
    return join_fields(fields);
}

auto field_mask(const std::vector<ParagraphField>& fields) -> std::string {
    return join_fields(fields);
}

auto to_requests(const std::vector<Operation>& ops) -> nlohmann::json {
    auto requests = nlohmann::json::array();
    for (const auto& op : ops) requests.push_back(op);
    return requests;
}

auto to_batch_update(const std::vector<Operation>& ops) -> nlohmann::json {
    return nlohmann::json{{"requests", to_requests(ops)}};
}

}  // namespace docdelta_cpp
