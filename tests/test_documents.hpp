#pragma once

// Shared document builders for the test suites.

#include <docdelta-cpp/model.hpp>

#include <string>
#include <utility>
#include <vector>

namespace docdelta_test {

namespace dd = docdelta_cpp;

inline auto run(std::string text, dd::TextStyle style = {}) -> dd::Inline {
    return dd::TextRun{std::move(text), std::move(style)};
}

inline auto bold_run(std::string text) -> dd::Inline {
    auto style = dd::TextStyle{};
    style.bold = true;
    return dd::TextRun{std::move(text), style};
}

inline auto marker(dd::MarkerKind kind, dd::Attributes attributes = {}) -> dd::Inline {
    return dd::AtomicMarker{kind, std::move(attributes), {}};
}

inline auto para(std::string text, dd::NamedStyle style = dd::NamedStyle::normal_text) -> dd::Element {
    return dd::make_paragraph(std::move(text), style);
}

inline auto runs(std::vector<dd::Inline> content) -> dd::Element {
    return dd::make_paragraph(std::move(content));
}

inline auto bulleted(std::string text, dd::BulletKind kind, int level = 0) -> dd::Element {
    auto paragraph = dd::make_paragraph(std::move(text));
    paragraph.bullet = dd::Bullet{kind, "list-1", level};
    return paragraph;
}

inline auto table(const std::vector<std::vector<std::string>>& rows) -> dd::Element {
    return dd::make_table(rows);
}

inline auto page_break() -> dd::Element {
    return dd::SpecialElement{dd::SpecialKind::page_break, {}};
}

inline auto section(dd::SectionKind kind, std::string id, std::vector<dd::Element> content) -> dd::Section {
    auto s = dd::Section{};
    s.kind = kind;
    s.id = std::move(id);
    s.content = std::move(content);
    return s;
}

inline auto body(std::vector<dd::Element> content) -> dd::Section {
    return section(dd::SectionKind::body, "", std::move(content));
}

inline auto document(std::vector<dd::Section> sections) -> dd::Document {
    auto doc = dd::Document{};
    doc.document_id = "doc-1";
    doc.revision_id = "rev-1";
    doc.title = "Test";
    doc.sections = std::move(sections);
    return doc;
}

inline auto body_document(std::vector<dd::Element> body_content) -> dd::Document {
    return document(std::vector<dd::Section>{body(std::move(body_content))});
}

}  // namespace docdelta_test
