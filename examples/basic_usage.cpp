// basic_usage — demonstrates the core docdelta-cpp API
//
// Builds a pristine and an edited document, diffs them, prints the
// batch-update request body, and replays the operations to confirm they
// reproduce the edit.
//
// Build: cmake --build build
// Run:   ./build/basic_usage [zlog.conf]

#include <docdelta-cpp/docdelta.hpp>

#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace dd = docdelta_cpp;

namespace {

auto bold(std::string text) -> dd::Inline {
    auto style = dd::TextStyle{};
    style.bold = true;
    return dd::TextRun{std::move(text), style};
}

auto make_body(std::vector<dd::Element> content) -> dd::Section {
    auto body = dd::Section{};
    body.content = std::move(content);
    return body;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc > 1 && !dd::init_logging(argv[1])) {
        std::fprintf(stderr, "warning: could not initialise logging from %s\n", argv[1]);
    }

    // -- Pristine: what the remote document holds -----------------------------
    auto pristine = dd::Document{};
    pristine.document_id = "example";
    pristine.sections.push_back(make_body({
        dd::make_paragraph("Release notes", dd::NamedStyle::title),
        dd::make_paragraph("Version 1.0 ships today."),
        dd::make_table({{"Feature", "Status"}, {"Diff", "beta"}}),
        dd::make_paragraph(""),
    }));

    // -- Current: the locally edited copy -------------------------------------
    auto current = pristine;
    auto& content = current.sections.front().content;
    content[1] = dd::make_paragraph(std::vector<dd::Inline>{
        dd::TextRun{"Version 1.1 ships ", {}}, bold("today"), dd::TextRun{".", {}}});
    content[2] = dd::make_table({{"Feature", "Status"}, {"Diff", "stable"}});
    content.insert(content.end() - 1, dd::make_paragraph("Thanks to every contributor \xF0\x9F\x8E\x89"));

    try {
        // -- Diff and serialise -----------------------------------------------
        const auto engine = dd::DiffEngine{};
        const auto ops = engine.diff(pristine, current);
        std::printf("%zu operations\n", ops.size());
        std::printf("%s\n", dd::to_batch_update(ops).dump(2).c_str());

        // -- Replay against the pristine document -----------------------------
        auto replayer = dd::Replayer{pristine};
        replayer.apply(ops);
        const auto matches = replayer.segment("") == dd::flatten(current.sections.front());
        std::printf("replay %s\n", matches ? "matches" : "DIFFERS");
        dd::shutdown_logging();
        return matches ? 0 : 1;
    } catch (const dd::DiffError& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        dd::shutdown_logging();
        return 1;
    }
}
