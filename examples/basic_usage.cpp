// basic_usage: demonstrates core fieldpath-cpp API
//
// Resolves, updates and deletes values inside a record's JSON payload:
// single and multi-match reads, defaults, path synthesis, the wildcard
// field pattern, deletion with array compaction, and typed errors.
//
// Build: cmake --build build
// Run:   ./build/basic_usage

#include <fieldpath-cpp/fieldpath.hpp>

#include <glog/logging.h>

#include <cstdio>
#include <string>

namespace fp = fieldpath_cpp;

namespace {

void show(const char* label, const fp::Json& value) {
    std::printf("%-34s %s\n", label, value.dump().c_str());
}

}  // anonymous namespace

int main(int /*argc*/, char** argv) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    auto rec = fp::Record{};
    rec.set_field("json_payload", std::string{R"({
        "user": {"name": "John Doe", "profile": {"age": 30}},
        "orders": [
            {"id": 1, "total": 100.50, "items": ["item1", "item2"]},
            {"id": 2, "total": 250.75, "items": ["item3"]}
        ],
        "tags": ["important", "urgent", "customer"]
    })"});

    // -- Reads ----------------------------------------------------------------
    show("$.user.name", rec.resolve_path("$.user.name"));
    show("$.orders[*].id", rec.resolve_path("$.orders[*].id"));
    show("$..items[*]", rec.resolve_path("$..items[*]"));
    show("$.tags[-1]", rec.resolve_path("$.tags[-1]"));
    show("$.orders[?(@.total > 200)].id", rec.resolve_path("$.orders[?(@.total > 200)].id"));
    show("$.user.address (default)", rec.resolve_path("$.user.address", "N/A"));

    // -- Updates --------------------------------------------------------------
    rec.update_path("$.user.profile.age", 31);
    rec.update_path("$.user.address.city", "Zürich");
    rec.update_path("$.orders[*].shipped", true);
    show("after updates: $.user", rec.resolve_path("$.user"));
    show("after updates: $.orders[*].shipped", rec.resolve_path("$.orders[*].shipped"));

    // -- Deletes --------------------------------------------------------------
    rec.delete_path("$.tags[1]");
    rec.delete_path("$..items");
    show("after deletes: $.tags", rec.resolve_path("$.tags"));
    show("after deletes: $.orders", rec.resolve_path("$.orders"));

    // -- Where things are -----------------------------------------------------
    for (const auto& pointer : rec.locate_path("$..id")) {
        std::printf("id at %s\n", pointer.c_str());
    }

    // -- Persisted text -------------------------------------------------------
    if (auto text = rec.field_text("json_payload")) {
        std::printf("\nStored payload:\n%s\n", text->c_str());
    }

    // -- Errors are typed -----------------------------------------------------
    try {
        rec.update_path("$.user.name.first", "John");
    } catch (const fp::UnsupportedOperationError& e) {
        std::printf("\nupdate refused (%s): %s\n",
                    std::string{fp::to_string_view(e.kind())}.c_str(), e.what());
    }
    try {
        rec.resolve_path("$.orders[");
    } catch (const fp::Exception& e) {
        std::printf("resolve refused (%s): %s\n",
                    std::string{fp::to_string_view(e.kind())}.c_str(), e.what());
    }

    return 0;
}
