// Fuzz target for compile(): exercises the path expression parser.
// Any expression that compiles is normalized with to_string(), which must
// compile again to the same selectors, and is evaluated against a fixed
// document, which must not throw.

#include <fieldpath-cpp/fieldpath.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

namespace {

const auto document = fieldpath_cpp::Json::parse(R"({
    "a": {"b": [1, 2, {"c": "x"}], "n": null},
    "l": [{"id": 1, "v": true}, {"id": 2, "v": "s"}, 3]
})");

}  // anonymous namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto path = std::string_view{reinterpret_cast<const char*>(data), size};

    auto expr = fieldpath_cpp::PathExpression{};
    try {
        expr = fieldpath_cpp::compile(path);
    } catch (const fieldpath_cpp::PathSyntaxError&) {
        return 0;
    }

    if (fieldpath_cpp::compile(expr.to_string()) != expr) std::abort();

    auto matches = fieldpath_cpp::evaluate(expr, document);
    for (const auto& m : matches) {
        (void)m.pointer();
    }
    return 0;
}
