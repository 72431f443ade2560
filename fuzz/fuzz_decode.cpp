// Fuzz target for decode(): feeds arbitrary field text through the codec
// and, when it decodes, through a delete and an update. Only typed
// fieldpath errors are acceptable failures.

#include <fieldpath-cpp/fieldpath.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace fp = fieldpath_cpp;
    const auto text = std::string{reinterpret_cast<const char*>(data), size};

    try {
        auto value = fp::decode(text);
        if (!value) return 0;

        // Canonical text must decode back to the same tree.
        auto encoded = fp::encode(*value);
        auto again = fp::decode(encoded);
        if (!again || fp::encode(*again) != encoded) std::abort();

        auto deleted = fp::apply_delete(fp::compile("$..*[0]"), *value);
        (void)fp::encode(deleted);
        auto updated = fp::apply_update(fp::compile("$..*"), std::move(deleted), "x");
        (void)fp::encode(updated);
    } catch (const fp::Exception&) {
        return 0;
    }
    return 0;
}
