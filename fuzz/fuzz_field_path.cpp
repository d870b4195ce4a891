// Fuzz target for FieldPath — arbitrary bytes as a dotted path, then a
// lookup and a create-mode resolve against a small document.

#include <docupdate-cpp/docupdate.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace du = docupdate_cpp;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    try {
        const auto path = du::FieldPath{text};
        if (path.dotted() != text) __builtin_trap();

        auto doc = du::Value{du::Document{
            {"a", du::Document{{"b", std::int32_t{1}}}},
            {"arr", du::Array{std::int32_t{1}, du::Document{{"x", "y"}}}},
        }};
        (void)du::find(doc, path);

        // Keep padding small so huge indexes fail fast instead of allocating
        auto options = du::UpdateOptions{};
        options.max_array_padding = 64;
        (void)du::resolve(doc, path, du::ResolveMode::create, options);
    } catch (const du::Error&) {
        // Rejected paths and non-viable traversals are expected
    }
    return 0;
}
