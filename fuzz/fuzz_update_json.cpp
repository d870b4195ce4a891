// Fuzz target for update documents — arbitrary bytes parsed as JSON and
// applied to a fixed document. Every accepted update is applied a second
// time; $set-only updates must then report no modification.

#include <docupdate-cpp/docupdate.hpp>
#include <docupdate-cpp/json.hpp>

#include <cstddef>
#include <cstdint>

namespace du = docupdate_cpp;
using json = nlohmann::ordered_json;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    auto update = json::parse(data, data + size, nullptr, false);
    if (update.is_discarded()) return 0;

    auto options = du::UpdateOptions{};
    options.max_array_padding = 64;
    const auto applier = du::UpdateApplier{options};

    auto doc = json::parse(R"({
        "_id": "document-composite",
        "v": {"foo": 42, "42": "foo", "array": [42, "foo", null]}
    })").get<du::Value>();

    try {
        const auto spec = du::parse_update(update);
        applier.apply(doc, spec);

        const auto set_only = update.size() == 1 && update.contains("$set");
        const auto second = applier.apply(doc, spec);
        if (set_only && second.modified_count != 0) __builtin_trap();
    } catch (const du::Error&) {
        // Malformed and rejected updates are expected
    }
    return 0;
}
