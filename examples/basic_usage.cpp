// basic_usage — demonstrates the core docupdate-cpp API
//
// Builds a document from JSON, applies $set/$pop/$inc/$push updates through
// UpdateApplier, inspects results with find(), and shows how rejected
// updates are reported with MongoDB error codes.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage [--v=2]

#include <docupdate-cpp/docupdate.hpp>
#include <docupdate-cpp/json.hpp>

#include <glog/logging.h>

#include <cstdint>
#include <cstdio>
#include <string>

namespace du = docupdate_cpp;
using json = nlohmann::ordered_json;

namespace {

void print(const char* label, const du::Value& doc) {
    std::printf("%-22s %s\n", label, json(doc).dump().c_str());
}

}  // anonymous namespace

int main(int argc, char** argv) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;
    for (int i = 1; i < argc; ++i) {
        if (std::string{argv[i]}.rfind("--v=", 0) == 0) {
            FLAGS_v = std::stoi(std::string{argv[i]}.substr(4));
        }
    }

    auto doc = json::parse(R"({
        "_id": "document-composite",
        "v": {"foo": 42, "42": "foo", "array": [42, "foo", null]}
    })").get<du::Value>();
    print("initial:", doc);

    const auto applier = du::UpdateApplier{};

    // -- Dotted paths: existing fields, array indexes, new nesting ------------
    auto result = du::apply_update(applier, doc, json::parse(R"({
        "$set": {"v.foo": 1, "v.array.0": "first", "v.new.path": true}
    })"));
    std::printf("modified: %zu\n", result.modified_count);
    print("after $set:", doc);

    // -- Same value again: matched but not modified ---------------------------
    result = du::apply_update(applier, doc, json::parse(R"({"$set": {"v.foo": 1}})"));
    std::printf("modified: %zu\n", result.modified_count);

    // -- Programmatic spec, no JSON involved ----------------------------------
    result = applier.apply(doc, {
        {"$pop", "v.array", std::int32_t{1}},
        {"$inc", "v.count", std::int32_t{5}},
        {"$push", "v.tags", du::Document{{"$each", du::Array{"a", "b"}}}},
    });
    print("after $pop/$inc/$push:", doc);

    // -- Reading back ---------------------------------------------------------
    if (const auto* count = du::find(doc, du::FieldPath{"v.count"})) {
        std::printf("v.count = %s (%s)\n", du::to_display_string(*count).c_str(),
                    std::string{du::to_string_view(count->type())}.c_str());
    }

    // -- Errors carry MongoDB codes -------------------------------------------
    for (const auto* text : {
             R"({"$pop": {"v.foo": 1}})",
             R"({"$set": {"v": 1}, "$unset": {"v.foo": ""}})",
             R"({"$rename": {"v": "w"}})",
             R"({"$set": {"_id": "other"}})",
         }) {
        try {
            du::apply_update(applier, doc, json::parse(text));
        } catch (const du::Error& e) {
            std::printf("%s\n  -> code %d: %s\n", text, e.code(), e.what());
        }
    }

    return 0;
}
