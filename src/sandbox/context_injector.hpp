#pragma once

#include <string>

#include "nlohmann/json.hpp"

namespace runbox::sandbox {

// Prepends a preamble that decodes the context object and binds every key as
// a module-level global, plus the whole object as `_context`. The injected
// names are plain bindings; the script keeps every capability its process
// has.
class ContextInjector {
public:
    // Returns code unchanged for a null or empty context. Throws
    // ContextSerializationError when the context is not an object or cannot
    // be encoded.
    static std::string Inject(const std::string& code, const nlohmann::json& context);

    static std::string BuildPreamble(const nlohmann::json& context);

    static bool IsEmpty(const nlohmann::json& context) {
        return context.is_null() || (context.is_object() && context.empty());
    }
};

}  // namespace runbox::sandbox
